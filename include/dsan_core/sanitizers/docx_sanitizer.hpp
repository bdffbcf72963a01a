#pragma once

#include <string>

#include "metadata_sanitizer.hpp"

namespace dsan_core {

struct DocxCleanupStats {
  size_t core_properties_removed = 0;
  size_t comment_nodes_removed = 0;
  size_t parts_rewritten = 0;
};

class DocxSanitizer : public MetadataSanitizer {
 public:
  explicit DocxSanitizer(std::shared_ptr<Logger> logger);

  bool can_handle(const fs::path& file_path) const override;

  // Copies the package entry by entry, rewriting core properties and comment parts
  void sanitize(const fs::path& source, const fs::path& destination) const override;

  FileType get_file_type() const override {
    return FileType::DOCX;
  }

  // Rewrites a single package part. Parts that need no change come back untouched.
  std::string clean_part(const std::string& part_name,
                         const std::string& content,
                         DocxCleanupStats& stats) const;
};

}  // namespace dsan_core
