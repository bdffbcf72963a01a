#pragma once

#include "metadata_sanitizer.hpp"

namespace dsan_core {

// Rebuilds a PDF from its pages alone, leaving the document-info dictionary behind
class PdfSanitizer : public MetadataSanitizer {
 public:
  PdfSanitizer(std::shared_ptr<Logger> logger, bool strip_xmp);

  bool can_handle(const fs::path& file_path) const override;

  void sanitize(const fs::path& source, const fs::path& destination) const override;

  FileType get_file_type() const override {
    return FileType::PDF;
  }

 private:
  bool strip_xmp_;
};

}  // namespace dsan_core
