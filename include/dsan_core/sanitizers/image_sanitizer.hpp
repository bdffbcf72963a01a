#pragma once

#include <cstdio>

#include "metadata_sanitizer.hpp"

namespace dsan_core {

enum class ImageCodec { PNG, JPEG, Unknown };

class ImageSanitizer : public MetadataSanitizer {
 public:
  explicit ImageSanitizer(std::shared_ptr<Logger> logger);

  bool can_handle(const fs::path& file_path) const override;

  // Writes a new container holding only the pixel data of source
  void sanitize(const fs::path& source, const fs::path& destination) const override;

  FileType get_file_type() const override {
    return FileType::Image;
  }

  // Identifies the codec from the file signature, regardless of extension
  static ImageCodec detect_codec(const fs::path& file_path);

 private:
  void rebuild_png(FILE* input, FILE* output, const fs::path& source) const;
  void rebuild_jpeg(FILE* input, FILE* output, const fs::path& source) const;
};

}  // namespace dsan_core
