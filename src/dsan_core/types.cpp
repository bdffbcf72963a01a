#include "dsan_core/types.hpp"

#include <algorithm>
#include <cctype>

namespace dsan_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::PDF:
      return "PDF";
    case FileType::DOCX:
      return "DOCX";
    case FileType::Image:
      return "Image";
    default:
      return "Unsupported";
  }
}

std::string normalized_extension(const std::filesystem::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

FileType file_type_for(const std::filesystem::path& file_path) {
  const std::string extension = normalized_extension(file_path);
  if (extension == ".pdf")
    return FileType::PDF;
  if (extension == ".docx")
    return FileType::DOCX;
  if (extension == ".jpg" || extension == ".jpeg" || extension == ".png")
    return FileType::Image;
  return FileType::Unsupported;
}

RunSummary::RunSummary() : sanitized(0), failed(0), skipped(0) {}

void RunSummary::record(SanitizeResult result) {
  switch (result.status) {
    case SanitizeStatus::Sanitized:
      sanitized++;
      break;
    case SanitizeStatus::Failed:
      failed++;
      break;
    case SanitizeStatus::Skipped:
      skipped++;
      break;
  }
  results.push_back(std::move(result));
}

}  // namespace dsan_core
