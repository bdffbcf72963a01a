#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "dsan_core/types/file.hpp"

namespace dsan_core {

enum class SanitizeStatus { Sanitized, Failed, Skipped };

struct SanitizeResult {
  SanitizeStatus status;
  std::string error_message;
  std::filesystem::path source_path;
  std::filesystem::path output_path;
  FileType file_type;
  size_t output_size;
  std::string content_hash;

  bool success() const {
    return status == SanitizeStatus::Sanitized;
  }

  // Constructor for success
  static SanitizeResult sanitized_response(const std::filesystem::path& source,
                                           const std::filesystem::path& output,
                                           FileType type,
                                           size_t size,
                                           const std::string& hash) {
    return {SanitizeStatus::Sanitized, "", source, output, type, size, hash};
  }

  // Constructor for failure
  static SanitizeResult failure_response(const std::string& error,
                                         const std::filesystem::path& source,
                                         FileType type = FileType::Unsupported) {
    return {SanitizeStatus::Failed, error, source, {}, type, 0, ""};
  }

  // Constructor for files no sanitizer handles
  static SanitizeResult skipped_response(const std::string& reason,
                                         const std::filesystem::path& source) {
    return {SanitizeStatus::Skipped, reason, source, {}, FileType::Unsupported, 0, ""};
  }
};

struct RunSummary {
  size_t sanitized;
  size_t failed;
  size_t skipped;
  std::vector<SanitizeResult> results;

  RunSummary();

  void record(SanitizeResult result);

  size_t total() const {
    return sanitized + failed + skipped;
  }
};

}  // namespace dsan_core
