#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "dsan_core/logger.hpp"
#include "dsan_core/types/file.hpp"

namespace fs = std::filesystem;

namespace dsan_core {

class SanitizerError : public std::exception {
 public:
  explicit SanitizerError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class MetadataSanitizer {
 public:
  explicit MetadataSanitizer(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}
  virtual ~MetadataSanitizer() = default;

  // Checks if this sanitizer can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Reads source, drops its metadata and writes the cleaned copy to destination.
  // Throws SanitizerError on any failure; destination does not exist afterwards.
  virtual void sanitize(const fs::path& source, const fs::path& destination) const = 0;

  virtual FileType get_file_type() const = 0;

  std::string get_content_hash(const fs::path& file_path) const;

 protected:
  std::string get_binary_content(const fs::path& file_path) const;
  std::string compute_hash_from_content(const std::string& content) const;

  // Deletes whatever a failed sanitize() left behind at destination
  void remove_partial_output(const fs::path& destination) const;

  std::shared_ptr<Logger> logger_;
};

// Define a type for our smart pointers
using MetadataSanitizerPtr = std::unique_ptr<MetadataSanitizer>;

}  // namespace dsan_core
