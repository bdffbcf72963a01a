#pragma once

#include <filesystem>
#include <string>

namespace dsan_core {

// Core file type enumeration
enum class FileType { PDF, DOCX, Image, Unsupported };

// Name used in log lines
std::string to_string(FileType type);

// Lower-cased extension of the path, including the leading dot (".pdf")
std::string normalized_extension(const std::filesystem::path& file_path);

// Derives the type tag from the file extension only; the file is never opened
FileType file_type_for(const std::filesystem::path& file_path);

struct SourceFile {
  std::filesystem::path path;
  FileType type;

  static SourceFile from_path(const std::filesystem::path& file_path) {
    return {file_path, file_type_for(file_path)};
  }
};

}  // namespace dsan_core
