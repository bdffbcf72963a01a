#include "dsan_core/services/file_dispatcher.hpp"

#include <system_error>

namespace dsan_core {

std::filesystem::path FileDispatcher::staging_path_for(const std::filesystem::path& destination) {
  std::filesystem::path staging = destination;
  staging += ".partial";
  return staging;
}

FileDispatcher::FileDispatcher(std::shared_ptr<SanitizerFactory> sanitizer_factory,
                               std::shared_ptr<OutputTarget> output_target,
                               std::shared_ptr<Logger> logger)
    : sanitizer_factory_(std::move(sanitizer_factory)),
      output_target_(std::move(output_target)),
      logger_(std::move(logger)) {}

SanitizeResult FileDispatcher::dispatch(const std::filesystem::path& file_path) {
  const MetadataSanitizer* sanitizer = sanitizer_factory_->find_sanitizer_for(file_path);
  if (!sanitizer) {
    logger_->warning("Unsupported file type: " + file_path.string());
    return SanitizeResult::skipped_response("Unsupported file type", file_path);
  }

  const FileType file_type = sanitizer->get_file_type();
  try {
    const std::filesystem::path destination = output_target_->destination_for(file_path);

    std::error_code ec;
    if (std::filesystem::equivalent(file_path, destination, ec)) {
      throw SanitizerError("Refusing to overwrite the source file " + file_path.string());
    }

    // The destination is replaced only once the sanitizer has finished the staging file
    const std::filesystem::path staging = staging_path_for(destination);
    logger_->debug("Sanitizing " + to_string(file_type) + " file " + file_path.string());
    sanitizer->sanitize(file_path, staging);

    std::filesystem::rename(staging, destination, ec);
    if (ec) {
      std::error_code remove_ec;
      std::filesystem::remove(staging, remove_ec);
      throw SanitizerError("Cannot move " + staging.string() + " to " + destination.string() +
                           ": " + ec.message());
    }

    const std::filesystem::path previous = output_target_->claim(destination, file_path);
    if (!previous.empty()) {
      logger_->warning("Output collision: " + destination.string() + " from " +
                       previous.string() + " is overwritten by " + file_path.string());
    }

    const auto output_size = static_cast<size_t>(std::filesystem::file_size(destination));
    const std::string content_hash = sanitizer->get_content_hash(destination);

    logger_->info("Sanitized " + to_string(file_type) + ": " + file_path.string() + " -> " +
                  destination.string());
    logger_->debug("Output " + destination.string() + " is " + std::to_string(output_size) +
                   " bytes, sha256 " + content_hash);
    return SanitizeResult::sanitized_response(file_path, destination, file_type, output_size,
                                              content_hash);
  } catch (const std::exception& e) {
    logger_->error("Error processing " + to_string(file_type) + " file " + file_path.string() +
                   ": " + e.what());
    return SanitizeResult::failure_response(e.what(), file_path, file_type);
  }
}

}  // namespace dsan_core
