#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "dsan_core/config.hpp"
#include "metadata_sanitizer.hpp"

/**
 * @class SanitizerFactory
 * @brief Manages and provides the correct MetadataSanitizer for a given file type.
 *
 * This factory holds one instance of every available sanitizer and selects
 * the one that handles a file's extension. There is no fallback sanitizer:
 * unknown extensions are reported to the caller. This class is non-copyable
 * and non-movable.
 */
namespace dsan_core {
class SanitizerFactory {
 public:
  /**
   * @brief Constructs the factory and initializes all available sanitizers.
   *
   * @param logger Shared run logger handed to every sanitizer.
   * @param config Options that change sanitizer behaviour (e.g. strip_xmp).
   */
  SanitizerFactory(std::shared_ptr<Logger> logger, const SanitizerConfig& config);

  virtual ~SanitizerFactory() = default;

  /**
   * @brief Finds the sanitizer for the given file, if any.
   *
   * Selection uses the lower-cased extension only; the file is not opened.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return The matching sanitizer, or nullptr for unsupported files.
   */
  virtual const MetadataSanitizer* find_sanitizer_for(const std::filesystem::path& file_path) const;

  SanitizerFactory(const SanitizerFactory&) = delete;
  SanitizerFactory& operator=(const SanitizerFactory&) = delete;
  SanitizerFactory(SanitizerFactory&&) = delete;
  SanitizerFactory& operator=(SanitizerFactory&&) = delete;

 protected:
  // Lets test doubles skip registration
  SanitizerFactory() = default;

 private:
  std::vector<std::unique_ptr<MetadataSanitizer>> sanitizers;
};
}  // namespace dsan_core
