#pragma once

#include <filesystem>
#include <memory>

#include "dsan_core/logger.hpp"
#include "dsan_core/output_target.hpp"
#include "dsan_core/sanitizers/sanitizer_factory.hpp"
#include "dsan_core/types.hpp"

namespace dsan_core {

/**
 * @class FileDispatcher
 * @brief Routes one file to its sanitizer and reports what happened.
 *
 * Nothing thrown while sanitizing a file escapes dispatch(): failures come back
 * as a Failed result and an error line, unsupported files as a Skipped result
 * and a warning line. Output is written to a staging file beside the destination and
 * renamed over it only on success, so a failing file never removes what an earlier
 * file wrote to the same destination.
 */
class FileDispatcher {
 public:
  FileDispatcher(std::shared_ptr<SanitizerFactory> sanitizer_factory,
                 std::shared_ptr<OutputTarget> output_target,
                 std::shared_ptr<Logger> logger);

  virtual ~FileDispatcher() = default;

  virtual SanitizeResult dispatch(const std::filesystem::path& file_path);

  // Sibling path the sanitizer writes to before the result replaces the destination
  static std::filesystem::path staging_path_for(const std::filesystem::path& destination);

 private:
  std::shared_ptr<SanitizerFactory> sanitizer_factory_;
  std::shared_ptr<OutputTarget> output_target_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace dsan_core
