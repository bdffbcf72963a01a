#include "dsan_core/services/directory_walker.hpp"

#include <algorithm>
#include <queue>
#include <system_error>
#include <vector>

namespace dsan_core {

DirectoryWalker::DirectoryWalker(std::shared_ptr<FileDispatcher> dispatcher,
                                 std::shared_ptr<Logger> logger,
                                 std::filesystem::path excluded_dir)
    : dispatcher_(std::move(dispatcher)),
      logger_(std::move(logger)),
      excluded_dir_(std::move(excluded_dir)) {}

bool DirectoryWalker::is_excluded(const std::filesystem::path& directory) const {
  if (excluded_dir_.empty()) return false;
  std::error_code ec;
  return std::filesystem::equivalent(directory, excluded_dir_, ec);
}

RunSummary DirectoryWalker::walk(const std::filesystem::path& root, bool recursive) {
  RunSummary summary;
  const auto opts = std::filesystem::directory_options::skip_permission_denied;

  std::queue<std::filesystem::path> pending;
  pending.push(root);

  while (!pending.empty()) {
    const std::filesystem::path directory = pending.front();
    pending.pop();
    logger_->debug("Scanning directory " + directory.string());

    std::vector<std::filesystem::path> files;
    std::vector<std::filesystem::path> subdirectories;

    std::error_code ec;
    std::filesystem::directory_iterator it(directory, opts, ec);
    if (ec) {
      logger_->warning("Cannot list directory " + directory.string() + ": " + ec.message());
      continue;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
      if (ec) break;
      const auto& entry = *it;
      std::error_code entry_ec;
      if (entry.is_directory(entry_ec)) {
        if (entry.is_symlink(entry_ec)) {
          logger_->debug("Not following directory symlink " + entry.path().string());
        } else {
          subdirectories.push_back(entry.path());
        }
      } else if (entry.is_regular_file(entry_ec)) {
        files.push_back(entry.path());
      } else {
        logger_->debug("Skipping non-regular entry " + entry.path().string());
      }
    }
    if (ec) {
      logger_->warning("Stopped listing " + directory.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
      summary.record(dispatcher_->dispatch(file));
    }

    if (!recursive) break;

    std::sort(subdirectories.begin(), subdirectories.end());
    for (const auto& subdirectory : subdirectories) {
      if (is_excluded(subdirectory)) {
        logger_->debug("Skipping output directory " + subdirectory.string());
        continue;
      }
      pending.push(subdirectory);
    }
  }

  return summary;
}

}  // namespace dsan_core
