#pragma once

#include <filesystem>
#include <memory>

#include "dsan_core/logger.hpp"
#include "dsan_core/services/file_dispatcher.hpp"
#include "dsan_core/types.hpp"

namespace dsan_core {

/**
 * @class DirectoryWalker
 * @brief Breadth-first walk over an input directory, dispatching every regular file.
 *
 * Each level's files are dispatched before any subdirectory is entered, in
 * lexicographic order. Without recursion only the root level is processed.
 * Symlinked directories and the excluded directory (normally the output
 * directory) are never entered.
 */
class DirectoryWalker {
 public:
  DirectoryWalker(std::shared_ptr<FileDispatcher> dispatcher,
                  std::shared_ptr<Logger> logger,
                  std::filesystem::path excluded_dir = {});

  RunSummary walk(const std::filesystem::path& root, bool recursive);

 private:
  bool is_excluded(const std::filesystem::path& directory) const;

  std::shared_ptr<FileDispatcher> dispatcher_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path excluded_dir_;
};

}  // namespace dsan_core
