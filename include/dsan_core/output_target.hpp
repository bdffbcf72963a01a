#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace dsan_core {

enum class OutputLayout { Flatten, Mirror };

std::string to_string(OutputLayout layout);
OutputLayout output_layout_from_string(const std::string& str);

/**
 * @class OutputTarget
 * @brief Destination directory plus the rule that maps a source file to its output path.
 *
 * With OutputLayout::Flatten every file lands directly in the output directory under
 * its own file name. With OutputLayout::Mirror the path relative to the input root is
 * reproduced below the output directory.
 */
class OutputTarget {
 public:
  OutputTarget(std::filesystem::path output_dir,
               std::filesystem::path input_root,
               OutputLayout layout = OutputLayout::Flatten);

  // Creates the output directory and any missing parents. No-op if it exists.
  void prepare() const;

  // Computes the destination for a source file and creates its parent directory.
  std::filesystem::path destination_for(const std::filesystem::path& source) const;

  // Remembers which source produced a destination. Returns the previous source when
  // another file already wrote the same destination during this run.
  std::filesystem::path claim(const std::filesystem::path& destination,
                              const std::filesystem::path& source);

  const std::filesystem::path& output_dir() const {
    return output_dir_;
  }
  const std::filesystem::path& input_root() const {
    return input_root_;
  }
  OutputLayout layout() const {
    return layout_;
  }

 private:
  std::filesystem::path output_dir_;
  std::filesystem::path input_root_;
  OutputLayout layout_;
  std::map<std::filesystem::path, std::filesystem::path> claimed_;
};

}  // namespace dsan_core
