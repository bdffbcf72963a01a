#include "dsan_core/output_target.hpp"

#include <stdexcept>

namespace dsan_core {

std::string to_string(OutputLayout layout) {
  switch (layout) {
    case OutputLayout::Mirror:
      return "mirror";
    default:
      return "flatten";
  }
}

OutputLayout output_layout_from_string(const std::string& str) {
  if (str == "flatten")
    return OutputLayout::Flatten;
  if (str == "mirror")
    return OutputLayout::Mirror;
  throw std::runtime_error("Unknown output layout: " + str + " (expected 'flatten' or 'mirror')");
}

OutputTarget::OutputTarget(std::filesystem::path output_dir,
                           std::filesystem::path input_root,
                           OutputLayout layout)
    : output_dir_(std::move(output_dir)), input_root_(std::move(input_root)), layout_(layout) {}

void OutputTarget::prepare() const {
  std::filesystem::create_directories(output_dir_);
}

std::filesystem::path OutputTarget::destination_for(const std::filesystem::path& source) const {
  if (layout_ == OutputLayout::Flatten || input_root_.empty()) {
    return output_dir_ / source.filename();
  }

  std::filesystem::path relative = source.lexically_relative(input_root_);
  // Sources outside the input root fall back to the flat layout
  if (relative.empty() || *relative.begin() == "..") {
    return output_dir_ / source.filename();
  }

  std::filesystem::path destination = output_dir_ / relative;
  std::filesystem::create_directories(destination.parent_path());
  return destination;
}

std::filesystem::path OutputTarget::claim(const std::filesystem::path& destination,
                                          const std::filesystem::path& source) {
  const std::filesystem::path key = destination.lexically_normal();
  auto it = claimed_.find(key);
  if (it == claimed_.end()) {
    claimed_.emplace(key, source);
    return {};
  }
  std::filesystem::path previous = it->second;
  it->second = source;
  return previous;
}

}  // namespace dsan_core
