#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "dsan_core/output_target.hpp"

namespace dsan_core {

class SanitizerConfig {
 public:
  std::string output_dir = "sanitized_output";
  bool recursive = false;
  bool verbose = false;
  OutputLayout output_layout = OutputLayout::Flatten;

  // Also drop page-level XMP streams from PDFs
  bool strip_xmp = true;

  // Load configuration from a JSON file at the given path
  static SanitizerConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static SanitizerConfig from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }

    SanitizerConfig config;

    // Apply defaults when keys are missing
    try {
      config.output_dir = json_config.value("output_dir", std::string("sanitized_output"));
      config.recursive = json_config.value("recursive", false);
      config.verbose = json_config.value("verbose", false);
      config.strip_xmp = json_config.value("strip_xmp", true);
      config.output_layout =
          output_layout_from_string(json_config.value("output_layout", std::string("flatten")));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (output_dir.empty()) {
      throw std::runtime_error("output_dir cannot be empty");
    }
  }
};

}  // namespace dsan_core
