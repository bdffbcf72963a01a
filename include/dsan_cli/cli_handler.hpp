#pragma once

#include <iostream>
#include <string>

#include "dsan_core/config.hpp"
#include "dsan_core/types.hpp"

#ifndef DSAN_VERSION
#define DSAN_VERSION "1.0"
#endif

namespace dsan_cli
{

  constexpr const char *kToolName = "dsan-metadata-stripper";
  constexpr const char *kToolVersion = DSAN_VERSION;

  enum class Command
  {
    Sanitize,
    Version,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Sanitize;
    std::string input_path;
    std::string output_dir;   // empty: take it from the config
    std::string config_path;
    bool recursive = false;
    bool verbose = false;
    bool mirror = false;
  };

  class CliError : public std::exception
  {
  public:
    // Exit code 2 marks a usage error, anything else a runtime failure
    explicit CliError(const std::string &message, int exit_code = 1)
        : message_(message), exit_code_(exit_code) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

    int exit_code() const
    {
      return exit_code_;
    }

  private:
    std::string message_;
    int exit_code_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::ostream &out = std::cout, std::ostream &log_stream = std::cerr);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Config file values overridden by command-line flags
    dsan_core::SanitizerConfig resolve_config(const CliOptions &options) const;

    // Results of the last sanitize command
    const dsan_core::RunSummary &last_summary() const
    {
      return summary_;
    }

    static std::string usage();

  private:
    std::ostream &out_;
    std::ostream &log_stream_;
    dsan_core::RunSummary summary_;

    // Command handlers
    void handle_sanitize_command(const CliOptions &options);
    void handle_version_command();
    void handle_help_command();
  };

} // namespace dsan_cli
