#include "dsan_cli/cli_handler.hpp"

#include <filesystem>
#include <memory>
#include <sstream>
#include <system_error>

#include "dsan_core/logger.hpp"
#include "dsan_core/output_target.hpp"
#include "dsan_core/sanitizers/sanitizer_factory.hpp"
#include "dsan_core/services/directory_walker.hpp"
#include "dsan_core/services/file_dispatcher.hpp"

namespace dsan_cli {

namespace {

constexpr int kUsageExitCode = 2;

// Accepts both "--flag value" and "--flag=value"
std::string take_value(const std::string& flag, const std::string& arg, int& i, int argc, char* argv[]) {
    const auto equals = arg.find('=');
    if (equals != std::string::npos) {
        std::string value = arg.substr(equals + 1);
        if (value.empty()) {
            throw CliError("argument " + flag + ": expected one argument", kUsageExitCode);
        }
        return value;
    }
    if (i + 1 >= argc) {
        throw CliError("argument " + flag + ": expected one argument", kUsageExitCode);
    }
    return argv[++i];
}

std::string flag_name(const std::string& arg) {
    return arg.substr(0, arg.find('='));
}

}  // namespace

CliHandler::CliHandler(std::ostream& out, std::ostream& log_stream)
    : out_(out), log_stream_(log_stream) {}

std::string CliHandler::usage() {
    std::ostringstream ss;
    ss << "usage: " << kToolName
       << " [-h] [--output OUTPUT] [--recursive] [--verbose] [--config CONFIG] [--mirror] [--version] input_path\n"
       << "\n"
       << "A tool to remove metadata from files for data sanitization.\n"
       << "\n"
       << "positional arguments:\n"
       << "  input_path            Path to the file or directory to process.\n"
       << "\n"
       << "options:\n"
       << "  -h, --help            Show this help message and exit.\n"
       << "  -o, --output OUTPUT   Output directory for sanitized files (default: sanitized_output).\n"
       << "  -r, --recursive       Recursively process files in directories.\n"
       << "  -v, --verbose         Enable verbose logging.\n"
       << "  -c, --config CONFIG   JSON configuration file; flags override its values.\n"
       << "  --mirror              Reproduce the input directory structure instead of flattening it.\n"
       << "  --version             Show program's version number and exit.\n";
    return ss.str();
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const std::string flag = flag_name(arg);

        if (arg == "--version") {
            options.command = Command::Version;
            return options;
        } else if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
            return options;
        } else if (flag == "--output" || arg == "-o") {
            options.output_dir = take_value("--output", arg, i, argc, argv);
        } else if (flag == "--config" || arg == "-c") {
            options.config_path = take_value("--config", arg, i, argc, argv);
        } else if (arg == "--recursive" || arg == "-r") {
            options.recursive = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--mirror") {
            options.mirror = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw CliError("unrecognized arguments: " + arg, kUsageExitCode);
        } else if (options.input_path.empty()) {
            options.input_path = arg;
        } else {
            throw CliError("unrecognized arguments: " + arg, kUsageExitCode);
        }
    }

    if (options.input_path.empty()) {
        throw CliError("the following arguments are required: input_path", kUsageExitCode);
    }

    return options;
}

dsan_core::SanitizerConfig CliHandler::resolve_config(const CliOptions& options) const {
    dsan_core::SanitizerConfig config;
    if (!options.config_path.empty()) {
        config = dsan_core::SanitizerConfig::from_file(options.config_path);
    }

    if (!options.output_dir.empty()) {
        config.output_dir = options.output_dir;
    }
    if (options.recursive) {
        config.recursive = true;
    }
    if (options.verbose) {
        config.verbose = true;
    }
    if (options.mirror) {
        config.output_layout = dsan_core::OutputLayout::Mirror;
    }
    return config;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Sanitize:
            handle_sanitize_command(options);
            break;
        case Command::Version:
            handle_version_command();
            break;
        case Command::Help:
            handle_help_command();
            break;
    }
}

void CliHandler::handle_sanitize_command(const CliOptions& options) {
    const dsan_core::SanitizerConfig config = resolve_config(options);

    auto logger = std::make_shared<dsan_core::Logger>(
        config.verbose ? dsan_core::LogLevel::Debug : dsan_core::LogLevel::Info, log_stream_);

    const std::filesystem::path input_path(options.input_path);
    std::error_code ec;
    const auto input_status = std::filesystem::status(input_path, ec);
    const bool is_file = std::filesystem::is_regular_file(input_status);
    const bool is_directory = std::filesystem::is_directory(input_status);
    if (!is_file && !is_directory) {
        throw CliError("Input path is neither a file nor a directory: " + input_path.string());
    }

    const std::filesystem::path input_root = is_directory ? input_path : input_path.parent_path();
    auto output_target = std::make_shared<dsan_core::OutputTarget>(
        config.output_dir, input_root, config.output_layout);
    output_target->prepare();

    logger->debug("Output directory: " + output_target->output_dir().string() + " (layout " +
                  dsan_core::to_string(config.output_layout) + ")");

    auto sanitizer_factory = std::make_shared<dsan_core::SanitizerFactory>(logger, config);
    auto dispatcher =
        std::make_shared<dsan_core::FileDispatcher>(sanitizer_factory, output_target, logger);

    summary_ = dsan_core::RunSummary();
    if (is_file) {
        summary_.record(dispatcher->dispatch(input_path));
    } else {
        dsan_core::DirectoryWalker walker(dispatcher, logger, output_target->output_dir());
        summary_ = walker.walk(input_path, config.recursive);
    }

    logger->info("Processed " + std::to_string(summary_.total()) + " file(s): " +
                 std::to_string(summary_.sanitized) + " sanitized, " +
                 std::to_string(summary_.failed) + " failed, " +
                 std::to_string(summary_.skipped) + " skipped");
}

void CliHandler::handle_version_command() {
    out_ << kToolName << " " << kToolVersion << std::endl;
}

void CliHandler::handle_help_command() {
    out_ << usage();
}

}  // namespace dsan_cli
