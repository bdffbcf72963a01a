#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace dsan_core {

enum class LogLevel { Debug, Info, Warning, Error };

std::string to_string(LogLevel level);

/**
 * @class Logger
 * @brief Line-oriented logger shared by every component of a run.
 *
 * A Logger is created once by the entry point with the configured level and
 * handed to each component through its constructor. Lines are written as
 * `YYYY-MM-DD HH:MM:SS,mmm - LEVEL - message`.
 *
 * Runs are single-threaded; a Logger is not safe to share across threads.
 */
class Logger {
 public:
  explicit Logger(LogLevel level = LogLevel::Info, std::ostream& out = std::cerr);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level);
  LogLevel level() const;
  bool enabled(LogLevel level) const;

  void debug(const std::string& message);
  void info(const std::string& message);
  void warning(const std::string& message);
  void error(const std::string& message);

  void log(LogLevel level, const std::string& message);

 private:
  static std::string timestamp();

  LogLevel level_;
  std::ostream* out_;
};

}  // namespace dsan_core
