#include "dsan_core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dsan_core {

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

Logger::Logger(LogLevel level, std::ostream& out) : level_(level), out_(&out) {}

void Logger::set_level(LogLevel level) {
  level_ = level;
}

LogLevel Logger::level() const {
  return level_;
}

bool Logger::enabled(LogLevel level) const {
  return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::debug(const std::string& message) {
  log(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) {
  log(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) {
  log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
  log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, const std::string& message) {
  if (!enabled(level)) return;
  *out_ << timestamp() << " - " << to_string(level) << " - " << message << std::endl;
}

std::string Logger::timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm local_tm{};
  localtime_r(&now_c, &local_tm);

  std::ostringstream ss;
  ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3)
     << std::setfill('0') << millis.count();
  return ss.str();
}

}  // namespace dsan_core
