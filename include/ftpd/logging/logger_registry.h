#pragma once

#include <mutex>
#include <regex>
#include <unordered_map>
#include <vector>

#include "ftpd/logging/logger.h"

namespace ftpd {
namespace logging {

// Pattern for glob-style log level control
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  // Singleton instance with zero-configuration defaults
  static LoggerRegistry& instance();

  // Get or create a named logger; new loggers share the default sink
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Pattern-based log level control, e.g. "Reactor.*"
  void setPattern(const std::string& pattern, LogLevel level);

  // Replaces the sink of every registered logger and of loggers created later
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  // Get all registered loggers (for testing/debugging)
  std::vector<std::string> getLoggerNames() const;

 private:
  LoggerRegistry();

  void initializeDefaults();

  // Assumes mutex_ is held
  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace ftpd
