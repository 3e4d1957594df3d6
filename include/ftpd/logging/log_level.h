#pragma once

#include <cstdint>
#include <string>

namespace ftpd {
namespace logging {

// Log levels following RFC-5424 severities
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Logging mode selection
enum class LogMode {
  Sync,  // Direct logging
  NoOp   // No operation (for critical paths)
};

// Sink types
enum class SinkType { File, Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

inline bool tryParseLogLevel(const std::string& str, LogLevel& out) {
  if (str == "DEBUG" || str == "debug" || str == "TRACE" || str == "trace") {
    out = LogLevel::Debug;
  } else if (str == "INFO" || str == "info") {
    out = LogLevel::Info;
  } else if (str == "NOTICE" || str == "notice") {
    out = LogLevel::Notice;
  } else if (str == "WARNING" || str == "warning" || str == "warn") {
    out = LogLevel::Warning;
  } else if (str == "ERROR" || str == "error") {
    out = LogLevel::Error;
  } else if (str == "CRITICAL" || str == "critical") {
    out = LogLevel::Critical;
  } else if (str == "ALERT" || str == "alert") {
    out = LogLevel::Alert;
  } else if (str == "EMERGENCY" || str == "emergency") {
    out = LogLevel::Emergency;
  } else if (str == "OFF" || str == "off") {
    out = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

inline LogLevel stringToLogLevel(const std::string& str) {
  LogLevel level = LogLevel::Info;  // Default
  tryParseLogLevel(str, level);
  return level;
}

}  // namespace logging
}  // namespace ftpd
