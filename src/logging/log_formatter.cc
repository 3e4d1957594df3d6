#include "ftpd/logging/log_formatter.h"

#include <cstring>
#include <ctime>
#include <functional>
#include <iterator>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace ftpd {
namespace logging {

namespace {

// Local time with milliseconds, e.g. 2024-03-01 12:00:00.042
std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count() %
            1000;
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", fmt::localtime(seconds),
                     ms);
}

const char* baseName(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

size_t threadNumber(std::thread::id id) {
  return std::hash<std::thread::id>()(id);
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "[{}] [{}] [{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level), msg.logger_name);
  if (msg.connection_id) {
    fmt::format_to(it, "[conn:{}] ", *msg.connection_id);
  }
  fmt::format_to(it, "{}", msg.message);
  if (msg.file != nullptr && msg.line > 0) {
    fmt::format_to(it, "  ({}:{})", baseName(msg.file), msg.line);
  }
  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json record;
  record["timestamp"] = formatTimestamp(msg.timestamp);
  record["level"] = logLevelToString(msg.level);
  record["logger"] = msg.logger_name;
  record["thread"] = threadNumber(msg.thread_id);
  record["message"] = msg.message;
  if (msg.connection_id) {
    record["connection_id"] = *msg.connection_id;
  }
  if (msg.file != nullptr) {
    record["file"] = baseName(msg.file);
    record["line"] = msg.line;
  }
  if (msg.function != nullptr) {
    record["function"] = msg.function;
  }
  // Messages may carry raw client bytes; do not throw on bad UTF-8
  return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace ftpd
