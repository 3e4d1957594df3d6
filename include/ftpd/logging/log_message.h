#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "ftpd/core/compat.h"
#include "ftpd/logging/log_level.h"

namespace ftpd {
namespace logging {

/**
 * One log record as handed to a sink. The logger fills everything but the
 * source location and connection, which only the macros know.
 */
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string message;
  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};
  std::thread::id thread_id{std::this_thread::get_id()};

  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  // Registry id of the connection the record is about
  optional<uint64_t> connection_id;
};

}  // namespace logging
}  // namespace ftpd
