#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include <fmt/format.h>

#include "ftpd/logging/log_level.h"
#include "ftpd/logging/log_message.h"
#include "ftpd/logging/log_sink.h"

namespace ftpd {
namespace logging {

class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name, LogMode mode = LogMode::Sync)
      : effective_level_(LogLevel::Info), name_(name), mode_(mode) {}

  // Core logging methods; formatting is skipped when the level is disabled
  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Debug)) {
      logImpl(LogLevel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Info)) {
      logImpl(LogLevel::Info, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Warning)) {
      logImpl(LogLevel::Warning, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Error)) {
      logImpl(LogLevel::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           fmt::format_string<Args...> fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg = located(level, file, line, function);
      msg.message = fmt::format(fmt, std::forward<Args>(args)...);
      logMessage(msg);
    }
  }

  // As log(), tagged with the registry id of a connection
  template <typename... Args>
  void logConnection(LogLevel level,
                     uint64_t connection_id,
                     const char* file,
                     int line,
                     const char* function,
                     fmt::format_string<Args...> fmt,
                     Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg = located(level, file, line, function);
      msg.connection_id = connection_id;
      msg.message = fmt::format(fmt, std::forward<Args>(args)...);
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  void setMode(LogMode mode) { mode_.store(mode, std::memory_order_relaxed); }

  bool shouldLog(LogLevel level) const {
    if (mode_.load(std::memory_order_relaxed) == LogMode::NoOp) {
      return false;
    }
    return level >= effective_level_.load(std::memory_order_relaxed);
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 protected:
  void logImpl(LogLevel level, const std::string& msg) {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.logger_name = name_;
    logMessage(log_msg);
  }

  LogMessage located(LogLevel level,
                     const char* file,
                     int line,
                     const char* function) const {
    LogMessage msg;
    msg.level = level;
    msg.logger_name = name_;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    return msg;
  }

  void logMessage(const LogMessage& msg) {
    switch (mode_.load(std::memory_order_relaxed)) {
      case LogMode::Sync:
        logSync(msg);
        break;
      case LogMode::NoOp:
        break;
    }
  }

 private:
  void logSync(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  std::atomic<LogLevel> effective_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::string name_;
  std::atomic<LogMode> mode_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace ftpd
