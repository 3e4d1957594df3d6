#include "ftpd/logging/log_sink.h"

#include <filesystem>
#include <system_error>

namespace ftpd {
namespace logging {

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  openFile();
}

RotatingFileSink::~RotatingFileSink() {
  flush();
  closeFile();
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string formatted = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open()) {
    openFile();
  }

  if (config_.max_file_size > 0 &&
      current_size_ + formatted.size() > config_.max_file_size) {
    rotate();
  }

  if (config_.rotation_period != std::chrono::seconds::zero()) {
    auto now = std::chrono::system_clock::now();
    if (now - last_rotation_ > config_.rotation_period) {
      rotate();
    }
  }

  file_ << formatted;
  if (formatted.empty() || formatted.back() != '\n') {
    file_ << '\n';
  }

  current_size_ += formatted.size() + 1;

  if (config_.auto_flush) {
    file_.flush();
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void RotatingFileSink::openFile() {
  closeFile();

  file_.open(config_.base_filename, std::ios::app);
  if (file_.is_open()) {
    file_.seekp(0, std::ios::end);
    current_size_ = static_cast<size_t>(file_.tellp());
    last_rotation_ = std::chrono::system_clock::now();
  }
}

void RotatingFileSink::closeFile() {
  if (file_.is_open()) {
    file_.close();
  }
}

void RotatingFileSink::rotate() {
  closeFile();

  namespace fs = std::filesystem;
  std::error_code ec;

  // Failures below leave the previous generation in place; logging must not
  // throw into the caller.
  if (config_.max_files > 0) {
    std::string oldest =
        config_.base_filename + "." + std::to_string(config_.max_files);
    fs::remove(oldest, ec);

    for (size_t i = config_.max_files - 1; i > 0; --i) {
      std::string old_name = config_.base_filename + "." + std::to_string(i);
      std::string new_name =
          config_.base_filename + "." + std::to_string(i + 1);
      if (fs::exists(old_name, ec)) {
        fs::rename(old_name, new_name, ec);
      }
    }
  }

  if (fs::exists(config_.base_filename, ec)) {
    fs::rename(config_.base_filename, config_.base_filename + ".1", ec);
  }

  openFile();
}

std::unique_ptr<LogSink> SinkFactory::createFileSink(
    const std::string& filename) {
  RotatingFileSink::Config config;
  config.base_filename = filename;
  return std::make_unique<RotatingFileSink>(config);
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

std::unique_ptr<LogSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback) {
  return std::make_unique<ExternalSink>(std::move(callback));
}

}  // namespace logging
}  // namespace ftpd
