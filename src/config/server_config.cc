#include "ftpd/config/server_config.h"

#include <limits>

#include "ftpd/logging/log_level.h"

namespace ftpd {
namespace config {

namespace {

constexpr size_t kMinCommandLength = 16;

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::type_error& e) {
    throw ConfigValidationError(key, e.what());
  }
}

template <typename T>
void readUnsigned(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  if (!it->is_number_integer()) {
    throw ConfigValidationError(key, "must be an unsigned integer");
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
      throw ConfigValidationError(key, "out of range");
    }
    out = static_cast<T>(value);
    return;
  }
  auto value = it->get<int64_t>();
  if (value < 0 ||
      static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
    throw ConfigValidationError(key, "out of range");
  }
  out = static_cast<T>(value);
}

}  // namespace

void LoggingConfig::validate() const {
  logging::LogLevel parsed;
  if (!logging::tryParseLogLevel(level, parsed)) {
    throw ConfigValidationError("logging.level",
                                "unknown log level '" + level + "'");
  }
  if (format != "default" && format != "json") {
    throw ConfigValidationError("logging.format",
                                "must be 'default' or 'json'");
  }
  for (const auto& pattern : patterns) {
    if (!logging::tryParseLogLevel(pattern.second, parsed)) {
      throw ConfigValidationError(
          "logging.patterns." + pattern.first,
          "unknown log level '" + pattern.second + "'");
    }
  }
}

void ServerConfig::validate() const {
  if (port == 0) {
    throw ConfigValidationError("port", "must be between 1 and 65535");
  }
  if (listen_address.empty()) {
    throw ConfigValidationError("listen_address", "must not be empty");
  }
  if (root_directory.empty()) {
    throw ConfigValidationError("root_directory", "must not be empty");
  }
  if (max_connections == 0) {
    throw ConfigValidationError("max_connections", "must be at least 1");
  }
  if (max_command_length < kMinCommandLength) {
    throw ConfigValidationError(
        "max_command_length",
        "must be at least " + std::to_string(kMinCommandLength));
  }
  if (transfer_chunk_size == 0) {
    throw ConfigValidationError("transfer_chunk_size", "must be at least 1");
  }
  logging.validate();
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
  if (!j.is_object()) {
    throw ConfigValidationError("logging", "must be a mapping");
  }
  readField(j, "level", config.level);
  readField(j, "file", config.file);
  readField(j, "format", config.format);
  readField(j, "patterns", config.patterns);
}

void from_json(const nlohmann::json& j, ServerConfig& config) {
  if (!j.is_object()) {
    throw ConfigValidationError("<root>", "must be a mapping");
  }
  readField(j, "listen_address", config.listen_address);
  readUnsigned(j, "port", config.port);
  readField(j, "root_directory", config.root_directory);
  readUnsigned(j, "max_connections", config.max_connections);
  readUnsigned(j, "max_command_length", config.max_command_length);
  readUnsigned(j, "transfer_chunk_size", config.transfer_chunk_size);
  readField(j, "passive_address", config.passive_address);
  readField(j, "per_user_directories", config.per_user_directories);

  auto logging = j.find("logging");
  if (logging != j.end() && !logging->is_null()) {
    from_json(*logging, config.logging);
  }
}

void to_json(nlohmann::json& j, const LoggingConfig& config) {
  j = nlohmann::json{{"level", config.level},
                     {"file", config.file},
                     {"format", config.format},
                     {"patterns", config.patterns}};
}

void to_json(nlohmann::json& j, const ServerConfig& config) {
  j = nlohmann::json{{"listen_address", config.listen_address},
                     {"port", config.port},
                     {"root_directory", config.root_directory},
                     {"max_connections", config.max_connections},
                     {"max_command_length", config.max_command_length},
                     {"transfer_chunk_size", config.transfer_chunk_size},
                     {"passive_address", config.passive_address},
                     {"per_user_directories", config.per_user_directories},
                     {"logging", config.logging}};
}

}  // namespace config
}  // namespace ftpd
