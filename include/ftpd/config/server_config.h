#ifndef FTPD_CONFIG_SERVER_CONFIG_H
#define FTPD_CONFIG_SERVER_CONFIG_H

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ftpd {
namespace config {

/**
 * Thrown when a configuration value is out of range or malformed
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error(formatError(field, reason)),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(const std::string& field,
                                 const std::string& reason) {
    return "Configuration validation failed for field '" + field +
           "': " + reason;
  }

  std::string field_;
  std::string reason_;
};

struct LoggingConfig {
  std::string level = "info";
  std::string file;  // Empty logs to stderr
  std::string format = "default";  // "default" or "json"
  std::map<std::string, std::string> patterns;  // Logger glob -> level

  void validate() const;
};

struct ServerConfig {
  std::string listen_address = "0.0.0.0";
  uint16_t port = 8080;
  std::string root_directory = "./root";
  size_t max_connections = 50;
  size_t max_command_length = 1024;
  size_t transfer_chunk_size = 8192;
  std::string passive_address;
  bool per_user_directories = false;

  LoggingConfig logging;

  void validate() const;
};

// Unknown keys are ignored; absent keys keep their defaults. Throws
// ConfigValidationError for values of the wrong type.
void from_json(const nlohmann::json& j, LoggingConfig& config);
void from_json(const nlohmann::json& j, ServerConfig& config);

void to_json(nlohmann::json& j, const LoggingConfig& config);
void to_json(nlohmann::json& j, const ServerConfig& config);

}  // namespace config
}  // namespace ftpd

#endif  // FTPD_CONFIG_SERVER_CONFIG_H
