#ifndef FTPD_CONFIG_CONFIG_LOADER_H
#define FTPD_CONFIG_CONFIG_LOADER_H

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ftpd/config/server_config.h"
#include "ftpd/core/compat.h"

namespace ftpd {
namespace config {

/**
 * Thrown when a configuration file cannot be read or parsed
 */
class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& source, const std::string& reason)
      : std::runtime_error(source + ": " + reason), source_(source) {}

  const std::string& source() const { return source_; }

 private:
  std::string source_;
};

// Values given on the command line; they win over file values
struct CommandLineOptions {
  optional<std::string> config_path;
  optional<uint16_t> port;
  optional<std::string> root_directory;
  optional<std::string> log_level;
  optional<size_t> max_connections;
  bool show_help{false};
};

/**
 * Locates, reads and validates the server configuration.
 *
 * Search order when no explicit path is given:
 *   1. $FTPD_CONFIG
 *   2. ./config/ftpd.yaml
 *   3. ./ftpd.yaml
 *   4. ./ftpd.json
 *   5. /etc/ftpd/ftpd.yaml
 * With no file found the defaults are used. "${VAR}" and "${VAR:-default}"
 * are expanded before parsing; an undefined variable without a default is a
 * parse error.
 */
class ConfigLoader {
 public:
  ConfigLoader() = default;
  explicit ConfigLoader(std::vector<std::string> search_paths)
      : search_paths_(std::move(search_paths)) {}

  // Throws ConfigParseError or ConfigValidationError
  ServerConfig load(const CommandLineOptions& options) const;

  ServerConfig loadFile(const std::string& path) const;

  // format is "yaml" or "json"
  ServerConfig loadString(const std::string& content,
                          const std::string& format,
                          const std::string& source = "<string>") const;

  // First existing candidate, or nullopt
  optional<std::string> findConfigFile(
      const optional<std::string>& explicit_path) const;

  const std::vector<std::string>& searchPaths() const;

  static std::string substituteEnvironmentVariables(const std::string& content,
                                                    const std::string& source);

  static nlohmann::json parseYaml(const std::string& content,
                                  const std::string& source);

  static void applyOverrides(ServerConfig& config,
                             const CommandLineOptions& options);

  // Throws ConfigParseError on an unknown flag or a bad value
  static CommandLineOptions parseCommandLine(int argc, char** argv);

  static std::string usage(const std::string& program);

 private:
  std::vector<std::string> search_paths_;
};

/**
 * Points the process-wide logger registry at the configured level, sink,
 * format and per-logger patterns.
 */
void applyLoggingConfig(const LoggingConfig& config);

}  // namespace config
}  // namespace ftpd

#endif  // FTPD_CONFIG_CONFIG_LOADER_H
