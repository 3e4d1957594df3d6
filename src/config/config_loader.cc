#define FTPD_LOG_COMPONENT "Config.loader"

#include "ftpd/config/config_loader.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "ftpd/logging/log_macros.h"
#include "ftpd/logging/log_sink.h"

namespace ftpd {
namespace config {

namespace {

constexpr size_t kMaxConfigFileBytes = 1024 * 1024;

const std::vector<std::string>& defaultSearchPaths() {
  static const std::vector<std::string> paths = {
      "./config/ftpd.yaml",
      "./ftpd.yaml",
      "./ftpd.json",
      "/etc/ftpd/ftpd.yaml",
  };
  return paths;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Scalars stay strings unless they read fully as a bool or a number
nlohmann::json yamlScalarToJson(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    // Quoted in the document
    return text;
  }
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }
  if (text == "~" || text == "null") {
    return nullptr;
  }
  if (!text.empty()) {
    char* end = nullptr;
    errno = 0;
    if (text[0] == '-') {
      long long value = std::strtoll(text.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') {
        return static_cast<int64_t>(value);
      }
    } else if (std::isdigit(static_cast<unsigned char>(text[0]))) {
      unsigned long long value = std::strtoull(text.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') {
        return static_cast<uint64_t>(value);
      }
    }
  }
  return text;
}

nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Scalar:
      return yamlScalarToJson(node);
    case YAML::NodeType::Sequence: {
      auto result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.Scalar()] = yamlToJson(pair.second);
      }
      return result;
    }
  }
  return nullptr;
}

template <typename T>
T parseUnsignedFlag(const std::string& flag, const std::string& value) {
  if (value.empty() ||
      value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigParseError(flag, "expected a number, got '" + value + "'");
  }
  errno = 0;
  unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
  if (errno != 0 || parsed > std::numeric_limits<T>::max()) {
    throw ConfigParseError(flag, "value '" + value + "' out of range");
  }
  return static_cast<T>(parsed);
}

}  // namespace

const std::vector<std::string>& ConfigLoader::searchPaths() const {
  return search_paths_.empty() ? defaultSearchPaths() : search_paths_;
}

optional<std::string> ConfigLoader::findConfigFile(
    const optional<std::string>& explicit_path) const {
  if (explicit_path) {
    return explicit_path;
  }
  if (const char* env = std::getenv("FTPD_CONFIG")) {
    if (*env != '\0') {
      return std::string(env);
    }
  }
  std::error_code ec;
  for (const auto& candidate : searchPaths()) {
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return nullopt;
}

ServerConfig ConfigLoader::load(const CommandLineOptions& options) const {
  ServerConfig config;
  auto path = findConfigFile(options.config_path);
  if (path) {
    config = loadFile(*path);
  } else {
    FTPD_LOG_INFO("no configuration file found, using defaults");
  }
  applyOverrides(config, options);
  config.validate();
  return config;
}

ServerConfig ConfigLoader::loadFile(const std::string& path) const {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw ConfigParseError(path, ec.message());
  }
  if (size > kMaxConfigFileBytes) {
    throw ConfigParseError(path, "file exceeds " +
                                     std::to_string(kMaxConfigFileBytes) +
                                     " bytes");
  }

  std::ifstream in(path);
  if (!in) {
    throw ConfigParseError(path, "cannot open file");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  FTPD_LOG_INFO("loading configuration from {}", path);
  return loadString(buffer.str(), endsWith(path, ".json") ? "json" : "yaml",
                    path);
}

ServerConfig ConfigLoader::loadString(const std::string& content,
                                      const std::string& format,
                                      const std::string& source) const {
  std::string expanded = substituteEnvironmentVariables(content, source);

  nlohmann::json document;
  if (format == "json") {
    try {
      document = nlohmann::json::parse(expanded);
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigParseError(source, std::string("JSON parse error: ") +
                                         e.what());
    }
  } else {
    document = parseYaml(expanded, source);
  }

  ServerConfig config;
  if (document.is_null()) {
    return config;
  }
  from_json(document, config);
  return config;
}

nlohmann::json ConfigLoader::parseYaml(const std::string& content,
                                       const std::string& source) {
  try {
    return yamlToJson(YAML::Load(content));
  } catch (const YAML::ParserException& e) {
    throw ConfigParseError(source, "YAML parse error at line " +
                                       std::to_string(e.mark.line + 1) +
                                       ", column " +
                                       std::to_string(e.mark.column + 1));
  }
}

std::string ConfigLoader::substituteEnvironmentVariables(
    const std::string& content,
    const std::string& source) {
  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  size_t expanded = 0;
  auto last = content.cbegin();
  for (std::sregex_iterator it(content.cbegin(), content.cend(), env_regex),
       end;
       it != end; ++it) {
    const std::smatch& match = *it;
    std::string name = match[1].str();
    const char* value = std::getenv(name.c_str());
    if (value == nullptr && !match[2].matched) {
      FTPD_LOG_ERROR("undefined environment variable without default: ${{{}}}",
                     name);
      throw ConfigParseError(source, "undefined environment variable: " + name);
    }
    result.append(last, match[0].first);
    result += value ? std::string(value) : match[3].str();
    last = match[0].second;
    ++expanded;
  }
  result.append(last, content.cend());

  if (expanded > 0) {
    FTPD_LOG_DEBUG("expanded {} environment variables in {}", expanded, source);
  }
  return result;
}

void ConfigLoader::applyOverrides(ServerConfig& config,
                                  const CommandLineOptions& options) {
  if (options.port) {
    config.port = *options.port;
  }
  if (options.root_directory) {
    config.root_directory = *options.root_directory;
  }
  if (options.log_level) {
    config.logging.level = *options.log_level;
  }
  if (options.max_connections) {
    config.max_connections = *options.max_connections;
  }
}

CommandLineOptions ConfigLoader::parseCommandLine(int argc, char** argv) {
  CommandLineOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      continue;
    }

    std::string value;
    size_t eq = arg.find('=');
    std::string flag = arg.substr(0, eq);
    if (eq != std::string::npos) {
      value = arg.substr(eq + 1);
    } else if (i + 1 < argc) {
      value = argv[++i];
    } else {
      throw ConfigParseError(flag, "missing value");
    }

    if (flag == "--config" || flag == "-c") {
      options.config_path = value;
    } else if (flag == "--port" || flag == "-p") {
      options.port = parseUnsignedFlag<uint16_t>(flag, value);
    } else if (flag == "--root" || flag == "-r") {
      options.root_directory = value;
    } else if (flag == "--log-level") {
      options.log_level = value;
    } else if (flag == "--max-connections") {
      options.max_connections = parseUnsignedFlag<size_t>(flag, value);
    } else {
      throw ConfigParseError(flag, "unknown option");
    }
  }
  return options;
}

std::string ConfigLoader::usage(const std::string& program) {
  return "Usage: " + program +
         " [options]\n"
         "Options:\n"
         "  -c, --config <path>        Configuration file (YAML or JSON)\n"
         "  -p, --port <port>          Control port\n"
         "  -r, --root <dir>           Root directory served to clients\n"
         "      --log-level <level>    debug, info, warning, error, off\n"
         "      --max-connections <n>  Concurrent control connections\n"
         "  -h, --help                 Show this help\n";
}

void applyLoggingConfig(const LoggingConfig& config) {
  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink;
  if (config.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    sink = logging::SinkFactory::createFileSink(config.file);
  }
  if (config.format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setDefaultSink(sink);

  registry.setGlobalLevel(logging::stringToLogLevel(config.level));
  for (const auto& pattern : config.patterns) {
    registry.setPattern(pattern.first,
                        logging::stringToLogLevel(pattern.second));
  }
}

}  // namespace config
}  // namespace ftpd
