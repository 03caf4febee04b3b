#include "acceptor/config/acceptor_config.h"

#include <fstream>
#include <limits>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "acceptor/logging/log_formatter.h"
#include "acceptor/logging/log_sink.h"

#define ACCEPTOR_LOG_COMPONENT "Config.acceptor"
#include "acceptor/logging/log_macros.h"

namespace acceptor {
namespace config {

namespace {

uint32_t readWatermark(const nlohmann::json& j,
                       const char* key,
                       uint32_t default_value) {
  if (!j.contains(key)) {
    return default_value;
  }
  const auto& value = j[key];
  if (!value.is_number_integer()) {
    throw ConfigValidationError(key, "must be an integer");
  }
  int64_t number = value.get<int64_t>();
  if (number <= 0 ||
      number > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    throw ConfigValidationError(key, "out of range");
  }
  return static_cast<uint32_t>(number);
}

std::string readString(const nlohmann::json& j,
                       const char* key,
                       const std::string& field,
                       const std::string& default_value) {
  if (!j.contains(key)) {
    return default_value;
  }
  if (!j[key].is_string()) {
    throw ConfigValidationError(field, "must be a string");
  }
  return j[key].get<std::string>();
}

void validateLevel(const std::string& field, const std::string& value) {
  logging::LogLevel level;
  if (!logging::tryParseLogLevel(value, level)) {
    throw ConfigValidationError(field, "unknown log level '" + value + "'");
  }
}

// Plain scalars keep their YAML type, quoted ones stay strings
nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Scalar: {
      const std::string& text = node.Scalar();
      if (node.Tag() == "!") {
        return text;
      }
      if (text == "true" || text == "false") {
        return node.as<bool>();
      }
      int64_t integer;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
      }
      double number;
      if (text.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return number;
      }
      return text;
    }
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
        result[pair.first.as<std::string>()] = yamlToJson(pair.second);
      }
      return result;
    }
    default:
      return nullptr;
  }
}

bool hasYamlExtension(const std::string& path) {
  size_t dot_pos = path.find_last_of('.');
  if (dot_pos == std::string::npos) {
    return false;
  }
  std::string extension = path.substr(dot_pos);
  return extension == ".yaml" || extension == ".yml";
}

}  // namespace

void LoggingConfig::validate() const {
  validateLevel("logging.level", level);
  validateLevel("logging.writability_level", writability_level);

  if (format != "text" && format != "json") {
    throw ConfigValidationError("logging.format",
                                "must be \"text\" or \"json\"");
  }

  for (const auto& pattern : patterns) {
    if (pattern.first.empty()) {
      throw ConfigValidationError("logging.patterns",
                                  "pattern cannot be empty");
    }
    validateLevel("logging.patterns." + pattern.first, pattern.second);
  }
}

nlohmann::json LoggingConfig::toJson() const {
  nlohmann::json j;
  j["level"] = level;
  j["format"] = format;
  j["file"] = file;
  j["writability_level"] = writability_level;
  j["patterns"] = nlohmann::json::object();
  for (const auto& pattern : patterns) {
    j["patterns"][pattern.first] = pattern.second;
  }
  return j;
}

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigValidationError("logging", "must be an object");
  }

  LoggingConfig config;
  config.level = readString(j, "level", "logging.level", config.level);
  config.format = readString(j, "format", "logging.format", config.format);
  config.file = readString(j, "file", "logging.file", config.file);
  config.writability_level =
      readString(j, "writability_level", "logging.writability_level",
                 config.writability_level);

  if (j.contains("patterns")) {
    const auto& patterns = j["patterns"];
    if (!patterns.is_object()) {
      throw ConfigValidationError("logging.patterns", "must be an object");
    }
    for (auto it = patterns.begin(); it != patterns.end(); ++it) {
      if (!it.value().is_string()) {
        throw ConfigValidationError("logging.patterns." + it.key(),
                                    "must be a string");
      }
      config.patterns[it.key()] = it.value().get<std::string>();
    }
  }

  return config;
}

void AcceptorConfig::validate() const {
  if (write_buffer_high_water_mark == 0) {
    throw ConfigValidationError("write_buffer_high_water_mark",
                                "must be positive");
  }
  if (write_buffer_low_water_mark == 0) {
    throw ConfigValidationError("write_buffer_low_water_mark",
                                "must be positive");
  }
  if (write_buffer_low_water_mark >= write_buffer_high_water_mark) {
    throw ConfigValidationError(
        "write_buffer_low_water_mark",
        "must be less than write_buffer_high_water_mark");
  }
  logging.validate();
}

nlohmann::json AcceptorConfig::toJson() const {
  nlohmann::json j;
  j["write_buffer_high_water_mark"] = write_buffer_high_water_mark;
  j["write_buffer_low_water_mark"] = write_buffer_low_water_mark;
  j["logging"] = logging.toJson();
  return j;
}

AcceptorConfig AcceptorConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigValidationError("<root>", "must be an object");
  }

  AcceptorConfig config;
  config.write_buffer_high_water_mark =
      readWatermark(j, "write_buffer_high_water_mark",
                    config.write_buffer_high_water_mark);
  config.write_buffer_low_water_mark =
      readWatermark(j, "write_buffer_low_water_mark",
                    config.write_buffer_low_water_mark);

  if (j.contains("logging")) {
    config.logging = LoggingConfig::fromJson(j["logging"]);
  }

  config.validate();
  return config;
}

AcceptorConfig AcceptorConfig::fromJsonString(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigValidationError("<root>", e.what());
  }
  return fromJson(j);
}

AcceptorConfig AcceptorConfig::fromJsonFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigValidationError(path, e.what());
  }

  ACCEPTOR_LOG_DEBUG("loaded acceptor config from {}", path);
  return fromJson(j);
}

AcceptorConfig AcceptorConfig::fromYamlString(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1;
    throw ConfigValidationError("<root>", error.str());
  }
  return fromJson(yamlToJson(root));
}

AcceptorConfig AcceptorConfig::fromFile(const std::string& path) {
  if (!hasYamlExtension(path)) {
    return fromJsonFile(path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }
  std::stringstream content;
  content << file.rdbuf();

  ACCEPTOR_LOG_DEBUG("loaded acceptor config from {}", path);
  return fromYamlString(content.str());
}

void AcceptorConfig::applyLogging(logging::LoggerRegistry& registry) const {
  logging.validate();

  std::shared_ptr<logging::LogSink> sink;
  if (logging.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    sink = logging::SinkFactory::createFileSink(logging.file);
  }
  if (logging.format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setDefaultSink(sink);

  registry.setGlobalLevel(logging::stringToLogLevel(logging.level));
  registry.clearPatterns();
  for (const auto& pattern : logging.patterns) {
    registry.setPattern(pattern.first,
                        logging::stringToLogLevel(pattern.second));
  }
}

void AcceptorConfig::applyWatermarks(
    network::ConnectionImplBase& connection) const {
  connection.setWriteBufferWatermarks(write_buffer_high_water_mark,
                                      write_buffer_low_water_mark);
}

server::AcceptorHandler::Options AcceptorConfig::handlerOptions() const {
  server::AcceptorHandler::Options options;
  logging::LogLevel level;
  if (!logging::tryParseLogLevel(logging.writability_level, level)) {
    throw ConfigValidationError("logging.writability_level",
                                "unknown log level '" +
                                    logging.writability_level + "'");
  }
  options.writability_log_level = level;
  return options;
}

}  // namespace config
}  // namespace acceptor
