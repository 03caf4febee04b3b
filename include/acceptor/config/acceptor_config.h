#ifndef ACCEPTOR_CONFIG_ACCEPTOR_CONFIG_H
#define ACCEPTOR_CONFIG_ACCEPTOR_CONFIG_H

#include <cstdint>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "acceptor/logging/logger_registry.h"
#include "acceptor/network/connection_impl.h"
#include "acceptor/server/acceptor_handler.h"

namespace acceptor {
namespace config {

/**
 * @brief Configuration validation error
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
    std::ostringstream oss;
    oss << "Configuration validation failed for field '" << field
        << "': " << reason;
    return oss.str();
  }

  std::string field_;
  std::string reason_;
};

/**
 * @brief Logging section
 */
struct LoggingConfig {
  std::string level{"info"};
  std::string format{"text"};  // "text" or "json"
  std::string file;            // empty: stderr
  std::string writability_level{"warning"};
  // Logger name glob -> level. Applied in key order, later entries win.
  std::map<std::string, std::string> patterns;

  void validate() const;
  nlohmann::json toJson() const;
  static LoggingConfig fromJson(const nlohmann::json& j);

  bool operator==(const LoggingConfig& other) const {
    return level == other.level && format == other.format &&
           file == other.file &&
           writability_level == other.writability_level &&
           patterns == other.patterns;
  }
};

/**
 * @brief Acceptor configuration
 *
 * Watermark defaults follow the usual 64 KiB / 32 KiB channel defaults.
 */
struct AcceptorConfig {
  uint32_t write_buffer_high_water_mark{
      network::WriteBufferWatermark::kDefaultHighWatermark};
  uint32_t write_buffer_low_water_mark{
      network::WriteBufferWatermark::kDefaultLowWatermark};
  LoggingConfig logging;

  /**
   * Throws ConfigValidationError naming the first invalid field
   */
  void validate() const;

  nlohmann::json toJson() const;

  /**
   * Parse and validate. Missing keys keep their defaults.
   */
  static AcceptorConfig fromJson(const nlohmann::json& j);
  static AcceptorConfig fromJsonString(const std::string& text);
  static AcceptorConfig fromJsonFile(const std::string& path);
  static AcceptorConfig fromYamlString(const std::string& text);

  /**
   * Load a .yaml/.yml file as YAML and anything else as JSON
   */
  static AcceptorConfig fromFile(const std::string& path);

  /**
   * Configure levels, patterns, format and destination of the registry
   */
  void applyLogging(logging::LoggerRegistry& registry =
                        logging::LoggerRegistry::instance()) const;

  /**
   * Apply the write buffer thresholds to a connection
   */
  void applyWatermarks(network::ConnectionImplBase& connection) const;

  server::AcceptorHandler::Options handlerOptions() const;

  bool operator==(const AcceptorConfig& other) const {
    return write_buffer_high_water_mark ==
               other.write_buffer_high_water_mark &&
           write_buffer_low_water_mark == other.write_buffer_low_water_mark &&
           logging == other.logging;
  }
};

}  // namespace config
}  // namespace acceptor

#endif  // ACCEPTOR_CONFIG_ACCEPTOR_CONFIG_H
