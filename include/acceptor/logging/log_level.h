#pragma once

#include <cstdint>
#include <string>

namespace acceptor {
namespace logging {

// Severity levels, ordered (RFC-5424 names)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

enum class LogMode {
  Sync,  // Write to the sink on the calling thread
  NoOp   // Drop everything
};

// Component identifiers, used as the first segment of logger names
enum class Component {
  Root,
  Server,
  Network,
  Channel,
  Processor,
  Event,
  Config,
  Count
};

enum class SinkType { File, Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

// Returns false for names that are not a level
inline bool tryParseLogLevel(const std::string& str, LogLevel& level) {
  if (str == "DEBUG" || str == "debug") {
    level = LogLevel::Debug;
  } else if (str == "INFO" || str == "info") {
    level = LogLevel::Info;
  } else if (str == "NOTICE" || str == "notice") {
    level = LogLevel::Notice;
  } else if (str == "WARNING" || str == "warning" || str == "warn") {
    level = LogLevel::Warning;
  } else if (str == "ERROR" || str == "error") {
    level = LogLevel::Error;
  } else if (str == "CRITICAL" || str == "critical") {
    level = LogLevel::Critical;
  } else if (str == "ALERT" || str == "alert") {
    level = LogLevel::Alert;
  } else if (str == "EMERGENCY" || str == "emergency") {
    level = LogLevel::Emergency;
  } else if (str == "OFF" || str == "off") {
    level = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

// Unknown names map to Info
inline LogLevel stringToLogLevel(const std::string& str) {
  LogLevel level = LogLevel::Info;
  tryParseLogLevel(str, level);
  return level;
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "Root";
    case Component::Server: return "Server";
    case Component::Network: return "Network";
    case Component::Channel: return "Channel";
    case Component::Processor: return "Processor";
    case Component::Event: return "Event";
    case Component::Config: return "Config";
    default: return "Unknown";
  }
}

}  // namespace logging
}  // namespace acceptor
