#include "acceptor/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace acceptor {
namespace logging {

// Helper function to format timestamp
static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

// Counters and watermarks go out as JSON numbers
static bool isUnsignedNumber(const std::string& value) {
  if (value.empty() || value.size() > 19) {
    return false;
  }
  for (char c : value) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return value.size() == 1 || value[0] != '0';
}

// DefaultFormatter implementation
std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  // Timestamp
  oss << '[' << formatTimestamp(msg.timestamp) << "] ";

  // Log level
  oss << '[' << logLevelToString(msg.level) << "] ";

  // Thread ID
  oss << "[T:" << msg.thread_id << "] ";

  // Logger name
  if (!msg.logger_name.empty()) {
    oss << '[' << msg.logger_name << "] ";
  }

  // Location if present
  if (msg.file && msg.line > 0) {
    oss << '[' << msg.file << ':' << msg.line << "] ";
  }

  // Connection/Request IDs if present
  if (!msg.connection_id.empty()) {
    oss << "[conn:" << msg.connection_id << "] ";
  }
  if (!msg.request_id.empty()) {
    oss << "[req:" << msg.request_id << "] ";
  }

  // Message
  oss << msg.message;

  // Event name first, then the remaining fields
  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    auto event = msg.key_values.find("event");
    if (event != msg.key_values.end()) {
      oss << "event=" << event->second;
      first = false;
    }
    for (const auto& kv : msg.key_values) {
      if (kv.first == "event")
        continue;
      if (!first)
        oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

// JsonFormatter implementation
std::string JsonFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << "{";

  // Timestamp in ISO format
  oss << "\"timestamp\":\"" << formatTimestamp(msg.timestamp) << "\"";

  // Level
  oss << ",\"level\":\"" << logLevelToString(msg.level) << "\"";

  // Logger name
  oss << ",\"logger\":\"" << escapeJson(msg.logger_name) << "\"";

  // Thread ID
  oss << ",\"thread\":\"" << msg.thread_id << "\"";

  // Process ID if available
  if (msg.process_id > 0) {
    oss << ",\"pid\":" << msg.process_id;
  }

  // Component
  if (msg.component != Component::Root) {
    oss << ",\"component\":\"" << componentToString(msg.component) << "\"";
  }

  // Location
  if (msg.file) {
    oss << ",\"file\":\"" << escapeJson(msg.file) << "\"";
    oss << ",\"line\":" << msg.line;
  }

  // Correlation IDs
  if (!msg.connection_id.empty()) {
    oss << ",\"connection_id\":\"" << escapeJson(msg.connection_id) << "\"";
  }
  if (!msg.request_id.empty()) {
    oss << ",\"request_id\":\"" << escapeJson(msg.request_id) << "\"";
  }

  // Connection event name
  auto event = msg.key_values.find("event");
  if (event != msg.key_values.end()) {
    oss << ",\"event\":\"" << escapeJson(event->second) << "\"";
  }

  // Message
  oss << ",\"message\":\"" << escapeJson(msg.message) << "\"";

  // Key-value pairs
  bool first = true;
  for (const auto& kv : msg.key_values) {
    if (kv.first == "event")
      continue;
    oss << (first ? ",\"fields\":{" : ",");
    oss << "\"" << escapeJson(kv.first) << "\":";
    if (isUnsignedNumber(kv.second)) {
      oss << kv.second;
    } else {
      oss << "\"" << escapeJson(kv.second) << "\"";
    }
    first = false;
  }
  if (!first) {
    oss << "}";
  }

  oss << "}";
  return oss.str();
}

std::string JsonFormatter::escapeJson(const std::string& str) const {
  std::ostringstream oss;

  for (char c : str) {
    switch (c) {
      case '"':
        oss << "\\\"";
        break;
      case '\\':
        oss << "\\\\";
        break;
      case '\b':
        oss << "\\b";
        break;
      case '\f':
        oss << "\\f";
        break;
      case '\n':
        oss << "\\n";
        break;
      case '\r':
        oss << "\\r";
        break;
      case '\t':
        oss << "\\t";
        break;
      default:
        if (c >= 0x20 && c <= 0x7E) {
          oss << c;
        } else {
          // Unicode escape
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<unsigned>(static_cast<unsigned char>(c))
              << std::dec;
        }
        break;
    }
  }

  return oss.str();
}

}  // namespace logging
}  // namespace acceptor
