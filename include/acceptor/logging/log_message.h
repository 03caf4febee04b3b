#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "acceptor/logging/log_level.h"

namespace acceptor {
namespace logging {

// One log record. key_values carries the structured fields of an event
// (e.g. event=connect, count=3) so sinks can consume them without parsing
// the rendered message.
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Correlation
  std::string connection_id;
  std::string request_id;

  std::map<std::string, std::string> key_values;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Correlation data and structured fields attached to a log call
class LogContext {
 public:
  std::string connection_id;
  std::string request_id;
  Component component{Component::Root};
  std::map<std::string, std::string> key_values;

  LogContext& with(const std::string& key, const std::string& value) {
    key_values[key] = value;
    return *this;
  }

  LogContext& with(const std::string& key, const char* value) {
    key_values[key] = value;
    return *this;
  }

  template <typename T>
  LogContext& with(const std::string& key, const T& value) {
    key_values[key] = std::to_string(value);
    return *this;
  }

  void setLocation(const char* file, int line, const char* func) {
    source_file_ = file;
    source_line_ = line;
    source_function_ = func;
  }

  const char* getFile() const { return source_file_; }
  int getLine() const { return source_line_; }
  const char* getFunction() const { return source_function_; }

  void merge(const LogContext& other) {
    if (!other.connection_id.empty())
      connection_id = other.connection_id;
    if (!other.request_id.empty())
      request_id = other.request_id;
    for (const auto& kv : other.key_values) {
      key_values[kv.first] = kv.second;
    }
  }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.component = component;
    log_msg.file = source_file_;
    log_msg.line = source_line_;
    log_msg.function = source_function_;
    log_msg.connection_id = connection_id;
    log_msg.request_id = request_id;
    log_msg.key_values = key_values;
    return log_msg;
  }

 private:
  const char* source_file_{nullptr};
  int source_line_{0};
  const char* source_function_{nullptr};
};

}  // namespace logging
}  // namespace acceptor
