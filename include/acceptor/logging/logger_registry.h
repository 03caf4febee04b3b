#pragma once

#include <mutex>
#include <regex>
#include <unordered_map>
#include <vector>

#include "acceptor/logging/logger.h"

namespace acceptor {
namespace logging {

// Glob-style level override ("Server.*")
struct LogPattern {
  std::string glob;
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& g, LogLevel lvl)
      : glob(g), pattern(globToRegex(g)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  // Process-wide registry, usable without configuration
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  // Logger named "<Component>.<name>"
  std::shared_ptr<Logger> getComponentLogger(Component component,
                                             const std::string& name);

  void setGlobalLevel(LogLevel level);
  void setComponentLevel(Component component, LogLevel level);

  // Later patterns win over earlier ones
  void setPattern(const std::string& glob, LogLevel level);
  void clearPatterns();

  // Replaces the sink of the default logger and of every logger sharing it
  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  bool shouldLog(const std::string& logger_name, LogLevel level) const;
  LogLevel getEffectiveLevel(const std::string& name) const;

  std::vector<std::string> getLoggerNames() const;

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace acceptor
