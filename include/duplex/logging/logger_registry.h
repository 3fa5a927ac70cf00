#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

#include "duplex/logging/logger.h"

namespace duplex {
namespace logging {

// Process-wide logger table. Loggers are created lazily by name, e.g.
// "transport.polling", and all write to the default sink.
//
// A logger's level is resolved in this order: the newest matching glob
// rule, then the level set for its component (the name up to the first
// dot), then the global level.
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(const std::string& component, LogLevel level);

  // |glob| supports '*' and '?', e.g. "transport.*"
  void setPattern(const std::string& glob, LogLevel level);

  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  bool shouldLog(const std::string& logger_name, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& name);

  std::vector<std::string> getLoggerNames() const;

  // Back to stderr at Info with no rules
  void reset();

 private:
  struct LevelRule {
    std::regex matcher;
    LogLevel level;
  };

  LoggerRegistry();
  LoggerRegistry(const LoggerRegistry&) = delete;
  LoggerRegistry& operator=(const LoggerRegistry&) = delete;

  void installDefaultsLocked();
  void refreshLevelsLocked();
  LogLevel resolveLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Logger>> loggers_;
  std::map<std::string, LogLevel> component_levels_;
  std::vector<LevelRule> rules_;
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace duplex
