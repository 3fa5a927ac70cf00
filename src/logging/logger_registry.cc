#include "duplex/logging/logger_registry.h"

namespace duplex {
namespace logging {

namespace {

constexpr char kDefaultLoggerName[] = "default";

std::regex compileGlob(const std::string& glob) {
  std::string expr;
  expr.reserve(glob.size() * 2);
  for (char c : glob) {
    if (c == '*') {
      expr += ".*";
    } else if (c == '?') {
      expr += '.';
    } else if (std::string("\\^$.|+()[]{}").find(c) != std::string::npos) {
      expr += '\\';
      expr += c;
    } else {
      expr += c;
    }
  }
  return std::regex(expr);
}

}  // namespace

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry() { installDefaultsLocked(); }

void LoggerRegistry::installDefaultsLocked() {
  loggers_.clear();
  component_levels_.clear();
  rules_.clear();
  global_level_ = LogLevel::Info;
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);

  auto fallback = std::make_shared<Logger>(kDefaultLoggerName);
  fallback->setLevel(global_level_);
  fallback->setSink(default_sink_);
  loggers_.emplace(kDefaultLoggerName, std::move(fallback));
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  installDefaultsLocked();
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = loggers_[name];
  if (!slot) {
    slot = std::make_shared<Logger>(name);
    slot->setLevel(resolveLocked(name));
    slot->setSink(default_sink_);
  }
  return slot;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(const std::string& component,
                                       LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[component] = level;
  refreshLevelsLocked();
}

void LoggerRegistry::setPattern(const std::string& glob, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.push_back(LevelRule{compileGlob(glob), level});
  refreshLevelsLocked();
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  LogLevel threshold =
      it != loggers_.end() ? it->second->getLevel() : resolveLocked(name);
  return threshold != LogLevel::Off && level >= threshold;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return resolveLocked(name);
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

void LoggerRegistry::refreshLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(resolveLocked(entry.first));
  }
}

LogLevel LoggerRegistry::resolveLocked(const std::string& name) const {
  for (auto rule = rules_.rbegin(); rule != rules_.rend(); ++rule) {
    if (std::regex_match(name, rule->matcher)) {
      return rule->level;
    }
  }

  auto component = component_levels_.find(name.substr(0, name.find('.')));
  if (component != component_levels_.end()) {
    return component->second;
  }
  return global_level_;
}

}  // namespace logging
}  // namespace duplex
