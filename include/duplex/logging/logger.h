#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "duplex/logging/log_level.h"
#include "duplex/logging/log_message.h"
#include "duplex/logging/log_sink.h"

namespace duplex {
namespace logging {

// Named logger writing synchronously to a shared sink. Messages use fmt
// syntax ("{}" placeholders); the level check happens before formatting.
class Logger {
 public:
  explicit Logger(const std::string& name) : name_(name) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    log(LogLevel::Debug, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    log(LogLevel::Info, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    log(LogLevel::Warning, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    log(LogLevel::Error, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  // Entry point of DUPLEX_LOG; file/function may be null
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.logger_name = name_;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    msg.message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    write(msg);
  }

  bool shouldLog(LogLevel level) const {
    LogLevel threshold = level_.load(std::memory_order_relaxed);
    return threshold != LogLevel::Off && level >= threshold;
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }
  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
  }
  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 private:
  void write(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  const std::string name_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  mutable std::mutex mutex_;
  std::shared_ptr<LogSink> sink_;
};

}  // namespace logging
}  // namespace duplex
