#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace duplex {
namespace logging {

// Severities in increasing order. Off disables a logger entirely.
enum class LogLevel : uint8_t {
  Debug = 0,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency,
  Off
};

enum class SinkType { File, Stdio, Null, External };

namespace detail {
constexpr const char* kLevelNames[] = {"DEBUG",    "INFO",  "NOTICE",
                                       "WARNING",  "ERROR", "CRITICAL",
                                       "ALERT",    "EMERGENCY", "OFF"};
constexpr size_t kLevelCount = sizeof(kLevelNames) / sizeof(kLevelNames[0]);
}  // namespace detail

inline const char* logLevelToString(LogLevel level) {
  size_t index = static_cast<size_t>(level);
  return index < detail::kLevelCount ? detail::kLevelNames[index] : "UNKNOWN";
}

// Case-insensitive. Returns false and leaves |level| alone for unknown names.
inline bool parseLogLevel(const std::string& name, LogLevel& level) {
  for (size_t i = 0; i < detail::kLevelCount; ++i) {
    const char* candidate = detail::kLevelNames[i];
    size_t n = 0;
    while (n < name.size() && candidate[n] != '\0' &&
           (name[n] == candidate[n] || name[n] == candidate[n] + ('a' - 'A'))) {
      ++n;
    }
    if (n == name.size() && candidate[n] == '\0') {
      level = static_cast<LogLevel>(i);
      return true;
    }
  }
  return false;
}

// Unknown names fall back to Info
inline LogLevel stringToLogLevel(const std::string& name) {
  LogLevel level = LogLevel::Info;
  parseLogLevel(name, level);
  return level;
}

}  // namespace logging
}  // namespace duplex
