#include "duplex/logging/log_formatter.h"

#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace duplex {
namespace logging {

namespace {

// Local time with millisecond precision: 2024-05-01 12:00:00.042
std::string timestampString(const std::chrono::system_clock::time_point& tp) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    tp.time_since_epoch())
                    .count() %
                1000;

  std::tm local{};
  localtime_r(&seconds, &local);
  char date[32];
  size_t n = std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
  return fmt::format("{}.{:03d}", std::string(date, n),
                     static_cast<int>(millis));
}

std::string threadIdString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] [T:{}] [{}] ", timestampString(msg.timestamp),
                 logLevelToString(msg.level), threadIdString(msg.thread_id),
                 msg.logger_name);
  if (msg.file && msg.line > 0) {
    if (msg.function) {
      fmt::format_to(it, "[{}:{} {}()] ", msg.file, msg.line, msg.function);
    } else {
      fmt::format_to(it, "[{}:{}] ", msg.file, msg.line);
    }
  }
  fmt::format_to(it, "{}", msg.message);

  const char* sep = " {";
  for (const auto& kv : msg.key_values) {
    fmt::format_to(it, "{}{}={}", sep, kv.first, kv.second);
    sep = ", ";
  }
  if (!msg.key_values.empty()) {
    fmt::format_to(it, "}}");
  }

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json line;
  line["timestamp"] = timestampString(msg.timestamp);
  line["level"] = logLevelToString(msg.level);
  line["logger"] = msg.logger_name;
  line["thread"] = threadIdString(msg.thread_id);
  if (msg.process_id > 0) {
    line["pid"] = msg.process_id;
  }
  if (msg.file) {
    line["file"] = msg.file;
    line["line"] = msg.line;
    if (msg.function) {
      line["function"] = msg.function;
    }
  }
  line["message"] = msg.message;
  if (!msg.key_values.empty()) {
    line["metadata"] = msg.key_values;
  }

  // Invalid UTF-8 in a message is replaced instead of throwing
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unique_ptr<Formatter> createFormatter(const std::string& name) {
  if (name == "json") {
    return std::make_unique<JsonFormatter>();
  }
  return std::make_unique<DefaultFormatter>();
}

}  // namespace logging
}  // namespace duplex
