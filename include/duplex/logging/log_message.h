#pragma once

#include <unistd.h>

#include <chrono>
#include <map>
#include <string>
#include <thread>

#include "duplex/logging/log_level.h"

namespace duplex {
namespace logging {

// One log record as handed to sinks. The constructor stamps time, pid and
// the calling thread; everything else is filled in by Logger::log().
struct LogMessage {
  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(::getpid()),
        thread_id(std::this_thread::get_id()) {}

  std::string logger_name;
  LogLevel level{LogLevel::Info};
  std::string message;

  std::chrono::system_clock::time_point timestamp;
  pid_t process_id;
  std::thread::id thread_id;

  // Call site, null when logged through Logger::info() and friends
  const char* file{nullptr};
  const char* function{nullptr};
  int line{0};

  std::map<std::string, std::string> key_values;
};

}  // namespace logging
}  // namespace duplex
