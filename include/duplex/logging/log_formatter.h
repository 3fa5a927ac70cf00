#pragma once

#include <memory>
#include <string>

#include "duplex/logging/log_message.h"

namespace duplex {
namespace logging {

// Base formatter interface
class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// "[time] [LEVEL] [T:id] [logger] [file:line fn()] message {k=v}"
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// "default" or "json"; anything else yields the default formatter
std::unique_ptr<Formatter> createFormatter(const std::string& name);

}  // namespace logging
}  // namespace duplex
