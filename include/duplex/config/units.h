#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace duplex {
namespace config {

struct UnitConversion {
  static constexpr size_t BYTE = 1;
  static constexpr size_t KILOBYTE = 1024;
  static constexpr size_t MEGABYTE = KILOBYTE * 1024;
  static constexpr size_t GIGABYTE = MEGABYTE * 1024;
};

// Byte sizes written as "<digits><unit>" with unit B, KB, MB or GB in
// binary multiples. Parse results are {ok, bytes}; failures are logged.
class Size {
 public:
  static std::pair<bool, size_t> parse(const std::string& str);

  // Accepts a unit string or a non-negative number of bytes
  static std::pair<bool, size_t> parse(const nlohmann::json& value);

  static std::pair<bool, size_t> parseWithError(const std::string& str,
                                                std::string& error_message);

  static bool isValid(const std::string& str);

  // Largest unit that divides |bytes| exactly, e.g. 2048 -> "2KB"
  static std::string toString(size_t bytes);
};

}  // namespace config
}  // namespace duplex
