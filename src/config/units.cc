#define DUPLEX_LOG_COMPONENT "config.units"

#include "duplex/config/units.h"

#include <cstdint>
#include <limits>
#include <regex>

#include "duplex/logging/log_macros.h"

namespace duplex {
namespace config {

namespace {

struct Unit {
  const char* suffix;
  size_t multiplier;
};

// Largest first so toString() picks the coarsest exact unit
constexpr Unit kUnits[] = {{"GB", UnitConversion::GIGABYTE},
                           {"MB", UnitConversion::MEGABYTE},
                           {"KB", UnitConversion::KILOBYTE},
                           {"B", UnitConversion::BYTE}};

const std::regex& sizePattern() {
  static const std::regex pattern("^([0-9]+)(B|KB|MB|GB)$");
  return pattern;
}

std::pair<bool, size_t> fail(std::string& error_message, std::string text) {
  error_message = std::move(text);
  DUPLEX_LOG(Error, "{}", error_message);
  return {false, 0};
}

}  // namespace

std::pair<bool, size_t> Size::parse(const std::string& str) {
  std::string ignored;
  return parseWithError(str, ignored);
}

std::pair<bool, size_t> Size::parse(const nlohmann::json& value) {
  constexpr size_t kMax = std::numeric_limits<size_t>::max();

  if (value.is_string()) {
    return parse(value.get<std::string>());
  }
  if (value.is_number_unsigned()) {
    uint64_t raw = value.get<uint64_t>();
    if (raw > static_cast<uint64_t>(kMax)) {
      DUPLEX_LOG(Error, "Size value too large (overflow): {}", raw);
      return {false, 0};
    }
    return {true, static_cast<size_t>(raw)};
  }
  if (value.is_number()) {
    // Signed integers and floats; nlohmann keeps positive literals unsigned
    double raw = value.get<double>();
    if (raw < 0) {
      DUPLEX_LOG(Error, "Size values must be non-negative: {}", value.dump());
      return {false, 0};
    }
    if (raw >= static_cast<double>(kMax)) {
      DUPLEX_LOG(Error, "Size value too large (overflow): {}", value.dump());
      return {false, 0};
    }
    if (value.is_number_integer()) {
      return {true, static_cast<size_t>(value.get<int64_t>())};
    }
    return {true, static_cast<size_t>(raw)};
  }

  DUPLEX_LOG(Error, "Invalid size value type: expected string or number, got {}",
             value.type_name());
  return {false, 0};
}

std::pair<bool, size_t> Size::parseWithError(const std::string& str,
                                             std::string& error_message) {
  std::smatch match;
  if (!std::regex_match(str, match, sizePattern())) {
    return fail(error_message,
                "Invalid size format '" + str +
                    "', expected <number><unit> with unit B, KB, MB or GB "
                    "(e.g. '1024B', '10MB')");
  }

  // 20 digits can already exceed 64 bits
  const std::string digits = match[1].str();
  if (digits.size() > 19) {
    return fail(error_message, "Size value too large (overflow): " + str);
  }

  size_t multiplier = UnitConversion::BYTE;
  for (const Unit& unit : kUnits) {
    if (match[2] == unit.suffix) {
      multiplier = unit.multiplier;
      break;
    }
  }

  uint64_t count = std::stoull(digits);
  if (count > std::numeric_limits<size_t>::max() / multiplier) {
    return fail(error_message, "Size value too large (overflow): " + str);
  }

  size_t bytes = static_cast<size_t>(count) * multiplier;
  DUPLEX_LOG(Debug, "Successfully parsed size '{}' to {} bytes", str, bytes);
  return {true, bytes};
}

bool Size::isValid(const std::string& str) {
  return std::regex_match(str, sizePattern());
}

std::string Size::toString(size_t bytes) {
  for (const Unit& unit : kUnits) {
    if (bytes != 0 && bytes % unit.multiplier == 0) {
      return std::to_string(bytes / unit.multiplier) + unit.suffix;
    }
  }
  return "0B";
}

}  // namespace config
}  // namespace duplex
