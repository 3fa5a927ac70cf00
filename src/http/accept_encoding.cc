#include "duplex/http/accept_encoding.h"

#include <cstdlib>
#include <sstream>

#include "duplex/http/http_types.h"

namespace duplex {
namespace http {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

// Returns false when the parameter list carries a malformed q value
bool parseQuality(const std::string& params, double& quality) {
  quality = 1.0;
  std::istringstream stream(params);
  std::string param;
  while (std::getline(stream, param, ';')) {
    param = trim(param);
    size_t eq = param.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string name = toLowerCase(trim(param.substr(0, eq)));
    if (name != "q") {
      continue;
    }
    std::string value = trim(param.substr(eq + 1));
    if (value.empty()) {
      return false;
    }
    char* end = nullptr;
    double q = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || q < 0.0 || q > 1.0) {
      return false;
    }
    quality = q;
  }
  return true;
}

}  // namespace

std::vector<AcceptedCoding> parseAcceptEncoding(const std::string& header) {
  std::vector<AcceptedCoding> result;
  std::istringstream stream(header);
  std::string entry;
  while (std::getline(stream, entry, ',')) {
    entry = trim(entry);
    if (entry.empty()) {
      continue;
    }

    AcceptedCoding coding;
    size_t semi = entry.find(';');
    coding.coding = toLowerCase(trim(entry.substr(0, semi)));
    if (coding.coding.empty()) {
      continue;
    }
    if (semi != std::string::npos &&
        !parseQuality(entry.substr(semi + 1), coding.quality)) {
      continue;
    }
    result.push_back(coding);
  }
  return result;
}

optional<std::string> selectEncoding(
    const std::string& header,
    const std::vector<std::string>& available) {
  if (trim(header).empty()) {
    return nullopt;
  }

  auto accepted = parseAcceptEncoding(header);

  optional<double> wildcard;
  for (const auto& entry : accepted) {
    if (entry.coding == "*") {
      wildcard = entry.quality;
    }
  }

  optional<std::string> best;
  double best_quality = 0.0;
  for (const auto& candidate : available) {
    std::string name = toLowerCase(candidate);
    optional<double> quality;
    for (const auto& entry : accepted) {
      if (entry.coding == name) {
        quality = entry.quality;
      }
    }
    if (!quality) {
      quality = wildcard;
    }
    if (quality && *quality > best_quality) {
      best_quality = *quality;
      best = candidate;
    }
  }
  return best;
}

}  // namespace http
}  // namespace duplex
