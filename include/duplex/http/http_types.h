#ifndef DUPLEX_HTTP_HTTP_TYPES_H
#define DUPLEX_HTTP_HTTP_TYPES_H

#include <cstdint>
#include <map>
#include <string>

namespace duplex {
namespace http {

// HTTP status codes used by the transports
enum class HttpStatusCode : uint16_t {
  OK = 200,
  BadRequest = 400,
  NotFound = 404,
  InternalServerError = 500
};

// HTTP methods
enum class HttpMethod {
  GET,
  POST,
  PUT,
  DELETE,
  HEAD,
  OPTIONS,
  PATCH,
  CONNECT,
  TRACE,
  UNKNOWN
};

// Request headers are keyed by lower-cased name. Response headers keep the
// case they are written with.
using HeaderMap = std::map<std::string, std::string>;

const char* methodToString(HttpMethod method);

HttpMethod methodFromString(const std::string& method);

std::string toLowerCase(const std::string& str);

// Old Internet Explorer sniffs content types unless told not to
bool isLegacyInternetExplorer(const std::string& user_agent);

}  // namespace http
}  // namespace duplex

#endif  // DUPLEX_HTTP_HTTP_TYPES_H
