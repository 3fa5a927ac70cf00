#include "duplex/http/http_types.h"

#include <algorithm>
#include <cctype>

namespace duplex {
namespace http {

const char* methodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
    case HttpMethod::PUT: return "PUT";
    case HttpMethod::DELETE: return "DELETE";
    case HttpMethod::HEAD: return "HEAD";
    case HttpMethod::OPTIONS: return "OPTIONS";
    case HttpMethod::PATCH: return "PATCH";
    case HttpMethod::CONNECT: return "CONNECT";
    case HttpMethod::TRACE: return "TRACE";
    default: return "UNKNOWN";
  }
}

HttpMethod methodFromString(const std::string& method) {
  if (method == "GET") return HttpMethod::GET;
  if (method == "POST") return HttpMethod::POST;
  if (method == "PUT") return HttpMethod::PUT;
  if (method == "DELETE") return HttpMethod::DELETE;
  if (method == "HEAD") return HttpMethod::HEAD;
  if (method == "OPTIONS") return HttpMethod::OPTIONS;
  if (method == "PATCH") return HttpMethod::PATCH;
  if (method == "CONNECT") return HttpMethod::CONNECT;
  if (method == "TRACE") return HttpMethod::TRACE;
  return HttpMethod::UNKNOWN;
}

std::string toLowerCase(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

bool isLegacyInternetExplorer(const std::string& user_agent) {
  return user_agent.find(";MSIE") != std::string::npos ||
         user_agent.find("Trident/") != std::string::npos;
}

}  // namespace http
}  // namespace duplex
