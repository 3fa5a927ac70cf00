#ifndef DUPLEX_HTTP_HTTP_EXCHANGE_H
#define DUPLEX_HTTP_HTTP_EXCHANGE_H

#include <memory>
#include <string>

#include "duplex/buffer.h"
#include "duplex/http/http_types.h"

namespace duplex {
namespace http {

/**
 * Request body and connection events, delivered on the dispatcher thread.
 * At most one of onEnd() / onClose() is delivered per request.
 */
class RequestCallbacks {
 public:
  virtual ~RequestCallbacks() = default;

  /**
   * Called for each chunk of request body
   */
  virtual void onData(const char* data, size_t length) = 0;

  /**
   * Called once the whole body has been received
   */
  virtual void onEnd() = 0;

  /**
   * Called when the connection closes before the response completed
   */
  virtual void onClose() = 0;
};

/**
 * Inbound HTTP request as seen by a transport
 */
class HttpRequest {
 public:
  virtual ~HttpRequest() = default;

  virtual HttpMethod method() const = 0;

  virtual const std::string& uri() const = 0;

  // Header names are lower-cased
  virtual const HeaderMap& headers() const = 0;

  // Empty string when the header is absent
  std::string header(const std::string& name) const {
    auto it = headers().find(toLowerCase(name));
    return it == headers().end() ? std::string() : it->second;
  }

  /**
   * Install or clear (nullptr) the receiver of body and close events. Body
   * data that arrived before callbacks were set is replayed to them.
   */
  virtual void setCallbacks(RequestCallbacks* callbacks) = 0;

  /**
   * Abort the underlying connection. No further callbacks are delivered.
   */
  virtual void destroy() = 0;
};

/**
 * Response side of an exchange. Following the encoder pattern: headers
 * first, then optional body; end_stream completes the response.
 */
class HttpResponse {
 public:
  virtual ~HttpResponse() = default;

  virtual void encodeHeaders(int status_code,
                             const HeaderMap& headers,
                             bool end_stream) = 0;

  virtual void encodeData(Buffer& data, bool end_stream) = 0;
};

using HttpRequestSharedPtr = std::shared_ptr<HttpRequest>;
using HttpResponseSharedPtr = std::shared_ptr<HttpResponse>;

}  // namespace http
}  // namespace duplex

#endif  // DUPLEX_HTTP_HTTP_EXCHANGE_H
