#ifndef DUPLEX_HTTP_EVHTTP_EXCHANGE_H
#define DUPLEX_HTTP_EVHTTP_EXCHANGE_H

#include <memory>
#include <string>

#include "duplex/http/http_exchange.h"
#include "duplex/http/http_types.h"

struct evhttp_request;
struct evhttp_connection;

namespace duplex {
namespace http {

/**
 * Adapts one libevent evhttp_request to HttpRequest and HttpResponse.
 *
 * evhttp reads the whole body before the request handler runs, so the body
 * is replayed through RequestCallbacks by deliverBody() once the handler
 * returns. A connection close observed before the reply is reported as
 * RequestCallbacks::onClose().
 *
 * The underlying evhttp_request is owned by libevent and is forgotten as soon
 * as the reply has been handed over or the connection has gone away.
 */
class EvHttpExchange : public HttpRequest, public HttpResponse {
 public:
  explicit EvHttpExchange(evhttp_request* request);
  ~EvHttpExchange() override;

  EvHttpExchange(const EvHttpExchange&) = delete;
  EvHttpExchange& operator=(const EvHttpExchange&) = delete;

  // HttpRequest
  HttpMethod method() const override { return method_; }
  const std::string& uri() const override { return uri_; }
  const HeaderMap& headers() const override { return headers_; }
  void setCallbacks(RequestCallbacks* callbacks) override;
  void destroy() override;

  // HttpResponse
  void encodeHeaders(int status_code,
                     const HeaderMap& headers,
                     bool end_stream) override;
  void encodeData(Buffer& data, bool end_stream) override;

  // Hands the request body to the installed callbacks, or to the next ones
  // installed if none are yet
  void deliverBody();

  // False once the reply was sent or the connection closed
  bool active() const { return request_ != nullptr; }

  static constexpr size_t kBodyChunkSize = 16 * 1024;

 private:
  static void onConnectionClose(evhttp_connection* connection, void* arg);

  void replayBody();
  void sendReply();
  void detachConnection();

  evhttp_request* request_;
  evhttp_connection* connection_{nullptr};

  HttpMethod method_{HttpMethod::UNKNOWN};
  std::string uri_;
  HeaderMap headers_;

  RequestCallbacks* callbacks_{nullptr};
  std::string body_;
  bool body_ready_{false};
  bool body_delivered_{false};

  int status_code_{200};
  std::string reply_body_;
};

using EvHttpExchangeSharedPtr = std::shared_ptr<EvHttpExchange>;

}  // namespace http
}  // namespace duplex

#endif  // DUPLEX_HTTP_EVHTTP_EXCHANGE_H
