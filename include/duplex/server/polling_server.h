#ifndef DUPLEX_SERVER_POLLING_SERVER_H
#define DUPLEX_SERVER_POLLING_SERVER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "duplex/core/result.h"
#include "duplex/event/libevent_dispatcher.h"
#include "duplex/http/http_exchange.h"

struct evhttp;
struct evhttp_request;

namespace duplex {
namespace server {

/**
 * HTTP listener for polling transports.
 *
 * Runs an evhttp server on the dispatcher's event base and hands every
 * request to the handler as an (HttpRequest, HttpResponse) pair. The request
 * body is delivered through RequestCallbacks once the handler returns.
 */
class PollingServer {
 public:
  using RequestHandler = std::function<void(http::HttpRequestSharedPtr,
                                            http::HttpResponseSharedPtr)>;

  // Throws std::runtime_error if the evhttp server cannot be created
  PollingServer(event::LibeventDispatcher& dispatcher, RequestHandler handler);
  ~PollingServer();

  PollingServer(const PollingServer&) = delete;
  PollingServer& operator=(const PollingServer&) = delete;

  /**
   * Bind to address:port. Port 0 picks an ephemeral port, readable through
   * port() afterwards.
   */
  VoidResult listen(const std::string& address, uint16_t port);

  uint16_t port() const { return port_; }

  /**
   * Cap on request bodies buffered by evhttp. Larger requests are answered
   * with 413 before reaching the handler. One byte of headroom is kept so a
   * body just over |bytes| still reaches the transport, which reports it
   * as BodyTooLarge.
   */
  void setMaxBodySize(size_t bytes);

 private:
  static void onRequest(evhttp_request* request, void* arg);

  event::LibeventDispatcher& dispatcher_;
  RequestHandler handler_;
  evhttp* http_{nullptr};
  uint16_t port_{0};
};

}  // namespace server
}  // namespace duplex

#endif  // DUPLEX_SERVER_POLLING_SERVER_H
