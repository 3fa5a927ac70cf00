#define DUPLEX_LOG_COMPONENT "server.polling"

#include "duplex/server/polling_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <event2/http.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>

#include "duplex/http/evhttp_exchange.h"
#include "duplex/logging/log_macros.h"

namespace duplex {
namespace server {

PollingServer::PollingServer(event::LibeventDispatcher& dispatcher,
                             RequestHandler handler)
    : dispatcher_(dispatcher), handler_(std::move(handler)) {
  http_ = evhttp_new(dispatcher_.base());
  if (!http_) {
    throw std::runtime_error("Failed to create evhttp server");
  }

  evhttp_set_allowed_methods(
      http_, EVHTTP_REQ_GET | EVHTTP_REQ_POST | EVHTTP_REQ_HEAD |
                 EVHTTP_REQ_PUT | EVHTTP_REQ_DELETE | EVHTTP_REQ_OPTIONS |
                 EVHTTP_REQ_PATCH);
  evhttp_set_gencb(http_, &PollingServer::onRequest, this);
}

PollingServer::~PollingServer() {
  if (http_) {
    evhttp_free(http_);
  }
}

void PollingServer::setMaxBodySize(size_t bytes) {
  constexpr size_t kLargest =
      static_cast<size_t>(std::numeric_limits<ev_ssize_t>::max()) - 1;
  size_t limit = std::min(bytes, kLargest) + 1;
  evhttp_set_max_body_size(http_, static_cast<ev_ssize_t>(limit));
  DUPLEX_LOG(Debug, "request bodies capped at {} bytes", limit);
}

VoidResult PollingServer::listen(const std::string& address, uint16_t port) {
  evhttp_bound_socket* handle =
      evhttp_bind_socket_with_handle(http_, address.c_str(), port);
  if (!handle) {
    int err = errno;
    DUPLEX_LOG(Error, "failed to bind {}:{}: {}", address, port,
               std::strerror(err));
    return makeVoidError(
        Error(kErrorIo, "Failed to bind " + address + ":" +
                            std::to_string(port) + ": " + std::strerror(err)));
  }

  evutil_socket_t fd = evhttp_bound_socket_get_fd(handle);
  sockaddr_storage addr;
  socklen_t addr_len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
    int err = errno;
    return makeVoidError(Error(
        kErrorIo, std::string("getsockname failed: ") + std::strerror(err)));
  }

  if (addr.ss_family == AF_INET) {
    port_ = ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  } else {
    port_ = port;
  }

  DUPLEX_LOG(Info, "listening on {}:{}", address, port_);
  return makeVoidSuccess();
}

void PollingServer::onRequest(evhttp_request* request, void* arg) {
  auto* server = static_cast<PollingServer*>(arg);
  auto exchange = std::make_shared<http::EvHttpExchange>(request);

  if (!server->handler_) {
    exchange->encodeHeaders(
        static_cast<int>(http::HttpStatusCode::NotFound), {}, true);
    return;
  }

  server->handler_(exchange, exchange);
  exchange->deliverBody();
}

}  // namespace server
}  // namespace duplex
