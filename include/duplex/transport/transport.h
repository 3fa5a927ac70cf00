#ifndef DUPLEX_TRANSPORT_TRANSPORT_H
#define DUPLEX_TRANSPORT_TRANSPORT_H

#include <functional>
#include <string>
#include <vector>

#include "duplex/http/http_exchange.h"
#include "duplex/transport/packet.h"

namespace duplex {
namespace transport {

enum class ReadyState { Open, Closing, Closed };

const char* readyStateToString(ReadyState state);

enum class TransportErrorCode {
  RequestOverlap,
  BodyTooLarge,
  PrematureClose,
  CompressionFailure,
  ParseError,
  DecodeError
};

const char* transportErrorCodeToString(TransportErrorCode code);

struct TransportError {
  TransportErrorCode code;
  std::string message;
  std::string description;
};

/**
 * Session-facing events of a transport. All callbacks run on the
 * dispatcher thread.
 */
class TransportCallbacks {
 public:
  virtual ~TransportCallbacks() = default;

  virtual void onPacket(const Packet& packet) = 0;

  virtual void onError(const TransportError& error) = 0;

  /**
   * The transport can accept a send()
   */
  virtual void onDrain() = 0;

  virtual void onClose() = 0;

  /**
   * Last chance to add or change headers of a 200 response
   */
  virtual void onHeaders(const http::HttpRequest& request,
                         http::HeaderMap& headers) {
    (void)request;
    (void)headers;
  }
};

/**
 * Capability interface shared by the transports a session can hold.
 */
class Transport {
 public:
  using CloseCallback = std::function<void()>;

  virtual ~Transport() = default;

  virtual const std::string& name() const = 0;

  virtual void onRequest(http::HttpRequestSharedPtr request,
                         http::HttpResponseSharedPtr response) = 0;

  /**
   * Flush |packets| to the client. Only valid while writable().
   */
  virtual void send(std::vector<Packet> packets) = 0;

  /**
   * Begin an orderly close. |on_complete| runs once the close packet has
   * been handed to a response. Ignored when already closing or closed.
   */
  virtual void close(CloseCallback on_complete = nullptr) = 0;

  virtual bool writable() const = 0;

  virtual ReadyState readyState() const = 0;

  virtual void setTransportCallbacks(TransportCallbacks* callbacks) = 0;

  virtual bool supportsBinary() const = 0;

  virtual bool supportsFraming() const = 0;

  virtual bool handlesUpgrades() const = 0;

  // Marks the transport as superseded; further errors are not reported
  virtual void discard() = 0;
};

}  // namespace transport
}  // namespace duplex

#endif  // DUPLEX_TRANSPORT_TRANSPORT_H
