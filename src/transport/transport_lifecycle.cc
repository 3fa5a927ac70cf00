#define DUPLEX_LOG_COMPONENT "transport.lifecycle"

#include "duplex/transport/transport_lifecycle.h"

#include "duplex/logging/log_macros.h"

namespace duplex {
namespace transport {

const char* readyStateToString(ReadyState state) {
  switch (state) {
    case ReadyState::Open: return "open";
    case ReadyState::Closing: return "closing";
    case ReadyState::Closed: return "closed";
  }
  return "unknown";
}

const char* transportErrorCodeToString(TransportErrorCode code) {
  switch (code) {
    case TransportErrorCode::RequestOverlap: return "RequestOverlap";
    case TransportErrorCode::BodyTooLarge: return "BodyTooLarge";
    case TransportErrorCode::PrematureClose: return "PrematureClose";
    case TransportErrorCode::CompressionFailure: return "CompressionFailure";
    case TransportErrorCode::ParseError: return "ParseError";
    case TransportErrorCode::DecodeError: return "DecodeError";
  }
  return "Unknown";
}

void TransportLifecycle::close(CloseCallback on_complete,
                               const DoClose& do_close) {
  if (ready_state_ == ReadyState::Closed ||
      ready_state_ == ReadyState::Closing) {
    DUPLEX_LOG(Debug, "{} transport already {}, ignoring close", name_,
               readyStateToString(ready_state_));
    return;
  }

  ready_state_ = ReadyState::Closing;
  do_close(std::move(on_complete));
}

void TransportLifecycle::onError(TransportErrorCode code,
                                 const std::string& message,
                                 const std::string& description) {
  if (!callbacks_ || discarded_) {
    DUPLEX_LOG(Debug, "ignored transport error {}: {}",
               transportErrorCodeToString(code), message);
    return;
  }

  DUPLEX_LOG(Debug, "{} transport error {}: {}", name_,
             transportErrorCodeToString(code), message);
  callbacks_->onError(TransportError{code, message, description});
}

void TransportLifecycle::onPacket(const Packet& packet) {
  if (callbacks_) {
    callbacks_->onPacket(packet);
  }
}

void TransportLifecycle::onDrain() {
  if (callbacks_) {
    callbacks_->onDrain();
  }
}

void TransportLifecycle::onClose() {
  if (ready_state_ == ReadyState::Closed) {
    return;
  }
  ready_state_ = ReadyState::Closed;
  DUPLEX_LOG(Debug, "{} transport closed", name_);
  if (callbacks_) {
    callbacks_->onClose();
  }
}

void TransportLifecycle::applyHeaders(const http::HttpRequest& request,
                                      http::HeaderMap& headers) {
  if (callbacks_) {
    callbacks_->onHeaders(request, headers);
  }
}

}  // namespace transport
}  // namespace duplex
