#ifndef DUPLEX_TRANSPORT_TRANSPORT_LIFECYCLE_H
#define DUPLEX_TRANSPORT_TRANSPORT_LIFECYCLE_H

#include <functional>
#include <string>

#include "duplex/transport/transport.h"

namespace duplex {
namespace transport {

/**
 * Ready state and event delivery shared by every transport. Transports
 * compose one and route their events through it.
 */
class TransportLifecycle {
 public:
  using CloseCallback = Transport::CloseCallback;
  using DoClose = std::function<void(CloseCallback)>;

  explicit TransportLifecycle(const std::string& name) : name_(name) {}

  const std::string& name() const { return name_; }

  ReadyState readyState() const { return ready_state_; }

  void setCallbacks(TransportCallbacks* callbacks) { callbacks_ = callbacks; }
  TransportCallbacks* callbacks() const { return callbacks_; }

  // Moves to Closing and runs |do_close| unless already closing or closed
  void close(CloseCallback on_complete, const DoClose& do_close);

  void onError(TransportErrorCode code,
               const std::string& message,
               const std::string& description = "");

  void onPacket(const Packet& packet);

  void onDrain();

  // Moves to Closed and notifies once
  void onClose();

  void applyHeaders(const http::HttpRequest& request,
                    http::HeaderMap& headers);

  void discard() { discarded_ = true; }
  bool discarded() const { return discarded_; }

 private:
  std::string name_;
  ReadyState ready_state_{ReadyState::Open};
  TransportCallbacks* callbacks_{nullptr};
  bool discarded_{false};
};

}  // namespace transport
}  // namespace duplex

#endif  // DUPLEX_TRANSPORT_TRANSPORT_LIFECYCLE_H
