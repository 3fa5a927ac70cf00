#ifndef DUPLEX_TRANSPORT_POLLING_TRANSPORT_H
#define DUPLEX_TRANSPORT_POLLING_TRANSPORT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "duplex/config/polling_config.h"
#include "duplex/core/compat.h"
#include "duplex/core/result.h"
#include "duplex/event/event_loop.h"
#include "duplex/http/http_exchange.h"
#include "duplex/transport/body_accumulator.h"
#include "duplex/transport/payload_codec.h"
#include "duplex/transport/transport.h"
#include "duplex/transport/transport_lifecycle.h"

namespace duplex {
namespace transport {

/**
 * HTTP long-polling transport.
 *
 * A held GET (the poll) carries server to client payloads; each POST carries
 * a client to server payload. At most one of each is bound at a time and an
 * overlapping request is answered with 500. Closing appends a close packet
 * to the current or next poll response.
 *
 * Not thread safe; every method must run on the dispatcher thread.
 */
class PollingTransport : public Transport {
 public:
  PollingTransport(event::Dispatcher& dispatcher,
                   const config::PollingConfig& config,
                   PayloadCodecSharedPtr codec = createEngineIoPayloadCodec());
  ~PollingTransport() override;

  // Transport
  const std::string& name() const override { return lifecycle_.name(); }
  void onRequest(http::HttpRequestSharedPtr request,
                 http::HttpResponseSharedPtr response) override;
  void send(std::vector<Packet> packets) override;
  void close(CloseCallback on_complete = nullptr) override;
  bool writable() const override { return writable_; }
  ReadyState readyState() const override { return lifecycle_.readyState(); }
  void setTransportCallbacks(TransportCallbacks* callbacks) override {
    lifecycle_.setCallbacks(callbacks);
  }
  bool supportsBinary() const override { return supports_binary_; }
  bool supportsFraming() const override { return false; }
  bool handlesUpgrades() const override { return false; }
  void discard() override { lifecycle_.discard(); }

  bool hasPollRequest() const { return poll_request_ != nullptr; }
  bool hasDataRequest() const { return data_request_ != nullptr; }
  bool hasPendingClose() const { return pending_close_.has_value(); }

 private:
  using WriteCallback = std::function<void(const optional<Error>&)>;

  // Close events of the held GET
  class PollRequestCallbacks : public http::RequestCallbacks {
   public:
    explicit PollRequestCallbacks(PollingTransport& parent)
        : parent_(parent) {}

    void onData(const char*, size_t) override {}
    void onEnd() override {}
    void onClose() override {
      if (!detached_) {
        parent_.onPollClose();
      }
    }

    void detach() { detached_ = true; }

   private:
    PollingTransport& parent_;
    bool detached_{false};
  };

  // Body and close events of the bound POST
  class DataRequestCallbacks : public http::RequestCallbacks {
   public:
    explicit DataRequestCallbacks(PollingTransport& parent)
        : parent_(parent) {}

    void onData(const char* data, size_t length) override {
      if (!detached_) {
        parent_.onDataChunk(data, length);
      }
    }
    void onEnd() override {
      if (!detached_) {
        parent_.onDataEnd();
      }
    }
    void onClose() override {
      if (!detached_) {
        parent_.onDataClose();
      }
    }

    void detach() { detached_ = true; }

   private:
    PollingTransport& parent_;
    bool detached_{false};
  };

  void onPollRequest(http::HttpRequestSharedPtr request,
                     http::HttpResponseSharedPtr response);
  void onDataRequest(http::HttpRequestSharedPtr request,
                     http::HttpResponseSharedPtr response);

  void onPollClose();
  void onDataChunk(const char* data, size_t length);
  void onDataEnd();
  void onDataClose();

  // Decodes an uploaded payload and dispatches its packets
  void onData(const Payload& payload);

  // Client sent a close packet
  void onClose();

  void write(Payload payload, bool compress, bool closing);
  void doWrite(Payload payload, bool compress, WriteCallback callback);
  void respond(const std::string& body,
               http::HeaderMap headers,
               const WriteCallback& callback);
  void doClose(CloseCallback on_complete);

  void releasePoll();
  void releaseData();

  event::Dispatcher& dispatcher_;
  config::PollingConfig config_;
  PayloadCodecSharedPtr codec_;
  TransportLifecycle lifecycle_;
  bool supports_binary_;
  bool first_request_{true};

  http::HttpRequestSharedPtr poll_request_;
  http::HttpResponseSharedPtr poll_response_;
  std::unique_ptr<PollRequestCallbacks> poll_callbacks_;
  // Bumped on every poll binding; stale async completions compare against it
  uint64_t poll_generation_{0};

  http::HttpRequestSharedPtr data_request_;
  http::HttpResponseSharedPtr data_response_;
  std::unique_ptr<DataRequestCallbacks> data_callbacks_;
  BodyAccumulator body_;

  bool writable_{false};
  optional<CloseCallback> pending_close_;

  // Expires with the transport; posted work checks it before touching this
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace transport
}  // namespace duplex

#endif  // DUPLEX_TRANSPORT_POLLING_TRANSPORT_H
