/**
 * @file polling_echo_server.cc
 * @brief Long-polling echo server
 *
 * Hosts a single polling transport behind an evhttp listener and sends every
 * message packet back to the client on the next poll.
 *
 * Usage: polling_echo_server [port] [config.yaml|config.json]
 *
 * Message Flow:
 * 1. Client POSTs a payload; its message packets are queued
 * 2. Client GETs; the transport drains and the queue is flushed as one payload
 * 3. A close packet from the client ends the session; the next request starts
 *    a new one
 */

#define DUPLEX_LOG_COMPONENT "server.echo"

#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "duplex/config/parse_error.h"
#include "duplex/config/polling_config.h"
#include "duplex/event/libevent_dispatcher.h"
#include "duplex/logging/log_macros.h"
#include "duplex/server/polling_server.h"
#include "duplex/transport/polling_transport.h"

namespace duplex {
namespace examples {

class EchoSession : public transport::TransportCallbacks {
 public:
  EchoSession(event::Dispatcher& dispatcher,
              const config::PollingConfig& config)
      : transport_(dispatcher, config) {
    transport_.setTransportCallbacks(this);
  }

  ~EchoSession() override { transport_.setTransportCallbacks(nullptr); }

  transport::PollingTransport& transport() { return transport_; }

  bool closed() const {
    return transport_.readyState() == transport::ReadyState::Closed;
  }

  void onPacket(const transport::Packet& packet) override {
    if (packet.type == transport::PacketType::Ping) {
      transport::Packet pong = packet;
      pong.type = transport::PacketType::Pong;
      queue_.push_back(pong);
    } else if (packet.type == transport::PacketType::Message) {
      queue_.push_back(packet);
    } else {
      return;
    }
    flush();
  }

  void onError(const transport::TransportError& error) override {
    DUPLEX_LOG(Warning, "transport error ({}): {} {}",
               transport::transportErrorCodeToString(error.code),
               error.message, error.description);
  }

  void onDrain() override { flush(); }

  void onClose() override { DUPLEX_LOG(Info, "session closed"); }

  void onHeaders(const http::HttpRequest& request,
                 http::HeaderMap& headers) override {
    std::string origin = request.header("origin");
    if (!origin.empty()) {
      headers["Access-Control-Allow-Origin"] = origin;
      headers["Access-Control-Allow-Credentials"] = "true";
    }
  }

 private:
  void flush() {
    if (queue_.empty() || !transport_.writable()) {
      return;
    }
    std::vector<transport::Packet> packets;
    packets.swap(queue_);
    transport_.send(std::move(packets));
  }

  transport::PollingTransport transport_;
  std::vector<transport::Packet> queue_;
};

int run(int argc, char** argv) {
  uint16_t port = 8080;
  if (argc > 1) {
    port = static_cast<uint16_t>(std::atoi(argv[1]));
  }

  config::PollingConfig config;
  if (argc > 2) {
    try {
      config = config::loadPollingConfig(argv[2]);
    } catch (const config::ConfigParseError& e) {
      std::cerr << "Invalid configuration: " << e.what() << std::endl;
      return 1;
    }
  }
  config::applyLoggingConfig(config.logging);

  event::LibeventDispatcher dispatcher("polling_echo");
  std::unique_ptr<EchoSession> session;

  server::PollingServer server(
      dispatcher, [&](http::HttpRequestSharedPtr request,
                      http::HttpResponseSharedPtr response) {
        if (!session || session->closed()) {
          session = std::make_unique<EchoSession>(dispatcher, config);
        }
        session->transport().onRequest(std::move(request),
                                       std::move(response));
      });

  server.setMaxBodySize(config.max_http_buffer_size);

  auto result = server.listen("0.0.0.0", port);
  if (isError(result)) {
    std::cerr << get<Error>(result).message << std::endl;
    return 1;
  }
  std::cout << "Polling echo server listening on port " << server.port()
            << std::endl;

  signal(SIGPIPE, SIG_IGN);
  auto sigint = dispatcher.listenForSignal(SIGINT, [&]() {
    DUPLEX_LOG(Info, "SIGINT received, shutting down");
    if (session) {
      session->transport().close();
    }
    dispatcher.exit();
  });

  dispatcher.run(event::RunType::Block);
  return 0;
}

}  // namespace examples
}  // namespace duplex

int main(int argc, char** argv) { return duplex::examples::run(argc, argv); }
