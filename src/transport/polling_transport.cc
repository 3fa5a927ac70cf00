#define DUPLEX_LOG_COMPONENT "transport.polling"

#include "duplex/transport/polling_transport.h"

#include <algorithm>

#include "duplex/compression/compression_negotiator.h"
#include "duplex/compression/compressor.h"
#include "duplex/logging/log_macros.h"

namespace duplex {
namespace transport {

namespace {

constexpr char kBinaryContentType[] = "application/octet-stream";
constexpr char kTextContentType[] = "text/plain; charset=UTF-8";

// text/html avoids a download dialog on some user agents
constexpr char kAckContentType[] = "text/html";
constexpr char kAckBody[] = "ok";

void addLegacyIeHeader(const http::HttpRequest& request,
                       http::HeaderMap& headers) {
  if (http::isLegacyInternetExplorer(request.header("user-agent"))) {
    headers["X-XSS-Protection"] = "0";
  }
}

// The b64 query parameter asks for text framing of binary data
bool requestsBase64(const std::string& uri) {
  size_t query = uri.find('?');
  if (query == std::string::npos) {
    return false;
  }
  std::string params = "&" + uri.substr(query + 1);
  size_t pos = params.find("&b64=");
  if (pos == std::string::npos) {
    return false;
  }
  size_t value = pos + 5;
  return value < params.size() && params[value] != '&' &&
         params[value] != '0';
}

}  // namespace

PollingTransport::PollingTransport(event::Dispatcher& dispatcher,
                                   const config::PollingConfig& config,
                                   PayloadCodecSharedPtr codec)
    : dispatcher_(dispatcher),
      config_(config),
      codec_(std::move(codec)),
      lifecycle_("polling"),
      supports_binary_(config.supports_binary) {}

PollingTransport::~PollingTransport() {
  alive_.reset();
  if (poll_callbacks_) {
    poll_callbacks_->detach();
  }
  if (data_callbacks_) {
    data_callbacks_->detach();
  }
  if (poll_request_) {
    poll_request_->setCallbacks(nullptr);
  }
  if (data_request_) {
    data_request_->setCallbacks(nullptr);
  }
}

void PollingTransport::onRequest(http::HttpRequestSharedPtr request,
                                 http::HttpResponseSharedPtr response) {
  if (first_request_) {
    first_request_ = false;
    if (requestsBase64(request->uri())) {
      DUPLEX_LOG(Debug, "client requested base64 framing");
      supports_binary_ = false;
    }
  }

  switch (request->method()) {
    case http::HttpMethod::GET:
      onPollRequest(std::move(request), std::move(response));
      break;
    case http::HttpMethod::POST:
      onDataRequest(std::move(request), std::move(response));
      break;
    default:
      DUPLEX_LOG(Debug, "unsupported method {}",
                 http::methodToString(request->method()));
      response->encodeHeaders(
          static_cast<int>(http::HttpStatusCode::InternalServerError), {},
          true);
      break;
  }
}

void PollingTransport::onPollRequest(http::HttpRequestSharedPtr request,
                                     http::HttpResponseSharedPtr response) {
  if (poll_request_) {
    DUPLEX_LOG(Debug, "request overlap");
    lifecycle_.onError(TransportErrorCode::RequestOverlap,
                       "overlap from client");
    response->encodeHeaders(
        static_cast<int>(http::HttpStatusCode::InternalServerError), {}, true);
    return;
  }

  DUPLEX_LOG(Debug, "setting request");

  poll_request_ = std::move(request);
  poll_response_ = std::move(response);
  ++poll_generation_;
  poll_callbacks_ = std::make_unique<PollRequestCallbacks>(*this);
  poll_request_->setCallbacks(poll_callbacks_.get());

  writable_ = true;
  lifecycle_.onDrain();

  // Still writable with a close pending: flush an empty batch to carry it
  if (writable_ && pending_close_) {
    DUPLEX_LOG(Debug, "triggering empty send to append close packet");
    send({Packet::control(PacketType::Noop, true)});
  }
}

void PollingTransport::onDataRequest(http::HttpRequestSharedPtr request,
                                     http::HttpResponseSharedPtr response) {
  if (data_request_) {
    DUPLEX_LOG(Debug, "data request overlap");
    lifecycle_.onError(TransportErrorCode::RequestOverlap,
                       "data request overlap from client");
    response->encodeHeaders(
        static_cast<int>(http::HttpStatusCode::InternalServerError), {}, true);
    return;
  }

  bool binary = request->header("content-type") == kBinaryContentType;

  data_request_ = std::move(request);
  data_response_ = std::move(response);
  body_.reset(binary);
  data_callbacks_ = std::make_unique<DataRequestCallbacks>(*this);
  data_request_->setCallbacks(data_callbacks_.get());
}

void PollingTransport::onPollClose() {
  DUPLEX_LOG(Debug, "poll connection closed before response completed");
  releasePoll();
  lifecycle_.onError(TransportErrorCode::PrematureClose,
                     "poll connection closed prematurely");
}

void PollingTransport::onDataChunk(const char* data, size_t length) {
  body_.append(data, length);

  if (body_.size() > config_.max_http_buffer_size) {
    DUPLEX_LOG(Debug, "data request body of {} bytes exceeds limit {}",
               body_.size(), config_.max_http_buffer_size);
    auto request = data_request_;
    releaseData();
    request->destroy();
    lifecycle_.onError(TransportErrorCode::BodyTooLarge,
                       "data request body too large",
                       "limit " + std::to_string(config_.max_http_buffer_size) +
                           " bytes");
  }
}

void PollingTransport::onDataEnd() {
  auto request = data_request_;
  auto response = data_response_;
  Payload payload = body_.take();

  onData(payload);

  // Dispatching may have closed the transport and aborted this request
  if (data_request_ != request) {
    return;
  }

  http::HeaderMap headers;
  headers["Content-Type"] = kAckContentType;
  headers["Content-Length"] = std::to_string(sizeof(kAckBody) - 1);
  addLegacyIeHeader(*request, headers);
  lifecycle_.applyHeaders(*request, headers);

  response->encodeHeaders(static_cast<int>(http::HttpStatusCode::OK), headers,
                          false);
  OwnedBuffer body(kAckBody);
  response->encodeData(body, true);

  releaseData();
}

void PollingTransport::onDataClose() {
  releaseData();
  lifecycle_.onError(TransportErrorCode::PrematureClose,
                     "data request connection closed prematurely");
}

void PollingTransport::onData(const Payload& payload) {
  DUPLEX_LOG(Debug, "received {} byte {} payload", payload.length(),
             payload.binary ? "binary" : "text");

  codec_->decodePayload(payload, [this](const Packet& packet, size_t, size_t) {
    if (packet.type == PacketType::Close) {
      DUPLEX_LOG(Debug, "got xhr close packet");
      onClose();
      return false;
    }
    if (packet.type == PacketType::Error) {
      lifecycle_.onError(TransportErrorCode::DecodeError,
                         packet.data.value_or("parser error"),
                         "malformed payload");
      return false;
    }
    lifecycle_.onPacket(packet);
    return true;
  });
}

void PollingTransport::onClose() {
  if (writable_) {
    // Release the pending poll
    send({Packet::control(PacketType::Noop, true)});
  }
  lifecycle_.onClose();
}

void PollingTransport::send(std::vector<Packet> packets) {
  if (!writable_) {
    DUPLEX_LOG(Error, "send while not writable, dropping {} packets",
               packets.size());
    return;
  }
  writable_ = false;

  if (pending_close_) {
    DUPLEX_LOG(Debug, "appending close packet to payload");
    packets.push_back(Packet::control(PacketType::Close, true));
    CloseCallback on_close = std::move(*pending_close_);
    pending_close_.reset();
    if (on_close) {
      on_close();
    }
  }

  bool compress = std::any_of(packets.begin(), packets.end(),
                              [](const Packet& p) { return p.options.compress; });
  bool closing = std::any_of(packets.begin(), packets.end(), [](const Packet& p) {
    return p.type == PacketType::Close;
  });

  codec_->encodePayload(packets, supports_binary_,
                        [this, compress, closing](Payload payload) {
                          write(std::move(payload), compress, closing);
                        });
}

void PollingTransport::write(Payload payload, bool compress, bool closing) {
  DUPLEX_LOG(Debug, "writing {} byte {} payload", payload.length(),
             payload.binary ? "binary" : "text");

  std::weak_ptr<bool> alive = alive_;
  uint64_t generation = poll_generation_;
  doWrite(std::move(payload), compress,
          [this, alive, generation, closing](const optional<Error>& error) {
            if (alive.expired() || generation != poll_generation_) {
              return;
            }
            if (error) {
              DUPLEX_LOG(Error, "poll response failed: {}", error->message);
            }
            releasePoll();
            if (closing && !error) {
              lifecycle_.onClose();
            }
          });
}

void PollingTransport::doWrite(Payload payload,
                               bool compress,
                               WriteCallback callback) {
  if (!poll_response_) {
    DUPLEX_LOG(Error, "no poll response bound, dropping payload");
    return;
  }

  http::HeaderMap headers;
  headers["Content-Type"] = payload.binary ? kBinaryContentType
                                           : kTextContentType;
  addLegacyIeHeader(*poll_request_, headers);

  auto encoding = compression::negotiateEncoding(
      payload.length(), compress, poll_request_->header("accept-encoding"),
      config_.http_compression);
  if (!encoding) {
    respond(payload.data, std::move(headers), callback);
    return;
  }

  DUPLEX_LOG(Debug, "compressing with {}",
             compression::contentEncodingToString(*encoding));

  // Completion is dropped when the binding it was started for is gone
  std::weak_ptr<bool> alive = alive_;
  uint64_t generation = poll_generation_;
  config::CompressorOptions options = config_.http_compression->compressor;
  dispatcher_.post([this, alive, generation, options,
                    encoding = *encoding, data = std::move(payload.data),
                    headers = std::move(headers), callback]() mutable {
    if (alive.expired()) {
      return;
    }
    if (generation != poll_generation_ || !poll_response_) {
      DUPLEX_LOG(Debug, "poll released before compression, dropping payload");
      return;
    }

    auto result = compression::compress(data, encoding, options);
    if (isError(result)) {
      const Error& error = get<Error>(result);
      DUPLEX_LOG(Error, "compression failed: {}", error.message);
      poll_response_->encodeHeaders(
          static_cast<int>(http::HttpStatusCode::InternalServerError), {},
          true);
      lifecycle_.onError(TransportErrorCode::CompressionFailure,
                         "compression failed", error.message);
      callback(error);
      return;
    }

    headers["Content-Encoding"] = compression::contentEncodingToString(encoding);
    respond(get<std::string>(result), std::move(headers), callback);
  });
}

void PollingTransport::respond(const std::string& body,
                               http::HeaderMap headers,
                               const WriteCallback& callback) {
  headers["Content-Length"] = std::to_string(body.size());
  lifecycle_.applyHeaders(*poll_request_, headers);

  poll_response_->encodeHeaders(static_cast<int>(http::HttpStatusCode::OK),
                                headers, false);
  OwnedBuffer buffer(body);
  poll_response_->encodeData(buffer, true);
  callback(nullopt);
}

void PollingTransport::close(CloseCallback on_complete) {
  lifecycle_.close(std::move(on_complete), [this](CloseCallback cb) {
    doClose(std::move(cb));
  });
}

void PollingTransport::doClose(CloseCallback on_complete) {
  DUPLEX_LOG(Debug, "closing");

  if (data_request_) {
    DUPLEX_LOG(Debug, "aborting ongoing data request");
    auto request = data_request_;
    releaseData();
    request->destroy();
  }

  if (writable_) {
    DUPLEX_LOG(Debug, "transport writable - closing right away");
    send({Packet::control(PacketType::Close, true)});
    if (on_complete) {
      on_complete();
    }
  } else {
    DUPLEX_LOG(Debug, "transport not writable - buffering orderly close");
    pending_close_ = std::move(on_complete);
  }
}

void PollingTransport::releasePoll() {
  if (poll_callbacks_) {
    poll_callbacks_->detach();
    // May be running on the stack; free it on a later iteration
    std::shared_ptr<PollRequestCallbacks> retired(std::move(poll_callbacks_));
    dispatcher_.post([retired]() {});
  }
  if (poll_request_) {
    poll_request_->setCallbacks(nullptr);
  }
  poll_request_.reset();
  poll_response_.reset();
  writable_ = false;
}

void PollingTransport::releaseData() {
  if (data_callbacks_) {
    data_callbacks_->detach();
    std::shared_ptr<DataRequestCallbacks> retired(std::move(data_callbacks_));
    dispatcher_.post([retired]() {});
  }
  if (data_request_) {
    data_request_->setCallbacks(nullptr);
  }
  data_request_.reset();
  data_response_.reset();
  body_.reset();
}

}  // namespace transport
}  // namespace duplex
