#pragma once

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "duplex/buffer.h"
#include "duplex/http/http_exchange.h"
#include "duplex/transport/transport.h"

namespace duplex {
namespace test {

// Request whose body and close events are driven by the test
class FakeHttpRequest : public http::HttpRequest {
 public:
  FakeHttpRequest(http::HttpMethod method,
                  const std::string& uri,
                  http::HeaderMap headers = {})
      : method_(method), uri_(uri) {
    for (const auto& header : headers) {
      headers_[http::toLowerCase(header.first)] = header.second;
    }
  }

  http::HttpMethod method() const override { return method_; }
  const std::string& uri() const override { return uri_; }
  const http::HeaderMap& headers() const override { return headers_; }

  void setCallbacks(http::RequestCallbacks* callbacks) override {
    callbacks_ = callbacks;
  }

  void destroy() override {
    destroyed_ = true;
    callbacks_ = nullptr;
  }

  void sendBody(const std::string& body) {
    if (callbacks_ && !body.empty()) {
      callbacks_->onData(body.data(), body.size());
    }
    if (callbacks_) {
      callbacks_->onEnd();
    }
  }

  void sendChunk(const std::string& chunk) {
    if (callbacks_) {
      callbacks_->onData(chunk.data(), chunk.size());
    }
  }

  void closeConnection() {
    if (callbacks_) {
      callbacks_->onClose();
    }
  }

  http::RequestCallbacks* callbacks() const { return callbacks_; }
  bool destroyed() const { return destroyed_; }

 private:
  http::HttpMethod method_;
  std::string uri_;
  http::HeaderMap headers_;
  http::RequestCallbacks* callbacks_{nullptr};
  bool destroyed_{false};
};

// Response that records everything written to it
class RecordingHttpResponse : public http::HttpResponse {
 public:
  void encodeHeaders(int status_code,
                     const http::HeaderMap& headers,
                     bool end_stream) override {
    ++header_writes_;
    status_code_ = status_code;
    headers_ = headers;
    if (end_stream) {
      ++completions_;
    }
  }

  void encodeData(Buffer& data, bool end_stream) override {
    body_ += data.toString();
    data.drain(data.length());
    if (end_stream) {
      ++completions_;
    }
  }

  int statusCode() const { return status_code_; }
  const http::HeaderMap& headers() const { return headers_; }
  const std::string& body() const { return body_; }
  int headerWrites() const { return header_writes_; }
  int completions() const { return completions_; }
  bool completed() const { return completions_ > 0; }

  std::string header(const std::string& name) const {
    auto it = headers_.find(name);
    return it == headers_.end() ? std::string() : it->second;
  }
  bool hasHeader(const std::string& name) const {
    return headers_.count(name) > 0;
  }

 private:
  int status_code_{0};
  http::HeaderMap headers_;
  std::string body_;
  int header_writes_{0};
  int completions_{0};
};

class MockTransportCallbacks : public transport::TransportCallbacks {
 public:
  MOCK_METHOD(void, onPacket, (const transport::Packet& packet), (override));
  MOCK_METHOD(void,
              onError,
              (const transport::TransportError& error),
              (override));
  MOCK_METHOD(void, onDrain, (), (override));
  MOCK_METHOD(void, onClose, (), (override));
  MOCK_METHOD(void,
              onHeaders,
              (const http::HttpRequest& request, http::HeaderMap& headers),
              (override));
};

}  // namespace test
}  // namespace duplex
