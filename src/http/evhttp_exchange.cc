#define DUPLEX_LOG_COMPONENT "http.evhttp"

#include "duplex/http/evhttp_exchange.h"

#include <sys/socket.h>

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>

#include <algorithm>
#include <cerrno>

#include "duplex/buffer.h"
#include "duplex/logging/log_macros.h"

namespace duplex {
namespace http {

namespace {

HttpMethod methodFromCommand(evhttp_cmd_type command) {
  switch (command) {
    case EVHTTP_REQ_GET:
      return HttpMethod::GET;
    case EVHTTP_REQ_POST:
      return HttpMethod::POST;
    case EVHTTP_REQ_HEAD:
      return HttpMethod::HEAD;
    case EVHTTP_REQ_PUT:
      return HttpMethod::PUT;
    case EVHTTP_REQ_DELETE:
      return HttpMethod::DELETE;
    case EVHTTP_REQ_OPTIONS:
      return HttpMethod::OPTIONS;
    case EVHTTP_REQ_TRACE:
      return HttpMethod::TRACE;
    case EVHTTP_REQ_CONNECT:
      return HttpMethod::CONNECT;
    case EVHTTP_REQ_PATCH:
      return HttpMethod::PATCH;
  }
  return HttpMethod::UNKNOWN;
}

struct EvBufferDeleter {
  void operator()(evbuffer* buffer) const { evbuffer_free(buffer); }
};

}  // namespace

EvHttpExchange::EvHttpExchange(evhttp_request* request) : request_(request) {
  method_ = methodFromCommand(evhttp_request_get_command(request_));
  const char* uri = evhttp_request_get_uri(request_);
  uri_ = uri ? uri : "";

  evkeyvalq* input_headers = evhttp_request_get_input_headers(request_);
  for (evkeyval* header = input_headers->tqh_first; header != nullptr;
       header = header->next.tqe_next) {
    std::string name = toLowerCase(header->key);
    auto it = headers_.find(name);
    if (it == headers_.end()) {
      headers_.emplace(std::move(name), header->value);
    } else {
      it->second.append(", ").append(header->value);
    }
  }

  evbuffer* input = evhttp_request_get_input_buffer(request_);
  size_t length = evbuffer_get_length(input);
  if (length > 0) {
    body_.resize(length);
    evbuffer_copyout(input, &body_[0], length);
  }

  connection_ = evhttp_request_get_connection(request_);
  if (connection_) {
    evhttp_connection_set_closecb(connection_, &EvHttpExchange::onConnectionClose,
                                  this);
  }

  DUPLEX_LOG(Debug, "{} {} ({} byte body)", methodToString(method_), uri_,
             body_.size());
}

EvHttpExchange::~EvHttpExchange() {
  if (request_) {
    DUPLEX_LOG(Debug, "exchange released without a reply: {}", uri_);
  }
  detachConnection();
}

void EvHttpExchange::setCallbacks(RequestCallbacks* callbacks) {
  callbacks_ = callbacks;
  if (callbacks_ && body_ready_ && !body_delivered_) {
    replayBody();
  }
}

void EvHttpExchange::deliverBody() {
  body_ready_ = true;
  if (callbacks_ && !body_delivered_) {
    replayBody();
  }
}

void EvHttpExchange::replayBody() {
  body_delivered_ = true;

  size_t offset = 0;
  while (offset < body_.size()) {
    if (!callbacks_) {
      return;
    }
    size_t length = std::min(kBodyChunkSize, body_.size() - offset);
    callbacks_->onData(body_.data() + offset, length);
    offset += length;
  }
  if (callbacks_) {
    callbacks_->onEnd();
  }
}

void EvHttpExchange::destroy() {
  callbacks_ = nullptr;
  if (!connection_) {
    return;
  }

  bufferevent* bev = evhttp_connection_get_bufferevent(connection_);
  evutil_socket_t fd = bev ? bufferevent_getfd(bev) : -1;
  DUPLEX_LOG(Debug, "aborting connection for {} (fd {})", uri_, fd);
  detachConnection();
  request_ = nullptr;
  if (fd >= 0 && ::shutdown(fd, SHUT_RDWR) != 0) {
    DUPLEX_LOG(Warning, "shutdown of fd {} failed: errno {}", fd, errno);
  }
}

void EvHttpExchange::encodeHeaders(int status_code,
                                   const HeaderMap& headers,
                                   bool end_stream) {
  if (!request_) {
    DUPLEX_LOG(Debug, "response headers for {} dropped: connection gone", uri_);
    return;
  }

  status_code_ = status_code;
  evkeyvalq* output_headers = evhttp_request_get_output_headers(request_);
  for (const auto& header : headers) {
    evhttp_remove_header(output_headers, header.first.c_str());
    evhttp_add_header(output_headers, header.first.c_str(),
                      header.second.c_str());
  }

  if (end_stream) {
    sendReply();
  }
}

void EvHttpExchange::encodeData(Buffer& data, bool end_stream) {
  if (!request_) {
    DUPLEX_LOG(Debug, "response body for {} dropped: connection gone", uri_);
    data.drain(data.length());
    return;
  }

  reply_body_ += data.toString();
  data.drain(data.length());

  if (end_stream) {
    sendReply();
  }
}

void EvHttpExchange::sendReply() {
  std::unique_ptr<evbuffer, EvBufferDeleter> body(evbuffer_new());
  if (!body) {
    DUPLEX_LOG(Error, "evbuffer_new failed, replying without body");
  } else if (!reply_body_.empty() &&
             evbuffer_add(body.get(), reply_body_.data(), reply_body_.size()) !=
                 0) {
    DUPLEX_LOG(Error, "failed to copy {} byte reply body", reply_body_.size());
  }

  DUPLEX_LOG(Debug, "reply {} for {} ({} bytes)", status_code_, uri_,
             reply_body_.size());

  // Completion may free the connection; stop listening for its close first
  detachConnection();
  evhttp_request* request = request_;
  request_ = nullptr;
  evhttp_send_reply(request, status_code_, nullptr, body.get());
  reply_body_.clear();
}

void EvHttpExchange::detachConnection() {
  if (connection_) {
    evhttp_connection_set_closecb(connection_, nullptr, nullptr);
    connection_ = nullptr;
  }
}

void EvHttpExchange::onConnectionClose(evhttp_connection*, void* arg) {
  auto* exchange = static_cast<EvHttpExchange*>(arg);
  DUPLEX_LOG(Debug, "connection closed before reply for {}", exchange->uri_);

  // libevent frees the request right after this callback
  exchange->connection_ = nullptr;
  exchange->request_ = nullptr;

  RequestCallbacks* callbacks = exchange->callbacks_;
  exchange->callbacks_ = nullptr;
  if (callbacks) {
    callbacks->onClose();
  }
}

}  // namespace http
}  // namespace duplex
