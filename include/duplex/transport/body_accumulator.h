#ifndef DUPLEX_TRANSPORT_BODY_ACCUMULATOR_H
#define DUPLEX_TRANSPORT_BODY_ACCUMULATOR_H

#include <cstddef>
#include <string>
#include <utility>

#include "duplex/buffer.h"
#include "duplex/transport/payload_codec.h"

namespace duplex {
namespace transport {

/**
 * Collects the body of one data request. size() counts raw bytes in both
 * modes. A text body is handed over as UTF-8 with ill-formed sequences
 * replaced by U+FFFD; a binary body is passed through untouched.
 */
class BodyAccumulator {
 public:
  void reset(bool binary = false) {
    binary_ = binary;
    buffer_.drain(buffer_.length());
  }

  void append(const char* data, size_t length) { buffer_.add(data, length); }

  size_t size() const { return buffer_.length(); }

  bool binary() const { return binary_; }

  // Hands the collected body over as a payload and empties the accumulator
  Payload take() {
    std::string body = buffer_.toString();
    Payload payload{binary_ ? std::move(body) : sanitizeUtf8(body), binary_};
    buffer_.drain(buffer_.length());
    return payload;
  }

 private:
  OwnedBuffer buffer_;
  bool binary_{false};
};

}  // namespace transport
}  // namespace duplex

#endif  // DUPLEX_TRANSPORT_BODY_ACCUMULATOR_H
