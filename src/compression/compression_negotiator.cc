#include "duplex/compression/compression_negotiator.h"

#include <vector>

#include "duplex/http/accept_encoding.h"

namespace duplex {
namespace compression {

optional<ContentEncoding> negotiateEncoding(
    size_t payload_length,
    bool compress,
    const std::string& accept_encoding,
    const optional<config::HttpCompressionConfig>& config) {
  if (!config || !compress) {
    return nullopt;
  }
  if (payload_length <= config->threshold) {
    return nullopt;
  }

  static const std::vector<std::string> kSupported = {"gzip", "deflate"};
  auto selected = http::selectEncoding(accept_encoding, kSupported);
  if (!selected) {
    return nullopt;
  }
  return contentEncodingFromString(*selected);
}

}  // namespace compression
}  // namespace duplex
