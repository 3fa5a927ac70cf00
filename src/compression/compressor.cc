#define DUPLEX_LOG_COMPONENT "compression.zlib"

#include "duplex/compression/compressor.h"

#include <zlib.h>

#include <vector>

#include "duplex/logging/log_macros.h"

namespace duplex {
namespace compression {

namespace {

// Adding 16 to windowBits selects the gzip wrapper
constexpr int kGzipWindowBitsOffset = 16;

std::string zlibMessage(const z_stream& stream, int rc) {
  if (stream.msg) {
    return stream.msg;
  }
  return "zlib error " + std::to_string(rc);
}

}  // namespace

const char* contentEncodingToString(ContentEncoding encoding) {
  switch (encoding) {
    case ContentEncoding::Gzip: return "gzip";
    case ContentEncoding::Deflate: return "deflate";
  }
  return "identity";
}

optional<ContentEncoding> contentEncodingFromString(const std::string& token) {
  if (token == "gzip") {
    return ContentEncoding::Gzip;
  }
  if (token == "deflate") {
    return ContentEncoding::Deflate;
  }
  return nullopt;
}

Result<std::string> compress(const std::string& input,
                             ContentEncoding encoding,
                             const config::CompressorOptions& options) {
  z_stream stream{};
  int window_bits = options.window_bits;
  if (encoding == ContentEncoding::Gzip) {
    window_bits += kGzipWindowBitsOffset;
  }

  int rc = deflateInit2(&stream, options.level, Z_DEFLATED, window_bits,
                        options.mem_level, options.strategy);
  if (rc != Z_OK) {
    std::string message = "deflateInit2 failed: " + zlibMessage(stream, rc);
    DUPLEX_LOG(Error, "{}", message);
    return makeError<std::string>(kErrorCompressionFailure, message);
  }

  const size_t chunk_size = options.chunk_size > 0 ? options.chunk_size : 16384;
  std::vector<unsigned char> chunk(chunk_size);
  std::string output;

  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());

  do {
    stream.next_out = chunk.data();
    stream.avail_out = static_cast<uInt>(chunk.size());
    rc = deflate(&stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      std::string message = "deflate failed: " + zlibMessage(stream, rc);
      deflateEnd(&stream);
      DUPLEX_LOG(Error, "{}", message);
      return makeError<std::string>(kErrorCompressionFailure, message);
    }
    output.append(reinterpret_cast<const char*>(chunk.data()),
                  chunk.size() - stream.avail_out);
  } while (rc != Z_STREAM_END);

  deflateEnd(&stream);

  DUPLEX_LOG(Debug, "{} compressed {} bytes to {}",
             contentEncodingToString(encoding), input.size(), output.size());
  return makeSuccess(std::move(output));
}

}  // namespace compression
}  // namespace duplex
