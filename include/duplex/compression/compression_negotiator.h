#ifndef DUPLEX_COMPRESSION_COMPRESSION_NEGOTIATOR_H
#define DUPLEX_COMPRESSION_COMPRESSION_NEGOTIATOR_H

#include <cstddef>
#include <string>

#include "duplex/compression/compressor.h"
#include "duplex/config/polling_config.h"
#include "duplex/core/compat.h"

namespace duplex {
namespace compression {

/**
 * Decide how to encode an outgoing payload of |payload_length| bytes.
 *
 * Returns nullopt (send uncompressed) when compression is not configured,
 * not requested by any packet, the payload is at or below the threshold,
 * or the client accepts neither gzip nor deflate. gzip wins ties.
 */
optional<ContentEncoding> negotiateEncoding(
    size_t payload_length,
    bool compress,
    const std::string& accept_encoding,
    const optional<config::HttpCompressionConfig>& config);

}  // namespace compression
}  // namespace duplex

#endif  // DUPLEX_COMPRESSION_COMPRESSION_NEGOTIATOR_H
