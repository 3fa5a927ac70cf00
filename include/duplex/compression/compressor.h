#ifndef DUPLEX_COMPRESSION_COMPRESSOR_H
#define DUPLEX_COMPRESSION_COMPRESSOR_H

#include <string>

#include "duplex/config/polling_config.h"
#include "duplex/core/compat.h"
#include "duplex/core/result.h"

namespace duplex {
namespace compression {

enum class ContentEncoding { Gzip, Deflate };

// Token used in Accept-Encoding / Content-Encoding
const char* contentEncodingToString(ContentEncoding encoding);

optional<ContentEncoding> contentEncodingFromString(const std::string& token);

/**
 * Compress |input| in one pass with zlib. gzip output carries the gzip
 * wrapper (magic 0x1f 0x8b), deflate output the zlib wrapper (RFC 1950).
 */
Result<std::string> compress(const std::string& input,
                             ContentEncoding encoding,
                             const config::CompressorOptions& options);

}  // namespace compression
}  // namespace duplex

#endif  // DUPLEX_COMPRESSION_COMPRESSOR_H
