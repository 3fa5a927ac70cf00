#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "duplex/core/compat.h"

namespace duplex {
namespace config {

// zlib deflateInit2 parameters
struct CompressorOptions {
  int level{-1};  // Z_DEFAULT_COMPRESSION
  int mem_level{8};
  int window_bits{15};
  int strategy{0};  // Z_DEFAULT_STRATEGY
  size_t chunk_size{16 * 1024};
};

struct HttpCompressionConfig {
  // Payloads of this many bytes or fewer are sent uncompressed
  size_t threshold{1024};
  CompressorOptions compressor;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;  // Empty: stderr
  std::string format{"default"};
};

/**
 * Settings for one polling transport.
 *
 * JSON / YAML layout:
 *   max_http_buffer_size: "10MB"      # or a byte count
 *   supports_binary: true
 *   http_compression:                 # or false to disable
 *     threshold: 1024
 *     level: 6
 *   logging:
 *     level: debug
 *     file: /var/log/duplex.log
 */
struct PollingConfig {
  size_t max_http_buffer_size{100000000};
  bool supports_binary{true};
  optional<HttpCompressionConfig> http_compression{HttpCompressionConfig{}};
  LoggingConfig logging;

  // Throws ConfigParseError naming the offending field
  static PollingConfig fromJson(const nlohmann::json& j,
                                const std::string& source_file = "");

  nlohmann::json toJson() const;
};

// Loads a .json, .yaml or .yml file. Throws ConfigParseError.
PollingConfig loadPollingConfig(const std::string& path);

// Converts a YAML document to JSON; scalars become bool, integer, float or
// string by content, quoted scalars always stay strings.
nlohmann::json yamlToJson(const std::string& content,
                          const std::string& source_file = "");

// Points the logger registry at the configured level, sink and format
void applyLoggingConfig(const LoggingConfig& logging);

}  // namespace config
}  // namespace duplex
