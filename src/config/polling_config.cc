#define DUPLEX_LOG_COMPONENT "config.polling"

#include "duplex/config/polling_config.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "duplex/config/parse_error.h"
#include "duplex/config/units.h"
#include "duplex/logging/log_level.h"
#include "duplex/logging/log_macros.h"
#include "duplex/logging/log_sink.h"

namespace duplex {
namespace config {

namespace {

constexpr size_t MAX_FILE_SIZE_BYTES = 20 * 1024 * 1024;

size_t parseSizeField(const nlohmann::json& j,
                      const std::string& field,
                      ParseContext& ctx) {
  ParseContext::FieldScope scope(ctx, field);
  auto parsed = Size::parse(j.at(field));
  if (!parsed.first) {
    throw ctx.createError("expected a byte count or a size such as '10MB'");
  }
  return parsed.second;
}

int parseIntField(const nlohmann::json& j,
                  const std::string& field,
                  int min_value,
                  int max_value,
                  ParseContext& ctx) {
  ParseContext::FieldScope scope(ctx, field);
  const auto& value = j.at(field);
  if (!value.is_number_integer()) {
    throw ctx.createError("expected an integer");
  }
  int64_t raw = value.get<int64_t>();
  if (raw < min_value || raw > max_value) {
    throw ctx.createError("value " + std::to_string(raw) +
                          " out of range [" + std::to_string(min_value) +
                          ", " + std::to_string(max_value) + "]");
  }
  return static_cast<int>(raw);
}

std::string parseStringField(const nlohmann::json& j,
                             const std::string& field,
                             ParseContext& ctx) {
  ParseContext::FieldScope scope(ctx, field);
  const auto& value = j.at(field);
  if (!value.is_string()) {
    throw ctx.createError("expected a string");
  }
  return value.get<std::string>();
}

HttpCompressionConfig parseCompression(const nlohmann::json& j,
                                       ParseContext& ctx) {
  HttpCompressionConfig result;
  if (!j.is_object()) {
    throw ctx.createError("expected an object or a boolean");
  }

  if (j.contains("threshold")) {
    result.threshold = parseSizeField(j, "threshold", ctx);
  }
  auto& opts = result.compressor;
  if (j.contains("level")) {
    opts.level = parseIntField(j, "level", -1, 9, ctx);
  }
  if (j.contains("mem_level")) {
    opts.mem_level = parseIntField(j, "mem_level", 1, 9, ctx);
  }
  if (j.contains("window_bits")) {
    opts.window_bits = parseIntField(j, "window_bits", 9, 15, ctx);
  }
  if (j.contains("strategy")) {
    opts.strategy = parseIntField(j, "strategy", 0, 4, ctx);
  }
  if (j.contains("chunk_size")) {
    opts.chunk_size = parseSizeField(j, "chunk_size", ctx);
    if (opts.chunk_size == 0) {
      ParseContext::FieldScope scope(ctx, "chunk_size");
      throw ctx.createError("must be greater than zero");
    }
  }
  return result;
}

LoggingConfig parseLogging(const nlohmann::json& j, ParseContext& ctx) {
  LoggingConfig result;
  if (!j.is_object()) {
    throw ctx.createError("expected an object");
  }
  if (j.contains("level")) {
    result.level = parseStringField(j, "level", ctx);
    std::transform(result.level.begin(), result.level.end(),
                   result.level.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    logging::LogLevel parsed;
    if (!logging::parseLogLevel(result.level, parsed)) {
      ParseContext::FieldScope scope(ctx, "level");
      throw ctx.createError("unknown log level '" + result.level + "'");
    }
  }
  if (j.contains("file")) {
    result.file = parseStringField(j, "file", ctx);
  }
  if (j.contains("format")) {
    result.format = parseStringField(j, "format", ctx);
    if (result.format != "default" && result.format != "json") {
      ParseContext::FieldScope scope(ctx, "format");
      throw ctx.createError("expected 'default' or 'json'");
    }
  }
  return result;
}

nlohmann::json convertYamlNode(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Scalar: {
      const std::string& scalar = node.Scalar();
      // Quoted scalars carry the non-specific tag "!"
      if (node.Tag() == "!") {
        return scalar;
      }
      if (scalar == "true" || scalar == "True" || scalar == "TRUE") {
        return true;
      }
      if (scalar == "false" || scalar == "False" || scalar == "FALSE") {
        return false;
      }
      static const std::regex integer("^-?[0-9]{1,18}$");
      static const std::regex floating("^-?[0-9]+\\.[0-9]+([eE][-+]?[0-9]+)?$");
      if (std::regex_match(scalar, integer)) {
        int64_t value = std::stoll(scalar);
        if (value >= 0) {
          return static_cast<uint64_t>(value);
        }
        return value;
      }
      if (std::regex_match(scalar, floating)) {
        return std::stod(scalar);
      }
      return scalar;
    }
    case YAML::NodeType::Sequence: {
      auto result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(convertYamlNode(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.as<std::string>()] = convertYamlNode(pair.second);
      }
      return result;
    }
  }
  return nullptr;
}

bool hasSuffix(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

PollingConfig PollingConfig::fromJson(const nlohmann::json& j,
                                      const std::string& source_file) {
  ParseContext ctx(source_file);
  PollingConfig result;

  if (j.is_null()) {
    return result;
  }
  if (!j.is_object()) {
    throw ctx.createError("top level must be an object");
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    if (key == "max_http_buffer_size") {
      result.max_http_buffer_size = parseSizeField(j, key, ctx);
    } else if (key == "supports_binary") {
      ParseContext::FieldScope scope(ctx, key);
      if (!it.value().is_boolean()) {
        throw ctx.createError("expected a boolean");
      }
      result.supports_binary = it.value().get<bool>();
    } else if (key == "http_compression") {
      ParseContext::FieldScope scope(ctx, key);
      if (it.value().is_boolean()) {
        if (it.value().get<bool>()) {
          result.http_compression = HttpCompressionConfig{};
        } else {
          result.http_compression = nullopt;
        }
      } else if (it.value().is_null()) {
        result.http_compression = nullopt;
      } else {
        result.http_compression = parseCompression(it.value(), ctx);
      }
    } else if (key == "logging") {
      ParseContext::FieldScope scope(ctx, key);
      result.logging = parseLogging(it.value(), ctx);
    } else {
      DUPLEX_LOG(Warning, "Ignoring unknown configuration field '{}'", key);
    }
  }

  DUPLEX_LOG(Debug,
             "Parsed polling config: max_http_buffer_size={} "
             "supports_binary={} compression={}",
             result.max_http_buffer_size, result.supports_binary,
             result.http_compression ? "enabled" : "disabled");
  return result;
}

nlohmann::json PollingConfig::toJson() const {
  nlohmann::json j;
  j["max_http_buffer_size"] = max_http_buffer_size;
  j["supports_binary"] = supports_binary;
  if (http_compression) {
    const auto& opts = http_compression->compressor;
    j["http_compression"] = {{"threshold", http_compression->threshold},
                             {"level", opts.level},
                             {"mem_level", opts.mem_level},
                             {"window_bits", opts.window_bits},
                             {"strategy", opts.strategy},
                             {"chunk_size", opts.chunk_size}};
  } else {
    j["http_compression"] = false;
  }
  j["logging"] = {{"level", logging.level},
                  {"file", logging.file},
                  {"format", logging.format}};
  return j;
}

nlohmann::json yamlToJson(const std::string& content,
                          const std::string& source_file) {
  try {
    return convertYamlNode(YAML::Load(content));
  } catch (const YAML::ParserException& e) {
    throw ConfigParseError("YAML parse error: " + e.msg, "", source_file,
                           e.mark.line + 1);
  }
}

PollingConfig loadPollingConfig(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw ConfigParseError("cannot open file", "", path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (content.size() > MAX_FILE_SIZE_BYTES) {
    throw ConfigParseError("file exceeds " +
                               Size::toString(MAX_FILE_SIZE_BYTES),
                           "", path);
  }

  DUPLEX_LOG(Info, "Loading polling config from {}", path);

  nlohmann::json j;
  if (hasSuffix(path, ".yaml") || hasSuffix(path, ".yml")) {
    j = yamlToJson(content, path);
  } else {
    try {
      j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigParseError(std::string("JSON parse error: ") + e.what(), "",
                             path);
    }
  }

  return PollingConfig::fromJson(j, path);
}

void applyLoggingConfig(const LoggingConfig& logging) {
  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink;
  if (logging.file.empty()) {
    sink = logging::SinkFactory::createStdioSink();
  } else {
    sink = logging::SinkFactory::createFileSink(logging.file);
  }
  sink->setFormatter(logging::createFormatter(logging.format));

  registry.setDefaultSink(sink);
  registry.setGlobalLevel(logging::stringToLogLevel(logging.level));
}

}  // namespace config
}  // namespace duplex
