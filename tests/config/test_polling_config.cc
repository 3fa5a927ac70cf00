#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

#include "duplex/config/parse_error.h"
#include "duplex/config/polling_config.h"
#include "duplex/logging/logger_registry.h"

#include "../mocks/log_mocks.h"

namespace duplex {
namespace config {
namespace {

using duplex::test::CapturingSink;

class PollingConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& registry = logging::LoggerRegistry::instance();
    registry.reset();
    sink_ = std::make_shared<CapturingSink>();
    registry.setDefaultSink(sink_);

    char tmpl[] = "/tmp/duplex_config_XXXXXX";
    char* dir = mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    dir_ = dir;
  }

  void TearDown() override {
    for (const auto& path : files_) {
      std::remove(path.c_str());
    }
    rmdir(dir_.c_str());
    logging::LoggerRegistry::instance().reset();
  }

  std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = dir_ + "/" + name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    files_.push_back(path);
    return path;
  }

  // Runs fromJson and returns the field path of the raised error
  std::string failingField(const nlohmann::json& j) {
    try {
      PollingConfig::fromJson(j);
    } catch (const ConfigParseError& e) {
      return e.field();
    }
    ADD_FAILURE() << "no error for " << j.dump();
    return "";
  }

  std::shared_ptr<CapturingSink> sink_;
  std::string dir_;
  std::vector<std::string> files_;
};

TEST_F(PollingConfigTest, Defaults) {
  PollingConfig config;
  EXPECT_EQ(config.max_http_buffer_size, 100000000u);
  EXPECT_TRUE(config.supports_binary);
  ASSERT_TRUE(config.http_compression.has_value());
  EXPECT_EQ(config.http_compression->threshold, 1024u);
  EXPECT_EQ(config.http_compression->compressor.level, -1);
  EXPECT_EQ(config.http_compression->compressor.window_bits, 15);
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.logging.format, "default");
  EXPECT_TRUE(config.logging.file.empty());
}

TEST_F(PollingConfigTest, NullDocumentKeepsDefaults) {
  auto config = PollingConfig::fromJson(nullptr);
  EXPECT_EQ(config.max_http_buffer_size, 100000000u);
  EXPECT_TRUE(config.http_compression.has_value());
}

TEST_F(PollingConfigTest, ParsesAllFields) {
  auto j = nlohmann::json::parse(R"({
    "max_http_buffer_size": "10MB",
    "supports_binary": false,
    "http_compression": {
      "threshold": "2KB",
      "level": 6,
      "mem_level": 9,
      "window_bits": 12,
      "strategy": 1,
      "chunk_size": 4096
    },
    "logging": {"level": "DEBUG", "file": "/tmp/duplex.log", "format": "json"}
  })");

  auto config = PollingConfig::fromJson(j);
  EXPECT_EQ(config.max_http_buffer_size, 10u * 1024 * 1024);
  EXPECT_FALSE(config.supports_binary);
  ASSERT_TRUE(config.http_compression.has_value());
  EXPECT_EQ(config.http_compression->threshold, 2048u);
  const auto& opts = config.http_compression->compressor;
  EXPECT_EQ(opts.level, 6);
  EXPECT_EQ(opts.mem_level, 9);
  EXPECT_EQ(opts.window_bits, 12);
  EXPECT_EQ(opts.strategy, 1);
  EXPECT_EQ(opts.chunk_size, 4096u);
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.file, "/tmp/duplex.log");
  EXPECT_EQ(config.logging.format, "json");
}

TEST_F(PollingConfigTest, NumericBufferSize) {
  auto config =
      PollingConfig::fromJson(nlohmann::json::parse(R"({"max_http_buffer_size": 512})"));
  EXPECT_EQ(config.max_http_buffer_size, 512u);
}

TEST_F(PollingConfigTest, CompressionSwitches) {
  auto disabled =
      PollingConfig::fromJson(nlohmann::json::parse(R"({"http_compression": false})"));
  EXPECT_FALSE(disabled.http_compression.has_value());

  auto null_disabled =
      PollingConfig::fromJson(nlohmann::json::parse(R"({"http_compression": null})"));
  EXPECT_FALSE(null_disabled.http_compression.has_value());

  auto enabled =
      PollingConfig::fromJson(nlohmann::json::parse(R"({"http_compression": true})"));
  ASSERT_TRUE(enabled.http_compression.has_value());
  EXPECT_EQ(enabled.http_compression->threshold, 1024u);

  auto partial = PollingConfig::fromJson(
      nlohmann::json::parse(R"({"http_compression": {"threshold": 0}})"));
  ASSERT_TRUE(partial.http_compression.has_value());
  EXPECT_EQ(partial.http_compression->threshold, 0u);
  EXPECT_EQ(partial.http_compression->compressor.level, -1);
}

TEST_F(PollingConfigTest, RejectsOutOfRangeCompressorOptions) {
  EXPECT_EQ(failingField(nlohmann::json::parse(
                R"({"http_compression": {"level": 10}})")),
            "http_compression.level");
  EXPECT_EQ(failingField(nlohmann::json::parse(
                R"({"http_compression": {"mem_level": 0}})")),
            "http_compression.mem_level");
  EXPECT_EQ(failingField(nlohmann::json::parse(
                R"({"http_compression": {"window_bits": 16}})")),
            "http_compression.window_bits");
  EXPECT_EQ(failingField(nlohmann::json::parse(
                R"({"http_compression": {"strategy": 5}})")),
            "http_compression.strategy");
  EXPECT_EQ(failingField(nlohmann::json::parse(
                R"({"http_compression": {"chunk_size": 0}})")),
            "http_compression.chunk_size");
  EXPECT_EQ(failingField(nlohmann::json::parse(
                R"({"http_compression": {"level": "fast"}})")),
            "http_compression.level");
}

TEST_F(PollingConfigTest, RejectsBadTypes) {
  EXPECT_EQ(failingField(nlohmann::json::parse(R"({"supports_binary": "yes"})")),
            "supports_binary");
  EXPECT_EQ(failingField(nlohmann::json::parse(R"({"http_compression": 3})")),
            "http_compression");
  EXPECT_EQ(
      failingField(nlohmann::json::parse(R"({"max_http_buffer_size": "lots"})")),
      "max_http_buffer_size");
  EXPECT_EQ(failingField(nlohmann::json::parse(R"({"max_http_buffer_size": -1})")),
            "max_http_buffer_size");
  EXPECT_THROW(PollingConfig::fromJson(nlohmann::json::array()),
               ConfigParseError);
}

TEST_F(PollingConfigTest, RejectsBadLoggingSettings) {
  EXPECT_EQ(failingField(nlohmann::json::parse(R"({"logging": {"level": "loud"}})")),
            "logging.level");
  EXPECT_EQ(
      failingField(nlohmann::json::parse(R"({"logging": {"format": "xml"}})")),
      "logging.format");
  EXPECT_EQ(failingField(nlohmann::json::parse(R"({"logging": "verbose"})")),
            "logging");
}

TEST_F(PollingConfigTest, UnknownKeysAreWarnedAndIgnored) {
  auto config = PollingConfig::fromJson(
      nlohmann::json::parse(R"({"ping_interval": 25000, "supports_binary": false})"));
  EXPECT_FALSE(config.supports_binary);
  EXPECT_TRUE(sink_->hasMessage(logging::LogLevel::Warning, "ping_interval"));
}

TEST_F(PollingConfigTest, ToJsonRoundTrip) {
  PollingConfig config;
  config.max_http_buffer_size = 4096;
  config.http_compression->threshold = 10;
  config.http_compression->compressor.level = 1;
  config.logging.format = "json";

  auto parsed = PollingConfig::fromJson(config.toJson());
  EXPECT_EQ(parsed.max_http_buffer_size, 4096u);
  ASSERT_TRUE(parsed.http_compression.has_value());
  EXPECT_EQ(parsed.http_compression->threshold, 10u);
  EXPECT_EQ(parsed.http_compression->compressor.level, 1);
  EXPECT_EQ(parsed.logging.format, "json");

  config.http_compression = nullopt;
  EXPECT_EQ(config.toJson()["http_compression"], false);
  EXPECT_FALSE(PollingConfig::fromJson(config.toJson()).http_compression);
}

TEST_F(PollingConfigTest, YamlScalarTyping) {
  auto j = yamlToJson(
      "a: true\n"
      "b: 'true'\n"
      "c: 42\n"
      "d: -3\n"
      "e: 1.5\n"
      "f: 10MB\n"
      "g: \"7\"\n"
      "h:\n"
      "list: [1, two]\n");

  EXPECT_TRUE(j["a"].is_boolean());
  EXPECT_TRUE(j["b"].is_string());
  EXPECT_EQ(j["b"], "true");
  EXPECT_TRUE(j["c"].is_number_unsigned());
  EXPECT_EQ(j["c"], 42);
  EXPECT_TRUE(j["d"].is_number_integer());
  EXPECT_EQ(j["d"], -3);
  EXPECT_TRUE(j["e"].is_number_float());
  EXPECT_EQ(j["f"], "10MB");
  EXPECT_TRUE(j["g"].is_string());
  EXPECT_TRUE(j["h"].is_null());
  ASSERT_TRUE(j["list"].is_array());
  EXPECT_EQ(j["list"][1], "two");
}

TEST_F(PollingConfigTest, YamlSyntaxErrorCarriesLine) {
  try {
    yamlToJson("a: 1\nb: [unclosed\n", "bad.yaml");
    FAIL() << "expected a parse error";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), "bad.yaml");
    EXPECT_GT(e.line(), 0);
  }
}

TEST_F(PollingConfigTest, LoadYamlFile) {
  auto path = writeFile("duplex.yaml",
                        "max_http_buffer_size: 1MB\n"
                        "http_compression:\n"
                        "  threshold: 0\n"
                        "  level: 9\n"
                        "logging:\n"
                        "  level: warning\n");

  auto config = loadPollingConfig(path);
  EXPECT_EQ(config.max_http_buffer_size, 1024u * 1024);
  ASSERT_TRUE(config.http_compression.has_value());
  EXPECT_EQ(config.http_compression->threshold, 0u);
  EXPECT_EQ(config.http_compression->compressor.level, 9);
  EXPECT_EQ(config.logging.level, "warning");
}

TEST_F(PollingConfigTest, LoadJsonFile) {
  auto path = writeFile("duplex.json",
                        R"({"supports_binary": false, "http_compression": false})");

  auto config = loadPollingConfig(path);
  EXPECT_FALSE(config.supports_binary);
  EXPECT_FALSE(config.http_compression.has_value());
}

TEST_F(PollingConfigTest, LoadErrorsNameTheFile) {
  auto missing = dir_ + "/missing.yaml";
  try {
    loadPollingConfig(missing);
    FAIL() << "expected a parse error";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), missing);
  }

  auto broken = writeFile("broken.json", "{\"supports_binary\": ");
  EXPECT_THROW(loadPollingConfig(broken), ConfigParseError);

  auto bad_value = writeFile("bad.json", R"({"http_compression": {"level": 42}})");
  try {
    loadPollingConfig(bad_value);
    FAIL() << "expected a parse error";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), bad_value);
    EXPECT_EQ(e.field(), "http_compression.level");
  }
}

TEST_F(PollingConfigTest, ApplyLoggingConfigSetsGlobalLevel) {
  LoggingConfig logging;
  logging.level = "error";
  logging.file = dir_ + "/duplex.log";
  files_.push_back(logging.file);

  applyLoggingConfig(logging);

  auto& registry = logging::LoggerRegistry::instance();
  EXPECT_EQ(registry.getGlobalLevel(), logging::LogLevel::Error);
  ASSERT_NE(registry.getDefaultSink(), nullptr);
  EXPECT_EQ(registry.getDefaultSink()->type(), logging::SinkType::File);
}

}  // namespace
}  // namespace config
}  // namespace duplex
