/**
 * @file test_parse_error.cc
 * @brief Unit tests for configuration error diagnostics
 */

#include <gtest/gtest.h>

#include "duplex/config/parse_error.h"

using namespace duplex::config;

class ParseErrorTest : public ::testing::Test {};

TEST_F(ParseErrorTest, ConfigParseErrorBasic) {
  ConfigParseError err("Something went wrong");
  std::string msg = err.what();
  EXPECT_NE(msg.find("Something went wrong"), std::string::npos);
  EXPECT_EQ(err.message(), "Something went wrong");
  EXPECT_TRUE(err.field().empty());
  EXPECT_EQ(err.line(), -1);
}

TEST_F(ParseErrorTest, ConfigParseErrorWithField) {
  ConfigParseError err("Invalid value", "http_compression.level");
  std::string msg = err.what();
  EXPECT_NE(msg.find("field 'http_compression.level'"), std::string::npos);
  EXPECT_NE(msg.find("Invalid value"), std::string::npos);
}

TEST_F(ParseErrorTest, ConfigParseErrorWithFile) {
  ConfigParseError err("File not found", "", "/etc/duplex.yaml", 42);
  std::string msg = err.what();
  EXPECT_NE(msg.find("/etc/duplex.yaml:42"), std::string::npos);
  EXPECT_EQ(err.file(), "/etc/duplex.yaml");
  EXPECT_EQ(err.line(), 42);
}

TEST_F(ParseErrorTest, ParseContextPathTracking) {
  ParseContext ctx;
  EXPECT_EQ(ctx.getCurrentPath(), "");

  ctx.pushField("http_compression");
  EXPECT_EQ(ctx.getCurrentPath(), "http_compression");

  ctx.pushField("threshold");
  EXPECT_EQ(ctx.getCurrentPath(), "http_compression.threshold");

  ctx.popField();
  ctx.popField();
  EXPECT_EQ(ctx.getCurrentPath(), "");

  // Popping an empty path is harmless
  ctx.popField();
  EXPECT_EQ(ctx.getCurrentPath(), "");
}

TEST_F(ParseErrorTest, ParseContextFieldScope) {
  ParseContext ctx;

  {
    ParseContext::FieldScope scope1(ctx, "logging");
    EXPECT_EQ(ctx.getCurrentPath(), "logging");

    {
      ParseContext::FieldScope scope2(ctx, "format");
      EXPECT_EQ(ctx.getCurrentPath(), "logging.format");
    }

    EXPECT_EQ(ctx.getCurrentPath(), "logging");
  }

  EXPECT_EQ(ctx.getCurrentPath(), "");
}

TEST_F(ParseErrorTest, ParseContextCreateError) {
  ParseContext ctx("duplex.yaml");
  ParseContext::FieldScope scope(ctx, "max_http_buffer_size");

  auto err = ctx.createError("expected a size");

  EXPECT_EQ(err.field(), "max_http_buffer_size");
  EXPECT_EQ(err.file(), "duplex.yaml");
  std::string msg = err.what();
  EXPECT_NE(msg.find("duplex.yaml"), std::string::npos);
  EXPECT_NE(msg.find("expected a size"), std::string::npos);
}
