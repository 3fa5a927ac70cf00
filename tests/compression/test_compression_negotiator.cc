#include <gtest/gtest.h>

#include "duplex/compression/compression_negotiator.h"

namespace duplex {
namespace compression {
namespace {

class CompressionNegotiatorTest : public ::testing::Test {
 protected:
  void SetUp() override { config_.threshold = 100; }

  config::HttpCompressionConfig config_;
};

TEST_F(CompressionNegotiatorTest, AboveThresholdUsesAcceptedCoding) {
  EXPECT_EQ(ContentEncoding::Gzip,
            negotiateEncoding(101, true, "gzip, deflate", config_));
  EXPECT_EQ(ContentEncoding::Deflate,
            negotiateEncoding(101, true, "deflate", config_));
}

TEST_F(CompressionNegotiatorTest, AtOrBelowThresholdIsPlain) {
  EXPECT_FALSE(negotiateEncoding(100, true, "gzip", config_).has_value());
  EXPECT_FALSE(negotiateEncoding(1, true, "gzip", config_).has_value());
}

TEST_F(CompressionNegotiatorTest, CompressFlagRequired) {
  EXPECT_FALSE(negotiateEncoding(5000, false, "gzip", config_).has_value());
}

TEST_F(CompressionNegotiatorTest, DisabledCompression) {
  EXPECT_FALSE(negotiateEncoding(5000, true, "gzip", nullopt).has_value());
}

TEST_F(CompressionNegotiatorTest, NoAcceptableCoding) {
  EXPECT_FALSE(negotiateEncoding(5000, true, "", config_).has_value());
  EXPECT_FALSE(negotiateEncoding(5000, true, "br", config_).has_value());
  EXPECT_FALSE(
      negotiateEncoding(5000, true, "gzip;q=0, deflate;q=0", config_)
          .has_value());
}

}  // namespace
}  // namespace compression
}  // namespace duplex
