/**
 * @file test_payload_codec.cc
 * @brief Engine.IO v3 payload framing: text and binary
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "duplex/transport/payload_codec.h"

namespace duplex {
namespace transport {
namespace {

class PayloadCodecTest : public ::testing::Test {
 protected:
  Payload encode(const std::vector<Packet>& packets, bool supports_binary) {
    Payload result;
    int calls = 0;
    codec_.encodePayload(packets, supports_binary, [&](Payload payload) {
      ++calls;
      result = std::move(payload);
    });
    EXPECT_EQ(1, calls);
    return result;
  }

  std::vector<Packet> decode(const Payload& payload) {
    std::vector<Packet> packets;
    codec_.decodePayload(payload, [&](const Packet& packet, size_t, size_t) {
      packets.push_back(packet);
      return true;
    });
    return packets;
  }

  static bool isParserError(const std::vector<Packet>& packets) {
    return packets.size() == 1 && packets[0].type == PacketType::Error &&
           packets[0].data == std::string("parser error");
  }

  static std::string binaryFrame(unsigned char marker,
                                 const std::string& body) {
    std::string frame;
    frame.push_back(static_cast<char>(marker));
    for (char digit : std::to_string(body.size())) {
      frame.push_back(static_cast<char>(digit - '0'));
    }
    frame.push_back('\xff');
    frame += body;
    return frame;
  }

  EngineIoPayloadCodec codec_;
};

TEST_F(PayloadCodecTest, EncodesTextPackets) {
  Payload payload = encode({Packet::text(PacketType::Message, "hello"),
                            Packet::control(PacketType::Ping)},
                           true);

  EXPECT_FALSE(payload.binary);
  EXPECT_EQ("6:4hello1:2", payload.data);
}

TEST_F(PayloadCodecTest, EmptyBatchEncodesAsZeroLength) {
  Payload payload = encode({}, true);
  EXPECT_EQ("0:", payload.data);
  EXPECT_TRUE(decode(payload).empty());
}

TEST_F(PayloadCodecTest, LengthCountsBytes) {
  // Two-byte UTF-8 character
  Payload payload = encode({Packet::text(PacketType::Message, "\xc3\xa9")},
                           true);
  EXPECT_EQ("3:4\xc3\xa9", payload.data);
}

TEST_F(PayloadCodecTest, BinaryPacketsWithoutBinarySupportUseBase64) {
  Payload payload =
      encode({Packet::bytes(PacketType::Message, std::string("\x00\x01", 2))},
             false);

  EXPECT_FALSE(payload.binary);
  EXPECT_EQ("6:b4AAE=", payload.data);

  auto packets = decode(payload);
  ASSERT_EQ(1u, packets.size());
  EXPECT_EQ(Packet::bytes(PacketType::Message, std::string("\x00\x01", 2)),
            packets[0]);
}

TEST_F(PayloadCodecTest, TextOnlyBatchStaysTextWithBinarySupport) {
  Payload payload = encode({Packet::text(PacketType::Message, "a")}, true);
  EXPECT_FALSE(payload.binary);
}

TEST_F(PayloadCodecTest, EncodesBinaryFraming) {
  Payload payload =
      encode({Packet::text(PacketType::Message, "hi"),
              Packet::bytes(PacketType::Message, std::string("\x07", 1))},
             true);

  ASSERT_TRUE(payload.binary);
  std::string expected = binaryFrame(0, "4hi") + binaryFrame(1, "\x04\x07");
  EXPECT_EQ(expected, payload.data);
}

TEST_F(PayloadCodecTest, RoundTripPreservesOrder) {
  std::vector<Packet> packets = {
      Packet::text(PacketType::Message, "first"),
      Packet::bytes(PacketType::Message, std::string("\x00\xff\x10", 3)),
      Packet::control(PacketType::Pong),
      Packet::text(PacketType::Message, "with:colon"),
  };

  EXPECT_EQ(packets, decode(encode(packets, true)));
  EXPECT_EQ(packets, decode(encode(packets, false)));
}

TEST_F(PayloadCodecTest, LongLengthPrefixInBinaryFraming) {
  std::string body(1234, 'x');
  Payload payload = encode(
      {Packet::text(PacketType::Message, body),
       Packet::bytes(PacketType::Message, "b")},
      true);

  auto packets = decode(payload);
  ASSERT_EQ(2u, packets.size());
  EXPECT_EQ(body, *packets[0].data);
}

TEST_F(PayloadCodecTest, StopsWhenCallbackReturnsFalse) {
  int seen = 0;
  codec_.decodePayload(Payload{"2:4a1:12:4b", false},
                       [&](const Packet& packet, size_t, size_t) {
                         ++seen;
                         return packet.type != PacketType::Close;
                       });
  EXPECT_EQ(2, seen);
}

TEST_F(PayloadCodecTest, MalformedTextPayloads) {
  EXPECT_TRUE(isParserError(decode(Payload{"", false})));
  EXPECT_TRUE(isParserError(decode(Payload{"abc", false})));
  EXPECT_TRUE(isParserError(decode(Payload{":4a", false})));
  EXPECT_TRUE(isParserError(decode(Payload{"9:4a", false})));
  EXPECT_TRUE(isParserError(decode(Payload{"2:9a", false})));
  EXPECT_TRUE(isParserError(decode(Payload{"4:b4!!", false})));
}

TEST_F(PayloadCodecTest, MalformedTextStopsAfterValidPrefix) {
  auto packets = decode(Payload{"2:4a2:x", false});
  ASSERT_EQ(2u, packets.size());
  EXPECT_EQ(PacketType::Message, packets[0].type);
  EXPECT_EQ(PacketType::Error, packets[1].type);

  // Dangling length after the last packet
  packets = decode(Payload{"2:4a3", false});
  ASSERT_EQ(2u, packets.size());
  EXPECT_EQ(PacketType::Error, packets[1].type);
}

TEST_F(PayloadCodecTest, MalformedBinaryPayloads) {
  EXPECT_TRUE(isParserError(decode(Payload{"", true})));
  EXPECT_TRUE(isParserError(decode(Payload{std::string("\x02\x01\xff" "4", 4),
                                           true})));
  EXPECT_TRUE(
      isParserError(decode(Payload{std::string("\x00\x05\xff" "4a", 5), true})));
  EXPECT_TRUE(isParserError(decode(Payload{std::string("\x00\x02", 2), true})));
  EXPECT_TRUE(isParserError(decode(Payload{std::string("\x01\x01\xff\x09", 4),
                                           true})));
}

TEST_F(PayloadCodecTest, MalformedBinaryDispatchesNothingElse) {
  std::string data = binaryFrame(0, "4ok") + std::string("\x05", 1);
  EXPECT_TRUE(isParserError(decode(Payload{data, true})));
}

TEST(PacketTextTest, EncodeAndDecodeSinglePacket) {
  EXPECT_EQ("4hello", EngineIoPayloadCodec::encodePacketAsText(
                          Packet::text(PacketType::Message, "hello")));
  EXPECT_EQ("6", EngineIoPayloadCodec::encodePacketAsText(
                     Packet::control(PacketType::Noop)));

  Packet close = EngineIoPayloadCodec::decodeTextPacket("1");
  EXPECT_EQ(PacketType::Close, close.type);
  EXPECT_FALSE(close.data.has_value());

  EXPECT_EQ(PacketType::Error,
            EngineIoPayloadCodec::decodeTextPacket("7").type);
  EXPECT_EQ(PacketType::Error,
            EngineIoPayloadCodec::decodeTextPacket("").type);
}

TEST(Base64Test, KnownVectors) {
  EXPECT_EQ("", base64Encode(""));
  EXPECT_EQ("Zg==", base64Encode("f"));
  EXPECT_EQ("Zm8=", base64Encode("fo"));
  EXPECT_EQ("Zm9v", base64Encode("foo"));
  EXPECT_EQ("Zm9vYmFy", base64Encode("foobar"));

  EXPECT_EQ("foobar", base64Decode("Zm9vYmFy"));
  EXPECT_EQ("fo", base64Decode("Zm8="));
}

TEST(Base64Test, RejectsInvalidInput) {
  EXPECT_FALSE(base64Decode("Zm9").has_value());
  EXPECT_FALSE(base64Decode("Zm9*").has_value());
  EXPECT_FALSE(base64Decode("Z===").has_value());
  EXPECT_FALSE(base64Decode("Zg=a").has_value());
}

TEST_F(PayloadCodecTest, TextLengthsCountUtf16Units) {
  // "4héllo" is six characters but seven bytes
  Payload accented = encode({Packet::text(PacketType::Message, "h\xc3\xa9llo")},
                            false);
  EXPECT_EQ("6:4h\xc3\xa9llo", accented.data);

  // U+1F600 takes a surrogate pair
  Payload emoji = encode({Packet::text(PacketType::Message, "\xf0\x9f\x98\x80!")},
                         false);
  EXPECT_EQ("4:4\xf0\x9f\x98\x80!", emoji.data);
}

TEST_F(PayloadCodecTest, DecodesNonAsciiTextPayload) {
  auto packets = decode(Payload{"6:4h\xc3\xa9llo4:4\xf0\x9f\x98\x80!1:6", false});

  ASSERT_EQ(3u, packets.size());
  EXPECT_EQ(PacketType::Message, packets[0].type);
  EXPECT_EQ(std::string("h\xc3\xa9llo"), *packets[0].data);
  EXPECT_EQ(std::string("\xf0\x9f\x98\x80!"), *packets[1].data);
  EXPECT_EQ(PacketType::Noop, packets[2].type);
}

TEST_F(PayloadCodecTest, LengthSplittingSurrogatePairIsParserError) {
  EXPECT_TRUE(isParserError(decode(Payload{"2:4\xf0\x9f\x98\x80", false})));
  EXPECT_TRUE(isParserError(decode(Payload{"7:4h\xc3\xa9llo", false})));
}

TEST_F(PayloadCodecTest, BinaryFramingCountsStringBytes) {
  Payload payload = encode({Packet::text(PacketType::Message, "h\xc3\xa9"),
                            Packet::bytes(PacketType::Message, "\x01")},
                           true);

  ASSERT_TRUE(payload.binary);
  EXPECT_EQ(0, payload.data.compare(0, 7, binaryFrame(0, "4h\xc3\xa9")));

  auto packets = decode(payload);
  ASSERT_EQ(2u, packets.size());
  EXPECT_EQ(std::string("h\xc3\xa9"), *packets[0].data);
}

TEST(Utf8Test, Utf16Length) {
  EXPECT_EQ(0u, utf16Length(""));
  EXPECT_EQ(5u, utf16Length("h\xc3\xa9llo"));
  EXPECT_EQ(3u, utf16Length("\xe2\x82\xac\xf0\x9f\x98\x80"));
}

TEST(Utf8Test, SanitizeReplacesIllFormedSequences) {
  const std::string replacement = "\xef\xbf\xbd";

  EXPECT_EQ("h\xc3\xa9llo", sanitizeUtf8("h\xc3\xa9llo"));
  EXPECT_EQ("a" + replacement + "b", sanitizeUtf8("a\xff" "b"));
  // Truncated sequence followed by ASCII
  EXPECT_EQ(replacement + "x", sanitizeUtf8("\xe2\x82x"));
  // Overlong encoding of '/'
  EXPECT_EQ(replacement + replacement, sanitizeUtf8("\xc0\xaf"));
  // UTF-16 surrogate encoded directly
  EXPECT_EQ(replacement + replacement + replacement,
            sanitizeUtf8("\xed\xa0\x80"));
}

}  // namespace
}  // namespace transport
}  // namespace duplex
