#define DUPLEX_LOG_COMPONENT "codec.engineio"

#include "duplex/transport/payload_codec.h"

#include <algorithm>
#include <cstring>

#include "duplex/logging/log_macros.h"

namespace duplex {
namespace transport {

namespace {

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr unsigned char kStringMarker = 0;
constexpr unsigned char kBinaryMarker = 1;
constexpr unsigned char kLengthTerminator = 0xFF;

// Longest length prefix accepted while decoding
constexpr size_t kMaxLengthDigits = 19;

Packet parserError() { return Packet::text(PacketType::Error, "parser error"); }

// Bytes in the UTF-8 sequence introduced by |lead|; stray continuation
// bytes stand alone
size_t sequenceWidth(unsigned char lead) {
  if (lead < 0xC0) {
    return 1;
  }
  if (lead < 0xE0) {
    return 2;
  }
  return lead < 0xF0 ? 3 : 4;
}

// Byte offset reached after |units| UTF-16 code units starting at |pos|,
// or npos if the data runs out or the count ends inside a surrogate pair
size_t advanceUtf16(const std::string& data, size_t pos, size_t units) {
  size_t end = pos;
  while (units > 0) {
    if (end >= data.size()) {
      return std::string::npos;
    }
    size_t width = sequenceWidth(static_cast<unsigned char>(data[end]));
    size_t cost = width == 4 ? 2 : 1;
    if (cost > units) {
      return std::string::npos;
    }
    end += width;
    units -= cost;
  }
  return end <= data.size() ? end : std::string::npos;
}

bool isWireType(int id) {
  return id >= static_cast<int>(PacketType::Open) &&
         id <= static_cast<int>(PacketType::Noop);
}

}  // namespace

const char* packetTypeToString(PacketType type) {
  switch (type) {
    case PacketType::Open: return "open";
    case PacketType::Close: return "close";
    case PacketType::Ping: return "ping";
    case PacketType::Pong: return "pong";
    case PacketType::Message: return "message";
    case PacketType::Upgrade: return "upgrade";
    case PacketType::Noop: return "noop";
    case PacketType::Error: return "error";
  }
  return "unknown";
}

std::string base64Encode(const std::string& input) {
  std::string encoded;
  encoded.reserve(((input.size() + 2) / 3) * 4);

  unsigned int val = 0;
  int valb = -6;
  for (unsigned char c : input) {
    val = ((val << 8) | c) & 0xFFFFFF;
    valb += 8;
    while (valb >= 0) {
      encoded.push_back(kBase64Chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    encoded.push_back(kBase64Chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (encoded.size() % 4 != 0) {
    encoded.push_back('=');
  }
  return encoded;
}

optional<std::string> base64Decode(const std::string& input) {
  if (input.size() % 4 != 0) {
    return nullopt;
  }

  std::string decoded;
  decoded.reserve(input.size() / 4 * 3);

  unsigned int val = 0;
  int valb = -8;
  size_t padding = 0;
  for (unsigned char c : input) {
    if (c == '=') {
      ++padding;
      continue;
    }
    // Data after padding
    if (padding > 0) {
      return nullopt;
    }
    const char* pos = std::strchr(kBase64Chars, c);
    if (!pos || c == '\0') {
      return nullopt;
    }
    val = ((val << 6) | static_cast<unsigned int>(pos - kBase64Chars)) &
          0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  if (padding > 2) {
    return nullopt;
  }
  return decoded;
}

size_t utf16Length(const std::string& utf8) {
  size_t units = 0;
  size_t pos = 0;
  while (pos < utf8.size()) {
    size_t width = sequenceWidth(static_cast<unsigned char>(utf8[pos]));
    units += width == 4 ? 2 : 1;
    pos += width;
  }
  return units;
}

std::string sanitizeUtf8(const std::string& input) {
  static const char kReplacement[] = "\xEF\xBF\xBD";

  std::string output;
  output.reserve(input.size());
  size_t pos = 0;
  while (pos < input.size()) {
    unsigned char lead = static_cast<unsigned char>(input[pos]);
    if (lead < 0x80) {
      output.push_back(input[pos++]);
      continue;
    }

    // Allowed range of the first continuation byte excludes overlong
    // forms, surrogates and code points above U+10FFFF
    size_t needed = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      needed = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      needed = 2;
      low = lead == 0xE0 ? 0xA0 : 0x80;
      high = lead == 0xED ? 0x9F : 0xBF;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      needed = 3;
      low = lead == 0xF0 ? 0x90 : 0x80;
      high = lead == 0xF4 ? 0x8F : 0xBF;
    } else {
      output += kReplacement;
      ++pos;
      continue;
    }

    size_t end = pos + 1;
    size_t seen = 0;
    while (seen < needed && end < input.size()) {
      unsigned char c = static_cast<unsigned char>(input[end]);
      if (c < low || c > high) {
        break;
      }
      low = 0x80;
      high = 0xBF;
      ++end;
      ++seen;
    }

    if (seen == needed) {
      output.append(input, pos, end - pos);
    } else {
      output += kReplacement;
    }
    pos = end;
  }
  return output;
}

std::string EngineIoPayloadCodec::encodePacketAsText(const Packet& packet) {
  std::string encoded;
  if (packet.binary && packet.data) {
    encoded.push_back('b');
    encoded.push_back(static_cast<char>('0' + static_cast<int>(packet.type)));
    encoded += base64Encode(*packet.data);
    return encoded;
  }

  encoded.push_back(static_cast<char>('0' + static_cast<int>(packet.type)));
  if (packet.data) {
    encoded += *packet.data;
  }
  return encoded;
}

Packet EngineIoPayloadCodec::decodeTextPacket(const std::string& encoded) {
  if (encoded.empty()) {
    return parserError();
  }

  if (encoded[0] == 'b') {
    if (encoded.size() < 2 || !isWireType(encoded[1] - '0')) {
      return parserError();
    }
    auto bytes = base64Decode(encoded.substr(2));
    if (!bytes) {
      return parserError();
    }
    return Packet::bytes(static_cast<PacketType>(encoded[1] - '0'),
                         std::move(*bytes));
  }

  int id = encoded[0] - '0';
  if (!isWireType(id)) {
    return parserError();
  }

  Packet packet(static_cast<PacketType>(id));
  if (encoded.size() > 1) {
    packet.data = encoded.substr(1);
  }
  return packet;
}

void EngineIoPayloadCodec::encodePayload(const std::vector<Packet>& packets,
                                         bool supports_binary,
                                         const EncodeCallback& on_encoded) {
  bool has_binary =
      std::any_of(packets.begin(), packets.end(),
                  [](const Packet& p) { return p.binary && p.data; });

  if (packets.empty()) {
    on_encoded(Payload{"0:", false});
    return;
  }

  if (supports_binary && has_binary) {
    on_encoded(encodeAsBinary(packets));
    return;
  }
  on_encoded(encodeAsText(packets));
}

Payload EngineIoPayloadCodec::encodeAsText(const std::vector<Packet>& packets) {
  Payload payload;
  for (const auto& packet : packets) {
    std::string encoded = encodePacketAsText(packet);
    payload.data += std::to_string(utf16Length(encoded));
    payload.data.push_back(':');
    payload.data += encoded;
  }
  return payload;
}

Payload EngineIoPayloadCodec::encodeAsBinary(
    const std::vector<Packet>& packets) {
  Payload payload;
  payload.binary = true;

  for (const auto& packet : packets) {
    std::string encoded;
    unsigned char marker = kStringMarker;
    if (packet.binary && packet.data) {
      marker = kBinaryMarker;
      encoded.push_back(static_cast<char>(packet.type));
      encoded += *packet.data;
    } else {
      encoded = encodePacketAsText(packet);
    }

    // Counted in bytes here, unlike text framing
    payload.data.push_back(static_cast<char>(marker));
    for (char digit : std::to_string(encoded.size())) {
      payload.data.push_back(static_cast<char>(digit - '0'));
    }
    payload.data.push_back(static_cast<char>(kLengthTerminator));
    payload.data += encoded;
  }
  return payload;
}

void EngineIoPayloadCodec::decodePayload(const Payload& payload,
                                         const PacketCallback& on_packet) {
  if (payload.binary) {
    decodeBinary(payload.data, on_packet);
  } else {
    decodeText(payload.data, on_packet);
  }
}

void EngineIoPayloadCodec::decodeText(const std::string& data,
                                      const PacketCallback& on_packet) {
  if (data.empty()) {
    DUPLEX_LOG(Debug, "empty text payload");
    on_packet(parserError(), 0, 1);
    return;
  }

  std::string length;
  for (size_t i = 0; i < data.size(); ++i) {
    char c = data[i];
    if (c != ':') {
      if (c < '0' || c > '9' || length.size() >= kMaxLengthDigits) {
        DUPLEX_LOG(Debug, "invalid length prefix at offset {}", i);
        on_packet(parserError(), 0, 1);
        return;
      }
      length.push_back(c);
      continue;
    }

    if (length.empty()) {
      on_packet(parserError(), 0, 1);
      return;
    }

    // Lengths count UTF-16 code units of the packet, not bytes
    size_t units = std::stoull(length);
    size_t start = i + 1;
    size_t end = advanceUtf16(data, start, units);
    if (end == std::string::npos) {
      DUPLEX_LOG(Debug, "packet length {} overruns payload", units);
      on_packet(parserError(), 0, 1);
      return;
    }

    if (end > start) {
      Packet packet = decodeTextPacket(data.substr(start, end - start));
      if (packet.type == PacketType::Error) {
        on_packet(packet, 0, 1);
        return;
      }
      if (!on_packet(packet, end - 1, data.size())) {
        return;
      }
    }

    i = end - 1;
    length.clear();
  }

  if (!length.empty()) {
    DUPLEX_LOG(Debug, "trailing length prefix without packet");
    on_packet(parserError(), 0, 1);
  }
}

void EngineIoPayloadCodec::decodeBinary(const std::string& data,
                                        const PacketCallback& on_packet) {
  std::vector<Packet> packets;
  size_t pos = 0;

  while (pos < data.size()) {
    unsigned char marker = static_cast<unsigned char>(data[pos++]);
    if (marker != kStringMarker && marker != kBinaryMarker) {
      on_packet(parserError(), 0, 1);
      return;
    }

    size_t length = 0;
    size_t digits = 0;
    bool terminated = false;
    while (pos < data.size()) {
      unsigned char b = static_cast<unsigned char>(data[pos++]);
      if (b == kLengthTerminator) {
        terminated = true;
        break;
      }
      if (b > 9 || ++digits > kMaxLengthDigits) {
        on_packet(parserError(), 0, 1);
        return;
      }
      length = length * 10 + b;
    }

    if (!terminated || digits == 0 || length > data.size() - pos) {
      on_packet(parserError(), 0, 1);
      return;
    }

    std::string body = data.substr(pos, length);
    pos += length;

    if (marker == kStringMarker) {
      Packet packet = decodeTextPacket(body);
      if (packet.type == PacketType::Error) {
        on_packet(packet, 0, 1);
        return;
      }
      packets.push_back(std::move(packet));
    } else {
      if (body.empty() ||
          !isWireType(static_cast<unsigned char>(body[0]))) {
        on_packet(parserError(), 0, 1);
        return;
      }
      packets.push_back(Packet::bytes(
          static_cast<PacketType>(static_cast<unsigned char>(body[0])),
          body.substr(1)));
    }
  }

  if (packets.empty()) {
    on_packet(parserError(), 0, 1);
    return;
  }

  for (size_t i = 0; i < packets.size(); ++i) {
    if (!on_packet(packets[i], i, packets.size())) {
      return;
    }
  }
}

PayloadCodecSharedPtr createEngineIoPayloadCodec() {
  return std::make_shared<EngineIoPayloadCodec>();
}

}  // namespace transport
}  // namespace duplex
