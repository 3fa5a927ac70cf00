#ifndef DUPLEX_TRANSPORT_PAYLOAD_CODEC_H
#define DUPLEX_TRANSPORT_PAYLOAD_CODEC_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "duplex/transport/packet.h"

namespace duplex {
namespace transport {

// One serialized batch of packets, opaque to the transport
struct Payload {
  std::string data;
  bool binary{false};

  size_t length() const { return data.size(); }
};

// Receives each decoded packet; return false to stop decoding
using PacketCallback =
    std::function<bool(const Packet& packet, size_t index, size_t total)>;

using EncodeCallback = std::function<void(Payload payload)>;

class PayloadCodec {
 public:
  virtual ~PayloadCodec() = default;

  /**
   * Encode |packets| into a single payload. Binary framing is used only when
   * |supports_binary| is set and at least one packet carries bytes.
   */
  virtual void encodePayload(const std::vector<Packet>& packets,
                             bool supports_binary,
                             const EncodeCallback& on_encoded) = 0;

  /**
   * Decode |payload| and hand each packet to |on_packet|. Malformed input
   * yields a single Error packet with data "parser error".
   */
  virtual void decodePayload(const Payload& payload,
                             const PacketCallback& on_packet) = 0;
};

using PayloadCodecSharedPtr = std::shared_ptr<PayloadCodec>;

// Engine.IO protocol revision 3 framing
class EngineIoPayloadCodec : public PayloadCodec {
 public:
  void encodePayload(const std::vector<Packet>& packets,
                     bool supports_binary,
                     const EncodeCallback& on_encoded) override;

  void decodePayload(const Payload& payload,
                     const PacketCallback& on_packet) override;

  // "<type digit><data>", or "b<type digit><base64>" for byte data
  static std::string encodePacketAsText(const Packet& packet);

  // Error packet on failure
  static Packet decodeTextPacket(const std::string& encoded);

 private:
  static Payload encodeAsText(const std::vector<Packet>& packets);
  static Payload encodeAsBinary(const std::vector<Packet>& packets);
  static void decodeText(const std::string& data,
                         const PacketCallback& on_packet);
  static void decodeBinary(const std::string& data,
                           const PacketCallback& on_packet);
};

PayloadCodecSharedPtr createEngineIoPayloadCodec();

// Standard alphabet with '=' padding
std::string base64Encode(const std::string& input);
optional<std::string> base64Decode(const std::string& input);

// Length of |utf8| in UTF-16 code units, the unit of text payload prefixes
size_t utf16Length(const std::string& utf8);

// Replaces each ill-formed UTF-8 sequence with U+FFFD
std::string sanitizeUtf8(const std::string& input);

}  // namespace transport
}  // namespace duplex

#endif  // DUPLEX_TRANSPORT_PAYLOAD_CODEC_H
