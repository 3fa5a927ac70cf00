#ifndef DUPLEX_TRANSPORT_PACKET_H
#define DUPLEX_TRANSPORT_PACKET_H

#include <string>

#include "duplex/core/compat.h"

namespace duplex {
namespace transport {

// Engine.IO packet types. The numeric value is the wire id; Error never
// goes on the wire and only reports decode failures.
enum class PacketType {
  Open = 0,
  Close = 1,
  Ping = 2,
  Pong = 3,
  Message = 4,
  Upgrade = 5,
  Noop = 6,
  Error = 7
};

const char* packetTypeToString(PacketType type);

struct PacketOptions {
  bool compress{false};
};

struct Packet {
  PacketType type{PacketType::Noop};
  optional<std::string> data;
  bool binary{false};  // data holds raw bytes rather than UTF-8 text
  PacketOptions options;

  Packet() = default;
  explicit Packet(PacketType t) : type(t) {}

  static Packet control(PacketType type, bool compress = false) {
    Packet packet(type);
    packet.options.compress = compress;
    return packet;
  }

  static Packet text(PacketType type, std::string payload) {
    Packet packet(type);
    packet.data = std::move(payload);
    return packet;
  }

  static Packet bytes(PacketType type, std::string payload) {
    Packet packet(type);
    packet.data = std::move(payload);
    packet.binary = true;
    return packet;
  }

  bool operator==(const Packet& other) const {
    return type == other.type && data == other.data &&
           binary == other.binary;
  }
};

}  // namespace transport
}  // namespace duplex

#endif  // DUPLEX_TRANSPORT_PACKET_H
