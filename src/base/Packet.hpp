#ifndef __FDMUX_PACKET_H__
#define __FDMUX_PACKET_H__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief A typed message on the packet channel: one header byte naming the
 * message type and an opaque payload (normally a serialized protobuf).
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Cannot parse an empty packet");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  int64_t length() const { return HEADER_SIZE + payload.length(); }

  /**
   * @brief Serializes the header byte and payload into the wire format.
   */
  string serialize() const {
    string s(1, char(header));
    s.append(payload);
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace fdmux

#endif  // __FDMUX_PACKET_H__
