#ifndef __FDMUX_MUX_PACKETS__
#define __FDMUX_MUX_PACKETS__

#include "CommandKey.hpp"
#include "Headers.hpp"
#include "Packet.hpp"

namespace fdmux {
/**
 * @brief Builds and decodes the typed packets exchanged by a Multiplexer.
 */
class MuxPackets {
 public:
  static Packet makeDataPacket(const CommandKey& ck, int fdNum,
                               const string& data, bool eof,
                               const string& error = "");
  static Packet makeDataAckPacket(const CommandKey& ck, int fdNum,
                                  int64_t ackLen, const string& error = "");
  static Packet makeSpecialInputPacket(const CommandKey& ck, int rows,
                                       int cols);
  static Packet makeCmdDonePacket(const CommandKey& ck, int exitCode,
                                  int64_t durationMs);

  template <typename T>
  static Packet protoToPacket(FdMuxPacketType type, const T& t) {
    return Packet(uint8_t(type), protoToString(t));
  }

  /**
   * @brief Decodes the base64 payload of a data packet.
   * @throws std::runtime_error if `data64` is not valid base64.
   */
  static string decodeData(const DataPacket& dataPacket);

  /** @brief One-line description of a packet for debug logs. */
  static string packetToString(const Packet& packet);

  /** @brief Checks the base64 alphabet, padding and length. */
  static bool isValidBase64(const string& s);
};
}  // namespace fdmux

#endif  // __FDMUX_MUX_PACKETS__
