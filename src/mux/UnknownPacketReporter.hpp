#ifndef __FDMUX_UNKNOWN_PACKET_REPORTER__
#define __FDMUX_UNKNOWN_PACKET_REPORTER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace fdmux {
/**
 * @brief Receives inbound packets the Multiplexer cannot dispatch.
 */
class UnknownPacketReporter {
 public:
  virtual ~UnknownPacketReporter() {}

  virtual void unknownPacket(const Packet& packet) = 0;
};

/** @brief Default reporter: logs and drops the packet. */
class LoggingUnknownPacketReporter : public UnknownPacketReporter {
 public:
  virtual void unknownPacket(const Packet& packet) {
    LOG(WARNING) << "Got unknown packet with header "
                 << int(packet.getHeader()) << " and "
                 << packet.getPayload().length() << " payload bytes";
  }
};
}  // namespace fdmux

#endif  // __FDMUX_UNKNOWN_PACKET_REPORTER__
