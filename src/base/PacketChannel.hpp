#ifndef __FDMUX_PACKET_CHANNEL__
#define __FDMUX_PACKET_CHANNEL__

#include "Headers.hpp"
#include "Packet.hpp"

namespace fdmux {
/**
 * @brief Sequential source of inbound packets.
 */
class PacketSource {
 public:
  virtual ~PacketSource() {}

  /**
   * @brief Blocks until the next packet is available.
   * @return false once the source is closed or exhausted.
   */
  virtual bool next(Packet* packet) = 0;

  /**
   * @brief Stops the source.  A blocked `next()` returns false.
   */
  virtual void close() = 0;
};

/**
 * @brief Thread-safe destination for outbound packets.
 */
class PacketSink {
 public:
  virtual ~PacketSink() {}

  /**
   * @throws std::runtime_error if the sink can no longer accept packets.
   */
  virtual void sendPacket(const Packet& packet) = 0;
};

/**
 * @brief Unbounded in-process packet channel.  Producers call sendPacket(),
 * the consumer calls next().
 */
class PacketQueue : public PacketSource, public PacketSink {
 public:
  PacketQueue() : closed(false) {}

  virtual void sendPacket(const Packet& packet);
  virtual bool next(Packet* packet);
  virtual void close();

  /**
   * @brief Like next(), but gives up after `timeout`.
   * @return false on timeout or when closed and empty.
   */
  bool tryNext(Packet* packet, std::chrono::milliseconds timeout);

  size_t size();
  bool isClosed();

 protected:
  std::mutex queueMutex;
  std::condition_variable queueCv;
  deque<Packet> packets;
  bool closed;
};

/**
 * @brief Reads length-prefixed packets from a descriptor.
 *
 * Each frame is a 4 byte big-endian length followed by Packet::serialize().
 */
class FdPacketReader : public PacketSource {
 public:
  /** @brief Frames larger than this are treated as corrupt. */
  static const int64_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

  FdPacketReader(int _fd, bool _shouldClose);
  virtual ~FdPacketReader();

  /**
   * @throws std::runtime_error on a truncated or oversized frame.
   */
  virtual bool next(Packet* packet);
  virtual void close();

 protected:
  std::mutex readerMutex;
  int fd;
  bool shouldClose;
  bool closed;
  int wakeupRead;
  int wakeupWrite;

  bool waitForData();
};

/**
 * @brief Writes length-prefixed packets to a descriptor.  Writes from
 * different threads never interleave.
 */
class FdPacketSender : public PacketSink {
 public:
  FdPacketSender(int _fd, bool _shouldClose);
  virtual ~FdPacketSender();

  virtual void sendPacket(const Packet& packet);

 protected:
  std::mutex senderMutex;
  int fd;
  bool shouldClose;
};
}  // namespace fdmux

#endif  // __FDMUX_PACKET_CHANNEL__
