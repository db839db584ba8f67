#ifndef __FDMUX_MUX_TEST_HELPERS__
#define __FDMUX_MUX_TEST_HELPERS__

#include "Multiplexer.hpp"
#include "MuxPackets.hpp"
#include "TestHeaders.hpp"

namespace fdmux {
const string TEST_SESSION_ID = "9a0c1e52-3b5f-4a8d-9c2e-7f6b1d0e4a31";
const string TEST_CMD_ID = "1f2e3d4c-5b6a-4789-8a9b-0c1d2e3f4a5b";

inline CommandKey testCommandKey() {
  return CommandKey::make(TEST_SESSION_ID, TEST_CMD_ID);
}

class RecordingUnknownPacketReporter : public UnknownPacketReporter {
 public:
  virtual void unknownPacket(const Packet& packet) {
    lock_guard<std::mutex> guard(packetMutex);
    packets.push_back(packet);
  }

  vector<Packet> getPackets() {
    lock_guard<std::mutex> guard(packetMutex);
    return packets;
  }

 protected:
  std::mutex packetMutex;
  vector<Packet> packets;
};

/**
 * Runs a Multiplexer on a background thread, feeding it from `inbound` and
 * collecting everything it sends in `outbound`.
 */
class MuxHarness {
 public:
  explicit MuxHarness(const MultiplexerConfig& config = MultiplexerConfig())
      : reporter(new RecordingUnknownPacketReporter()),
        mux(new Multiplexer(testCommandKey(), reporter, config)),
        inbound(new PacketQueue()),
        outbound(new PacketQueue()) {}

  ~MuxHarness() {
    inbound->close();
    join();
    mux.reset();
  }

  void start(bool waitOnReaders = true, bool waitOnWriters = true,
             bool waitForInputLoop = true) {
    runThread = std::thread(
        [this, waitOnReaders, waitOnWriters, waitForInputLoop]() {
          donePacket = mux->runIOAndWait(inbound, outbound, waitOnReaders,
                                         waitOnWriters, waitForInputLoop);
        });
  }

  void join() {
    if (runThread.joinable()) {
      runThread.join();
    }
  }

  void waitForPhase(MultiplexerPhase phase) {
    for (int a = 0; a < 500 && mux->getPhase() != phase; a++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(mux->getPhase() == phase);
  }

  /** Waits up to 5 seconds for the next outbound packet. */
  Packet nextOutbound() {
    Packet packet;
    REQUIRE(outbound->tryNext(&packet, std::chrono::seconds(5)));
    return packet;
  }

  void sendData(int fdNum, const string& data, bool eof) {
    inbound->sendPacket(
        MuxPackets::makeDataPacket(testCommandKey(), fdNum, data, eof));
  }

  void sendAck(int fdNum, int64_t ackLen) {
    inbound->sendPacket(
        MuxPackets::makeDataAckPacket(testCommandKey(), fdNum, ackLen));
  }

  shared_ptr<RecordingUnknownPacketReporter> reporter;
  shared_ptr<Multiplexer> mux;
  shared_ptr<PacketQueue> inbound;
  shared_ptr<PacketQueue> outbound;
  shared_ptr<CmdDonePacket> donePacket;
  std::thread runThread;
};

template <typename T>
inline T parsePacket(const Packet& packet, FdMuxPacketType type) {
  REQUIRE(packet.getHeader() == uint8_t(type));
  T t;
  REQUIRE(tryStringToProto(packet.getPayload(), &t));
  return t;
}

/** Reads `fd` until EOF or an error.  Safe to call off the test thread. */
inline string readUntilEof(int fd) {
  string result;
  char buf[4096];
  while (true) {
    ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (rc <= 0) {
      break;
    }
    result.append(buf, rc);
  }
  return result;
}

inline string makeTestPayload(size_t length) {
  string payload(length, '\0');
  for (size_t a = 0; a < length; a++) {
    payload[a] = char('a' + (a * 7 + a / 13) % 26);
  }
  return payload;
}
}  // namespace fdmux

#endif  // __FDMUX_MUX_TEST_HELPERS__
