#ifndef __FDMUX_MULTIPLEXER__
#define __FDMUX_MULTIPLEXER__

#include "CommandKey.hpp"
#include "FdReader.hpp"
#include "FdWriter.hpp"
#include "Headers.hpp"
#include "MultiplexerConfig.hpp"
#include "PacketChannel.hpp"
#include "UnknownPacketReporter.hpp"
#include "WaitGroup.hpp"

namespace fdmux {
enum class MultiplexerPhase {
  CREATED = 0,
  STARTED = 1,
  RUNNING = 2,
  DRAINING = 3,
  CLOSED = 4
};

const char* multiplexerPhaseName(MultiplexerPhase phase);

/**
 * @brief Carries the descriptors of one command over a single packet channel.
 *
 * Readers turn local descriptors into outbound data packets, writers turn
 * inbound data packets into writes, and acks flow back to keep each
 * reader's window bounded.  One instance serves one CommandKey and can only
 * be started once.
 *
 * Writes to a pipe whose reader went away must fail with EPIPE rather than
 * kill the process, so SIGPIPE has to be ignored by the host process.
 */
class Multiplexer {
 public:
  Multiplexer(const CommandKey& _commandKey,
              shared_ptr<UnknownPacketReporter> _unknownPacketReporter =
                  shared_ptr<UnknownPacketReporter>(),
              const MultiplexerConfig& _config = MultiplexerConfig());
  /** @brief Closes everything and joins every loop thread. */
  ~Multiplexer();

  /** @brief Attaches the pty master used for window-size changes. */
  void setPtyFd(int ptyFd);
  /** @brief Attaches the process that is signalled on window-size changes. */
  void setCmdPid(pid_t cmdPid);

  /**
   * @brief Creates a pipe whose read end is drained by a reader for `fdNum`.
   * @return The write end, for the child.  It is closed by the multiplexer
   * once IO starts.
   */
  int makeReaderPipe(int fdNum);

  /**
   * @brief Creates a pipe whose write end is fed by a writer for `fdNum`.
   * @return The read end, for the child.  It is closed by the multiplexer
   * once IO starts.
   */
  int makeWriterPipe(int fdNum);

  /**
   * @brief Like makeWriterPipe(), but the writer is pre-seeded with `data`
   * followed by EOF.
   * @throws std::runtime_error if `data` does not fit the write buffer.
   */
  int makeStaticWriterPipe(int fdNum, const string& data);

  /** @brief Reads `fd` as descriptor `fdNum` without creating a pipe. */
  void makeRawFdReader(int fdNum, int fd, bool shouldClose, bool isPty);
  /** @brief Writes descriptor `fdNum` into `fd` without creating a pipe. */
  void makeRawFdWriter(int fdNum, int fd, bool shouldClose);

  /**
   * @brief Starts IO and optionally blocks until the chosen loops finish.
   *
   * Launches every reader and writer, then dispatches packets from `input`
   * until a CmdDonePacket arrives or `input` is exhausted.
   * @return The CmdDonePacket, if the dispatch loop has seen one.
   */
  shared_ptr<CmdDonePacket> runIOAndWait(shared_ptr<PacketSource> input,
                                         shared_ptr<PacketSink> sender,
                                         bool waitOnReaders,
                                         bool waitOnWriters,
                                         bool waitForInputLoop);

  /**
   * @brief Called once no more input will arrive: closes every reader and
   * marks every writer's stream as ended.
   */
  void handleInputDone();

  /**
   * @brief Closes every reader, writer, setup handle and the input source.
   * Idempotent.
   */
  void close();

  void sendDataPacket(int fdNum, const string& data, bool eof,
                      const string& error);
  void sendDataAckPacket(int fdNum, int64_t ackLen, const string& error);

  const MultiplexerConfig& getConfig() const { return config; }
  const CommandKey& getCommandKey() const { return commandKey; }
  MultiplexerPhase getPhase();
  bool isStarted();
  int numReaders();
  int numWriters();

  /** @brief Serializes the slot tables and counters into JSON. */
  string toJsonString();

 protected:
  std::recursive_mutex muxMutex;
  const CommandKey commandKey;
  const MultiplexerConfig config;
  shared_ptr<UnknownPacketReporter> unknownPacketReporter;

  map<int, shared_ptr<FdReader>> fdReaders;
  map<int, shared_ptr<FdWriter>> fdWriters;
  vector<int> closeAfterStart;
  int ptyFd;
  pid_t cmdPid;

  shared_ptr<PacketSource> input;
  shared_ptr<PacketSink> sender;
  MultiplexerPhase phase;
  shared_ptr<CmdDonePacket> donePacket;

  vector<std::thread> loopThreads;

  void startIO(shared_ptr<PacketSource> _input, shared_ptr<PacketSink> _sender);
  void closeTempStartFds();
  /** @param staticData If set, queued with EOF before IO starts. */
  int createWriterPipe(int fdNum, const string* staticData);
  void launchReaders(WaitGroup* wg);
  void launchWriters(WaitGroup* wg);
  void sendPacket(const Packet& packet);

  shared_ptr<CmdDonePacket> runPacketInputLoop();
  /** @return An error to report back as an ack, or "" if none. */
  string processDataPacket(const DataPacket& dataPacket);
  void processAckPacket(const DataAckPacket& ackPacket);
  void processSpecialInputPacket(const SpecialInputPacket& inputPacket);
};
}  // namespace fdmux

#endif  // __FDMUX_MULTIPLEXER__
