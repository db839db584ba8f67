#ifndef __FDMUX_FD_READER__
#define __FDMUX_FD_READER__

#include "Headers.hpp"
#include "WaitGroup.hpp"

namespace fdmux {
class Multiplexer;

/**
 * @brief Reads one source descriptor and emits its bytes as data packets,
 * never letting more than the configured window go unacknowledged.
 */
class FdReader {
 public:
  /**
   * @param _mux Owner, used to send packets and look up the config.
   * @param _fd Source descriptor.
   * @param _fdNum Descriptor number the remote side knows this stream by.
   * @param _shouldClose Close `_fd` when the reader finishes.
   * @param _isPty `_fd` is a pty master; EIO means the slave hung up (EOF).
   */
  FdReader(Multiplexer* _mux, int _fd, int _fdNum, bool _shouldClose,
           bool _isPty);
  ~FdReader();

  /**
   * @brief Runs until EOF, a read error or close().  Sends exactly one
   * terminal packet (EOF or error) unless stopped by close().
   * @param wg Signalled when the loop exits, may be null.
   */
  void readLoop(WaitGroup* wg);

  /** @brief Returns `ackLen` bytes to the window and wakes the loop. */
  void notifyAck(int64_t ackLen);

  /**
   * @brief Stops the loop without sending anything further and closes the
   * source if owned.
   */
  void close();

  int getFdNum() const { return fdNum; }
  bool isPty() const { return pty; }
  int64_t getBytesInFlight();
  int64_t getTotalRead();
  bool isClosed();

 protected:
  Multiplexer* mux;
  int fd;
  int fdNum;
  bool shouldClose;
  bool pty;

  std::mutex readerMutex;
  std::condition_variable windowCv;
  bool closed;
  bool loopRunning;
  int64_t bytesInFlight;
  int64_t totalRead;
  int64_t maxInFlight;
  int wakeupRead;
  int wakeupWrite;

  /**
   * @brief Blocks until `count` more bytes fit in the window and claims them.
   * @return false if the reader was closed while waiting.
   */
  bool waitForWindow(int64_t count);
  bool sendChunks(const char* buf, int64_t count);
  void finishLoop(WaitGroup* wg);
  void closeFdLocked();
};
}  // namespace fdmux

#endif  // __FDMUX_FD_READER__
