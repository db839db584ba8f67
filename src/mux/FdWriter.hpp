#ifndef __FDMUX_FD_WRITER__
#define __FDMUX_FD_WRITER__

#include "Headers.hpp"
#include "WaitGroup.hpp"
#include "WriteBuffer.hpp"

namespace fdmux {
class Multiplexer;

/**
 * @brief Writes inbound data for one descriptor to its destination and acks
 * every byte once it has actually been written.
 *
 * A writer built with a negative fd is a closed placeholder: addData()
 * always fails on it.  An owned destination is switched to non-blocking mode;
 * a borrowed one is left alone, so close() cannot interrupt a write that
 * blocks on it.
 */
class FdWriter {
 public:
  FdWriter(Multiplexer* _mux, int _fd, int _fdNum, bool _shouldClose);
  ~FdWriter();

  /**
   * @brief Queues `data`; `eof` marks the end of the stream.
   * @throws std::runtime_error if the writer is closed, already saw EOF or
   * the queue would exceed its capacity.
   */
  void addData(const string& data, bool eof);

  /**
   * @brief Drains the queue into the destination until EOF, a write error or
   * close().  Sends a DataAckPacket after every successful write and one
   * carrying the error if a write fails.
   * @param wg Signalled when the loop exits, may be null.
   */
  void writeLoop(WaitGroup* wg);

  /** @brief Drops pending data, stops the loop and closes the fd if owned. */
  void close();

  int getFdNum() const { return fdNum; }
  bool isClosed();
  bool isEof();
  int64_t getTotalWritten();
  size_t getPendingBytes();

 protected:
  Multiplexer* mux;
  int fd;
  int fdNum;
  bool shouldClose;

  std::mutex writerMutex;
  std::condition_variable dataCv;
  WriteBuffer buffer;
  bool closed;
  bool eof;
  bool loopRunning;
  int64_t totalWritten;
  int wakeupRead;
  int wakeupWrite;

  void finishLoop(WaitGroup* wg);
  void closeFdLocked();
};
}  // namespace fdmux

#endif  // __FDMUX_FD_WRITER__
