#ifndef __FDMUX_RAW_FD_UTILS__
#define __FDMUX_RAW_FD_UTILS__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Blocking helpers around POSIX descriptors (pipes, ptys, sockets).
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the descriptor, retrying on EAGAIN.
   * @throws std::runtime_error if the descriptor fails or closes.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads exactly `count` bytes from the descriptor.
   * @return false if the descriptor hit end-of-file before any byte was read.
   * @throws std::runtime_error on a read error or a short read.
   */
  static bool readAll(int fd, char* buf, size_t count);

  /**
   * @brief Creates an OS pipe.
   * @return {read end, write end}
   * @throws std::runtime_error if the pipe could not be created.
   */
  static pair<int, int> createPipe();

  /**
   * @brief Sets O_NONBLOCK on the descriptor.
   * @throws std::runtime_error if the flags cannot be changed.
   */
  static void setNonBlocking(int fd);

  /** @brief Closes `*fd` if it is open and resets it to -1. */
  static void closeFd(int* fd);

  /**
   * @brief Blocks until `fd` is ready (readable, or writable if `forWrite`)
   * or `wakeupFd` becomes readable.
   * @return true if `fd` is ready, false if the wait was interrupted through
   * `wakeupFd`.
   */
  static bool waitOnFdOrWakeup(int fd, int wakeupFd, bool forWrite);
};
}  // namespace fdmux
#endif  // __FDMUX_RAW_FD_UTILS__
