#ifndef __FDMUX_WRITE_BUFFER__
#define __FDMUX_WRITE_BUFFER__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Bounded FIFO of bytes waiting to be written to a descriptor.
 *
 * Callers check `canAccept()` before enqueueing; a full buffer is the
 * backpressure signal handed back to whoever produced the data.
 */
class WriteBuffer {
 public:
  explicit WriteBuffer(size_t _capacity)
      : capacity(_capacity), totalBytes(0), writeOffset(0) {}

  /** @brief Returns true if `count` more bytes fit under the capacity. */
  bool canAccept(size_t count) const { return totalBytes + count <= capacity; }

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return totalBytes; }

  size_t getCapacity() const { return capacity; }

  void enqueue(const string &data) {
    if (data.empty()) return;
    pending.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Copies up to `maxCount` bytes from the front without consuming
   * them.  Never crosses a chunk boundary.
   */
  string peek(size_t maxCount) const {
    if (pending.empty()) {
      return string();
    }
    const string &front = pending.front();
    size_t count = std::min(maxCount, front.size() - writeOffset);
    return front.substr(writeOffset, count);
  }

  /**
   * @brief Removes bytesWritten from the front of the buffer.
   */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      string &front = pending.front();
      size_t available = front.size() - writeOffset;

      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t capacity;
  std::deque<string> pending;
  size_t totalBytes;
  size_t writeOffset;  // Offset into the front chunk for partial writes
};
}  // namespace fdmux

#endif  // __FDMUX_WRITE_BUFFER__
