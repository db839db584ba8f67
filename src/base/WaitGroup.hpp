#ifndef __FDMUX_WAIT_GROUP__
#define __FDMUX_WAIT_GROUP__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Counts outstanding tasks and lets a caller block until all of them
 * have called done().
 */
class WaitGroup {
 public:
  WaitGroup() : count(0) {}

  void add(int delta) {
    lock_guard<std::mutex> guard(countMutex);
    count += delta;
    if (count < 0) {
      STFATAL << "WaitGroup counter went negative";
    }
    if (count == 0) {
      countCv.notify_all();
    }
  }

  void done() { add(-1); }

  void wait() {
    unique_lock<std::mutex> guard(countMutex);
    countCv.wait(guard, [this] { return count == 0; });
  }

 protected:
  std::mutex countMutex;
  std::condition_variable countCv;
  int count;
};
}  // namespace fdmux

#endif  // __FDMUX_WAIT_GROUP__
