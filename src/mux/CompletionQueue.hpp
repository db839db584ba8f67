#ifndef __FDMUX_COMPLETION_QUEUE__
#define __FDMUX_COMPLETION_QUEUE__

#include "CommandKey.hpp"
#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Per-command registry of callbacks to run once the command is done.
 *
 * While a key is open, runOrDefer() queues the callback.  For an absent key
 * (never opened, or already closed and drained) the callback runs right away
 * on the calling thread.  close() hands any queued callbacks to a drain task
 * so the closer never runs them itself.
 */
class CompletionQueue {
 public:
  typedef std::function<void()> Callback;

  explicit CompletionQueue(int numDrainThreads = 4);
  /** @brief Waits for any in-progress drains to finish. */
  ~CompletionQueue();

  /**
   * @brief Starts tracking `key`.  Must be called before anyone may race to
   * register callbacks for it.
   */
  void open(const CommandKey& key);

  /**
   * @brief Queues `callback` if `key` is open, otherwise runs it now.
   * @return true if the callback was deferred.
   */
  bool runOrDefer(const CommandKey& key, Callback callback);

  /**
   * @brief Marks `key` as finished.  Queued callbacks run in registration
   * order on a drain thread, after which the key is forgotten.
   */
  void close(const CommandKey& key);

  bool isOpen(const CommandKey& key);
  int numPending(const CommandKey& key);

 protected:
  struct Entry {
    deque<Callback> callbacks;
    bool closing = false;
  };

  std::mutex registryMutex;
  unordered_map<CommandKey, Entry> entries;
  unique_ptr<ThreadPool> drainPool;

  bool pushIfOpen(const CommandKey& key, Callback* callback);
  /** @brief Pops the oldest callback, removing the entry once it is empty. */
  Callback popFirst(const CommandKey& key);
  void drain(const CommandKey& key);
};
}  // namespace fdmux

#endif  // __FDMUX_COMPLETION_QUEUE__
