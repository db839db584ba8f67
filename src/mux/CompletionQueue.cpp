#include "CompletionQueue.hpp"

namespace fdmux {
CompletionQueue::CompletionQueue(int numDrainThreads)
    : drainPool(new ThreadPool(numDrainThreads)) {}

CompletionQueue::~CompletionQueue() {
  // ThreadPool joins its workers after running every queued drain
  drainPool.reset();
}

void CompletionQueue::open(const CommandKey& key) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = entries.find(key);
  if (it != entries.end()) {
    LOG(ERROR) << "Completion queue for " << key
               << " is already open, keeping its "
               << it->second.callbacks.size() << " pending callbacks";
    return;
  }
  entries[key] = Entry();
  VLOG(1) << "Opened completion queue for " << key;
}

bool CompletionQueue::pushIfOpen(const CommandKey& key, Callback* callback) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = entries.find(key);
  if (it == entries.end()) {
    return false;
  }
  it->second.callbacks.push_back(std::move(*callback));
  return true;
}

bool CompletionQueue::runOrDefer(const CommandKey& key, Callback callback) {
  if (pushIfOpen(key, &callback)) {
    return true;
  }
  callback();
  return false;
}

void CompletionQueue::close(const CommandKey& key) {
  {
    lock_guard<std::mutex> guard(registryMutex);
    auto it = entries.find(key);
    if (it == entries.end()) {
      VLOG(1) << "Tried to close completion queue for unknown key " << key;
      return;
    }
    if (it->second.closing) {
      return;
    }
    if (it->second.callbacks.empty()) {
      entries.erase(it);
      VLOG(1) << "Closed completion queue for " << key;
      return;
    }
    it->second.closing = true;
  }
  // Enqueued outside the registry lock so the pool cannot deadlock on it
  drainPool->enqueue([this, key]() { this->drain(key); });
}

CompletionQueue::Callback CompletionQueue::popFirst(const CommandKey& key) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = entries.find(key);
  if (it == entries.end()) {
    return Callback();
  }
  if (it->second.callbacks.empty()) {
    entries.erase(it);
    return Callback();
  }
  Callback callback = std::move(it->second.callbacks.front());
  it->second.callbacks.pop_front();
  return callback;
}

void CompletionQueue::drain(const CommandKey& key) {
  int count = 0;
  while (true) {
    Callback callback = popFirst(key);
    if (!callback) {
      break;
    }
    try {
      callback();
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Completion callback for " << key
                 << " threw: " << ex.what();
    }
    count++;
  }
  VLOG(1) << "Drained " << count << " completion callbacks for " << key;
}

bool CompletionQueue::isOpen(const CommandKey& key) {
  lock_guard<std::mutex> guard(registryMutex);
  return entries.find(key) != entries.end();
}

int CompletionQueue::numPending(const CommandKey& key) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = entries.find(key);
  if (it == entries.end()) {
    return 0;
  }
  return int(it->second.callbacks.size());
}
}  // namespace fdmux
