#include "CompletionQueue.hpp"

#include "MuxTestHelpers.hpp"

using namespace fdmux;

namespace {
void waitUntilClosed(CompletionQueue* queue, const CommandKey& key) {
  for (int a = 0; a < 500 && queue->isOpen(key); a++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE_FALSE(queue->isOpen(key));
}
}  // namespace

TEST_CASE("Callbacks wait for close and then run in order",
          "[CompletionQueue]") {
  CompletionQueue queue;
  CommandKey key = testCommandKey();
  std::mutex orderMutex;
  vector<string> order;
  auto record = [&orderMutex, &order](const string& name) {
    return [&orderMutex, &order, name]() {
      lock_guard<std::mutex> guard(orderMutex);
      order.push_back(name);
    };
  };

  queue.open(key);
  REQUIRE(queue.runOrDefer(key, record("A")));
  REQUIRE(queue.runOrDefer(key, record("B")));
  REQUIRE(queue.numPending(key) == 2);
  {
    lock_guard<std::mutex> guard(orderMutex);
    REQUIRE(order.empty());
  }

  queue.close(key);
  waitUntilClosed(&queue, key);
  {
    lock_guard<std::mutex> guard(orderMutex);
    REQUIRE(order == vector<string>({"A", "B"}));
  }

  // Once drained the key is absent, so callbacks run on the caller
  REQUIRE_FALSE(queue.runOrDefer(key, record("C")));
  lock_guard<std::mutex> guard(orderMutex);
  REQUIRE(order == vector<string>({"A", "B", "C"}));
}

TEST_CASE("Absent keys run callbacks immediately", "[CompletionQueue]") {
  CompletionQueue queue;
  CommandKey key = CommandKey::generate(TEST_SESSION_ID);
  std::thread::id ranOn;
  REQUIRE_FALSE(queue.runOrDefer(
      key, [&ranOn]() { ranOn = std::this_thread::get_id(); }));
  REQUIRE(ranOn == std::this_thread::get_id());
  REQUIRE_FALSE(queue.isOpen(key));
  REQUIRE(queue.numPending(key) == 0);

  // Closing an unknown key is harmless
  queue.close(key);
}

TEST_CASE("Closing an empty key forgets it at once", "[CompletionQueue]") {
  CompletionQueue queue;
  CommandKey key = testCommandKey();
  queue.open(key);
  REQUIRE(queue.isOpen(key));
  queue.close(key);
  REQUIRE_FALSE(queue.isOpen(key));
}

TEST_CASE("Reopening an open key keeps its callbacks", "[CompletionQueue]") {
  CompletionQueue queue;
  CommandKey key = testCommandKey();
  std::atomic<int> runs(0);
  queue.open(key);
  queue.runOrDefer(key, [&runs]() { runs++; });
  queue.open(key);
  REQUIRE(queue.numPending(key) == 1);
  queue.close(key);
  waitUntilClosed(&queue, key);
  REQUIRE(runs == 1);
}

TEST_CASE("A throwing callback does not stop the drain", "[CompletionQueue]") {
  CompletionQueue queue;
  CommandKey key = testCommandKey();
  std::atomic<int> runs(0);
  queue.open(key);
  queue.runOrDefer(key, []() { throw std::runtime_error("boom"); });
  queue.runOrDefer(key, [&runs]() { runs++; });
  queue.close(key);
  waitUntilClosed(&queue, key);
  REQUIRE(runs == 1);
}

TEST_CASE("Every callback runs exactly once when racing with close",
          "[CompletionQueue]") {
  for (int iteration = 0; iteration < 20; iteration++) {
    std::atomic<int> runs(0);
    std::atomic<int> deferred(0);
    {
      CompletionQueue queue;
      CommandKey key = CommandKey::generate(TEST_SESSION_ID);
      queue.open(key);
      vector<std::thread> threads;
      for (int t = 0; t < 4; t++) {
        threads.emplace_back([&queue, &key, &runs, &deferred]() {
          for (int a = 0; a < 100; a++) {
            if (queue.runOrDefer(key, [&runs]() { runs++; })) {
              deferred++;
            }
          }
        });
      }
      std::this_thread::sleep_for(std::chrono::microseconds(200));
      queue.close(key);
      for (auto& it : threads) {
        it.join();
      }
      waitUntilClosed(&queue, key);
    }
    REQUIRE(runs == 400);
  }
}
