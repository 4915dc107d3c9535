#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include "utils/serial_queue.hpp"
#include "test_utils.hpp"

using namespace webimg::utils;

TEST(SerialQueueTest, RunsInSubmissionOrder) {
  SerialQueue queue("test.order");
  std::vector<int> order;
  std::mutex mutex;

  for (int i = 0; i < 100; ++i) {
    queue.post([&, i]() {
      std::lock_guard<std::mutex> lock(mutex);
      order.push_back(i);
    });
  }
  queue.sync([]() {});

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

TEST(SerialQueueTest, NeverRunsTwoItemsAtOnce) {
  SerialQueue queue("test.exclusive");
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&]() {
      for (int i = 0; i < 25; ++i) {
        queue.post([&]() {
          int now = ++active;
          int seen = max_active.load();
          while (now > seen && !max_active.compare_exchange_weak(seen, now)) {}
          std::this_thread::sleep_for(std::chrono::microseconds(50));
          --active;
        });
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  queue.sync([]() {});
  EXPECT_EQ(max_active.load(), 1);
}

TEST(SerialQueueTest, SyncReturnsValue) {
  SerialQueue queue("test.sync");
  EXPECT_FALSE(queue.running_in_this_thread());
  EXPECT_EQ(queue.name(), "test.sync");

  int value = queue.sync([]() { return 42; });
  EXPECT_EQ(value, 42);

  bool inside = queue.sync([&queue]() { return queue.running_in_this_thread(); });
  EXPECT_TRUE(inside);
}

TEST(SerialQueueTest, NestedSyncRunsInline) {
  SerialQueue queue("test.nested");
  int value = queue.sync([&queue]() {
    return queue.sync([]() { return 7; }) + 1;
  });
  EXPECT_EQ(value, 8);
}

TEST(SerialQueueTest, SyncPropagatesExceptions) {
  SerialQueue queue("test.throw");
  EXPECT_THROW(queue.sync([]() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
  // Still usable afterwards
  EXPECT_EQ(queue.sync([]() { return 1; }), 1);
}

TEST(SerialQueueTest, ShutdownDrainsPendingWork) {
  std::atomic<int> ran{0};
  {
    SerialQueue queue("test.drain");
    for (int i = 0; i < 10; ++i) {
      queue.post([&ran]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++ran;
      });
    }
    queue.shutdown();
    EXPECT_EQ(ran.load(), 10);
    // Second shutdown is a no-op
    queue.shutdown();
  }
  EXPECT_EQ(ran.load(), 10);
}
