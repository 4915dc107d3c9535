#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "network/operation_queue.hpp"
#include "test_utils.hpp"

using namespace webimg::network;

namespace {

// Appends its name to a shared log when started
class RecordingOperation : public QueuedOperation {
public:
  RecordingOperation(std::string name, std::vector<std::string>& log, std::mutex& mutex)
    : name_(std::move(name)), log_(log), mutex_(mutex) {}

  void start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.push_back(name_);
    started = true;
  }

  std::atomic<bool> started{false};

private:
  std::string name_;
  std::vector<std::string>& log_;
  std::mutex& mutex_;
};

} // namespace

class OperationQueueTest : public ::testing::Test {
protected:
  std::vector<std::string> log;
  std::mutex mutex;

  std::shared_ptr<RecordingOperation> make(const std::string& name) {
    return std::make_shared<RecordingOperation>(name, log, mutex);
  }

  std::vector<std::string> started() {
    std::lock_guard<std::mutex> lock(mutex);
    return log;
  }

  bool wait_started(std::size_t count) {
    return wait_until([this, count]() { return started().size() >= count; });
  }
};

TEST_F(OperationQueueTest, RejectsZeroConcurrency) {
  EXPECT_THROW(OperationQueue(0), std::invalid_argument);
  OperationQueue queue(1);
  EXPECT_THROW(queue.set_max_concurrent(0), std::invalid_argument);
}

TEST_F(OperationQueueTest, FifoRespectsConcurrencyLimit) {
  OperationQueue queue(2);
  auto a = make("a");
  auto b = make("b");
  auto c = make("c");
  queue.add(a);
  queue.add(b);
  queue.add(c);

  ASSERT_TRUE(wait_started(2));
  EXPECT_EQ(queue.running_count(), 2u);
  EXPECT_EQ(queue.pending_count(), 1u);
  EXPECT_FALSE(c->started);

  queue.finished(a);
  ASSERT_TRUE(wait_started(3));
  EXPECT_EQ(started(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(OperationQueueTest, LifoStartsNewestFirst) {
  OperationQueue queue(1, ExecutionOrder::LIFO);
  auto u1 = make("u1");
  auto u2 = make("u2");
  auto u3 = make("u3");
  queue.add(u1);
  ASSERT_TRUE(wait_started(1));
  queue.add(u2);
  queue.add(u3);

  queue.finished(u1);
  ASSERT_TRUE(wait_started(2));
  EXPECT_FALSE(u2->started);

  queue.finished(u3);
  ASSERT_TRUE(wait_started(3));
  EXPECT_EQ(started(), (std::vector<std::string>{"u1", "u3", "u2"}));
}

TEST_F(OperationQueueTest, WithdrawnPendingOperationReleasesDependents) {
  OperationQueue queue(1, ExecutionOrder::LIFO);
  auto u1 = make("u1");
  auto u2 = make("u2");
  auto u3 = make("u3");
  queue.add(u1);
  ASSERT_TRUE(wait_started(1));
  queue.add(u2);
  queue.add(u3);

  // u3 canceled before it ever started
  queue.finished(u3);
  EXPECT_EQ(queue.pending_count(), 1u);
  queue.finished(u1);
  ASSERT_TRUE(wait_started(2));
  EXPECT_EQ(started(), (std::vector<std::string>{"u1", "u2"}));
}

TEST_F(OperationQueueTest, HigherPriorityStartsFirst) {
  OperationQueue queue(1);
  auto blocker = make("blocker");
  queue.add(blocker);
  ASSERT_TRUE(wait_started(1));

  auto low = make("low");
  auto normal = make("normal");
  auto high = make("high");
  queue.add(low, QueuePriority::Low);
  queue.add(normal, QueuePriority::Normal);
  queue.add(high, QueuePriority::High);

  queue.finished(blocker);
  ASSERT_TRUE(wait_started(2));
  queue.finished(high);
  ASSERT_TRUE(wait_started(3));
  queue.finished(normal);
  ASSERT_TRUE(wait_started(4));
  EXPECT_EQ(started(), (std::vector<std::string>{"blocker", "high", "normal", "low"}));
}

TEST_F(OperationQueueTest, RaisePriorityOnlyLifts) {
  OperationQueue queue(1);
  auto blocker = make("blocker");
  queue.add(blocker);
  ASSERT_TRUE(wait_started(1));

  auto first = make("first");
  auto second = make("second");
  auto third = make("third");
  queue.add(first, QueuePriority::Normal);
  queue.add(second, QueuePriority::High);
  queue.add(third, QueuePriority::Normal);
  queue.raise_priority(third, QueuePriority::High);
  queue.raise_priority(second, QueuePriority::Low);
  // Started operations are left alone
  queue.raise_priority(blocker, QueuePriority::High);

  queue.finished(blocker);
  ASSERT_TRUE(wait_started(2));
  queue.finished(second);
  ASSERT_TRUE(wait_started(3));
  queue.finished(third);
  ASSERT_TRUE(wait_started(4));
  EXPECT_EQ(started(), (std::vector<std::string>{"blocker", "second", "third", "first"}));
}

TEST_F(OperationQueueTest, SuspendStopsAdmission) {
  OperationQueue queue(4);
  queue.set_suspended(true);
  EXPECT_TRUE(queue.suspended());

  auto a = make("a");
  queue.add(a);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(a->started);
  EXPECT_EQ(queue.pending_count(), 1u);

  queue.set_suspended(false);
  ASSERT_TRUE(wait_started(1));
  EXPECT_EQ(queue.running_count(), 1u);
}

TEST_F(OperationQueueTest, RaisingLimitAdmitsWaitingOperations) {
  OperationQueue queue(1);
  queue.add(make("a"));
  queue.add(make("b"));
  queue.add(make("c"));
  ASSERT_TRUE(wait_started(1));
  EXPECT_EQ(queue.pending_count(), 2u);

  queue.set_max_concurrent(3);
  EXPECT_EQ(queue.max_concurrent(), 3u);
  ASSERT_TRUE(wait_started(3));
}

TEST_F(OperationQueueTest, FinishedIsIdempotent) {
  OperationQueue queue(1);
  auto a = make("a");
  queue.add(a);
  ASSERT_TRUE(wait_started(1));
  queue.finished(a);
  queue.finished(a);
  EXPECT_EQ(queue.running_count(), 0u);
}

TEST_F(OperationQueueTest, ShutdownDropsPendingOperations) {
  OperationQueue queue(1);
  queue.add(make("a"));
  auto b = make("b");
  queue.add(b);
  ASSERT_TRUE(wait_started(1));

  queue.shutdown();
  EXPECT_EQ(queue.pending_count(), 0u);
  queue.add(make("late"));
  EXPECT_EQ(queue.pending_count(), 0u);
  EXPECT_FALSE(b->started);
}
