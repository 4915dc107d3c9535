#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "store/memory_store.hpp"
#include "test_utils.hpp"

using namespace webimg::store;

TEST(MemoryStoreTest, InsertGetErase) {
  MemoryStore store;
  EXPECT_EQ(store.get("missing"), nullptr);

  ASSERT_TRUE(store.insert("a", bytes_of("alpha"), 5));
  EXPECT_TRUE(store.contains("a"));
  EXPECT_EQ(string_of(store.get("a")), "alpha");
  EXPECT_EQ(store.total_cost(), 5u);

  // Replacing updates value and cost
  ASSERT_TRUE(store.insert("a", bytes_of("alphabet"), 8));
  EXPECT_EQ(string_of(store.get("a")), "alphabet");
  EXPECT_EQ(store.count(), 1u);
  EXPECT_EQ(store.total_cost(), 8u);

  EXPECT_TRUE(store.erase("a"));
  EXPECT_FALSE(store.erase("a"));
  EXPECT_EQ(store.total_cost(), 0u);
}

TEST(MemoryStoreTest, CountLimitEvictsLeastRecentlyUsed) {
  MemoryStore store(0, 3);
  store.insert("1", bytes_of("one"), 1);
  store.insert("2", bytes_of("two"), 1);
  store.insert("3", bytes_of("three"), 1);

  // Touch 1 so 2 becomes the oldest
  ASSERT_NE(store.get("1"), nullptr);
  store.insert("4", bytes_of("four"), 1);

  EXPECT_EQ(store.count(), 3u);
  EXPECT_TRUE(store.contains("1"));
  EXPECT_FALSE(store.contains("2"));
  EXPECT_TRUE(store.contains("3"));
  EXPECT_TRUE(store.contains("4"));
}

TEST(MemoryStoreTest, CostLimitEvictsUntilUnderLimit) {
  MemoryStore store(100);
  store.insert("a", bytes_of("a"), 40);
  store.insert("b", bytes_of("b"), 40);
  store.insert("c", bytes_of("c"), 40);

  EXPECT_FALSE(store.contains("a"));
  EXPECT_TRUE(store.contains("b"));
  EXPECT_TRUE(store.contains("c"));
  EXPECT_EQ(store.total_cost(), 80u);
}

TEST(MemoryStoreTest, OversizeEntryRejected) {
  MemoryStore store(10);
  store.insert("small", bytes_of("s"), 5);
  EXPECT_FALSE(store.insert("huge", bytes_of("h"), 11));
  EXPECT_FALSE(store.contains("huge"));
  // Existing entries are untouched
  EXPECT_TRUE(store.contains("small"));

  // An oversize replacement drops the old value
  EXPECT_FALSE(store.insert("small", bytes_of("s"), 50));
  EXPECT_FALSE(store.contains("small"));
}

TEST(MemoryStoreTest, LoweringLimitsEvicts) {
  MemoryStore store;
  for (int i = 0; i < 10; ++i) {
    store.insert(std::to_string(i), bytes_of("x"), 10);
  }
  store.set_max_count(4);
  EXPECT_EQ(store.count(), 4u);
  EXPECT_TRUE(store.contains("9"));
  EXPECT_FALSE(store.contains("0"));

  store.set_max_cost(20);
  EXPECT_EQ(store.count(), 2u);
  EXPECT_EQ(store.max_cost(), 20u);
  EXPECT_EQ(store.max_count(), 4u);
}

TEST(MemoryStoreTest, ClearDropsEverything) {
  MemoryStore store;
  store.insert("a", bytes_of("a"), 1);
  store.insert("b", bytes_of("b"), 1);
  store.clear();
  EXPECT_EQ(store.count(), 0u);
  EXPECT_EQ(store.total_cost(), 0u);
  EXPECT_EQ(store.get("a"), nullptr);
}

TEST(MemoryStoreTest, ConcurrentAccess) {
  MemoryStore store(0, 50);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t]() {
      for (int i = 0; i < 200; ++i) {
        const std::string key = std::to_string(t) + "_" + std::to_string(i);
        store.insert(key, bytes_of(key), 1);
        store.get(std::to_string(t) + "_" + std::to_string(i / 2));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(store.count(), 50u);
  EXPECT_EQ(store.total_cost(), 50u);
}
