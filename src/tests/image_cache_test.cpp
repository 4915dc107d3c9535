#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>
#include "cache/image_cache.hpp"
#include "utils/key_hasher.hpp"
#include "fakes.hpp"
#include "test_utils.hpp"

using namespace webimg;
using namespace webimg::cache;
using webimg::testing_support::MockDiskStore;
using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

// Waits until everything queued on the disk queue before this call has run
void drain(ImageCache& cache) {
  cache.drain();
}

void set_age(const std::filesystem::path& path, std::chrono::hours age) {
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
}

} // namespace

//==============================================
// REAL DISK TIER
//==============================================

class ImageCacheTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    test_dir = make_test_dir("image_cache_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  std::unique_ptr<ImageCache> make_cache(CacheConfig config = CacheConfig()) {
    return std::make_unique<ImageCache>("test", test_dir, config);
  }
};

TEST_F(ImageCacheTest, StoreThenQueryHitsMemory) {
  auto cache = make_cache();
  cache->store("https://example.com/a.png", bytes_of("image-a"));

  std::promise<CacheEntry> result;
  cache->query("https://example.com/a.png", [&result](const CacheEntry& entry) { result.set_value(entry); });
  // Memory hits complete before query() returns
  auto future = result.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);

  CacheEntry entry = future.get();
  EXPECT_TRUE(entry.found());
  EXPECT_EQ(entry.origin_tier, CacheTier::Memory);
  EXPECT_EQ(string_of(entry.blob), "image-a");
}

TEST_F(ImageCacheTest, DiskLayoutUsesNamespaceAndHashedName) {
  auto cache = make_cache();
  const std::string key = "https://example.com/photo.jpg";
  std::promise<void> written;
  cache->store(key, bytes_of("jpeg bytes"), 0, true, [&written]() { written.set_value(); });
  written.get_future().wait();

  const auto expected = ImageCache::namespaced_root(test_dir, "test") / utils::KeyHasher::filename_for_key(key);
  EXPECT_EQ(cache->cache_path_for_key(key), expected);
  EXPECT_TRUE(std::filesystem::exists(expected));
  EXPECT_EQ(expected.parent_path().filename().string(), "webimg.cache.test");
}

TEST_F(ImageCacheTest, DiskHitRepopulatesMemory) {
  auto cache = make_cache();
  const std::string key = "https://example.com/b.gif";
  std::promise<void> written;
  cache->store(key, bytes_of("gif bytes"), 0, true, [&written]() { written.set_value(); });
  written.get_future().wait();

  cache->clear_memory();
  EXPECT_EQ(cache->get(key), nullptr);

  std::promise<CacheEntry> result;
  cache->query(key, [&result](const CacheEntry& entry) { result.set_value(entry); });
  CacheEntry entry = result.get_future().get();
  EXPECT_EQ(entry.origin_tier, CacheTier::Disk);
  EXPECT_EQ(string_of(entry.blob), "gif bytes");

  EXPECT_EQ(string_of(cache->get(key)), "gif bytes");
}

TEST_F(ImageCacheTest, MissReportsNoneTier) {
  auto cache = make_cache();
  std::promise<CacheEntry> result;
  cache->query("https://example.com/missing.png", [&result](const CacheEntry& entry) { result.set_value(entry); });
  CacheEntry entry = result.get_future().get();
  EXPECT_FALSE(entry.found());
  EXPECT_EQ(entry.origin_tier, CacheTier::None);
}

TEST_F(ImageCacheTest, StoreWithoutDiskStaysInMemory) {
  auto cache = make_cache();
  const std::string key = "https://example.com/memory.png";
  cache->store(key, bytes_of("only in memory"), 0, false);
  drain(*cache);

  EXPECT_NE(cache->get(key), nullptr);
  EXPECT_EQ(cache->get_from_disk(key), nullptr);

  cache->clear_memory();
  EXPECT_EQ(cache->get_from_any(key), nullptr);
}

TEST_F(ImageCacheTest, MemoryOnlyCacheNeverTouchesDisk) {
  CacheConfig config;
  config.memory_only = true;
  auto cache = make_cache(config);
  cache->store("key", bytes_of("value"));

  EXPECT_EQ(cache->disk_count(), 0u);
  EXPECT_FALSE(std::filesystem::exists(ImageCache::namespaced_root(test_dir, "test")));

  std::promise<bool> exists;
  cache->disk_exists("key", [&exists](bool found) { exists.set_value(found); });
  EXPECT_FALSE(exists.get_future().get());
}

TEST_F(ImageCacheTest, RemoveFromBothTiers) {
  auto cache = make_cache();
  cache->store("key", bytes_of("value"));
  drain(*cache);

  std::promise<void> removed;
  cache->remove("key", true, [&removed]() { removed.set_value(); });
  removed.get_future().wait();

  EXPECT_EQ(cache->get("key"), nullptr);
  EXPECT_EQ(cache->get_from_disk("key"), nullptr);

  std::promise<bool> exists;
  cache->disk_exists("key", [&exists](bool found) { exists.set_value(found); });
  EXPECT_FALSE(exists.get_future().get());
}

TEST_F(ImageCacheTest, ClearDiskAndSizeInfo) {
  auto cache = make_cache();
  cache->store("a", bytes_of("12345"));
  cache->store("b", bytes_of("1234567890"));
  drain(*cache);

  EXPECT_EQ(cache->disk_count(), 2u);
  EXPECT_EQ(cache->disk_size(), 15u);

  std::promise<std::pair<std::size_t, std::uintmax_t>> size;
  cache->calculate_size([&size](std::size_t count, std::uintmax_t total) { size.set_value({count, total}); });
  EXPECT_EQ(size.get_future().get(), (std::pair<std::size_t, std::uintmax_t>{2, 15}));

  std::promise<void> cleared;
  cache->clear_disk([&cleared]() { cleared.set_value(); });
  cleared.get_future().wait();
  EXPECT_EQ(cache->disk_count(), 0u);
  // Memory is untouched by a disk clear
  EXPECT_NE(cache->get("a"), nullptr);
}

TEST_F(ImageCacheTest, AgeSweepRemovesOnlyExpiredFiles) {
  CacheConfig config;
  config.max_disk_age = std::chrono::hours(24 * 7);
  auto cache = make_cache(config);

  cache->store("fresh", bytes_of("fresh"));
  cache->store("recent", bytes_of("recent"));
  cache->store("stale", bytes_of("stale"));
  drain(*cache);

  set_age(cache->cache_path_for_key("recent"), std::chrono::hours(48));
  set_age(cache->cache_path_for_key("stale"), std::chrono::hours(240));

  std::promise<void> evicted;
  cache->evict_expired([&evicted]() { evicted.set_value(); });
  evicted.get_future().wait();

  EXPECT_TRUE(std::filesystem::exists(cache->cache_path_for_key("fresh")));
  EXPECT_TRUE(std::filesystem::exists(cache->cache_path_for_key("recent")));
  EXPECT_FALSE(std::filesystem::exists(cache->cache_path_for_key("stale")));
  EXPECT_EQ(cache->disk_count(), 2u);
}

TEST_F(ImageCacheTest, ReadOnlyRootServesBundledImages) {
  const auto bundled = test_dir / "bundled";
  std::filesystem::create_directories(bundled);
  const std::string key = "https://example.com/placeholder.png";
  {
    std::ofstream file(bundled / utils::KeyHasher::filename_for_key(key), std::ios::binary);
    file << "placeholder";
  }

  auto cache = make_cache();
  cache->add_read_only_root(bundled);
  EXPECT_EQ(string_of(cache->get_from_disk(key)), "placeholder");
  EXPECT_EQ(cache->disk_count(), 0u);
}

TEST_F(ImageCacheTest, MemoryPressureClearsMemoryTier) {
  auto cache = make_cache();
  lifecycle::LifecycleSignals signals;
  cache->connect_lifecycle(signals);

  cache->store("key", bytes_of("value"));
  drain(*cache);
  ASSERT_GT(cache->memory_count(), 0u);

  signals.memory_pressure();
  EXPECT_EQ(cache->memory_count(), 0u);
  EXPECT_EQ(cache->memory_cost(), 0u);
  // Disk copy survives
  EXPECT_EQ(string_of(cache->get_from_disk("key")), "value");
}

TEST_F(ImageCacheTest, DisconnectsFromSignalsOnDestruction) {
  lifecycle::LifecycleSignals signals;
  {
    auto cache = make_cache();
    cache->connect_lifecycle(signals);
    EXPECT_EQ(signals.memory_pressure.num_slots(), 1u);
  }
  EXPECT_EQ(signals.memory_pressure.num_slots(), 0u);
  signals.memory_pressure();
  signals.terminating();
}

TEST_F(ImageCacheTest, MemoryLimitsApply) {
  CacheConfig config;
  config.max_memory_count = 2;
  auto cache = make_cache(config);
  cache->store("1", bytes_of("one"), 1, false);
  cache->store("2", bytes_of("two"), 1, false);
  cache->store("3", bytes_of("three"), 1, false);
  EXPECT_EQ(cache->memory_count(), 2u);
  EXPECT_EQ(cache->get("1"), nullptr);

  cache->set_max_memory_count(1);
  EXPECT_EQ(cache->memory_count(), 1u);
}

TEST_F(ImageCacheTest, NegativeMaxAgeRejected) {
  CacheConfig config;
  config.max_disk_age = std::chrono::seconds(-1);
  EXPECT_THROW(make_cache(config), std::invalid_argument);
}


//==============================================
// MOCKED DISK TIER
//==============================================

class ImageCacheMockTest : public ::testing::Test {
protected:
  NiceMock<MockDiskStore>* disk{nullptr};

  std::unique_ptr<ImageCache> make_cache(CacheConfig config) {
    auto store = std::make_unique<NiceMock<MockDiskStore>>();
    disk = store.get();
    return std::make_unique<ImageCache>(std::move(store), config);
  }

  static std::vector<store::DiskEntry> make_entries(std::size_t count, std::chrono::hours newest_age) {
    std::vector<store::DiskEntry> entries;
    const auto now = std::chrono::system_clock::now();
    // Listed newest first so the sweep has to sort
    for (std::size_t i = 0; i < count; ++i) {
      store::DiskEntry entry;
      entry.path = "/cache/file" + std::to_string(i);
      entry.modified = now - newest_age - std::chrono::hours(i);
      entry.allocated_size = 100;
      entry.file_size = 100;
      entries.push_back(entry);
    }
    return entries;
  }
};

TEST_F(ImageCacheMockTest, SizeSweepRemovesOldestUntilHalfTheLimit) {
  CacheConfig config;
  config.max_disk_size = 300;
  auto cache = make_cache(config);

  // 500 bytes against a 300 byte limit: trim to under 150, oldest first
  auto entries = make_entries(5, std::chrono::hours(1));
  ON_CALL(*disk, entries()).WillByDefault(Return(entries));
  {
    InSequence seq;
    EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file4"))).WillOnce(Return(true));
    EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file3"))).WillOnce(Return(true));
    EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file2"))).WillOnce(Return(true));
    EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file1"))).WillOnce(Return(true));
  }
  EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file0"))).Times(0);

  std::promise<void> evicted;
  cache->evict_expired([&evicted]() { evicted.set_value(); });
  evicted.get_future().wait();
}

TEST_F(ImageCacheMockTest, FailedRemovalDoesNotCountTowardsSize) {
  CacheConfig config;
  config.max_disk_size = 300;
  auto cache = make_cache(config);

  ON_CALL(*disk, entries()).WillByDefault(Return(make_entries(4, std::chrono::hours(1))));
  // The oldest file cannot be deleted, so one more goes instead
  EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file3"))).WillOnce(Return(false));
  EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file2"))).WillOnce(Return(true));
  EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file1"))).WillOnce(Return(true));
  EXPECT_CALL(*disk, remove_entry(std::filesystem::path("/cache/file0"))).WillOnce(Return(true));

  std::promise<void> evicted;
  cache->evict_expired([&evicted]() { evicted.set_value(); });
  evicted.get_future().wait();
}

TEST_F(ImageCacheMockTest, ZeroMaxAgeDisablesAgeSweep) {
  CacheConfig config;
  config.max_disk_age = std::chrono::seconds(0);
  auto cache = make_cache(config);

  ON_CALL(*disk, entries()).WillByDefault(Return(make_entries(3, std::chrono::hours(24 * 365))));
  EXPECT_CALL(*disk, remove_entry(_)).Times(0);

  std::promise<void> evicted;
  cache->evict_expired([&evicted]() { evicted.set_value(); });
  evicted.get_future().wait();
}

TEST_F(ImageCacheMockTest, StoredValueServedFromMemoryWithoutDiskRead) {
  auto cache = make_cache(CacheConfig());
  EXPECT_CALL(*disk, write("key", _)).Times(1);
  EXPECT_CALL(*disk, read(_)).Times(0);

  cache->store("key", bytes_of("value"));
  std::promise<CacheEntry> result;
  cache->query("key", [&result](const CacheEntry& entry) { result.set_value(entry); });
  EXPECT_EQ(string_of(result.get_future().get().blob), "value");
  drain(*cache);
}

TEST_F(ImageCacheMockTest, FailedWriteStillCompletes) {
  auto cache = make_cache(CacheConfig());
  EXPECT_CALL(*disk, write("key", _)).WillOnce(::testing::Throw(store::StoreError("disk full")));

  std::promise<void> done;
  cache->store("key", bytes_of("value"), 0, true, [&done]() { done.set_value(); });
  ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(3)), std::future_status::ready);
  // Memory tier still has it
  EXPECT_EQ(string_of(cache->get("key")), "value");
}

TEST_F(ImageCacheMockTest, FailedReadIsAMiss) {
  auto cache = make_cache(CacheConfig());
  EXPECT_CALL(*disk, read("key")).WillOnce(::testing::Throw(store::StoreError("io error")));

  std::promise<CacheEntry> result;
  cache->query("key", [&result](const CacheEntry& entry) { result.set_value(entry); });
  EXPECT_FALSE(result.get_future().get().found());
}

TEST_F(ImageCacheMockTest, CanceledQuerySkipsPendingRead) {
  auto cache = make_cache(CacheConfig());

  // Park the disk queue inside an eviction sweep
  std::promise<void> sweep_started;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  EXPECT_CALL(*disk, entries())
    .WillOnce([&sweep_started, released]() {
      sweep_started.set_value();
      released.wait();
      return std::vector<store::DiskEntry>{};
    })
    .WillRepeatedly(Return(std::vector<store::DiskEntry>{}));
  EXPECT_CALL(*disk, read(_)).Times(0);

  cache->evict_expired();
  sweep_started.get_future().wait();

  bool called = false;
  auto handle = cache->query("key", [&called](const CacheEntry&) { called = true; });
  handle->cancel();
  release.set_value();

  drain(*cache);
  EXPECT_FALSE(called);
}

TEST_F(ImageCacheMockTest, CanceledQueryAfterReadSuppressesCallback) {
  auto cache = make_cache(CacheConfig());

  std::promise<void> read_started;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  EXPECT_CALL(*disk, read("key")).WillOnce([&read_started, released](const std::string&) {
    read_started.set_value();
    released.wait();
    return std::optional<Bytes>(Bytes{'v'});
  });

  bool called = false;
  auto handle = cache->query("key", [&called](const CacheEntry&) { called = true; });
  read_started.get_future().wait();
  handle->cancel();
  release.set_value();

  drain(*cache);
  EXPECT_FALSE(called);
  // The read itself still completed and populated memory
  EXPECT_NE(cache->get("key"), nullptr);
}
