#ifndef WEBIMG_CACHE_IMAGE_CACHE_HPP
#define WEBIMG_CACHE_IMAGE_CACHE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/signals2/connection.hpp>
#include "codec/image.hpp"
#include "lifecycle/lifecycle_signals.hpp"
#include "store/memory_store.hpp"
#include "store/store.hpp"
#include "utils/bytes.hpp"
#include "utils/serial_queue.hpp"

namespace webimg {
namespace cache {

// Where a served value came from
enum class CacheTier {
  None,    // freshly fetched, or a miss
  Disk,
  Memory
};

const char* tier_to_string(CacheTier tier);

struct CacheEntry {
  std::string key;
  BytesPtr blob;
  std::size_t decoded_cost{0};
  CacheTier origin_tier{CacheTier::None};

  bool found() const { return blob != nullptr; }
};

struct CacheConfig {
  // Keep decoded values in the memory tier
  bool cache_in_memory{true};
  // Never touch the disk tier
  bool memory_only{false};
  // Memory tier limits, 0 means unbounded
  std::size_t max_memory_cost{0};
  std::size_t max_memory_count{0};
  // Files older than this are removed by evict_expired(), 0 disables the age sweep
  std::chrono::seconds max_disk_age{std::chrono::hours(24 * 7)};
  // Allocated bytes on disk, 0 disables the size sweep
  std::uintmax_t max_disk_size{0};
};

class CacheError : public std::runtime_error {
public:
  explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// Returned by query(). Canceling suppresses the callback; a disk read that
// already started still runs to completion.
class QueryHandle {
public:
  void cancel() { cancelled_ = true; }
  bool cancelled() const { return cancelled_; }

private:
  std::atomic<bool> cancelled_{false};
};

using QueryHandlePtr = std::shared_ptr<QueryHandle>;
using DoneCallback = std::function<void()>;
using QueryCallback = std::function<void(const CacheEntry&)>;
using ExistsCallback = std::function<void(bool)>;
using SizeCallback = std::function<void(std::size_t file_count, std::uintmax_t total_size)>;

// Two-tier cache: a MemoryStore in front of a DiskStore. Every disk access
// runs on one serial queue; disk completion callbacks run on that queue too.
class ImageCache {
public:
  // Delete copy operations, the cache owns its disk queue
  ImageCache(const ImageCache&) = delete;
  ImageCache& operator=(const ImageCache&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Disk tier under {directory}/webimg.cache.{name_space}
  ImageCache(const std::string& name_space, const std::filesystem::path& directory,
             CacheConfig config = CacheConfig(),
             std::shared_ptr<codec::ImageDecoder> decoder = nullptr);
  // Disk tier supplied by the caller
  ImageCache(std::unique_ptr<store::DiskStore> disk_store,
             CacheConfig config = CacheConfig(),
             std::shared_ptr<codec::ImageDecoder> decoder = nullptr);
  ~ImageCache();

  // $XDG_CACHE_HOME, $HOME/.cache, or the temp directory
  static std::filesystem::path default_directory();
  static std::filesystem::path namespaced_root(const std::filesystem::path& directory,
                                               const std::string& name_space);


  // ---- STORE OPERATIONS ----
  // Inserts into memory synchronously (cost 0 means compute it), then writes
  // to disk on the disk queue if to_disk. on_done runs after the disk write,
  // or immediately when there is none.
  void store(const std::string& key, BytesPtr blob, std::size_t cost = 0,
             bool to_disk = true, DoneCallback on_done = nullptr);


  // ---- QUERY OPERATIONS ----
  // Memory hits complete synchronously. Misses are looked up on the disk queue
  // and repopulate the memory tier.
  QueryHandlePtr query(const std::string& key, QueryCallback on_done);
  // Memory tier only
  BytesPtr get(const std::string& key);
  // Disk tier only, blocks on the disk queue
  BytesPtr get_from_disk(const std::string& key);
  // Memory, then disk
  BytesPtr get_from_any(const std::string& key);
  void disk_exists(const std::string& key, ExistsCallback on_done);


  // ---- REMOVE OPERATIONS ----
  void remove(const std::string& key, bool from_disk = true, DoneCallback on_done = nullptr);


  // ---- CLEAN OPERATIONS ----
  void clear_memory();
  void clear_disk(DoneCallback on_done = nullptr);
  // Age sweep, then size sweep
  void evict_expired(DoneCallback on_done = nullptr);


  // ---- CACHE INFO ----
  // Sum of file sizes on the primary root, blocks on the disk queue
  std::uintmax_t disk_size();
  std::size_t disk_count();
  void calculate_size(SizeCallback on_done);
  std::size_t memory_cost() const { return memory_.total_cost(); }
  std::size_t memory_count() const { return memory_.count(); }
  std::filesystem::path cache_path_for_key(const std::string& key) const;
  // Blocks until the disk work queued so far has run
  void drain();


  // ---- CONFIGURATION ----
  void add_read_only_root(const std::filesystem::path& root);
  void set_max_memory_cost(std::size_t max_cost);
  void set_max_memory_count(std::size_t max_count);
  const CacheConfig& config() const { return config_; }


  // ---- LIFECYCLE ----
  // Memory pressure clears memory; background and terminate run evict_expired
  void connect_lifecycle(lifecycle::LifecycleSignals& signals);

private:
  // ---- PARAMETERS ----
  CacheConfig config_;
  std::shared_ptr<codec::ImageDecoder> decoder_;
  store::MemoryStore memory_;
  std::unique_ptr<store::DiskStore> disk_;
  utils::SerialQueue disk_queue_;
  std::vector<boost::signals2::scoped_connection> connections_;


  // ---- HELPERS ----
  std::size_t cost_for(const Bytes& blob) const;
  bool disk_enabled() const { return disk_ != nullptr && !config_.memory_only; }
  // Runs on the disk queue
  BytesPtr read_disk_and_cache(const std::string& key);
  void run_eviction();

  static void notify(const DoneCallback& callback);
};

} // namespace cache
} // namespace webimg

#endif // WEBIMG_CACHE_IMAGE_CACHE_HPP
