#include "cache/image_cache.hpp"
#include "store/file_store.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstdlib>

namespace webimg {
namespace cache {

const char* tier_to_string(CacheTier tier) {
  switch (tier) {
    case CacheTier::None:   return "None";
    case CacheTier::Disk:   return "Disk";
    case CacheTier::Memory: return "Memory";
    default:                return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ImageCache::ImageCache(const std::string& name_space, const std::filesystem::path& directory,
                       CacheConfig config, std::shared_ptr<codec::ImageDecoder> decoder)
  : ImageCache(config.memory_only ? nullptr
                                  : std::make_unique<store::FileStore>(namespaced_root(directory, name_space)),
               config, std::move(decoder)) {}

ImageCache::ImageCache(std::unique_ptr<store::DiskStore> disk_store, CacheConfig config,
                       std::shared_ptr<codec::ImageDecoder> decoder)
  : config_(config)
  , decoder_(std::move(decoder))
  , memory_(config.max_memory_cost, config.max_memory_count)
  , disk_(std::move(disk_store))
  , disk_queue_("webimg.cache.io") {
  if (config_.max_disk_age.count() < 0) {
    throw std::invalid_argument("Image cache: max_disk_age must not be negative");
  }
  BOOST_LOG_TRIVIAL(info) << "Image cache: Initialized (memory " << (config_.cache_in_memory ? "on" : "off")
                          << ", disk " << (disk_enabled() ? "on" : "off")
                          << ", max disk age " << config_.max_disk_age.count() << "s"
                          << ", max disk size " << config_.max_disk_size << ")";
}

ImageCache::~ImageCache() {
  connections_.clear();
  // Let queued disk work finish while the stores are still alive
  disk_queue_.shutdown();
}

std::filesystem::path ImageCache::default_directory() {
  if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
    return xdg;
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".cache";
  }
  return std::filesystem::temp_directory_path();
}

std::filesystem::path ImageCache::namespaced_root(const std::filesystem::path& directory,
                                                  const std::string& name_space) {
  return directory / ("webimg.cache." + name_space);
}


//==============================================
// STORE OPERATIONS
//==============================================

void ImageCache::store(const std::string& key, BytesPtr blob, std::size_t cost, bool to_disk,
                       DoneCallback on_done) {
  if (!blob || key.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Image cache: Ignoring store without key or data";
    notify(on_done);
    return;
  }

  if (config_.cache_in_memory) {
    std::size_t entry_cost = cost > 0 ? cost : cost_for(*blob);
    memory_.insert(key, blob, entry_cost);
    BOOST_LOG_TRIVIAL(debug) << "Image cache: Stored key in memory with cost " << entry_cost << ": " << key;
  }

  if (!to_disk || !disk_enabled()) {
    notify(on_done);
    return;
  }

  disk_queue_.post([this, key, blob, on_done]() {
    try {
      disk_->write(key, *blob);
    } catch (const std::exception& e) {
      // A failed disk write does not fail the store
      BOOST_LOG_TRIVIAL(error) << "Image cache: Disk write failed for key " << key << ": " << e.what();
    }
    notify(on_done);
  });
}


//==============================================
// QUERY OPERATIONS
//==============================================

QueryHandlePtr ImageCache::query(const std::string& key, QueryCallback on_done) {
  auto handle = std::make_shared<QueryHandle>();

  if (key.empty()) {
    if (on_done) {
      on_done(CacheEntry{key, nullptr, 0, CacheTier::None});
    }
    return handle;
  }

  if (BytesPtr blob = get(key)) {
    BOOST_LOG_TRIVIAL(trace) << "Image cache: Memory hit for key: " << key;
    if (on_done) {
      on_done(CacheEntry{key, blob, 0, CacheTier::Memory});
    }
    return handle;
  }

  if (!disk_enabled()) {
    if (on_done) {
      on_done(CacheEntry{key, nullptr, 0, CacheTier::None});
    }
    return handle;
  }

  disk_queue_.post([this, key, handle, on_done]() {
    // Canceled before the read started: skip it altogether
    if (handle->cancelled()) {
      return;
    }

    BytesPtr blob = read_disk_and_cache(key);
    if (handle->cancelled() || !on_done) {
      return;
    }

    CacheEntry entry{key, blob, 0, blob ? CacheTier::Disk : CacheTier::None};
    try {
      on_done(entry);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Image cache: Query callback threw: " << e.what();
    }
  });
  return handle;
}

BytesPtr ImageCache::get(const std::string& key) {
  if (!config_.cache_in_memory) {
    return nullptr;
  }
  return memory_.get(key);
}

BytesPtr ImageCache::get_from_disk(const std::string& key) {
  if (!disk_enabled()) {
    return nullptr;
  }
  return disk_queue_.sync([this, &key]() { return read_disk_and_cache(key); });
}

BytesPtr ImageCache::get_from_any(const std::string& key) {
  if (BytesPtr blob = get(key)) {
    return blob;
  }
  return get_from_disk(key);
}

void ImageCache::disk_exists(const std::string& key, ExistsCallback on_done) {
  if (!disk_enabled()) {
    if (on_done) {
      on_done(false);
    }
    return;
  }

  disk_queue_.post([this, key, on_done]() {
    bool exists = false;
    try {
      exists = disk_->contains(key);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Image cache: Existence check failed for key " << key << ": " << e.what();
    }
    if (on_done) {
      on_done(exists);
    }
  });
}


//==============================================
// REMOVE OPERATIONS
//==============================================

void ImageCache::remove(const std::string& key, bool from_disk, DoneCallback on_done) {
  if (key.empty()) {
    notify(on_done);
    return;
  }

  memory_.erase(key);

  if (!from_disk || !disk_enabled()) {
    notify(on_done);
    return;
  }

  disk_queue_.post([this, key, on_done]() {
    try {
      disk_->remove(key);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Image cache: Disk remove failed for key " << key << ": " << e.what();
    }
    notify(on_done);
  });
}


//==============================================
// CLEAN OPERATIONS
//==============================================

void ImageCache::clear_memory() {
  BOOST_LOG_TRIVIAL(info) << "Image cache: Clearing memory tier";
  memory_.clear();
}

void ImageCache::clear_disk(DoneCallback on_done) {
  if (!disk_enabled()) {
    notify(on_done);
    return;
  }

  disk_queue_.post([this, on_done]() {
    try {
      disk_->clear();
      BOOST_LOG_TRIVIAL(info) << "Image cache: Disk tier cleared";
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Image cache: Failed to clear disk tier: " << e.what();
    }
    notify(on_done);
  });
}

void ImageCache::evict_expired(DoneCallback on_done) {
  if (!disk_enabled()) {
    notify(on_done);
    return;
  }

  disk_queue_.post([this, on_done]() {
    try {
      run_eviction();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Image cache: Eviction sweep aborted: " << e.what();
    }
    notify(on_done);
  });
}

void ImageCache::run_eviction() {
  using std::chrono::system_clock;

  std::vector<store::DiskEntry> entries = disk_->entries();
  const bool age_sweep = config_.max_disk_age.count() > 0;
  const system_clock::time_point expiration = system_clock::now() - config_.max_disk_age;

  // Phase 1: age sweep
  std::vector<store::DiskEntry> survivors;
  std::uintmax_t current_size = 0;
  std::size_t expired = 0;

  for (auto& entry : entries) {
    if (age_sweep && entry.modified <= expiration) {
      // Individual failures are ignored
      if (disk_->remove_entry(entry.path)) {
        ++expired;
      }
      continue;
    }
    current_size += entry.allocated_size;
    survivors.push_back(std::move(entry));
  }

  BOOST_LOG_TRIVIAL(debug) << "Image cache: Age sweep removed " << expired << " files, "
                           << survivors.size() << " remain (" << current_size << " bytes)";

  // Phase 2: size sweep down to half the limit, oldest first
  std::size_t trimmed = 0;
  if (config_.max_disk_size > 0 && current_size > config_.max_disk_size) {
    const std::uintmax_t desired_size = config_.max_disk_size / 2;

    std::stable_sort(survivors.begin(), survivors.end(),
                     [](const store::DiskEntry& a, const store::DiskEntry& b) { return a.modified < b.modified; });

    for (const auto& entry : survivors) {
      if (disk_->remove_entry(entry.path)) {
        ++trimmed;
        current_size -= std::min(current_size, entry.allocated_size);
        if (current_size < desired_size) {
          break;
        }
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Image cache: Eviction finished, removed " << expired << " expired and "
                          << trimmed << " excess files, " << current_size << " bytes remain";
}


//==============================================
// CACHE INFO
//==============================================

std::uintmax_t ImageCache::disk_size() {
  if (!disk_enabled()) {
    return 0;
  }
  return disk_queue_.sync([this]() {
    std::uintmax_t size = 0;
    for (const auto& entry : disk_->entries()) {
      size += entry.file_size;
    }
    return size;
  });
}

std::size_t ImageCache::disk_count() {
  if (!disk_enabled()) {
    return 0;
  }
  return disk_queue_.sync([this]() { return disk_->entries().size(); });
}

void ImageCache::calculate_size(SizeCallback on_done) {
  if (!disk_enabled()) {
    if (on_done) {
      on_done(0, 0);
    }
    return;
  }

  disk_queue_.post([this, on_done]() {
    std::size_t count = 0;
    std::uintmax_t total = 0;
    for (const auto& entry : disk_->entries()) {
      total += entry.file_size;
      ++count;
    }
    if (on_done) {
      on_done(count, total);
    }
  });
}

std::filesystem::path ImageCache::cache_path_for_key(const std::string& key) const {
  if (!disk_) {
    return {};
  }
  return disk_->path_for_key(key);
}

void ImageCache::drain() {
  disk_queue_.sync([]() {});
}


//==============================================
// CONFIGURATION
//==============================================

void ImageCache::add_read_only_root(const std::filesystem::path& root) {
  if (!disk_enabled()) {
    return;
  }
  disk_queue_.post([this, root]() { disk_->add_read_only_root(root); });
}

void ImageCache::set_max_memory_cost(std::size_t max_cost) {
  memory_.set_max_cost(max_cost);
}

void ImageCache::set_max_memory_count(std::size_t max_count) {
  memory_.set_max_count(max_count);
}


//==============================================
// LIFECYCLE
//==============================================

void ImageCache::connect_lifecycle(lifecycle::LifecycleSignals& signals) {
  connections_.emplace_back(signals.memory_pressure.connect([this]() { clear_memory(); }));
  connections_.emplace_back(signals.entered_background.connect([this]() { evict_expired(); }));
  connections_.emplace_back(signals.terminating.connect([this]() { evict_expired(); }));
  BOOST_LOG_TRIVIAL(debug) << "Image cache: Connected to lifecycle signals";
}


//==============================================
// HELPERS
//==============================================

std::size_t ImageCache::cost_for(const Bytes& blob) const {
  if (decoder_) {
    if (auto image = decoder_->decode(blob); image && !image->empty()) {
      return image->cost();
    }
  }
  return blob.size();
}

BytesPtr ImageCache::read_disk_and_cache(const std::string& key) {
  std::optional<Bytes> data;
  try {
    data = disk_->read(key);
  } catch (const std::exception& e) {
    // A failed read is a miss
    BOOST_LOG_TRIVIAL(warning) << "Image cache: Disk read failed for key " << key << ": " << e.what();
    return nullptr;
  }
  if (!data) {
    return nullptr;
  }

  BytesPtr blob = make_bytes(std::move(*data));
  if (config_.cache_in_memory) {
    memory_.insert(key, blob, cost_for(*blob));
  }
  BOOST_LOG_TRIVIAL(debug) << "Image cache: Disk hit for key: " << key << " (" << blob->size() << " bytes)";
  return blob;
}

void ImageCache::notify(const DoneCallback& callback) {
  if (!callback) {
    return;
  }
  try {
    callback();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Image cache: Completion callback threw: " << e.what();
  }
}

} // namespace cache
} // namespace webimg
