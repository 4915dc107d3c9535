#ifndef WEBIMG_MANAGER_IMAGE_MANAGER_HPP
#define WEBIMG_MANAGER_IMAGE_MANAGER_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "cache/image_cache.hpp"
#include "codec/image.hpp"
#include "network/downloader.hpp"
#include "network/fetch_error.hpp"
#include "utils/bytes.hpp"
#include "utils/serial_queue.hpp"

namespace webimg {
namespace manager {

struct ResolveOptions {
  // Try again even if the key failed before
  bool retry_failed{false};
  bool low_priority{false};
  bool high_priority{false};
  // Store fresh downloads in memory only
  bool memory_only{false};
  bool progressive{false};
  // Deliver the cached value, then revalidate with the server
  bool refresh_cached{false};
  bool continue_in_background{false};
  bool allow_invalid_certificates{false};
  // Apply the transform to animated images too
  bool transform_animated{false};
};

// One delivery to a resolve caller. Fresh downloads have tier None.
struct ResolveResult {
  BytesPtr data;
  std::optional<codec::Image> image;
  cache::CacheTier tier{cache::CacheTier::None};
  std::optional<network::FetchError> error;
  bool finished{true};
  std::string key;

  // Declined is an empty success
  bool succeeded() const { return !error || error->kind == network::ErrorKind::Declined; }
};

using ResolveProgress = std::function<void(std::int64_t received, std::int64_t expected)>;
using ResolveCompletion = std::function<void(const ResolveResult& result)>;

// Keys whose last fetch failed for a reason that will not go away on its own
class FailureBlacklist {
public:
  void add(const std::string& key);
  void remove(const std::string& key);
  bool contains(const std::string& key) const;
  std::size_t size() const;
  void clear();

private:
  std::set<std::string> keys_;
  mutable std::mutex mutex_;
};

struct ManagerConfig {
  bool blacklist_failed_keys{true};
  // Identifier to cache key, identity when unset
  std::function<std::string(const std::string& identifier)> key_filter;
  // Return false to skip the download of a cache miss
  std::function<bool(const std::string& identifier)> should_fetch;
  // Rewrites freshly downloaded data before it is cached, nullptr keeps it
  std::function<BytesPtr(const BytesPtr& data, const std::optional<codec::Image>& image,
                         const std::string& identifier)> transform;
  // Runs every caller callback, a dedicated callback thread when unset
  std::function<void(std::function<void()>)> callback_dispatcher;
};

// Counts the callbacks running inside a manager. Closing it refuses new ones
// and blocks until the running ones have left.
class CallbackGate {
public:
  // Held for the duration of one callback; false if the gate was closed
  class Pass {
  public:
    explicit Pass(CallbackGate& gate) : gate_(gate), entered_(gate.enter()) {}
    ~Pass() {
      if (entered_) {
        gate_.leave();
      }
    }
    Pass(const Pass&) = delete;
    Pass& operator=(const Pass&) = delete;

    explicit operator bool() const { return entered_; }

  private:
    CallbackGate& gate_;
    bool entered_;
  };

  void close();

private:
  bool enter();
  void leave();

  bool open_{true};
  std::size_t active_{0};
  std::condition_variable idle_;
  std::mutex mutex_;
};

class ImageManager;

// Returned by resolve(). Canceling stops any pending delivery.
class ResolveOperation {
public:
  explicit ResolveOperation(std::string key, std::weak_ptr<network::Downloader> downloader);

  void cancel();
  bool cancelled() const;
  const std::string& key() const { return key_; }

private:
  friend class ImageManager;

  std::string key_;
  std::weak_ptr<network::Downloader> downloader_;
  bool cancelled_{false};
  cache::QueryHandlePtr query_;
  std::optional<network::CancellationToken> token_;
  mutable std::mutex mutex_;

  void set_query(cache::QueryHandlePtr query);
  // False if canceled meanwhile; the caller then leaves the fetch itself
  bool set_token(const network::CancellationToken& token);
};

using ResolveHandle = std::shared_ptr<ResolveOperation>;

// Resolve-or-fetch entry point composing the two-tier cache and the
// download coordinator. Safe to call from any thread.
class ImageManager {
public:
  // Delete copy operations, the manager owns its callback thread
  ImageManager(const ImageManager&) = delete;
  ImageManager& operator=(const ImageManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ImageManager(std::shared_ptr<cache::ImageCache> cache, std::shared_ptr<network::Downloader> downloader,
               ManagerConfig config = ManagerConfig(), std::shared_ptr<codec::ImageDecoder> decoder = nullptr);
  // Waits for callbacks already running inside the manager, so it must not be
  // destroyed from one of its own callbacks
  ~ImageManager();


  // ---- RESOLVE OPERATIONS ----
  ResolveHandle resolve(const std::string& identifier, const ResolveOptions& options,
                        ResolveProgress progress, ResolveCompletion completion);
  void cancel(const ResolveHandle& handle);
  void cancel_all();
  bool is_busy() const;


  // ---- CACHE HELPERS ----
  std::string cache_key_for(const std::string& identifier) const;
  void save_to_cache(BytesPtr data, const std::string& identifier);
  // Memory, then disk
  void cached_exists(const std::string& identifier, cache::ExistsCallback on_done);
  void disk_exists(const std::string& identifier, cache::ExistsCallback on_done);


  // ---- GETTERS ----
  cache::ImageCache& cache() { return *cache_; }
  network::Downloader& downloader() { return *downloader_; }
  FailureBlacklist& blacklist() { return blacklist_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<cache::ImageCache> cache_;
  std::shared_ptr<network::Downloader> downloader_;
  ManagerConfig config_;
  std::shared_ptr<codec::ImageDecoder> decoder_;
  FailureBlacklist blacklist_;

  // Shared with every callback handed to the cache and the downloader
  std::shared_ptr<CallbackGate> gate_;

  std::vector<ResolveHandle> running_;
  mutable std::mutex running_mutex_;

  // Default dispatcher, only created when none is configured
  std::unique_ptr<utils::SerialQueue> callback_queue_;


  // ---- RESOLVE STEPS ----
  void on_cache_result(const ResolveHandle& handle, const std::string& identifier, const ResolveOptions& options,
                       const cache::CacheEntry& entry, ResolveProgress progress, ResolveCompletion completion);
  void on_fetch_result(const ResolveHandle& handle, const ResolveOptions& options, bool had_cached_value,
                       const network::FetchResult& fetched, const std::string& identifier,
                       const ResolveCompletion& completion);


  // ---- HELPERS ----
  void deliver(const ResolveHandle& handle, const ResolveCompletion& completion, ResolveResult result);
  void dispatch(std::function<void()> work);
  void finish(const ResolveHandle& handle);
  std::optional<codec::Image> decode(const BytesPtr& data) const;
  static network::FetchOptions fetch_options_for(const ResolveOptions& options);
};

// Manager with a disk cache in the default directory, a BeastTransport
// downloader and a HeaderDecoder
std::unique_ptr<ImageManager> make_default_manager(const std::string& name_space = "default");

} // namespace manager
} // namespace webimg

#endif // WEBIMG_MANAGER_IMAGE_MANAGER_HPP
