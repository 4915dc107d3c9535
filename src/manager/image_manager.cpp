#include "manager/image_manager.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "codec/header_decoder.hpp"

namespace webimg {
namespace manager {

//==============================================
// FAILURE BLACKLIST
//==============================================

void FailureBlacklist::add(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.insert(key);
}

void FailureBlacklist::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(key);
}

bool FailureBlacklist::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.count(key) > 0;
}

std::size_t FailureBlacklist::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

void FailureBlacklist::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.clear();
}


//==============================================
// CALLBACK GATE
//==============================================

bool CallbackGate::enter() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return false;
  }
  ++active_;
  return true;
}

void CallbackGate::leave() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (--active_ == 0) {
    idle_.notify_all();
  }
}

void CallbackGate::close() {
  std::unique_lock<std::mutex> lock(mutex_);
  open_ = false;
  idle_.wait(lock, [this]() { return active_ == 0; });
}


//==============================================
// RESOLVE OPERATION
//==============================================

ResolveOperation::ResolveOperation(std::string key, std::weak_ptr<network::Downloader> downloader)
  : key_(std::move(key))
  , downloader_(std::move(downloader)) {}

void ResolveOperation::cancel() {
  cache::QueryHandlePtr query;
  std::optional<network::CancellationToken> token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    query = query_;
    token = token_;
  }

  if (query) {
    query->cancel();
  }
  if (token) {
    if (auto downloader = downloader_.lock()) {
      downloader->cancel(*token);
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Image manager: Canceled resolve of " << key_;
}

bool ResolveOperation::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void ResolveOperation::set_query(cache::QueryHandlePtr query) {
  bool cancel_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    query_ = query;
    cancel_now = cancelled_;
  }
  if (cancel_now && query) {
    query->cancel();
  }
}

bool ResolveOperation::set_token(const network::CancellationToken& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }
  token_ = token;
  return true;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ImageManager::ImageManager(std::shared_ptr<cache::ImageCache> cache, std::shared_ptr<network::Downloader> downloader,
                           ManagerConfig config, std::shared_ptr<codec::ImageDecoder> decoder)
  : cache_(std::move(cache))
  , downloader_(std::move(downloader))
  , config_(std::move(config))
  , decoder_(std::move(decoder))
  , gate_(std::make_shared<CallbackGate>()) {
  if (!cache_ || !downloader_) {
    throw std::invalid_argument("Image manager: cache and downloader are required");
  }
  if (!config_.callback_dispatcher) {
    callback_queue_ = std::make_unique<utils::SerialQueue>("webimg.manager.callbacks");
  }
  BOOST_LOG_TRIVIAL(info) << "Image manager: Initialized (blacklist "
                          << (config_.blacklist_failed_keys ? "on" : "off") << ")";
}

ImageManager::~ImageManager() {
  cancel_all();
  // A fetch result may be in the middle of delivery on a transport thread
  gate_->close();
  cache_->drain();
  if (callback_queue_) {
    callback_queue_->shutdown();
  }
  BOOST_LOG_TRIVIAL(debug) << "Image manager: Destroyed";
}


//==============================================
// RESOLVE OPERATIONS
//==============================================

ResolveHandle ImageManager::resolve(const std::string& identifier, const ResolveOptions& options,
                                    ResolveProgress progress, ResolveCompletion completion) {
  std::string key = identifier.empty() ? std::string() : cache_key_for(identifier);
  auto handle = std::make_shared<ResolveOperation>(key, downloader_);

  if (key.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Image manager: Resolve without identifier";
    deliver(handle, completion,
            ResolveResult{nullptr, std::nullopt, cache::CacheTier::None,
                          network::make_error(network::ErrorKind::TransportFailure, "empty identifier"), true, key});
    return handle;
  }

  if (!options.retry_failed && blacklist_.contains(key)) {
    BOOST_LOG_TRIVIAL(debug) << "Image manager: Key is blacklisted: " << key;
    deliver(handle, completion,
            ResolveResult{nullptr, std::nullopt, cache::CacheTier::None,
                          network::make_error(network::ErrorKind::Blacklisted, "previous fetch failed"), true, key});
    return handle;
  }

  {
    std::lock_guard<std::mutex> lock(running_mutex_);
    running_.push_back(handle);
  }

  auto query = cache_->query(key,
    [this, gate = gate_, handle, identifier, options, progress, completion](const cache::CacheEntry& entry) {
      CallbackGate::Pass pass(*gate);
      if (pass) {
        on_cache_result(handle, identifier, options, entry, progress, completion);
      }
    });
  handle->set_query(query);
  return handle;
}

void ImageManager::cancel(const ResolveHandle& handle) {
  if (!handle) {
    return;
  }
  handle->cancel();
  finish(handle);
}

void ImageManager::cancel_all() {
  std::vector<ResolveHandle> running;
  {
    std::lock_guard<std::mutex> lock(running_mutex_);
    running.swap(running_);
  }
  if (!running.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Image manager: Canceling " << running.size() << " resolves";
  }
  for (const auto& handle : running) {
    handle->cancel();
  }
}

bool ImageManager::is_busy() const {
  std::lock_guard<std::mutex> lock(running_mutex_);
  return std::any_of(running_.begin(), running_.end(),
                     [](const ResolveHandle& handle) { return !handle->cancelled(); });
}


//==============================================
// RESOLVE STEPS
//==============================================

void ImageManager::on_cache_result(const ResolveHandle& handle, const std::string& identifier,
                                   const ResolveOptions& options, const cache::CacheEntry& entry,
                                   ResolveProgress progress, ResolveCompletion completion) {
  if (handle->cancelled()) {
    finish(handle);
    return;
  }

  const bool hit = entry.found();
  if (hit) {
    BOOST_LOG_TRIVIAL(debug) << "Image manager: " << cache::tier_to_string(entry.origin_tier)
                             << " hit for " << handle->key();
    deliver(handle, completion,
            ResolveResult{entry.blob, decode(entry.blob), entry.origin_tier, std::nullopt, true, handle->key()});
    if (!options.refresh_cached) {
      finish(handle);
      return;
    }
  }

  if (config_.should_fetch && !config_.should_fetch(identifier)) {
    BOOST_LOG_TRIVIAL(debug) << "Image manager: Download declined for " << identifier;
    if (!hit) {
      deliver(handle, completion,
              ResolveResult{nullptr, std::nullopt, cache::CacheTier::None,
                            network::make_error(network::ErrorKind::Declined, "download declined"), true,
                            handle->key()});
    }
    finish(handle);
    return;
  }

  network::FetchOptions fetch_options = fetch_options_for(options);
  if (hit) {
    // Revalidate: identical bytes come back as "not modified"
    fetch_options.ignore_cached_response = true;
    fetch_options.cached_data = entry.blob;
    fetch_options.use_protocol_cache = true;
  }

  network::CancellationToken token = downloader_->fetch(identifier, fetch_options,
    [this, gate = gate_, handle, progress](std::int64_t received, std::int64_t expected) {
      CallbackGate::Pass pass(*gate);
      if (!pass || !progress) {
        return;
      }
      dispatch([handle, progress, received, expected]() {
        if (!handle->cancelled()) {
          progress(received, expected);
        }
      });
    },
    [this, gate = gate_, handle, options, hit, identifier, completion](const network::FetchResult& fetched) {
      CallbackGate::Pass pass(*gate);
      if (pass) {
        on_fetch_result(handle, options, hit, fetched, identifier, completion);
      }
    });

  if (token.valid() && !handle->set_token(token)) {
    downloader_->cancel(token);
  }
}

void ImageManager::on_fetch_result(const ResolveHandle& handle, const ResolveOptions& options, bool had_cached_value,
                                   const network::FetchResult& fetched, const std::string& identifier,
                                   const ResolveCompletion& completion) {
  const std::string& key = handle->key();

  if (handle->cancelled()) {
    if (fetched.finished) {
      finish(handle);
    }
    return;
  }

  if (fetched.error) {
    const network::FetchError& error = *fetched.error;
    if (config_.blacklist_failed_keys && error.kind != network::ErrorKind::Canceled && !error.transient) {
      BOOST_LOG_TRIVIAL(info) << "Image manager: Blacklisting " << key << " after " << error.to_string();
      blacklist_.add(key);
    }
    deliver(handle, completion,
            ResolveResult{nullptr, std::nullopt, cache::CacheTier::None, error, true, key});
    finish(handle);
    return;
  }

  // Progressive intermediate, never cached
  if (!fetched.finished) {
    deliver(handle, completion,
            ResolveResult{fetched.data, fetched.image, cache::CacheTier::None, std::nullopt, false, key});
    return;
  }

  if (fetched.not_modified()) {
    // The cached value was already delivered
    if (!had_cached_value) {
      deliver(handle, completion,
              ResolveResult{nullptr, std::nullopt, cache::CacheTier::None, std::nullopt, true, key});
    }
    finish(handle);
    return;
  }

  if (options.retry_failed) {
    blacklist_.remove(key);
  }

  BytesPtr data = fetched.data;
  std::optional<codec::Image> image = fetched.image;
  if (config_.transform && (!image || !image->animated || options.transform_animated)) {
    try {
      BytesPtr transformed = config_.transform(data, image, identifier);
      if (transformed && transformed != data) {
        data = transformed;
        image = decode(data);
      }
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Image manager: Transform of " << key << " threw, keeping original: " << e.what();
    }
  }

  cache_->store(key, data, image && !image->empty() ? image->cost() : 0, !options.memory_only);
  deliver(handle, completion, ResolveResult{data, image, cache::CacheTier::None, std::nullopt, true, key});
  finish(handle);
}


//==============================================
// CACHE HELPERS
//==============================================

std::string ImageManager::cache_key_for(const std::string& identifier) const {
  if (config_.key_filter) {
    return config_.key_filter(identifier);
  }
  return identifier;
}

void ImageManager::save_to_cache(BytesPtr data, const std::string& identifier) {
  if (!data || identifier.empty()) {
    return;
  }
  auto image = decode(data);
  cache_->store(cache_key_for(identifier), data, image && !image->empty() ? image->cost() : 0, true);
}

void ImageManager::cached_exists(const std::string& identifier, cache::ExistsCallback on_done) {
  std::string key = cache_key_for(identifier);
  if (cache_->get(key)) {
    if (on_done) {
      on_done(true);
    }
    return;
  }
  cache_->disk_exists(key, std::move(on_done));
}

void ImageManager::disk_exists(const std::string& identifier, cache::ExistsCallback on_done) {
  cache_->disk_exists(cache_key_for(identifier), std::move(on_done));
}


//==============================================
// HELPERS
//==============================================

void ImageManager::deliver(const ResolveHandle& handle, const ResolveCompletion& completion, ResolveResult result) {
  if (!completion) {
    return;
  }
  dispatch([handle, completion, result = std::move(result)]() {
    if (handle->cancelled()) {
      return;
    }
    try {
      completion(result);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Image manager: Completion callback threw: " << e.what();
    }
  });
}

void ImageManager::dispatch(std::function<void()> work) {
  if (config_.callback_dispatcher) {
    config_.callback_dispatcher(std::move(work));
    return;
  }
  callback_queue_->post(std::move(work));
}

void ImageManager::finish(const ResolveHandle& handle) {
  std::lock_guard<std::mutex> lock(running_mutex_);
  running_.erase(std::remove(running_.begin(), running_.end(), handle), running_.end());
}

std::optional<codec::Image> ImageManager::decode(const BytesPtr& data) const {
  if (!decoder_ || !data) {
    return std::nullopt;
  }
  return decoder_->decode(*data);
}

network::FetchOptions ImageManager::fetch_options_for(const ResolveOptions& options) {
  network::FetchOptions fetch_options;
  fetch_options.low_priority = options.low_priority;
  fetch_options.high_priority = options.high_priority;
  fetch_options.progressive = options.progressive;
  fetch_options.continue_in_background = options.continue_in_background;
  fetch_options.allow_invalid_certificates = options.allow_invalid_certificates;
  return fetch_options;
}


//==============================================
// DEFAULT INSTANCE
//==============================================

std::unique_ptr<ImageManager> make_default_manager(const std::string& name_space) {
  auto decoder = std::make_shared<codec::HeaderDecoder>();
  auto cache = std::make_shared<cache::ImageCache>(name_space, cache::ImageCache::default_directory(),
                                                   cache::CacheConfig(), decoder);
  auto downloader = std::make_shared<network::Downloader>(network::DownloaderConfig(), nullptr, decoder);
  return std::make_unique<ImageManager>(cache, downloader, ManagerConfig(), decoder);
}

} // namespace manager
} // namespace webimg
