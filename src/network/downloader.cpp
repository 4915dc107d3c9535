#include "network/downloader.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "network/beast_transport.hpp"

namespace webimg {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Downloader::Downloader(DownloaderConfig config, std::shared_ptr<Transport> transport,
                       std::shared_ptr<codec::ImageDecoder> decoder)
  : config_(std::move(config))
  , transport_(transport ? std::move(transport) : std::make_shared<BeastTransport>())
  , decoder_(std::move(decoder))
  , queue_(config_.max_concurrent_downloads, config_.execution_order) {
  if (config_.download_timeout.count() <= 0) {
    config_.download_timeout = std::chrono::seconds(15);
  }
  BOOST_LOG_TRIVIAL(info) << "Downloader: Initialized with " << config_.max_concurrent_downloads
                          << " concurrent downloads, timeout " << config_.download_timeout.count() << "s";
}

Downloader::~Downloader() {
  connections_.clear();
  cancel_all();
  queue_.shutdown();
  BOOST_LOG_TRIVIAL(debug) << "Downloader: Destroyed";
}


//==============================================
// FETCH OPERATIONS
//==============================================

CancellationToken Downloader::fetch(const std::string& url, const FetchOptions& options,
                                    ProgressCallback progress, CompletionCallback completion) {
  if (!Url::parse(url)) {
    BOOST_LOG_TRIVIAL(warning) << "Downloader: Rejecting invalid URL: '" << url << "'";
    if (completion) {
      completion(FetchResult{nullptr, std::nullopt, make_error(ErrorKind::TransportFailure, "invalid URL"), true});
    }
    return CancellationToken{};
  }

  CancellationToken token{url, next_subscriber_id_.fetch_add(1)};
  FetchOperation::Subscriber subscriber{token.subscriber_id, std::move(progress), std::move(completion),
                                        options.ignore_cached_response ? options.cached_data : nullptr};

  // Built outside the registry lock, the headers filter is client code
  Request request = make_request(url, options);

  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = registry_.find(url);
  if (it != registry_.end() && it->second->add_subscriber(subscriber)) {
    BOOST_LOG_TRIVIAL(debug) << "Downloader: Joined in-flight fetch of " << url;
    queue_.raise_priority(it->second, options.priority());
    return token;
  }

  // None in flight, or the registered one already reached a terminal state
  auto operation = std::make_shared<FetchOperation>(
      std::move(request), options, transport_, decoder_,
      [this](const std::shared_ptr<FetchOperation>& finished) { operation_finished(finished); });
  operation->add_subscriber(std::move(subscriber));
  registry_[url] = operation;

  // Queued under the registry lock so a concurrent cancel cannot finish it first
  queue_.add(operation, options.priority());
  BOOST_LOG_TRIVIAL(debug) << "Downloader: Queued fetch of " << url;
  return token;
}

bool Downloader::cancel(const CancellationToken& token) {
  if (!token.valid()) {
    return false;
  }

  std::shared_ptr<FetchOperation> operation;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(token.url);
    if (it == registry_.end()) {
      return false;
    }
    if (!it->second->remove_subscriber(token.subscriber_id)) {
      return false;
    }
    operation = it->second;
    registry_.erase(it);
  }

  BOOST_LOG_TRIVIAL(info) << "Downloader: Canceled fetch of " << token.url;
  operation->cancel_transport();
  queue_.finished(operation);
  return true;
}

void Downloader::cancel_all() {
  auto operations = snapshot();
  if (operations.empty()) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Downloader: Canceling " << operations.size() << " fetches";
  for (const auto& operation : operations) {
    operation->force_cancel("all downloads canceled");
  }
}


//==============================================
// QUEUE CONTROL
//==============================================

void Downloader::set_suspended(bool suspended) {
  queue_.set_suspended(suspended);
}

bool Downloader::suspended() const {
  return queue_.suspended();
}

void Downloader::set_max_concurrent_downloads(std::size_t max_concurrent) {
  queue_.set_max_concurrent(max_concurrent);
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_.max_concurrent_downloads = max_concurrent;
}

std::size_t Downloader::max_concurrent_downloads() const {
  return queue_.max_concurrent();
}

void Downloader::set_execution_order(ExecutionOrder order) {
  queue_.set_execution_order(order);
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_.execution_order = order;
}

std::size_t Downloader::current_download_count() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return registry_.size();
}


//==============================================
// HEADERS
//==============================================

void Downloader::set_header(const std::string& name, const std::string& value) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  if (value.empty()) {
    config_.headers.erase(name);
  } else {
    config_.headers[name] = value;
  }
}

std::optional<std::string> Downloader::header(const std::string& name) const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  auto it = config_.headers.find(name);
  if (it == config_.headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Downloader::set_headers_filter(HeadersFilter filter) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_.headers_filter = std::move(filter);
}

void Downloader::set_credentials(const std::string& username, const std::string& password) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_.username = username;
  config_.password = password;
}


//==============================================
// LIFECYCLE
//==============================================

void Downloader::on_process_suspending() {
  std::size_t kept = 0;
  for (const auto& operation : snapshot()) {
    if (operation->options().continue_in_background) {
      ++kept;
      continue;
    }
    operation->force_cancel("process suspending");
  }
  BOOST_LOG_TRIVIAL(info) << "Downloader: Process suspending, " << kept << " fetches continue in background";
}

void Downloader::on_background_time_expired() {
  auto operations = snapshot();
  BOOST_LOG_TRIVIAL(info) << "Downloader: Background time expired, canceling " << operations.size() << " fetches";
  for (const auto& operation : operations) {
    operation->force_cancel("background time expired");
  }
}

void Downloader::connect_lifecycle(lifecycle::LifecycleSignals& signals) {
  connections_.emplace_back(signals.process_suspending.connect([this]() { on_process_suspending(); }));
  connections_.emplace_back(signals.background_time_expired.connect([this]() { on_background_time_expired(); }));
  BOOST_LOG_TRIVIAL(debug) << "Downloader: Connected to lifecycle signals";
}


//==============================================
// HELPERS
//==============================================

Request Downloader::make_request(const std::string& url, const FetchOptions& options) const {
  Request request;
  request.url = url;
  HeadersFilter filter;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    request.headers = config_.headers;
    request.timeout = config_.download_timeout;
    request.username = config_.username;
    request.password = config_.password;
    filter = config_.headers_filter;
  }

  request.cache_policy = options.use_protocol_cache ? CachePolicy::UseProtocolCache
                                                    : CachePolicy::ReloadIgnoringProtocolCache;
  request.allow_invalid_certificates = options.allow_invalid_certificates;

  if (filter) {
    request.headers = filter(url, request.headers);
  }
  return request;
}

void Downloader::operation_finished(const std::shared_ptr<FetchOperation>& operation) {
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(operation->url());
    // A newer fetch may already own the slot
    if (it != registry_.end() && it->second == operation) {
      registry_.erase(it);
    }
  }
  queue_.finished(operation);
}

std::vector<std::shared_ptr<FetchOperation>> Downloader::snapshot() const {
  std::vector<std::shared_ptr<FetchOperation>> operations;
  std::lock_guard<std::mutex> lock(registry_mutex_);
  operations.reserve(registry_.size());
  for (const auto& [url, operation] : registry_) {
    operations.push_back(operation);
  }
  return operations;
}

} // namespace network
} // namespace webimg
