#ifndef WEBIMG_NETWORK_DOWNLOADER_HPP
#define WEBIMG_NETWORK_DOWNLOADER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/signals2/connection.hpp>
#include "codec/image.hpp"
#include "lifecycle/lifecycle_signals.hpp"
#include "network/fetch_operation.hpp"
#include "network/operation_queue.hpp"
#include "network/request.hpp"
#include "network/transport.hpp"

namespace webimg {
namespace network {

// Returned by fetch(). The only handle a caller keeps to leave a fetch.
struct CancellationToken {
  std::string url;
  std::uint64_t subscriber_id{0};

  bool valid() const { return subscriber_id != 0; }
};

// Rewrites the headers of the request for url
using HeadersFilter = std::function<HeaderMap(const std::string& url, const HeaderMap& headers)>;

struct DownloaderConfig {
  std::size_t max_concurrent_downloads{6};
  std::chrono::seconds download_timeout{15};
  ExecutionOrder execution_order{ExecutionOrder::FIFO};
  HeaderMap headers{{"Accept", "image/*,*/*;q=0.8"}};
  std::string username;
  std::string password;
  HeadersFilter headers_filter;
};

// Download coordinator. Concurrent fetches of the same URL share one
// FetchOperation; the operation queue bounds how many transfers run at once.
class Downloader {
public:
  // Delete copy operations, the downloader owns its registry and queue
  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // A null transport selects BeastTransport. A null decoder skips the
  // zero-extent check and progressive decoding.
  explicit Downloader(DownloaderConfig config = DownloaderConfig(),
                      std::shared_ptr<Transport> transport = nullptr,
                      std::shared_ptr<codec::ImageDecoder> decoder = nullptr);
  ~Downloader();


  // ---- FETCH OPERATIONS ----
  // Joins the in-flight fetch of url or starts a new one. An unusable url
  // completes synchronously with a TransportFailure and an invalid token.
  // A joiner can only raise the queue priority of the fetch; progressive,
  // continue_in_background and the request itself keep the first caller's
  // options. cached_data is honoured per subscriber.
  CancellationToken fetch(const std::string& url, const FetchOptions& options,
                          ProgressCallback progress, CompletionCallback completion);
  // Leaves the fetch without any callback. True if that canceled the transfer.
  bool cancel(const CancellationToken& token);
  // Completes every subscriber of every fetch with Canceled
  void cancel_all();


  // ---- QUEUE CONTROL ----
  void set_suspended(bool suspended);
  bool suspended() const;
  void set_max_concurrent_downloads(std::size_t max_concurrent);
  std::size_t max_concurrent_downloads() const;
  void set_execution_order(ExecutionOrder order);
  // In-flight fetches, queued or running
  std::size_t current_download_count() const;


  // ---- HEADERS ----
  // An empty value removes the header
  void set_header(const std::string& name, const std::string& value);
  std::optional<std::string> header(const std::string& name) const;
  void set_headers_filter(HeadersFilter filter);
  void set_credentials(const std::string& username, const std::string& password);


  // ---- LIFECYCLE ----
  // Fetches without continue_in_background are canceled; the others run until
  // the background time expires
  void on_process_suspending();
  void on_background_time_expired();
  void connect_lifecycle(lifecycle::LifecycleSignals& signals);

private:
  // ---- PARAMETERS ----
  DownloaderConfig config_;
  mutable std::mutex config_mutex_;
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<codec::ImageDecoder> decoder_;
  OperationQueue queue_;

  // In-flight registry, keyed by URL
  std::map<std::string, std::shared_ptr<FetchOperation>> registry_;
  mutable std::mutex registry_mutex_;
  std::atomic<std::uint64_t> next_subscriber_id_{1};

  std::vector<boost::signals2::scoped_connection> connections_;


  // ---- HELPERS ----
  Request make_request(const std::string& url, const FetchOptions& options) const;
  void operation_finished(const std::shared_ptr<FetchOperation>& operation);
  std::vector<std::shared_ptr<FetchOperation>> snapshot() const;
};

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_DOWNLOADER_HPP
