#ifndef WEBIMG_NETWORK_FETCH_OPERATION_HPP
#define WEBIMG_NETWORK_FETCH_OPERATION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "codec/image.hpp"
#include "network/fetch_error.hpp"
#include "network/operation_queue.hpp"
#include "network/request.hpp"
#include "network/transport.hpp"
#include "utils/bytes.hpp"

namespace webimg {
namespace network {

struct FetchOptions {
  bool low_priority{false};
  bool high_priority{false};
  // Offer partial data to the decoder and deliver intermediate results
  bool progressive{false};
  bool use_protocol_cache{false};
  // Treat a body equal to cached_data as "not modified"
  bool ignore_cached_response{false};
  BytesPtr cached_data;
  bool continue_in_background{false};
  bool allow_invalid_certificates{false};

  QueuePriority priority() const {
    if (high_priority) {
      return QueuePriority::High;
    }
    return low_priority ? QueuePriority::Low : QueuePriority::Normal;
  }
};

// One delivery to a subscriber. A terminal result has finished set; an empty
// data blob without error means "not modified".
struct FetchResult {
  BytesPtr data;
  std::optional<codec::Image> image;
  std::optional<FetchError> error;
  bool finished{true};

  bool not_modified() const { return finished && !error && (!data || data->empty()); }
};

// expected is -1 while unknown
using ProgressCallback = std::function<void(std::int64_t received, std::int64_t expected)>;
using CompletionCallback = std::function<void(const FetchResult& result)>;

// The in-flight fetch for one URL, shared by every subscriber asking for it.
// It lives in the Downloader's registry until it reaches a terminal state or
// loses its last subscriber; from then on it refuses new subscribers.
class FetchOperation : public QueuedOperation,
                       public TransportDelegate,
                       public std::enable_shared_from_this<FetchOperation> {
public:
  // Called exactly once, when the operation leaves the running state on its own
  using FinishedHandler = std::function<void(const std::shared_ptr<FetchOperation>&)>;

  enum class State {
    Pending,
    Running,
    Finished
  };

  struct Subscriber {
    std::uint64_t id;
    ProgressCallback progress;
    CompletionCallback completion;
    // The copy this subscriber revalidates, null for a plain fetch
    BytesPtr cached_data;
  };

  // Delete copy operations, subscribers are identity bound
  FetchOperation(const FetchOperation&) = delete;
  FetchOperation& operator=(const FetchOperation&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FetchOperation(Request request, FetchOptions options, std::shared_ptr<Transport> transport,
                 std::shared_ptr<codec::ImageDecoder> decoder, FinishedHandler on_finished);
  ~FetchOperation() override;


  // ---- SUBSCRIBERS ----
  // False once the operation is finished; the caller then needs a new one
  bool add_subscriber(Subscriber subscriber);
  // True if the subscriber was the last one. The operation is then finished
  // without any delivery and the caller must cancel it.
  bool remove_subscriber(std::uint64_t subscriber_id);
  std::size_t subscriber_count() const;


  // ---- LIFECYCLE ----
  // Called by the OperationQueue
  void start() override;
  // Stops the transfer without notifying anyone
  void cancel_transport();
  // Completes every current subscriber with Canceled, then stops the transfer
  void force_cancel(const std::string& reason);


  // ---- GETTERS ----
  const std::string& url() const { return request_.url; }
  const FetchOptions& options() const { return options_; }
  State state() const;


  // ---- TRANSPORT EVENTS ----
  bool on_response(const Response& response) override;
  void on_data(const std::uint8_t* data, std::size_t size) override;
  void on_complete(const std::optional<FetchError>& error) override;
  bool on_redirect(const std::string& location) override;
  std::optional<Credential> on_auth_challenge(unsigned previous_failures) override;

private:
  // ---- PARAMETERS ----
  Request request_;
  FetchOptions options_;
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<codec::ImageDecoder> decoder_;
  FinishedHandler on_finished_;

  State state_{State::Pending};
  std::vector<Subscriber> subscribers_;
  std::shared_ptr<TransportTask> task_;
  Bytes buffer_;
  std::int64_t expected_{-1};
  mutable std::mutex mutex_;


  // ---- DELIVERY ----
  // Moves to Finished and hands result to every subscriber; no-op if already finished.
  // A "not modified" result only goes to subscribers holding the current
  // bytes, the others get those bytes as a fresh result.
  void finish(const FetchResult& result);
  bool holds_current_bytes(const Subscriber& subscriber) const;
  void fail(FetchError error);
  void notify_progress(const std::vector<Subscriber>& subscribers, std::int64_t received, std::int64_t expected);
  // Builds the terminal result from the accumulated body
  FetchResult build_result(Bytes body);
  FetchResult decoded_result(BytesPtr data);
};

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_FETCH_OPERATION_HPP
