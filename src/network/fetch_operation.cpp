#include "network/fetch_operation.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace webimg {
namespace network {

namespace {

// Upper bound for reserving a body buffer from Content-Length
constexpr std::int64_t kMaxReserve = 32 * 1024 * 1024;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FetchOperation::FetchOperation(Request request, FetchOptions options, std::shared_ptr<Transport> transport,
                               std::shared_ptr<codec::ImageDecoder> decoder, FinishedHandler on_finished)
  : request_(std::move(request))
  , options_(std::move(options))
  , transport_(std::move(transport))
  , decoder_(std::move(decoder))
  , on_finished_(std::move(on_finished)) {
  BOOST_LOG_TRIVIAL(trace) << "Fetch: Created operation for " << request_.url;
}

FetchOperation::~FetchOperation() {
  BOOST_LOG_TRIVIAL(trace) << "Fetch: Destroyed operation for " << request_.url;
}


//==============================================
// SUBSCRIBERS
//==============================================

bool FetchOperation::add_subscriber(Subscriber subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::Finished) {
    return false;
  }
  subscribers_.push_back(std::move(subscriber));
  return true;
}

bool FetchOperation::remove_subscriber(std::uint64_t subscriber_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::Finished) {
    return false;
  }

  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [subscriber_id](const Subscriber& s) { return s.id == subscriber_id; });
  if (it == subscribers_.end()) {
    return false;
  }
  subscribers_.erase(it);

  if (!subscribers_.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Fetch: Subscriber left " << request_.url << ", "
                             << subscribers_.size() << " remain";
    return false;
  }

  // Last one out: nobody is left to deliver to
  state_ = State::Finished;
  buffer_.clear();
  BOOST_LOG_TRIVIAL(debug) << "Fetch: Last subscriber left " << request_.url;
  return true;
}

std::size_t FetchOperation::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}


//==============================================
// LIFECYCLE
//==============================================

void FetchOperation::start() {
  std::vector<Subscriber> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Pending) {
      return;
    }
    state_ = State::Running;
    subscribers = subscribers_;
  }

  BOOST_LOG_TRIVIAL(info) << "Fetch: Starting " << request_.url;
  notify_progress(subscribers, 0, -1);

  std::shared_ptr<TransportTask> task;
  try {
    task = transport_->create_task(request_, weak_from_this());
  } catch (const std::exception& e) {
    fail(make_error(ErrorKind::TransportFailure, std::string("could not create request: ") + e.what()));
    return;
  }
  if (!task) {
    fail(make_error(ErrorKind::TransportFailure, "could not create request"));
    return;
  }

  bool abandoned = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    abandoned = state_ == State::Finished;
    task_ = task;
  }

  // Canceled while the request was being created
  if (abandoned) {
    task->cancel();
    return;
  }
  task->start();
}

void FetchOperation::cancel_transport() {
  std::shared_ptr<TransportTask> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task = task_;
  }
  if (task) {
    BOOST_LOG_TRIVIAL(debug) << "Fetch: Canceling transfer of " << request_.url;
    task->cancel();
  }
}

void FetchOperation::force_cancel(const std::string& reason) {
  BOOST_LOG_TRIVIAL(info) << "Fetch: Force canceling " << request_.url << ": " << reason;
  fail(make_error(ErrorKind::Canceled, reason));
  cancel_transport();
}

FetchOperation::State FetchOperation::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}


//==============================================
// TRANSPORT EVENTS
//==============================================

bool FetchOperation::on_response(const Response& response) {
  if (state() != State::Running) {
    return false;
  }

  if (response.status == 304) {
    BOOST_LOG_TRIVIAL(debug) << "Fetch: Not modified: " << request_.url;
    finish(FetchResult{});
    return false;
  }

  if (response.status >= 400) {
    BOOST_LOG_TRIVIAL(warning) << "Fetch: HTTP " << response.status << " for " << request_.url;
    fail(make_error(ErrorKind::TransportFailure, "unacceptable status code", response.status));
    return false;
  }

  std::int64_t expected = response.expected_length > 0 ? response.expected_length : -1;
  std::vector<Subscriber> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Running) {
      return false;
    }
    expected_ = expected;
    if (expected > 0) {
      buffer_.reserve(static_cast<std::size_t>(std::min(expected, kMaxReserve)));
    }
    subscribers = subscribers_;
  }

  notify_progress(subscribers, 0, expected);
  return true;
}

void FetchOperation::on_data(const std::uint8_t* data, std::size_t size) {
  std::vector<Subscriber> subscribers;
  Bytes snapshot;
  std::int64_t received = 0;
  std::int64_t expected = -1;
  bool progressive = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Running) {
      return;
    }
    buffer_.insert(buffer_.end(), data, data + size);
    received = static_cast<std::int64_t>(buffer_.size());
    expected = expected_;
    subscribers = subscribers_;

    progressive = options_.progressive && decoder_ && decoder_->supports_incremental() && expected_ > 0;
    if (progressive) {
      snapshot = buffer_;
    }
  }

  notify_progress(subscribers, received, expected);

  if (!progressive) {
    return;
  }

  std::optional<codec::Image> image = decoder_->decode_incremental(snapshot, false);
  if (!image || image->empty()) {
    return;
  }

  FetchResult partial{make_bytes(std::move(snapshot)), image, std::nullopt, false};
  {
    // Subscribers may have left while decoding
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Running) {
      return;
    }
    subscribers = subscribers_;
  }
  for (const auto& subscriber : subscribers) {
    if (!subscriber.completion) {
      continue;
    }
    try {
      subscriber.completion(partial);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Fetch: Completion callback threw: " << e.what();
    }
  }
}

void FetchOperation::on_complete(const std::optional<FetchError>& error) {
  Bytes body;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Running) {
      return;
    }
    body.swap(buffer_);
  }

  if (error) {
    BOOST_LOG_TRIVIAL(warning) << "Fetch: Transfer of " << request_.url << " failed: " << error->to_string();
    fail(*error);
    return;
  }

  finish(build_result(std::move(body)));
}

bool FetchOperation::on_redirect(const std::string& location) {
  BOOST_LOG_TRIVIAL(debug) << "Fetch: " << request_.url << " redirected to " << location;
  return true;
}

std::optional<Credential> FetchOperation::on_auth_challenge(unsigned previous_failures) {
  // Offer the credential once, a second challenge means it was rejected
  if (previous_failures == 0 && !request_.username.empty()) {
    return Credential{request_.username, request_.password};
  }
  return std::nullopt;
}


//==============================================
// DELIVERY
//==============================================

FetchResult FetchOperation::build_result(Bytes body) {
  if (body.empty()) {
    return FetchResult{nullptr, std::nullopt, make_error(ErrorKind::DecodeFailure, "image data is empty"), true};
  }

  if (options_.ignore_cached_response && options_.cached_data && *options_.cached_data == body) {
    BOOST_LOG_TRIVIAL(debug) << "Fetch: Body unchanged from cached copy: " << request_.url;
    return FetchResult{};
  }

  return decoded_result(make_bytes(std::move(body)));
}

FetchResult FetchOperation::decoded_result(BytesPtr data) {
  std::optional<codec::Image> image;
  if (decoder_) {
    image = decoder_->decode(*data);
    if (!image || image->empty()) {
      return FetchResult{nullptr, std::nullopt,
                         make_error(ErrorKind::DecodeFailure, "downloaded image has 0 pixels"), true};
    }
  }
  return FetchResult{std::move(data), image, std::nullopt, true};
}

void FetchOperation::fail(FetchError error) {
  finish(FetchResult{nullptr, std::nullopt, std::move(error), true});
}

void FetchOperation::finish(const FetchResult& result) {
  std::vector<Subscriber> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Finished) {
      return;
    }
    state_ = State::Finished;
    subscribers.swap(subscribers_);
    buffer_.clear();
  }

  if (result.error) {
    BOOST_LOG_TRIVIAL(debug) << "Fetch: " << request_.url << " failed for " << subscribers.size()
                             << " subscribers: " << result.error->to_string();
  } else {
    BOOST_LOG_TRIVIAL(info) << "Fetch: Finished " << request_.url << " ("
                            << (result.data ? result.data->size() : 0) << " bytes, "
                            << subscribers.size() << " subscribers)";
  }

  // Joiners without the revalidated copy still need the bytes
  std::optional<FetchResult> current;
  for (const auto& subscriber : subscribers) {
    if (!subscriber.completion) {
      continue;
    }
    const FetchResult* delivered = &result;
    if (result.not_modified() && options_.cached_data && !holds_current_bytes(subscriber)) {
      if (!current) {
        current = decoded_result(options_.cached_data);
      }
      delivered = &*current;
    }
    try {
      subscriber.completion(*delivered);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Fetch: Completion callback threw: " << e.what();
    }
  }

  if (on_finished_) {
    on_finished_(shared_from_this());
  }
}

bool FetchOperation::holds_current_bytes(const Subscriber& subscriber) const {
  if (!subscriber.cached_data) {
    return false;
  }
  return subscriber.cached_data == options_.cached_data || *subscriber.cached_data == *options_.cached_data;
}

void FetchOperation::notify_progress(const std::vector<Subscriber>& subscribers, std::int64_t received,
                                     std::int64_t expected) {
  for (const auto& subscriber : subscribers) {
    if (!subscriber.progress) {
      continue;
    }
    try {
      subscriber.progress(received, expected);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Fetch: Progress callback threw: " << e.what();
    }
  }
}

} // namespace network
} // namespace webimg
