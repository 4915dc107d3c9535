#ifndef WEBIMG_NETWORK_TRANSPORT_HPP
#define WEBIMG_NETWORK_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "network/fetch_error.hpp"
#include "network/request.hpp"

namespace webimg {
namespace network {

struct Response {
  unsigned status{0};
  // Content-Length, -1 when unknown
  std::int64_t expected_length{-1};
  HeaderMap headers;
};

struct Credential {
  std::string username;
  std::string password;
};

// Receives the events of one transfer. Events of a task arrive one at a time,
// in order: on_response, any number of on_data, then on_complete.
class TransportDelegate {
public:
  virtual ~TransportDelegate() = default;

  // Return false to cancel the transfer; no on_complete follows
  virtual bool on_response(const Response& response) = 0;
  virtual void on_data(const std::uint8_t* data, std::size_t size) = 0;
  // Success when error is empty
  virtual void on_complete(const std::optional<FetchError>& error) = 0;

  // Return false to refuse the redirect; the 3xx response is then delivered
  virtual bool on_redirect(const std::string& location) {
    (void)location;
    return true;
  }
  // Credential to answer a 401 with, nullopt to deliver the 401 as is
  virtual std::optional<Credential> on_auth_challenge(unsigned previous_failures) {
    (void)previous_failures;
    return std::nullopt;
  }
};

class TransportTask {
public:
  virtual ~TransportTask() = default;
  virtual void start() = 0;
  // No event starts after cancel() returns. The FetchOperation tolerates one
  // that was already being delivered.
  virtual void cancel() = 0;
};

// HTTP client collaborator. The delegate is held weakly; a task whose delegate
// is gone stops at its next event.
class Transport {
public:
  virtual ~Transport() = default;
  virtual std::shared_ptr<TransportTask> create_task(const Request& request,
                                                     std::weak_ptr<TransportDelegate> delegate) = 0;
};

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_TRANSPORT_HPP
