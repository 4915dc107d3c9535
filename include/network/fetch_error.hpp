#ifndef WEBIMG_NETWORK_FETCH_ERROR_HPP
#define WEBIMG_NETWORK_FETCH_ERROR_HPP

#include <string>

namespace webimg {
namespace network {

enum class ErrorKind {
  TransportFailure = 0,
  DecodeFailure,
  Canceled,
  Declined,
  Blacklisted
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::TransportFailure: return "Transport failure";
    case ErrorKind::DecodeFailure: return "Decode failure";
    case ErrorKind::Canceled: return "Canceled";
    case ErrorKind::Declined: return "Declined";
    case ErrorKind::Blacklisted: return "Blacklisted";
    default: return "Undefined error";
  }
}

// Outcome of a failed fetch. Delivered as a value to every subscriber.
struct FetchError {
  ErrorKind kind{ErrorKind::TransportFailure};
  // HTTP status, 0 when the failure happened below HTTP
  unsigned status{0};
  std::string message;
  // Timeouts, DNS and connect failures: worth trying again later
  bool transient{false};

  std::string to_string() const {
    std::string text = error_kind_to_string(kind);
    if (status != 0) {
      text += " (HTTP " + std::to_string(status) + ")";
    }
    if (!message.empty()) {
      text += ": " + message;
    }
    return text;
  }
};

inline FetchError make_error(ErrorKind kind, std::string message, unsigned status = 0, bool transient = false) {
  return FetchError{kind, status, std::move(message), transient};
}

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_FETCH_ERROR_HPP
