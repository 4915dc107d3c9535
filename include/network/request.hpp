#ifndef WEBIMG_NETWORK_REQUEST_HPP
#define WEBIMG_NETWORK_REQUEST_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace webimg {
namespace network {

using HeaderMap = std::map<std::string, std::string>;

enum class CachePolicy {
  // Send "Cache-Control: no-cache", the image cache is the only cache
  ReloadIgnoringProtocolCache,
  // Let intermediaries answer, including 304 revalidation
  UseProtocolCache
};

// Parsed absolute http(s) URL
struct Url {
  std::string scheme;
  std::string host;
  std::string port;
  // Path and query, never empty
  std::string target;

  bool tls() const { return scheme == "https"; }
  std::string to_string() const;

  // nullopt unless the scheme is http or https and a host is present
  static std::optional<Url> parse(const std::string& text);
  // Resolves a Location header against this URL
  std::optional<Url> resolve(const std::string& location) const;
};

struct Request {
  std::string url;
  HeaderMap headers;
  CachePolicy cache_policy{CachePolicy::ReloadIgnoringProtocolCache};
  std::chrono::seconds timeout{15};
  // Basic credentials offered on a 401 challenge, ignored when username is empty
  std::string username;
  std::string password;
  bool allow_invalid_certificates{false};
};

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_REQUEST_HPP
