#include "network/request.hpp"
#include <algorithm>
#include <cctype>

namespace webimg {
namespace network {

std::string Url::to_string() const {
  std::string text = scheme + "://" + host;
  bool default_port = (tls() && port == "443") || (!tls() && port == "80");
  if (!default_port) {
    text += ":" + port;
  }
  return text + target;
}

std::optional<Url> Url::parse(const std::string& text) {
  auto scheme_end = text.find("://");
  if (scheme_end == std::string::npos) {
    return std::nullopt;
  }

  Url url;
  url.scheme = text.substr(0, scheme_end);
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (url.scheme != "http" && url.scheme != "https") {
    return std::nullopt;
  }

  std::string rest = text.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, path_start);
  url.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

  // Fragments never go on the wire
  auto fragment = url.target.find('#');
  if (fragment != std::string::npos) {
    url.target.erase(fragment);
  }
  if (url.target.empty() || url.target[0] != '/') {
    url.target.insert(0, "/");
  }

  // Drop userinfo
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority.erase(0, at + 1);
  }

  // Bracketed IPv6 literal
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    url.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      url.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      url.host = authority.substr(0, colon);
      url.port = authority.substr(colon + 1);
    } else {
      url.host = authority;
    }
  }

  if (url.host.empty()) {
    return std::nullopt;
  }
  if (url.port.empty()) {
    url.port = url.tls() ? "443" : "80";
  }
  if (!std::all_of(url.port.begin(), url.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  return url;
}

std::optional<Url> Url::resolve(const std::string& location) const {
  if (location.empty()) {
    return std::nullopt;
  }
  if (location.find("://") != std::string::npos) {
    return parse(location);
  }
  // Scheme relative
  if (location.compare(0, 2, "//") == 0) {
    return parse(scheme + ":" + location);
  }

  Url next = *this;
  if (location[0] == '/') {
    next.target = location;
  } else {
    std::string base = target.substr(0, target.find('?'));
    next.target = base.substr(0, base.rfind('/') + 1) + location;
  }
  return next;
}

} // namespace network
} // namespace webimg
