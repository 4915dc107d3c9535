#ifndef WEBIMG_UTILS_BYTES_HPP
#define WEBIMG_UTILS_BYTES_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace webimg {

using Bytes = std::vector<std::uint8_t>;
// Immutable blob shared between subscribers and cache tiers
using BytesPtr = std::shared_ptr<const Bytes>;

inline BytesPtr make_bytes(Bytes data) {
  return std::make_shared<const Bytes>(std::move(data));
}

inline BytesPtr make_bytes(const std::string& data) {
  return std::make_shared<const Bytes>(data.begin(), data.end());
}

} // namespace webimg

#endif // WEBIMG_UTILS_BYTES_HPP
