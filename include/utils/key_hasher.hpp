#pragma once

#include <string>
#include <stdexcept>

namespace webimg {
namespace utils {

class HashError : public std::runtime_error {
public:
  explicit HashError(const std::string& message) : std::runtime_error(message) {}
};

// Maps arbitrary cache keys to stable, filesystem safe file names.
class KeyHasher {
public:
  // ---- FILE NAMES ----
  // SHA-256 hex digest of the key followed by its extension, if one is derivable
  static std::string filename_for_key(const std::string& key);
  // SHA-256 hex digest of the key without extension, used by older cache layouts
  static std::string legacy_filename_for_key(const std::string& key);


  // ---- HELPERS ----
  // Lowercase hex SHA-256 digest using OpenSSL EVP
  static std::string sha256_hex(const std::string& input);
  // Extension of the last path segment of a URL or plain path, empty if none
  // or if it contains anything other than 1-16 ASCII alphanumerics
  static std::string extension_for_key(const std::string& key);
};

} // namespace utils
} // namespace webimg
