#include "utils/key_hasher.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace webimg {
namespace utils {

namespace {

constexpr std::size_t kMaxExtensionLength = 16;

} // namespace

//==============================================
// FILE NAMES
//==============================================

std::string KeyHasher::filename_for_key(const std::string& key) {
  std::string filename = sha256_hex(key);
  std::string ext = extension_for_key(key);
  if (!ext.empty()) {
    filename += "." + ext;
  }
  return filename;
}

std::string KeyHasher::legacy_filename_for_key(const std::string& key) {
  return sha256_hex(key);
}


//==============================================
// HELPERS
//==============================================

std::string KeyHasher::sha256_hex(const std::string& input) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw HashError("Key hasher: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw HashError("Key hasher: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx.get(), input.data(), input.size())) {
    throw HashError("Key hasher: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw HashError("Key hasher: Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string KeyHasher::extension_for_key(const std::string& key) {
  std::string path = key;

  // For URL shaped keys only the path component counts
  auto scheme_end = path.find("://");
  if (scheme_end != std::string::npos) {
    path = path.substr(scheme_end + 3);
    auto path_start = path.find('/');
    path = (path_start == std::string::npos) ? std::string() : path.substr(path_start);
  }

  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path.erase(cut);
  }

  auto last_slash = path.find_last_of('/');
  std::string segment = (last_slash == std::string::npos) ? path : path.substr(last_slash + 1);

  auto dot = segment.find_last_of('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == segment.size()) {
    return {};
  }

  std::string ext = segment.substr(dot + 1);
  if (ext.size() > kMaxExtensionLength) {
    return {};
  }
  for (char c : ext) {
    if (!std::isalnum(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) > 0x7f) {
      return {};
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Key hasher: Extension '" << ext << "' derived for key: " << key;
  return ext;
}

} // namespace utils
} // namespace webimg
