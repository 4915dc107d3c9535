#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "utils/bytes.hpp"

namespace webimg {
namespace store {

// One regular file under the primary root, as seen by an eviction sweep
struct DiskEntry {
  std::filesystem::path path;
  std::chrono::system_clock::time_point modified;
  std::uintmax_t allocated_size{0};
  std::uintmax_t file_size{0};
};

// Durable blob storage keyed by cache key. Implementations are not required to
// be thread safe: the two-tier cache serializes every call through its disk
// queue.
class DiskStore {
public:
  virtual ~DiskStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Writes data under the primary root, replacing any previous value
  virtual void write(const std::string& key, const Bytes& data) = 0;
  // Searches the primary root, then the read-only roots in registration order.
  // Returns nullopt on a miss or an unreadable file.
  virtual std::optional<Bytes> read(const std::string& key) = 0;
  // Removes the value from the primary root, false if nothing was removed
  virtual bool remove(const std::string& key) = 0;
  // Removes every file under the primary root and recreates it
  virtual void clear() = 0;


  // ---- QUERY OPERATIONS ----
  // True if the key exists under the primary root (with or without extension)
  virtual bool contains(const std::string& key) const = 0;
  // Path the key is written to under the primary root
  virtual std::filesystem::path path_for_key(const std::string& key) const = 0;
  // Regular files under the primary root
  virtual std::vector<DiskEntry> entries() const = 0;
  // Deletes one file found by entries(), false on failure
  virtual bool remove_entry(const std::filesystem::path& path) = 0;


  // ---- READ-ONLY ROOTS ----
  virtual void add_read_only_root(const std::filesystem::path& root) = 0;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace webimg
