#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "store/store.hpp"

namespace webimg {
namespace store {

// DiskStore on the local filesystem. Files are named by KeyHasher and laid out
// flat under the primary root: {root}/{sha256}[.ext]
class FileStore : public DiskStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileStore(const std::filesystem::path& root);


  // ---- CORE STORAGE OPERATIONS ----
  void write(const std::string& key, const Bytes& data) override;
  std::optional<Bytes> read(const std::string& key) override;
  bool remove(const std::string& key) override;
  void clear() override;


  // ---- QUERY OPERATIONS ----
  bool contains(const std::string& key) const override;
  std::filesystem::path path_for_key(const std::string& key) const override;
  std::vector<DiskEntry> entries() const override;
  bool remove_entry(const std::filesystem::path& path) override;


  // ---- READ-ONLY ROOTS ----
  void add_read_only_root(const std::filesystem::path& root) override;

  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  // Primary root, the only one ever written to
  std::filesystem::path root_;
  // Auxiliary roots searched on primary misses
  std::vector<std::filesystem::path> read_only_roots_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Tries {root}/{name} then {root}/{legacy name}
  std::optional<Bytes> read_from_root(const std::filesystem::path& root, const std::string& key) const;
  static std::optional<Bytes> read_file(const std::filesystem::path& path);
};

} // namespace store
} // namespace webimg
