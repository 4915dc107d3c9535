#include "store/file_store.hpp"
#include "utils/key_hasher.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <sys/stat.h>

namespace webimg {
namespace store {

namespace {

// Modification time and allocated size straight from stat(2): std::filesystem
// reports neither allocated blocks nor a system_clock timestamp in C++17.
bool stat_entry(const std::filesystem::path& path, DiskEntry& entry) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  entry.path = path;
  entry.modified = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
  entry.allocated_size = static_cast<std::uintmax_t>(st.st_blocks) * 512;
  entry.file_size = static_cast<std::uintmax_t>(st.st_size);
  return true;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileStore::FileStore(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "File store: Initializing store with root: " << root_.string();
  try {
    check_directory_exists(root_);
  } catch (const std::filesystem::filesystem_error& e) {
    // Writes will retry creating it
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to create root directory: " << e.what();
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FileStore::write(const std::string& key, const Bytes& data) {
  std::filesystem::path file_path = path_for_key(key);
  BOOST_LOG_TRIVIAL(debug) << "File store: Writing " << data.size() << " bytes to: " << file_path.string();

  try {
    check_directory_exists(root_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("File store: Failed to create directory: " + std::string(e.what()));
  }

  // Write next to the target and rename so readers never see a partial file
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("File store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      throw StoreError("File store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StoreError("File store: Failed to move file into place: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "File store: Stored " << data.size() << " bytes for key: " << key;
}

std::optional<Bytes> FileStore::read(const std::string& key) {
  if (auto data = read_from_root(root_, key)) {
    return data;
  }

  for (const auto& root : read_only_roots_) {
    if (auto data = read_from_root(root, key)) {
      BOOST_LOG_TRIVIAL(debug) << "File store: Key found in read-only root: " << root.string();
      return data;
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "File store: Key not found: " << key;
  return std::nullopt;
}

bool FileStore::remove(const std::string& key) {
  std::error_code ec;
  bool removed = std::filesystem::remove(path_for_key(key), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "File store: Failed to remove key " << key << ": " << ec.message();
    return false;
  }
  // Older layouts stored the same key without extension
  removed = std::filesystem::remove(root_ / utils::KeyHasher::legacy_filename_for_key(key), ec) || removed;
  BOOST_LOG_TRIVIAL(debug) << "File store: Remove key " << key << (removed ? " succeeded" : " found nothing");
  return removed;
}

void FileStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "File store: Clearing store at: " << root_.string();
  std::error_code ec;
  std::filesystem::remove_all(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to clear store: " << ec.message();
  }
  try {
    check_directory_exists(root_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("File store: Failed to recreate root: " + std::string(e.what()));
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileStore::contains(const std::string& key) const {
  std::error_code ec;
  if (std::filesystem::exists(path_for_key(key), ec)) {
    return true;
  }
  return std::filesystem::exists(root_ / utils::KeyHasher::legacy_filename_for_key(key), ec);
}

std::filesystem::path FileStore::path_for_key(const std::string& key) const {
  return root_ / utils::KeyHasher::filename_for_key(key);
}

std::vector<DiskEntry> FileStore::entries() const {
  std::vector<DiskEntry> result;
  std::error_code ec;

  auto it = std::filesystem::recursive_directory_iterator(
      root_, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "File store: Cannot enumerate " << root_.string() << ": " << ec.message();
    return result;
  }

  for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "File store: Enumeration error: " << ec.message();
      break;
    }
    const auto& path = it->path();
    // Hidden files are not ours
    if (path.filename().string().rfind('.', 0) == 0) {
      continue;
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }
    DiskEntry entry;
    if (stat_entry(path, entry)) {
      result.push_back(std::move(entry));
    }
  }
  return result;
}

bool FileStore::remove_entry(const std::filesystem::path& path) {
  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "File store: Failed to delete " << path.string() << ": " << ec.message();
    return false;
  }
  return removed;
}


//==============================================
// READ-ONLY ROOTS
//==============================================

void FileStore::add_read_only_root(const std::filesystem::path& root) {
  if (std::find(read_only_roots_.begin(), read_only_roots_.end(), root) != read_only_roots_.end()) {
    return;
  }
  read_only_roots_.push_back(root);
  BOOST_LOG_TRIVIAL(info) << "File store: Added read-only root: " << root.string();
}


//==============================================
// UTILITY METHODS
//==============================================

void FileStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::optional<Bytes> FileStore::read_from_root(const std::filesystem::path& root, const std::string& key) const {
  if (auto data = read_file(root / utils::KeyHasher::filename_for_key(key))) {
    return data;
  }
  return read_file(root / utils::KeyHasher::legacy_filename_for_key(key));
}

std::optional<Bytes> FileStore::read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  std::streamsize size = file.tellg();
  if (size < 0) {
    return std::nullopt;
  }
  file.seekg(0, std::ios::beg);

  Bytes data(static_cast<std::size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    BOOST_LOG_TRIVIAL(warning) << "File store: Short read from: " << path.string();
    return std::nullopt;
  }
  return data;
}

} // namespace store
} // namespace webimg
