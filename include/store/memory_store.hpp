#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include "utils/bytes.hpp"

namespace webimg {
namespace store {

// Thread safe key/value store bounded by entry count and total cost. When an
// insert pushes it over either bound, least recently used entries are
// evicted until both hold again. A limit of 0 means unbounded.
class MemoryStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryStore(std::size_t max_cost = 0, std::size_t max_count = 0);


  // ---- CORE STORAGE OPERATIONS ----
  // Inserts or replaces; false if the entry alone exceeds the cost limit
  bool insert(const std::string& key, BytesPtr value, std::size_t cost);
  // Returns the value and marks it recently used, nullptr on miss
  BytesPtr get(const std::string& key);
  bool erase(const std::string& key);
  // Drops everything, used for the low-memory signal
  void clear();


  // ---- LIMITS ----
  void set_max_cost(std::size_t max_cost);
  void set_max_count(std::size_t max_count);
  std::size_t max_cost() const;
  std::size_t max_count() const;


  // ---- QUERY OPERATIONS ----
  bool contains(const std::string& key) const;
  std::size_t total_cost() const;
  std::size_t count() const;

private:
  struct Entry {
    std::string key;
    BytesPtr value;
    std::size_t cost;
  };
  using EntryList = std::list<Entry>;

  // ---- PARAMETERS ----
  std::size_t max_cost_;
  std::size_t max_count_;
  std::size_t total_cost_{0};
  // Most recently used at the front
  EntryList entries_;
  std::unordered_map<std::string, EntryList::iterator> index_;
  mutable std::mutex mutex_;


  // ---- EVICTION ----
  // Requires mutex_ held
  void evict_to_limits();
  void erase_locked(EntryList::iterator it);
};

} // namespace store
} // namespace webimg
