#include "store/memory_store.hpp"
#include <boost/log/trivial.hpp>

namespace webimg {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryStore::MemoryStore(std::size_t max_cost, std::size_t max_count)
  : max_cost_(max_cost)
  , max_count_(max_count) {
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Created with max cost " << max_cost_
                           << " and max count " << max_count_;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool MemoryStore::insert(const std::string& key, BytesPtr value, std::size_t cost) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = index_.find(key);
  if (existing != index_.end()) {
    erase_locked(existing->second);
  }

  if (max_cost_ > 0 && cost > max_cost_) {
    BOOST_LOG_TRIVIAL(debug) << "Memory store: Entry for key " << key << " with cost " << cost
                             << " exceeds limit " << max_cost_;
    return false;
  }

  entries_.push_front(Entry{key, std::move(value), cost});
  index_[key] = entries_.begin();
  total_cost_ += cost;

  evict_to_limits();
  return true;
}

BytesPtr MemoryStore::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  entries_.splice(entries_.begin(), entries_, it->second);
  return it->second->value;
}

bool MemoryStore::erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }
  erase_locked(it->second);
  return true;
}

void MemoryStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Clearing " << entries_.size() << " entries";
  entries_.clear();
  index_.clear();
  total_cost_ = 0;
}


//==============================================
// LIMITS
//==============================================

void MemoryStore::set_max_cost(std::size_t max_cost) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_cost_ = max_cost;
  evict_to_limits();
}

void MemoryStore::set_max_count(std::size_t max_count) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_count_ = max_count;
  evict_to_limits();
}

std::size_t MemoryStore::max_cost() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_cost_;
}

std::size_t MemoryStore::max_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_count_;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool MemoryStore::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.find(key) != index_.end();
}

std::size_t MemoryStore::total_cost() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_cost_;
}

std::size_t MemoryStore::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}


//==============================================
// EVICTION
//==============================================

void MemoryStore::evict_to_limits() {
  while (!entries_.empty() &&
         ((max_cost_ > 0 && total_cost_ > max_cost_) ||
          (max_count_ > 0 && entries_.size() > max_count_))) {
    auto victim = std::prev(entries_.end());
    BOOST_LOG_TRIVIAL(trace) << "Memory store: Evicting key: " << victim->key;
    erase_locked(victim);
  }
}

void MemoryStore::erase_locked(EntryList::iterator it) {
  total_cost_ -= it->cost;
  index_.erase(it->key);
  entries_.erase(it);
}

} // namespace store
} // namespace webimg
