#include "network/operation_queue.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace webimg {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

OperationQueue::OperationQueue(std::size_t max_concurrent, ExecutionOrder order)
  : max_concurrent_(max_concurrent)
  , order_(order)
  , pool_(std::max<std::size_t>(1, max_concurrent)) {
  if (max_concurrent == 0) {
    throw std::invalid_argument("Operation queue: max_concurrent must be at least 1");
  }
  BOOST_LOG_TRIVIAL(debug) << "Operation queue: Created with " << max_concurrent_ << " slots, "
                           << (order_ == ExecutionOrder::FIFO ? "FIFO" : "LIFO") << " order";
}

OperationQueue::~OperationQueue() {
  shutdown();
}


//==============================================
// ADMISSION
//==============================================

void OperationQueue::add(std::shared_ptr<QueuedOperation> operation, QueuePriority priority) {
  if (!operation) {
    return;
  }

  std::vector<std::shared_ptr<QueuedOperation>> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      BOOST_LOG_TRIVIAL(warning) << "Operation queue: Dropping operation added after shutdown";
      return;
    }

    if (order_ == ExecutionOrder::LIFO) {
      // The previously added operation now waits for this one
      if (auto previous = last_added_.lock()) {
        for (auto& entry : pending_) {
          if (entry.operation == previous) {
            entry.dependencies.push_back(operation.get());
            break;
          }
        }
      }
    }
    last_added_ = operation;

    pending_.push_back(Entry{std::move(operation), priority, next_sequence_++, {}});
    ready = take_admissible();
  }
  dispatch(std::move(ready));
}

void OperationQueue::finished(const std::shared_ptr<QueuedOperation>& operation) {
  if (!operation) {
    return;
  }

  std::vector<std::shared_ptr<QueuedOperation>> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    QueuedOperation* raw = operation.get();

    auto running = std::find(running_.begin(), running_.end(), raw);
    if (running != running_.end()) {
      running_.erase(running);
    } else {
      auto pending = std::find_if(pending_.begin(), pending_.end(),
                                  [raw](const Entry& entry) { return entry.operation.get() == raw; });
      if (pending == pending_.end()) {
        return;
      }
      pending_.erase(pending);
    }

    release_dependents(raw);
    if (!shut_down_) {
      ready = take_admissible();
    }
  }
  dispatch(std::move(ready));
}

void OperationQueue::raise_priority(const std::shared_ptr<QueuedOperation>& operation, QueuePriority priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : pending_) {
    if (entry.operation == operation) {
      if (priority > entry.priority) {
        entry.priority = priority;
      }
      return;
    }
  }
}

void OperationQueue::set_suspended(bool suspended) {
  std::vector<std::shared_ptr<QueuedOperation>> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (suspended_ == suspended) {
      return;
    }
    suspended_ = suspended;
    BOOST_LOG_TRIVIAL(info) << "Operation queue: " << (suspended ? "Suspended" : "Resumed")
                            << " with " << pending_.size() << " pending operations";
    if (!suspended_ && !shut_down_) {
      ready = take_admissible();
    }
  }
  dispatch(std::move(ready));
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void OperationQueue::set_max_concurrent(std::size_t max_concurrent) {
  if (max_concurrent == 0) {
    throw std::invalid_argument("Operation queue: max_concurrent must be at least 1");
  }

  std::vector<std::shared_ptr<QueuedOperation>> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    max_concurrent_ = max_concurrent;
    if (!shut_down_) {
      ready = take_admissible();
    }
  }
  dispatch(std::move(ready));
}

void OperationQueue::set_execution_order(ExecutionOrder order) {
  std::lock_guard<std::mutex> lock(mutex_);
  order_ = order;
}

std::size_t OperationQueue::max_concurrent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_concurrent_;
}

ExecutionOrder OperationQueue::execution_order() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

bool OperationQueue::suspended() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suspended_;
}

std::size_t OperationQueue::running_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_.size();
}

std::size_t OperationQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}


//==============================================
// TEARDOWN
//==============================================

void OperationQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    if (!pending_.empty()) {
      BOOST_LOG_TRIVIAL(debug) << "Operation queue: Dropping " << pending_.size() << " pending operations";
    }
    pending_.clear();
  }
  pool_.join();
}


//==============================================
// ADMISSION HELPERS
//==============================================

std::vector<std::shared_ptr<QueuedOperation>> OperationQueue::take_admissible() {
  std::vector<std::shared_ptr<QueuedOperation>> ready;

  while (!suspended_ && running_.size() < max_concurrent_) {
    auto best = pending_.end();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      if (!it->dependencies.empty()) {
        continue;
      }
      // pending_ is in insertion order, so only a strictly higher priority wins
      if (best == pending_.end() || it->priority > best->priority) {
        best = it;
      }
    }
    if (best == pending_.end()) {
      break;
    }

    running_.push_back(best->operation.get());
    ready.push_back(std::move(best->operation));
    pending_.erase(best);
  }
  return ready;
}

void OperationQueue::release_dependents(QueuedOperation* operation) {
  for (auto& entry : pending_) {
    auto& deps = entry.dependencies;
    deps.erase(std::remove(deps.begin(), deps.end(), operation), deps.end());
  }
}

void OperationQueue::dispatch(std::vector<std::shared_ptr<QueuedOperation>> operations) {
  for (auto& operation : operations) {
    boost::asio::post(pool_, [operation]() {
      try {
        operation->start();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Operation queue: Operation failed to start: " << e.what();
      }
    });
  }
}

} // namespace network
} // namespace webimg
