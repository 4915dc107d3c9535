#ifndef WEBIMG_NETWORK_OPERATION_QUEUE_HPP
#define WEBIMG_NETWORK_OPERATION_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <vector>
#include <boost/asio/thread_pool.hpp>

namespace webimg {
namespace network {

enum class ExecutionOrder {
  FIFO,
  // Emulated through dependencies: every new operation must finish before the
  // previously added one may start
  LIFO
};

enum class QueuePriority {
  Low = -1,
  Normal = 0,
  High = 1
};

// Unit of work admitted by the OperationQueue. start() kicks off asynchronous
// work; the owner reports completion through OperationQueue::finished().
class QueuedOperation {
public:
  virtual ~QueuedOperation() = default;
  virtual void start() = 0;
};

// Bounded admission of asynchronous operations. At most max_concurrent
// operations are started and not yet finished at any time. Among operations
// whose dependencies are satisfied, higher priority goes first, then
// insertion order.
class OperationQueue {
public:
  // Delete copy operations, the queue owns its thread pool
  OperationQueue(const OperationQueue&) = delete;
  OperationQueue& operator=(const OperationQueue&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit OperationQueue(std::size_t max_concurrent, ExecutionOrder order = ExecutionOrder::FIFO);
  ~OperationQueue();


  // ---- ADMISSION ----
  void add(std::shared_ptr<QueuedOperation> operation, QueuePriority priority = QueuePriority::Normal);
  // Reports a started operation as done, or withdraws a pending one. Either
  // way dependents are released. Safe to call more than once.
  void finished(const std::shared_ptr<QueuedOperation>& operation);
  // Lifts a pending operation to priority; never lowers it. No-op once started.
  void raise_priority(const std::shared_ptr<QueuedOperation>& operation, QueuePriority priority);
  // Stops admitting new operations; started ones keep running
  void set_suspended(bool suspended);


  // ---- GETTERS AND SETTERS ----
  void set_max_concurrent(std::size_t max_concurrent);
  void set_execution_order(ExecutionOrder order);
  std::size_t max_concurrent() const;
  ExecutionOrder execution_order() const;
  bool suspended() const;
  std::size_t running_count() const;
  std::size_t pending_count() const;


  // ---- TEARDOWN ----
  // Drops pending operations and waits for start() calls in flight
  void shutdown();

private:
  struct Entry {
    std::shared_ptr<QueuedOperation> operation;
    QueuePriority priority;
    std::uint64_t sequence;
    // Operations that must finish before this one may start
    std::vector<QueuedOperation*> dependencies;
  };

  // ---- PARAMETERS ----
  std::size_t max_concurrent_;
  ExecutionOrder order_;
  bool suspended_{false};
  bool shut_down_{false};
  std::uint64_t next_sequence_{0};
  std::list<Entry> pending_;
  std::vector<QueuedOperation*> running_;
  // Target of the next LIFO dependency
  std::weak_ptr<QueuedOperation> last_added_;
  boost::asio::thread_pool pool_;
  mutable std::mutex mutex_;


  // ---- ADMISSION HELPERS ----
  // Requires mutex_ held. Moves admissible operations to running_.
  std::vector<std::shared_ptr<QueuedOperation>> take_admissible();
  void release_dependents(QueuedOperation* operation);
  void dispatch(std::vector<std::shared_ptr<QueuedOperation>> operations);
};

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_OPERATION_QUEUE_HPP
