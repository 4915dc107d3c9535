#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <boost/asio.hpp>

namespace webimg {
namespace utils {

// Sequential execution context: an io_context drained by a single thread.
// Work posted to it runs one item at a time in submission order.
class SerialQueue {
public:
  // Delete copy operations, the queue owns its thread
  SerialQueue(const SerialQueue&) = delete;
  SerialQueue& operator=(const SerialQueue&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit SerialQueue(std::string name);
  ~SerialQueue();


  // ---- SUBMISSION ----
  // Enqueues work and returns immediately
  void post(std::function<void()> work);

  // Runs work on the queue and blocks until it finished. Runs inline when
  // called from the queue thread itself.
  template <typename Fn>
  auto sync(Fn&& fn) -> std::invoke_result_t<Fn> {
    using Result = std::invoke_result_t<Fn>;
    if (running_in_this_thread()) {
      return fn();
    }
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> result = task->get_future();
    boost::asio::post(io_context_, [task]() { (*task)(); });
    return result.get();
  }


  // ---- QUERY METHODS ----
  bool running_in_this_thread() const;
  const std::string& name() const { return name_; }


  // ---- TEARDOWN ----
  // Drains queued work, then joins the thread
  void shutdown();

private:
  // ---- PARAMETERS ----
  std::string name_;
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::thread thread_;
  std::thread::id thread_id_;
};

} // namespace utils
} // namespace webimg
