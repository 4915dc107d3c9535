#include "utils/serial_queue.hpp"
#include <boost/log/trivial.hpp>

namespace webimg {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SerialQueue::SerialQueue(std::string name)
  : name_(std::move(name))
  , work_guard_(boost::asio::make_work_guard(io_context_)) {
  thread_ = std::thread([this]() {
    // Keep draining until the work guard is released and the queue is empty
    for (;;) {
      try {
        io_context_.run();
        break;
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Serial queue: Work item on '" << name_ << "' threw: " << e.what();
      }
    }
  });
  thread_id_ = thread_.get_id();
  BOOST_LOG_TRIVIAL(debug) << "Serial queue: Started queue '" << name_ << "'";
}

SerialQueue::~SerialQueue() {
  shutdown();
}


//==============================================
// SUBMISSION
//==============================================

void SerialQueue::post(std::function<void()> work) {
  boost::asio::post(io_context_, std::move(work));
}


//==============================================
// QUERY METHODS
//==============================================

bool SerialQueue::running_in_this_thread() const {
  return std::this_thread::get_id() == thread_id_;
}


//==============================================
// TEARDOWN
//==============================================

void SerialQueue::shutdown() {
  if (!thread_.joinable()) {
    return;
  }

  work_guard_.reset();
  if (running_in_this_thread()) {
    // Joining here would deadlock
    BOOST_LOG_TRIVIAL(error) << "Serial queue: '" << name_ << "' shut down from its own thread";
    thread_.detach();
    return;
  }
  thread_.join();
  BOOST_LOG_TRIVIAL(debug) << "Serial queue: Stopped queue '" << name_ << "'";
}

} // namespace utils
} // namespace webimg
