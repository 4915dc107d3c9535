#ifndef WEBIMG_NETWORK_BEAST_TRANSPORT_HPP
#define WEBIMG_NETWORK_BEAST_TRANSPORT_HPP

#include <cstddef>
#include <memory>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include "network/transport.hpp"

namespace webimg {
namespace network {

// HTTP/1.1 client on Boost.Beast. Every transfer runs on one I/O thread owned
// by the transport; TLS goes through Boost.Asio SSL on OpenSSL.
class BeastTransport : public Transport {
public:
  static constexpr std::size_t kChunkSize = 16 * 1024;
  static constexpr unsigned kMaxRedirects = 5;

  // Delete copy operations, the transport owns its I/O thread
  BeastTransport(const BeastTransport&) = delete;
  BeastTransport& operator=(const BeastTransport&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BeastTransport();
  ~BeastTransport() override;


  // ---- TRANSPORT ----
  std::shared_ptr<TransportTask> create_task(const Request& request,
                                             std::weak_ptr<TransportDelegate> delegate) override;

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::thread io_thread_;
};

} // namespace network
} // namespace webimg

#endif // WEBIMG_NETWORK_BEAST_TRANSPORT_HPP
