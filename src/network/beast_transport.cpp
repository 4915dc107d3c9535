#include "network/beast_transport.hpp"
#include <atomic>
#include <limits>
#include <optional>
#include <vector>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>
#include <openssl/ssl.h>

namespace webimg {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

std::string to_std(beast::string_view view) {
  return std::string(view.data(), view.size());
}

std::string base64(const std::string& input) {
  std::string output(4 * ((input.size() + 2) / 3) + 1, '\0');
  int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                               reinterpret_cast<const unsigned char*>(input.data()),
                               static_cast<int>(input.size()));
  output.resize(length > 0 ? static_cast<std::size_t>(length) : 0);
  return output;
}

bool is_redirect(unsigned status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// Failures that may go away on their own
bool is_transient(const beast::error_code& ec) {
  return ec == beast::error::timeout ||
         ec == net::error::timed_out ||
         ec == net::error::host_not_found ||
         ec == net::error::host_not_found_try_again ||
         ec == net::error::connection_refused ||
         ec == net::error::connection_reset ||
         ec == net::error::network_unreachable ||
         ec == net::error::host_unreachable;
}

// One transfer. Every handler runs on the transport's single I/O thread, so
// members other than cancelled_ need no locking.
class BeastSession : public TransportTask, public std::enable_shared_from_this<BeastSession> {
public:
  BeastSession(net::io_context& io_context, Request request, std::weak_ptr<TransportDelegate> delegate)
    : io_context_(io_context)
    , resolver_(io_context)
    , request_(std::move(request))
    , delegate_(std::move(delegate))
    , chunk_(BeastTransport::kChunkSize) {}

  void start() override {
    net::post(io_context_, [self = shared_from_this()]() { self->begin(self->request_.url); });
  }

  void cancel() override {
    cancelled_ = true;
    net::post(io_context_, [self = shared_from_this()]() { self->close(); });
  }

private:
  // ---- PARAMETERS ----
  net::io_context& io_context_;
  tcp::resolver resolver_;
  Request request_;
  std::weak_ptr<TransportDelegate> delegate_;

  Url url_;
  std::unique_ptr<ssl::context> ssl_context_;
  std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_stream_;
  std::unique_ptr<beast::tcp_stream> plain_stream_;

  http::request<http::empty_body> http_request_;
  std::optional<http::response_parser<http::buffer_body>> parser_;
  beast::flat_buffer buffer_;
  std::vector<std::uint8_t> chunk_;

  std::string authorization_;
  unsigned redirects_{0};
  unsigned auth_failures_{0};
  bool completed_{false};
  std::atomic<bool> cancelled_{false};


  // ---- CONNECTION SETUP ----
  void begin(const std::string& url_text) {
    if (cancelled_) {
      return;
    }

    auto url = Url::parse(url_text);
    if (!url) {
      complete(make_error(ErrorKind::TransportFailure, "invalid URL: " + url_text));
      return;
    }

    // Credentials never follow a redirect to another host
    if (!url_.host.empty() && url->host != url_.host) {
      authorization_.clear();
    }
    url_ = *url;

    try {
      reset_streams();
    } catch (const std::exception& e) {
      complete(make_error(ErrorKind::TransportFailure, std::string("TLS setup failed: ") + e.what()));
      return;
    }

    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Resolving " << url_.host << ":" << url_.port;
    resolver_.async_resolve(url_.host, url_.port,
      [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
        self->on_resolve(ec, results);
      });
  }

  void reset_streams() {
    close();
    tls_stream_.reset();
    plain_stream_.reset();
    ssl_context_.reset();
    buffer_.clear();

    if (!url_.tls()) {
      plain_stream_ = std::make_unique<beast::tcp_stream>(io_context_);
      return;
    }

    ssl_context_ = std::make_unique<ssl::context>(ssl::context::tls_client);
    if (request_.allow_invalid_certificates) {
      ssl_context_->set_verify_mode(ssl::verify_none);
    } else {
      ssl_context_->set_default_verify_paths();
      ssl_context_->set_verify_mode(ssl::verify_peer);
      ssl_context_->set_verify_callback(ssl::host_name_verification(url_.host));
    }

    tls_stream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(io_context_, *ssl_context_);
    // SNI
    if (!SSL_set_tlsext_host_name(tls_stream_->native_handle(), url_.host.c_str())) {
      throw std::runtime_error("could not set SNI host name");
    }
  }

  beast::tcp_stream& lowest_layer() {
    if (tls_stream_) {
      return beast::get_lowest_layer(*tls_stream_);
    }
    return *plain_stream_;
  }

  template <typename Fn>
  void with_stream(Fn&& fn) {
    if (tls_stream_) {
      fn(*tls_stream_);
    } else {
      fn(*plain_stream_);
    }
  }

  void on_resolve(beast::error_code ec, const tcp::resolver::results_type& results) {
    if (ec) {
      fail(ec, "resolve");
      return;
    }
    lowest_layer().expires_after(request_.timeout);
    lowest_layer().async_connect(results,
      [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) { self->on_connect(ec); });
  }

  void on_connect(beast::error_code ec) {
    if (ec) {
      fail(ec, "connect");
      return;
    }
    if (!tls_stream_) {
      send_request();
      return;
    }
    lowest_layer().expires_after(request_.timeout);
    tls_stream_->async_handshake(ssl::stream_base::client,
      [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
          self->fail(ec, "TLS handshake");
          return;
        }
        self->send_request();
      });
  }


  // ---- REQUEST ----
  void send_request() {
    if (cancelled_) {
      return;
    }

    http_request_ = http::request<http::empty_body>{};
    http_request_.method(http::verb::get);
    http_request_.target(url_.target);
    http_request_.version(11);

    bool default_port = (url_.tls() && url_.port == "443") || (!url_.tls() && url_.port == "80");
    http_request_.set(http::field::host, default_port ? url_.host : url_.host + ":" + url_.port);
    http_request_.set(http::field::user_agent, "webimg/1.0");
    for (const auto& [name, value] : request_.headers) {
      http_request_.set(name, value);
    }
    if (request_.cache_policy == CachePolicy::ReloadIgnoringProtocolCache &&
        request_.headers.find("Cache-Control") == request_.headers.end()) {
      http_request_.set(http::field::cache_control, "no-cache");
    }
    if (!authorization_.empty()) {
      http_request_.set(http::field::authorization, authorization_);
    }

    lowest_layer().expires_after(request_.timeout);
    with_stream([this](auto& stream) {
      http::async_write(stream, http_request_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_write(ec); });
    });
  }

  void on_write(beast::error_code ec) {
    if (ec) {
      fail(ec, "write");
      return;
    }

    parser_.emplace();
    parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());

    lowest_layer().expires_after(request_.timeout);
    with_stream([this](auto& stream) {
      http::async_read_header(stream, buffer_, *parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_header(ec); });
    });
  }


  // ---- RESPONSE ----
  void on_header(beast::error_code ec) {
    if (ec) {
      fail(ec, "read header");
      return;
    }

    auto delegate = delegate_.lock();
    if (!delegate || cancelled_) {
      close();
      return;
    }

    const auto& message = parser_->get();
    unsigned status = message.result_int();

    if (is_redirect(status) && message.find(http::field::location) != message.end()) {
      if (redirects_ >= BeastTransport::kMaxRedirects) {
        complete(make_error(ErrorKind::TransportFailure, "too many redirects"));
        return;
      }
      auto next = url_.resolve(to_std(message[http::field::location]));
      if (!next) {
        complete(make_error(ErrorKind::TransportFailure, "invalid redirect location"));
        return;
      }
      if (delegate->on_redirect(next->to_string())) {
        ++redirects_;
        begin(next->to_string());
        return;
      }
    }

    if (status == 401) {
      if (auto credential = delegate->on_auth_challenge(auth_failures_)) {
        ++auth_failures_;
        authorization_ = "Basic " + base64(credential->username + ":" + credential->password);
        BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Answering authentication challenge for " << url_.host;
        begin(url_.to_string());
        return;
      }
    }

    Response response;
    response.status = status;
    if (auto length = parser_->content_length()) {
      response.expected_length = static_cast<std::int64_t>(*length);
    }
    for (const auto& field : message) {
      response.headers[to_std(field.name_string())] = to_std(field.value());
    }

    if (!delegate->on_response(response)) {
      // Refused: the delegate needs no completion
      completed_ = true;
      close();
      return;
    }

    if (parser_->is_done()) {
      complete(std::nullopt);
      return;
    }
    read_body();
  }

  void read_body() {
    if (cancelled_) {
      return;
    }
    auto& body = parser_->get().body();
    body.data = chunk_.data();
    body.size = chunk_.size();

    lowest_layer().expires_after(request_.timeout);
    with_stream([this](auto& stream) {
      http::async_read(stream, buffer_, *parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_body(ec); });
    });
  }

  void on_body(beast::error_code ec) {
    // A full chunk buffer is not an error
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      fail(ec, "read body");
      return;
    }

    std::size_t produced = chunk_.size() - parser_->get().body().size;
    if (produced > 0) {
      auto delegate = delegate_.lock();
      if (!delegate || cancelled_) {
        close();
        return;
      }
      delegate->on_data(chunk_.data(), produced);
    }

    if (parser_->is_done()) {
      complete(std::nullopt);
      return;
    }
    read_body();
  }


  // ---- TEARDOWN ----
  void fail(beast::error_code ec, const char* what) {
    if (cancelled_ && ec == net::error::operation_aborted) {
      return;
    }
    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << what << " failed for " << url_.to_string()
                             << ": " << ec.message();
    complete(make_error(ErrorKind::TransportFailure, std::string(what) + ": " + ec.message(), 0, is_transient(ec)));
  }

  void complete(const std::optional<FetchError>& error) {
    if (completed_ || cancelled_) {
      close();
      return;
    }
    completed_ = true;
    if (auto delegate = delegate_.lock()) {
      delegate->on_complete(error);
    }
    close();
  }

  void close() {
    beast::error_code ec;
    resolver_.cancel();
    if (tls_stream_) {
      beast::get_lowest_layer(*tls_stream_).socket().shutdown(tcp::socket::shutdown_both, ec);
      beast::get_lowest_layer(*tls_stream_).close();
    }
    if (plain_stream_) {
      plain_stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
      plain_stream_->close();
    }
  }
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastTransport::BeastTransport()
  : work_guard_(net::make_work_guard(io_context_)) {
  io_thread_ = std::thread([this]() {
    for (;;) {
      try {
        io_context_.run();
        break;
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP transport: I/O handler threw: " << e.what();
      }
    }
  });
  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: I/O thread started";
}

BeastTransport::~BeastTransport() {
  work_guard_.reset();
  io_context_.stop();
  if (!io_thread_.joinable()) {
    return;
  }
  if (io_thread_.get_id() == std::this_thread::get_id()) {
    // Last reference dropped from inside a handler
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: Destroyed on its own I/O thread, detaching";
    io_thread_.detach();
    return;
  }
  io_thread_.join();
  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: I/O thread stopped";
}


//==============================================
// TRANSPORT
//==============================================

std::shared_ptr<TransportTask> BeastTransport::create_task(const Request& request,
                                                           std::weak_ptr<TransportDelegate> delegate) {
  return std::make_shared<BeastSession>(io_context_, request, std::move(delegate));
}

} // namespace network
} // namespace webimg
