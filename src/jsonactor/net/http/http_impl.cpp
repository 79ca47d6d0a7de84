#include "stdinc.hpp"

#include "http-handler.hpp"
#include "http-server.hpp"

#include "jsonactor/net/detail/listener.hpp"
#include "jsonactor/net/tls/tls-identity.hpp"

#include "jsonactor/utils.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <optional>

namespace jsonactor::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

// ------------------------------------------------------------------------------------- HttpSession

/**
 * @brief The server side of one http connection, over a plain tcp stream, or a TLS
 *        stream.
 *
 * Requests are read, answered, and written one at a time. The connection stays open
 * between requests while the client asks for keep-alive.
 */
template <typename Stream>
class HttpSession final : public Connection, public std::enable_shared_from_this<HttpSession<Stream>> {
private:
  static constexpr bool is_tls = !std::is_same_v<Stream, beast::tcp_stream>;

  const uint64_t id_{0};
  shared_ptr<const TlsIdentity> tls_; //! Outlives the ssl stream
  shared_ptr<const rpc::Dispatcher> dispatcher_;
  const std::size_t max_body_bytes_;
  Stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  HttpResponse response_;
  std::chrono::seconds timeout_{30};
  CloseThunk on_close_thunk_;

  static Stream make_stream_(asio::ip::tcp::socket&& socket, const TlsIdentity* tls) {
    if constexpr (is_tls) {
      Expects(tls != nullptr);
      return Stream{std::move(socket), tls->context()};
    } else {
      return Stream{std::move(socket)};
    }
  }

public:
  HttpSession(uint64_t id, asio::ip::tcp::socket&& socket, shared_ptr<const TlsIdentity> tls,
              shared_ptr<const rpc::Dispatcher> dispatcher, std::size_t max_body_bytes)
      : id_{id}, tls_{std::move(tls)}, dispatcher_{std::move(dispatcher)},
        max_body_bytes_{max_body_bytes}, stream_{make_stream_(std::move(socket), tls_.get())} {}

  ~HttpSession() override {
    if (on_close_thunk_)
      on_close_thunk_(this);
  }

  static shared_ptr<HttpSession> make(uint64_t id, asio::ip::tcp::socket&& socket,
                                      shared_ptr<const TlsIdentity> tls,
                                      shared_ptr<const rpc::Dispatcher> dispatcher,
                                      std::size_t max_body_bytes) {
    Expects(dispatcher != nullptr);
    TRACE("http session created, id={}, tls={}", id, is_tls);
    return make_shared<HttpSession>(id, std::move(socket), std::move(tls), std::move(dispatcher),
                                    max_body_bytes);
  }

  void run(CloseThunk on_close_thunk) override {
    on_close_thunk_ = std::move(on_close_thunk);
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&HttpSession::on_run_, this->shared_from_this()));
  }

  void cancel() override {
    asio::post(stream_.get_executor(), [self = this->shared_from_this()]() {
      beast::get_lowest_layer(self->stream_).cancel();
    });
  }

private:
  void on_run_() {
    if constexpr (is_tls) {
      beast::get_lowest_layer(stream_).expires_after(timeout_);
      stream_.async_handshake(
          asio::ssl::stream_base::server,
          beast::bind_front_handler(&HttpSession::on_handshake_, this->shared_from_this()));
    } else {
      do_read_();
    }
  }

  void on_handshake_(beast::error_code ec) {
    if (ec) {
      INFO("http connection {}: tls handshake failed: {}", id_, ec.message());
      return;
    }
    do_read_();
  }

  void do_read_() {
    parser_.emplace();
    parser_->body_limit(max_body_bytes_);
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::on_read_, this->shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      do_close_();
      return;
    }

    if (ec == http::error::body_limit) {
      INFO("http connection {}: request body exceeds {} bytes", id_, max_body_bytes_);
      send_(make_text_response(http::status::payload_too_large, parser_->get().version(), false,
                               "Request body too large"));
      return;
    }

    if (ec) {
      const bool is_expected = ec == asio::error::operation_aborted
                               || ec == beast::error::timeout
                               || ec == asio::ssl::error::stream_truncated;
      if (is_expected) {
        TRACE("http connection {}: read ended: {}", id_, ec.message());
      } else {
        INFO("http connection {}: read failed: {}", id_, ec.message());
      }
      return;
    }

    send_(handle_http_request(*dispatcher_, parser_->get()));
  }

  void send_(HttpResponse&& response) {
    response_ = std::move(response);
    const bool keep_alive = response_.keep_alive();
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_write(
        stream_, response_,
        beast::bind_front_handler(&HttpSession::on_write_, this->shared_from_this(), keep_alive));
  }

  void on_write_(bool keep_alive, beast::error_code ec, std::size_t) {
    if (ec) {
      INFO("http connection {}: write failed: {}", id_, ec.message());
      return;
    }

    if (!keep_alive) {
      do_close_();
      return;
    }

    do_read_();
  }

  void do_close_() {
    if constexpr (is_tls) {
      beast::get_lowest_layer(stream_).expires_after(timeout_);
      stream_.async_shutdown(
          beast::bind_front_handler(&HttpSession::on_shutdown_, this->shared_from_this()));
    } else {
      beast::error_code ec;
      stream_.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
      if (ec)
        TRACE("http connection {}: shutdown: {}", id_, ec.message());
    }
  }

  void on_shutdown_(beast::error_code ec) {
    if (ec)
      TRACE("http connection {}: tls shutdown: {}", id_, ec.message());
  }
};

} // namespace jsonactor::net::detail

namespace jsonactor::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

// ------------------------------------------------------------------------------------------- Pimpl

struct HttpServer::Pimpl {
  shared_ptr<detail::Listener> listener = nullptr;
  std::error_code ec = {};

  Pimpl(asio::io_context& io_context, const Config& config) {
    Expects(config.dispatcher != nullptr);

    boost::system::error_code address_ec;
    const auto address = asio::ip::make_address(config.address, address_ec);
    if (address_ec) {
      ec = address_ec;
      return;
    }

    auto factory = [tls = config.tls, dispatcher = config.dispatcher,
                    max_body_bytes = config.max_body_bytes](
                       uint64_t id, asio::ip::tcp::socket&& socket) -> shared_ptr<detail::Connection> {
      if (tls != nullptr)
        return detail::HttpSession<beast::ssl_stream<beast::tcp_stream>>::make(
            id, std::move(socket), tls, dispatcher, max_body_bytes);
      return detail::HttpSession<beast::tcp_stream>::make(id, std::move(socket), nullptr,
                                                          dispatcher, max_body_bytes);
    };

    listener = make_shared<detail::Listener>(
        io_context, asio::ip::tcp::endpoint{address, config.port}, std::move(factory));
  }
};

// ------------------------------------------------------------------------------------ Construction

HttpServer::HttpServer(asio::io_context& io_context, const Config& config)
    : pimpl_{make_unique<Pimpl>(io_context, config)} {}

HttpServer::~HttpServer() = default;

std::error_code HttpServer::run() {
  if (pimpl_->ec)
    return pimpl_->ec;
  return pimpl_->listener->run();
}

uint16_t HttpServer::local_port() const {
  return (pimpl_->listener == nullptr) ? 0 : pimpl_->listener->local_port();
}

void HttpServer::shutdown() {
  TRACE("post shutdown");
  if (pimpl_->listener != nullptr)
    pimpl_->listener->shutdown();
}

} // namespace jsonactor::net
