#include "stdinc.hpp"

#include "websocket-server.hpp"
#include "websocket-session.hpp"

#include "jsonactor/net/detail/listener.hpp"
#include "jsonactor/net/tls/tls-identity.hpp"
#include "jsonactor/version.hpp"

#include "jsonactor/utils.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <deque>

namespace jsonactor::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

/**
 * @brief What `WebsocketSession` needs from the stream-specific connection.
 */
class WebsocketConnection : public Connection {
public:
  virtual void async_write(BufferType&& buffer) = 0;

protected:
  static void attach(WebsocketSession& session, shared_ptr<WebsocketConnection> connection);
};

} // namespace jsonactor::net::detail

namespace jsonactor::net {

// This pimpl needs to come first
struct WebsocketSession::Pimpl {
private:
  std::mutex padlock_;
  weak_ptr<detail::WebsocketConnection> connection_{};

public:
  void set_connection(shared_ptr<detail::WebsocketConnection> connection) {
    std::lock_guard lock{padlock_};
    connection_ = connection;
  }

  shared_ptr<detail::WebsocketConnection> connection() {
    std::lock_guard lock{padlock_};
    return connection_.lock();
  }
};

} // namespace jsonactor::net

namespace jsonactor::net::detail {

void WebsocketConnection::attach(WebsocketSession& session,
                                 shared_ptr<WebsocketConnection> connection) {
  session.pimpl_->set_connection(std::move(connection));
}

// ----------------------------------------------------------------------------------------- Session

/**
 * @brief The server side of one websocket connection, over a plain tcp stream, or
 *        a TLS stream.
 *
 * Everything after `run` happens on the connection's strand. Writes are queued, so
 * that only one is outstanding, and replies leave in the order they were queued.
 */
template <typename Stream>
class Session final : public WebsocketConnection,
                      public std::enable_shared_from_this<Session<Stream>> {
private:
  static constexpr bool is_tls = !std::is_same_v<Stream, beast::tcp_stream>;

  const uint64_t id_{0};
  shared_ptr<const TlsIdentity> tls_; //! Outlives the ssl stream
  shared_ptr<WebsocketSession> external_session_ = nullptr;
  websocket::stream<Stream> ws_;
  beast::flat_buffer buffer_;
  std::deque<BufferType> write_queue_;
  bool is_closed_ = false;
  std::chrono::seconds handshake_timeout_{30};
  CloseThunk on_close_thunk_;

  static websocket::stream<Stream> make_stream_(asio::ip::tcp::socket&& socket,
                                                const TlsIdentity* tls) {
    if constexpr (is_tls) {
      Expects(tls != nullptr);
      return websocket::stream<Stream>{std::move(socket), tls->context()};
    } else {
      return websocket::stream<Stream>{std::move(socket)};
    }
  }

public:
  Session(uint64_t id, asio::ip::tcp::socket&& socket, shared_ptr<const TlsIdentity> tls,
          shared_ptr<WebsocketSession> external_session)
      : id_{id}, tls_{std::move(tls)}, external_session_{std::move(external_session)},
        ws_{make_stream_(std::move(socket), tls_.get())} {}

  ~Session() override {
    if (on_close_thunk_)
      on_close_thunk_(this);
  }

  static shared_ptr<Session> make(uint64_t id, asio::ip::tcp::socket&& socket,
                                  shared_ptr<const TlsIdentity> tls,
                                  shared_ptr<WebsocketSession> external_session) {
    Expects(external_session != nullptr);
    auto session =
        make_shared<Session>(id, std::move(socket), std::move(tls), std::move(external_session));
    attach(*session->external_session_, session);
    TRACE("websocket session created, id={}, tls={}", id, is_tls);
    return session;
  }

  void run(CloseThunk on_close_thunk) override {
    on_close_thunk_ = std::move(on_close_thunk); // deletes server-side resources

    // We need to be executing within a strand to perform async operations
    // on the I/O objects in this session.
    asio::dispatch(ws_.get_executor(),
                   beast::bind_front_handler(&Session::on_run_, this->shared_from_this()));
  }

  void cancel() override {
    asio::post(ws_.get_executor(),
               [self = this->shared_from_this()]() { beast::get_lowest_layer(self->ws_).cancel(); });
  }

  void async_write(BufferType&& buffer) override {
    asio::post(ws_.get_executor(),
               [self = this->shared_from_this(), buffer = std::move(buffer)]() mutable {
                 self->queue_write_(std::move(buffer));
               });
  }

private:
  void on_run_() {
    if constexpr (is_tls) {
      beast::get_lowest_layer(ws_).expires_after(handshake_timeout_);
      ws_.next_layer().async_handshake(
          asio::ssl::stream_base::server,
          beast::bind_front_handler(&Session::on_handshake_, this->shared_from_this()));
    } else {
      do_accept_();
    }
  }

  void on_handshake_(beast::error_code ec) {
    if (ec) {
      on_error_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }
    do_accept_();
  }

  void do_accept_() {
    // The websocket stream has its own timeout system
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) { res.set(beast::http::field::server, k_server_string); }));
    ws_.async_accept(beast::bind_front_handler(&Session::on_accept_, this->shared_from_this()));
  }

  void on_accept_(beast::error_code ec) {
    if (ec) {
      on_error_(WebsocketOperation::ACCEPT, ec);
      return;
    }
    external_session_->on_connect();
    do_read_();
  }

  void do_read_() {
    ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read_, this->shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
      on_close_();
      return;
    }

    if (ec) {
      on_error_(WebsocketOperation::READ, ec);
      return;
    }

    if (ws_.got_text()) {
      const auto data = buffer_.data();
      const std::span<const std::byte> payload{static_cast<const std::byte*>(data.data()),
                                               data.size()};
      try {
        external_session_->on_receive(payload);
      } catch (std::exception& e) {
        FATAL("callback `on_receive` must not throw: {}", e.what());
      }
    } else {
      TRACE("dropping binary message, id={}, size={}", id_, buffer_.size());
    }

    buffer_.consume(buffer_.size());
    do_read_();
  }

  void queue_write_(BufferType&& buffer) {
    if (is_closed_) {
      external_session_->on_error(WebsocketOperation::WRITE,
                                  beast::error_code{websocket::error::closed});
      return;
    }

    write_queue_.push_back(std::move(buffer));
    if (write_queue_.size() == 1)
      do_write_(); // otherwise a write is in flight, and `on_write_` continues
  }

  void do_write_() {
    const auto& buffer = write_queue_.front();
    ws_.text(true);
    ws_.async_write(asio::buffer(buffer.data(), buffer.size()),
                    beast::bind_front_handler(&Session::on_write_, this->shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t) {
    auto buffer = std::move(write_queue_.front());
    write_queue_.pop_front();

    if (ec) {
      on_error_(WebsocketOperation::WRITE, ec);
      return;
    }

    external_session_->on_return_buffer(std::move(buffer));
    if (!write_queue_.empty())
      do_write_();
  }

  void on_close_() {
    is_closed_ = true;
    write_queue_.clear();
    const auto& reason = ws_.reason();
    external_session_->on_close(reason.code,
                                std::string_view{reason.reason.data(), reason.reason.size()});
  }

  void on_error_(WebsocketOperation operation, beast::error_code ec) {
    is_closed_ = true;
    write_queue_.clear();
    external_session_->on_error(operation, ec);
  }
};

} // namespace jsonactor::net::detail

namespace jsonactor::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

// -------------------------------------------------------------------------------- WebsocketSession

WebsocketSession::WebsocketSession() : pimpl_{make_unique<Pimpl>()} {}

WebsocketSession::~WebsocketSession() = default;

void WebsocketSession::send_message(BufferType&& buffer) {
  auto connection = pimpl_->connection();
  if (connection)
    connection->async_write(std::move(buffer));
  else
    on_error(WebsocketOperation::WRITE, std::make_error_code(std::errc::not_connected));
}

// ------------------------------------------------------------------------------------------- Pimpl

struct WebsocketServer::Pimpl {
  shared_ptr<detail::Listener> listener = nullptr;
  std::error_code ec = {};

  Pimpl(asio::io_context& io_context, const Config& config) {
    Expects(config.session_factory != nullptr);

    boost::system::error_code address_ec;
    const auto address = asio::ip::make_address(config.address, address_ec);
    if (address_ec) {
      ec = address_ec;
      return;
    }

    auto factory = [tls = config.tls, session_factory = config.session_factory](
                       uint64_t id, asio::ip::tcp::socket&& socket) -> shared_ptr<detail::Connection> {
      auto external_session = session_factory(id);
      if (external_session == nullptr)
        FATAL("callback `session_factory` returned an empty result");
      if (tls != nullptr)
        return detail::Session<beast::ssl_stream<beast::tcp_stream>>::make(
            id, std::move(socket), tls, std::move(external_session));
      return detail::Session<beast::tcp_stream>::make(id, std::move(socket), nullptr,
                                                      std::move(external_session));
    };

    listener = make_shared<detail::Listener>(
        io_context, asio::ip::tcp::endpoint{address, config.port}, std::move(factory));
  }
};

// ------------------------------------------------------------------------------------ Construction

WebsocketServer::WebsocketServer(asio::io_context& io_context, const Config& config)
    : pimpl_{make_unique<Pimpl>(io_context, config)} {}

WebsocketServer::~WebsocketServer() = default;

std::error_code WebsocketServer::run() {
  if (pimpl_->ec)
    return pimpl_->ec;
  return pimpl_->listener->run();
}

uint16_t WebsocketServer::local_port() const {
  return (pimpl_->listener == nullptr) ? 0 : pimpl_->listener->local_port();
}

void WebsocketServer::shutdown() {
  TRACE("post shutdown");
  if (pimpl_->listener != nullptr)
    pimpl_->listener->shutdown();
}

} // namespace jsonactor::net
