#include "stdinc.hpp"

#include "listener.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>

namespace jsonactor::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;

std::chrono::milliseconds accept_retry_delay(const boost::system::error_code& ec,
                                             unsigned consecutive_failures) {
  constexpr std::chrono::milliseconds k_initial_delay{50};
  constexpr std::chrono::milliseconds k_max_delay{2000};

  if (ec == asio::error::connection_aborted || consecutive_failures == 0)
    return std::chrono::milliseconds{0};

  auto delay = k_initial_delay;
  for (unsigned i = 1; i < consecutive_failures && delay < k_max_delay; ++i)
    delay *= 2;
  return std::min(delay, k_max_delay);
}

Listener::Listener(asio::io_context& ioc, asio::ip::tcp::endpoint endpoint,
                   ConnectionFactory factory)
    : ioc_{ioc}, acceptor_{asio::make_strand(ioc)}, retry_timer_{acceptor_.get_executor()},
      factory_{std::move(factory)} {
  acceptor_.open(endpoint.protocol(), ec_);
  if (ec_)
    return;

  acceptor_.set_option(asio::socket_base::reuse_address(true), ec_);
  if (ec_)
    return;

  acceptor_.bind(endpoint, ec_);
  if (ec_)
    return;

  acceptor_.listen(asio::socket_base::max_listen_connections, ec_);
}

std::error_code Listener::run() {
  if (!ec_)
    do_accept_();
  return ec_;
}

uint16_t Listener::local_port() const {
  boost::system::error_code ec;
  const auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

void Listener::shutdown() {
  {
    std::lock_guard lock{padlock_};
    is_shutdown_ = true;
  }
  asio::post(acceptor_.get_executor(), [self = shared_from_this()]() { self->finish_shutdown_(); });
}

bool Listener::is_shutdown_requested_() const {
  std::lock_guard lock{padlock_};
  return is_shutdown_;
}

void Listener::do_accept_() {
  // The new connection gets its own strand
  acceptor_.async_accept(asio::make_strand(ioc_),
                         beast::bind_front_handler(&Listener::on_accept_, shared_from_this()));
}

void Listener::on_accept_(boost::system::error_code ec, asio::ip::tcp::socket socket) {
  if (ec == asio::error::operation_aborted)
    return; // acceptor was shut down

  if (ec) {
    const auto delay = accept_retry_delay(ec, ++accept_failures_);
    INFO("accept failed: {}, retrying in {}ms", ec.message(), delay.count());
    if (delay.count() > 0 && !is_shutdown_requested_()) {
      retry_timer_.expires_after(delay);
      retry_timer_.async_wait(
          beast::bind_front_handler(&Listener::on_retry_timer_, shared_from_this()));
      return;
    }
  } else {
    accept_failures_ = 0;
    const auto id = connection_id_.fetch_add(1, std::memory_order_acq_rel);
    auto connection = factory_(id, std::move(socket));
    Expects(connection != nullptr);

    bool is_shutdown = false;
    {
      std::lock_guard lock{padlock_};
      is_shutdown = is_shutdown_;
      if (!is_shutdown)
        connections_.insert({connection.get(), connection});
    }

    if (is_shutdown) {
      connection->cancel();
      return;
    }

    TRACE("accepted connection, id={}", id);
    connection->run([weak = weak_from_this()](Connection* closed) {
      if (auto self = weak.lock())
        self->remove_connection_(closed);
    });
  }

  if (!is_shutdown_requested_())
    do_accept_();
}

void Listener::on_retry_timer_(boost::system::error_code ec) {
  if (ec == asio::error::operation_aborted)
    return; // cancelled by shutdown
  if (!is_shutdown_requested_())
    do_accept_();
}

void Listener::remove_connection_(Connection* connection) {
  std::lock_guard lock{padlock_};
  connections_.erase(connection);
}

void Listener::finish_shutdown_() {
  boost::system::error_code ec;
  acceptor_.close(ec); // stop listening
  if (ec)
    INFO("closing acceptor: {}", ec.message());
  retry_timer_.cancel();

  decltype(connections_) connections;
  {
    std::lock_guard lock{padlock_};
    using std::swap;
    swap(connections, connections_);
  }

  for (auto& [ptr, weak] : connections)
    if (auto connection = weak.lock())
      connection->cancel();
}

} // namespace jsonactor::net::detail
