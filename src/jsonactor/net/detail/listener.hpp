#pragma once

#include "connection.hpp"

#include "jsonactor/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>

namespace jsonactor::net::detail {

/**
 * @brief How long to wait before accepting again, after `consecutive_failures` accept
 *        errors in a row, the last of which was `ec`.
 *
 * A connection that was aborted before it was accepted costs nothing to retry. Any
 * other error (eg., out of file descriptors) tends to repeat, so the delay doubles
 * from 50ms, up to 2s.
 */
std::chrono::milliseconds accept_retry_delay(const boost::system::error_code& ec,
                                             unsigned consecutive_failures);

// ---------------------------------------------------------------------------------------- Listener

/**
 * @brief Accepts incoming connections, and hands each socket (on its own strand) to
 *        the connection factory.
 *
 * Live connections are tracked so that `shutdown` can cancel them.
 */
class Listener : public std::enable_shared_from_this<Listener> {
public:
  using ConnectionFactory = std::function<shared_ptr<Connection>(
      uint64_t id, boost::asio::ip::tcp::socket&& socket)>;

private:
  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::steady_timer retry_timer_; //!< Shares the acceptor's strand
  unsigned accept_failures_ = 0;
  ConnectionFactory factory_;
  boost::system::error_code ec_;
  std::atomic<uint64_t> connection_id_{1};

  mutable std::mutex padlock_;
  std::unordered_map<Connection*, weak_ptr<Connection>> connections_;
  bool is_shutdown_ = false;

public:
  /**
   * Opens, binds, and listens on `endpoint`. Any failure is held, and returned
   * from `run`.
   */
  Listener(boost::asio::io_context& ioc, boost::asio::ip::tcp::endpoint endpoint,
           ConnectionFactory factory);

  /** @brief Start accepting incoming connections */
  std::error_code run();

  /** @brief The bound port; the actual port when listening on port 0 */
  uint16_t local_port() const;

  /** @brief Stop accepting, and cancel live connections. Threadsafe */
  void shutdown();

private:
  bool is_shutdown_requested_() const;
  void do_accept_();
  void on_accept_(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
  void on_retry_timer_(boost::system::error_code ec);
  void remove_connection_(Connection* connection);
  void finish_shutdown_();
};

} // namespace jsonactor::net::detail
