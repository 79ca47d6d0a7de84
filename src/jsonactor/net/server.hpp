#pragma once

#include "server-config.hpp"

#include "jsonactor/rpc/actor-handle.hpp"
#include "jsonactor/rpc/dispatcher.hpp"

#include "jsonactor/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace jsonactor::net {

// ---------------------------------------------------------------------------------------- Server

/**
 * @brief One listener (http or websocket, plain or TLS) in front of one actor.
 *
 * The server owns the actor from construction onwards: constructing from an
 * `ActorHandle` empties the handle.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto handle = rpc::ActorHandle<Calculator>::make();
 * Server server{io_context, config, std::move(handle)};
 * if (auto ec = server.run(); ec)
 *   return ec;
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class Server {
private:
  struct Pimpl;
  unique_ptr<Pimpl> pimpl_;

public:
  Server(boost::asio::io_context& io_context, ServerConfig config,
         shared_ptr<const rpc::Dispatcher> dispatcher);

  template <typename Actor>
  Server(boost::asio::io_context& io_context, ServerConfig config, rpc::ActorHandle<Actor>&& actor)
      : Server{io_context, std::move(config), std::move(actor).into_dispatcher()} {}

  Server(const Server&) = delete;
  Server(Server&&) = default;
  ~Server();
  Server& operator=(const Server&) = delete;
  Server& operator=(Server&&) = default;

  /**
   * @brief Loads the TLS identity (if any), binds, and starts accepting.
   *
   * Errors
   * + One of the `tls_*` codes if the identity cannot be loaded.
   * + `ecode::listener_bind` if the address is invalid or cannot be bound.
   */
  std::error_code run();

  /** @brief The bound port once running, 0 otherwise */
  uint16_t local_port() const;

  /** @brief Stop accepting, and cancel live connections. Threadsafe */
  void shutdown();

  const ServerConfig& config() const;
};

/**
 * @brief Serves until SIGINT or SIGTERM, on a thread pool of `config.thread_pool_size`.
 * Startup failure is fatal.
 */
void serve(shared_ptr<const rpc::Dispatcher> dispatcher, ServerConfig config);

template <typename Actor> void serve(rpc::ActorHandle<Actor>&& actor, ServerConfig config) {
  serve(std::move(actor).into_dispatcher(), std::move(config));
}

} // namespace jsonactor::net
