#pragma once

#include "websocket-session.hpp"

#include "jsonactor/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace jsonactor::net {

class TlsIdentity;

// --------------------------------------------------------------------------------- WebsocketServer

class WebsocketServer {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    string address = "0.0.0.0";               //! Listen address
    uint16_t port = 0;                        //! Listen port, 0 for any free port
    shared_ptr<const TlsIdentity> tls = nullptr; //! `wss` when set, plain `ws` otherwise

    /**
     * @brief A callback for associating logic with an underlying websocket session.
     * @note Must be set, and must not return nullptr.
     */
    std::function<std::shared_ptr<WebsocketSession>(uint64_t id)> session_factory;
  };

  WebsocketServer(boost::asio::io_context& io_context, const Config& config);
  WebsocketServer(const WebsocketServer&) = delete;
  WebsocketServer(WebsocketServer&&) = default;
  ~WebsocketServer();
  WebsocketServer& operator=(const WebsocketServer&) = delete;
  WebsocketServer& operator=(WebsocketServer&&) = default;

  /**
   * @brief Start listening on the configured port.
   * Returns the reason if the address is invalid, or it cannot be bound.
   */
  std::error_code run();

  /** @brief The bound port, once running */
  uint16_t local_port() const;

  /**
   * @brief Orderly shutdown of the server
   */
  void shutdown();
};

} // namespace jsonactor::net
