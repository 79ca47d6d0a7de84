#pragma once

#include "jsonactor/rpc/dispatcher.hpp"

#include "jsonactor/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace jsonactor::net {

class TlsIdentity;

// ------------------------------------------------------------------------------------ HttpServer

/**
 * @brief Serves `POST /<method>` requests from a dispatcher, over http or https.
 *
 * Connections are kept alive when the client asks for it, and each connection
 * handles its requests one at a time.
 */
class HttpServer {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    string address = "0.0.0.0";                 //! Listen address
    uint16_t port = 0;                          //! Listen port, 0 for any free port
    shared_ptr<const TlsIdentity> tls = nullptr; //! `https` when set, plain `http` otherwise
    shared_ptr<const rpc::Dispatcher> dispatcher = nullptr; //! Must be set
    std::size_t max_body_bytes = 1024 * 1024;  //! Larger requests are refused
  };

  HttpServer(boost::asio::io_context& io_context, const Config& config);
  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = default;
  ~HttpServer();
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = default;

  /**
   * @brief Start listening on the configured port.
   * Returns the reason if the address is invalid, or it cannot be bound.
   */
  std::error_code run();

  /** @brief The bound port, once running */
  uint16_t local_port() const;

  /** @brief Stop accepting, and cancel open connections */
  void shutdown();
};

} // namespace jsonactor::net
