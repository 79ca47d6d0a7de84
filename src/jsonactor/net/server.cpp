#include "stdinc.hpp"

#include "server.hpp"

#include "asio-execution-context.hpp"
#include "http/http-server.hpp"
#include "websockets/envelope-session.hpp"
#include "websockets/websocket-server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>

namespace jsonactor::net {

namespace asio = boost::asio;

// ------------------------------------------------------------------------------------------- Pimpl

struct Server::Pimpl {
  asio::io_context& io_context;
  const ServerConfig config;
  shared_ptr<const rpc::Dispatcher> dispatcher;

  std::mutex padlock;
  unique_ptr<HttpServer> http = nullptr;
  unique_ptr<WebsocketServer> websocket = nullptr;

  Pimpl(asio::io_context& io_context_, ServerConfig config_,
        shared_ptr<const rpc::Dispatcher> dispatcher_)
      : io_context{io_context_}, config{std::move(config_)}, dispatcher{std::move(dispatcher_)} {
    Expects(dispatcher != nullptr);
  }

  std::error_code start_http(shared_ptr<const TlsIdentity> tls) {
    HttpServer::Config http_config;
    http_config.address = config.address;
    http_config.port = config.port;
    http_config.tls = std::move(tls);
    http_config.dispatcher = dispatcher;
    http_config.max_body_bytes = config.max_body_bytes;
    http = make_unique<HttpServer>(io_context, http_config);
    return http->run();
  }

  std::error_code start_websocket(shared_ptr<const TlsIdentity> tls) {
    WebsocketServer::Config ws_config;
    ws_config.address = config.address;
    ws_config.port = config.port;
    ws_config.tls = std::move(tls);
    ws_config.session_factory = [dispatcher = dispatcher,
                                 policy = config.envelope_policy](uint64_t id) {
      return std::static_pointer_cast<WebsocketSession>(
          make_shared<EnvelopeSession>(id, dispatcher, policy));
    };
    websocket = make_unique<WebsocketServer>(io_context, ws_config);
    return websocket->run();
  }
};

// ------------------------------------------------------------------------------------ Construction

Server::Server(asio::io_context& io_context, ServerConfig config,
               shared_ptr<const rpc::Dispatcher> dispatcher)
    : pimpl_{make_unique<Pimpl>(io_context, std::move(config), std::move(dispatcher))} {}

Server::~Server() = default;

// --------------------------------------------------------------------------------------------- run

std::error_code Server::run() {
  std::lock_guard lock{pimpl_->padlock};
  Expects(pimpl_->http == nullptr && pimpl_->websocket == nullptr);
  const auto& config = pimpl_->config;

  shared_ptr<const TlsIdentity> tls = nullptr;
  if (config.tls.has_value()) {
    auto identity = load_tls_identity(*config.tls);
    if (!identity.has_value()) {
      LOG_ERR("failed to load TLS identity: {}", identity.error().message);
      return identity.error().error();
    }
    tls = std::move(identity.value());
  }

  const auto ec = (config.transport == Transport::HTTP) ? pimpl_->start_http(std::move(tls))
                                                        : pimpl_->start_websocket(std::move(tls));
  if (ec) {
    LOG_ERR("failed to listen on {}:{}: {}", config.address, config.port, ec.message());
    return make_error_code(ecode::listener_bind);
  }

  const auto port = (pimpl_->http != nullptr) ? pimpl_->http->local_port()
                                              : pimpl_->websocket->local_port();
  INFO("{} server listening on {}, {} methods", str(config.transport), config.url(port),
       pimpl_->dispatcher->method_names().size());
  return {};
}

// -------------------------------------------------------------------------------------- local-port

uint16_t Server::local_port() const {
  std::lock_guard lock{pimpl_->padlock};
  if (pimpl_->http != nullptr)
    return pimpl_->http->local_port();
  if (pimpl_->websocket != nullptr)
    return pimpl_->websocket->local_port();
  return 0;
}

// ---------------------------------------------------------------------------------------- shutdown

void Server::shutdown() {
  std::lock_guard lock{pimpl_->padlock};
  if (pimpl_->http != nullptr)
    pimpl_->http->shutdown();
  if (pimpl_->websocket != nullptr)
    pimpl_->websocket->shutdown();
}

const ServerConfig& Server::config() const { return pimpl_->config; }

// ------------------------------------------------------------------------------------------- serve

void serve(shared_ptr<const rpc::Dispatcher> dispatcher, ServerConfig config) {
  asio::io_context io_context;
  AsioExecutionContext pool{io_context, config.thread_pool_size};
  Server server{io_context, std::move(config), std::move(dispatcher)};

  if (const auto ec = server.run(); ec)
    FATAL("failed to start server: {}", ec.message());

  asio::signal_set signals{io_context, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
    if (ec)
      return;
    INFO("received signal {}, shutting down", signal_number);
    server.shutdown();
    io_context.stop();
  });

  pool.run();
  pool.join();
}

} // namespace jsonactor::net
