#pragma once

#include "test-actor.hpp"

#include "jsonactor/net.hpp"
#include "jsonactor/rpc.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <type_traits>

namespace jsonactor::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

constexpr const char* k_test_cert_path = "assets/test-certificate/server.crt";
constexpr const char* k_test_key_path = "assets/test-certificate/server.key";

inline net::TlsConfig test_tls_config() { return {k_test_cert_path, k_test_key_path}; }

// The test certificate is self-signed
inline asio::ssl::context make_client_context() {
  asio::ssl::context context{asio::ssl::context::tls_client};
  context.set_verify_mode(asio::ssl::verify_none);
  return context;
}

template <bool is_tls>
using ClientStream =
    std::conditional_t<is_tls, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

// ------------------------------------------------------------------------------------- TestServer

/**
 * @brief Runs a server on 127.0.0.1, on any free port, for the lifetime of the object.
 */
class TestServer {
private:
  asio::io_context io_context_;
  net::AsioExecutionContext pool_;
  unique_ptr<net::Server> server_ = nullptr;
  std::error_code ec_ = {};

public:
  TestServer(net::ServerConfig config, shared_ptr<const rpc::Dispatcher> dispatcher)
      : pool_{io_context_, 2} {
    config.address = "127.0.0.1";
    config.port = 0;
    server_ = make_unique<net::Server>(io_context_, std::move(config), std::move(dispatcher));
    ec_ = server_->run();
    if (!ec_)
      pool_.run();
  }

  template <typename Actor>
  TestServer(net::ServerConfig config, rpc::ActorHandle<Actor>&& actor)
      : TestServer{std::move(config), std::move(actor).into_dispatcher()} {}

  TestServer(const TestServer&) = delete;
  TestServer& operator=(const TestServer&) = delete;

  ~TestServer() {
    server_->shutdown();
    io_context_.stop();
    pool_.join();
    server_.reset();
  }

  std::error_code error() const { return ec_; }
  uint16_t port() const { return server_->local_port(); }
  net::Server& server() { return *server_; }
};

// ----------------------------------------------------------------------------- HttpTestConnection

/**
 * @brief A blocking http(s) client, holding one connection open.
 */
template <bool is_tls> class HttpTestConnection {
private:
  asio::io_context io_context_;
  asio::ssl::context ssl_context_;
  ClientStream<is_tls> stream_;
  beast::flat_buffer buffer_;

  static ClientStream<is_tls> make_stream_(asio::io_context& io_context,
                                           asio::ssl::context& ssl_context) {
    if constexpr (is_tls)
      return ClientStream<is_tls>{io_context, ssl_context};
    else
      return ClientStream<is_tls>{io_context};
  }

public:
  explicit HttpTestConnection(uint16_t port)
      : ssl_context_{make_client_context()}, stream_{make_stream_(io_context_, ssl_context_)} {
    beast::get_lowest_layer(stream_).connect(
        asio::ip::tcp::endpoint{asio::ip::make_address("127.0.0.1"), port});
    if constexpr (is_tls)
      stream_.handshake(asio::ssl::stream_base::client);
  }

  net::HttpResponse request(http::verb verb, string target, string body = {},
                            bool keep_alive = true) {
    net::HttpRequest request{verb, target, 11};
    request.set(http::field::host, "localhost");
    request.set(http::field::content_type, "application/json");
    request.keep_alive(keep_alive);
    request.body() = std::move(body);
    request.prepare_payload();
    http::write(stream_, request);
    return read_response();
  }

  net::HttpResponse post(string target, string body, bool keep_alive = true) {
    return request(http::verb::post, std::move(target), std::move(body), keep_alive);
  }

  net::HttpResponse read_response() {
    net::HttpResponse response;
    http::read(stream_, buffer_, response);
    return response;
  }

  /** @brief true if the server has closed the connection */
  bool is_closed_by_peer() {
    net::HttpResponse response;
    beast::error_code ec;
    http::read(stream_, buffer_, response, ec);
    return ec == http::error::end_of_stream || ec == asio::error::eof
           || ec == asio::ssl::error::stream_truncated || ec == asio::error::connection_reset;
  }
};

// ---------------------------------------------------------------------------- WebsocketTestClient

/**
 * @brief A blocking ws(s) client.
 */
template <bool is_tls> class WebsocketTestClient {
private:
  asio::io_context io_context_;
  asio::ssl::context ssl_context_;
  websocket::stream<ClientStream<is_tls>> ws_;
  websocket::response_type handshake_response_;

  static websocket::stream<ClientStream<is_tls>> make_stream_(asio::io_context& io_context,
                                                              asio::ssl::context& ssl_context) {
    if constexpr (is_tls)
      return websocket::stream<ClientStream<is_tls>>{io_context, ssl_context};
    else
      return websocket::stream<ClientStream<is_tls>>{io_context};
  }

public:
  explicit WebsocketTestClient(uint16_t port, string_view target = "/")
      : ssl_context_{make_client_context()}, ws_{make_stream_(io_context_, ssl_context_)} {
    beast::get_lowest_layer(ws_).connect(
        asio::ip::tcp::endpoint{asio::ip::make_address("127.0.0.1"), port});
    if constexpr (is_tls)
      ws_.next_layer().handshake(asio::ssl::stream_base::client);
    ws_.handshake(handshake_response_, "localhost", target);
  }

  const websocket::response_type& handshake_response() const { return handshake_response_; }

  void send_text(string_view text) {
    ws_.text(true);
    ws_.write(asio::buffer(text.data(), text.size()));
  }

  void send_binary(string_view data) {
    ws_.binary(true);
    ws_.write(asio::buffer(data.data(), data.size()));
  }

  /** @brief Send a text message, returning the error instead of throwing */
  beast::error_code try_send_text(string_view text) {
    beast::error_code ec;
    ws_.text(true);
    ws_.write(asio::buffer(text.data(), text.size()), ec);
    return ec;
  }

  string read_text() {
    beast::flat_buffer buffer;
    ws_.read(buffer);
    return beast::buffers_to_string(buffer.data());
  }

  string call(string_view text) {
    send_text(text);
    return read_text();
  }

  void ping() { ws_.ping({}); }

  void close() { ws_.close(websocket::close_code::normal); }

  bool is_open() const { return ws_.is_open(); }
};

} // namespace jsonactor::test
