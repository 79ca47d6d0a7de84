
#include "stdinc.hpp"

#include "../test-clients.hpp"

#include "jsonactor/version.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::net::tests {

using test::TestHandle;
using test::TestServer;
using test::WebsocketTestClient;

namespace {
  ServerConfig websocket_config(EnvelopePolicy policy = EnvelopePolicy::STRICT) {
    ServerConfig config;
    config.transport = Transport::WEBSOCKET;
    config.envelope_policy = policy;
    return config;
  }

  const string k_invalid_format =
      R"({"error":"Invalid message format. Expected {\"method\": \"method_name\", \"params\": {...}}"})";
} // namespace

CATCH_TEST_CASE("WebsocketServer", "[websockets]") {
  CATCH_SECTION("end-to-end") {
    TestServer server{websocket_config(), TestHandle::make("WS-E2E-Test")};
    CATCH_REQUIRE(!server.error());

    WebsocketTestClient<false> client{server.port()};
    const auto server_header = client.handshake_response()[boost::beast::http::field::server];
    CATCH_REQUIRE(string{server_header.data(), server_header.size()} == k_server_string);

    CATCH_REQUIRE(client.call(R"({"method": "add", "params": {"a": 20, "b": 20}})") == "40");
    CATCH_REQUIRE(client.call(R"({"method": "greet", "params": {"name": "WebSocket"}})")
                  == R"("Hello, WebSocket! I'm WS-E2E-Test")");
    CATCH_REQUIRE(client.call(R"({"method": "ping", "params": {}})") == R"("pong")");
    CATCH_REQUIRE(client.call(R"({"method": "divide", "params": {"a": 1.0, "b": 0.0}})")
                  == R"({"Err":"Division by zero"})");
    CATCH_REQUIRE(client.call(R"({"method": "nope", "params": {}})") == R"("Unknown method: nope")");
    client.close();
  }

  CATCH_SECTION("strict-envelopes") {
    TestServer server{websocket_config(), TestHandle::make("Strict")};
    WebsocketTestClient<false> client{server.port()};

    const auto parse_error = json::parse(client.call("{not json"));
    CATCH_REQUIRE(parse_error.at("error").get<string>().starts_with("JSON parse error: "));
    CATCH_REQUIRE(client.call(R"({"method": "ping"})") == k_invalid_format);
    CATCH_REQUIRE(client.call(R"({"params": {}})") == k_invalid_format);

    // The connection survives malformed messages
    CATCH_REQUIRE(client.call(R"({"method": "ping", "params": {}})") == R"("pong")");
  }

  CATCH_SECTION("lenient-envelopes") {
    TestServer server{websocket_config(EnvelopePolicy::LENIENT), TestHandle::make("Lenient")};
    WebsocketTestClient<false> client{server.port()};

    CATCH_REQUIRE(client.call("{not json") == R"("Invalid JSON")");
    CATCH_REQUIRE(client.call(R"({"method": "ping"})") == R"("pong")");
    CATCH_REQUIRE(client.call(R"({"params": {}})") == R"("Unknown method: unknown")");
  }

  CATCH_SECTION("replies-are-in-order") {
    TestServer server{websocket_config(), TestHandle::make("Order")};
    WebsocketTestClient<false> client{server.port()};

    constexpr int k_messages = 50;
    for (int i = 0; i < k_messages; ++i)
      client.send_text(format(R"({{"method": "add", "params": {{"a": {}, "b": 0}}}})", i));
    for (int i = 0; i < k_messages; ++i)
      CATCH_REQUIRE(client.read_text() == std::to_string(i));
  }

  CATCH_SECTION("binary-and-control-frames") {
    TestServer server{websocket_config(), TestHandle::make("WS-MessageTypes-Test")};
    WebsocketTestClient<false> client{server.port()};

    client.send_binary(R"({"method": "add", "params": {"a": 1, "b": 1}})");
    client.ping();
    CATCH_REQUIRE(client.call(R"({"method": "ping", "params": {}})") == R"("pong")");
    CATCH_REQUIRE(client.call(R"({"method": "info", "params": {}})")
                  == R"("Test server: WS-MessageTypes-Test")");
  }

  CATCH_SECTION("any-upgrade-path") {
    TestServer server{websocket_config(), TestHandle::make("Path")};
    WebsocketTestClient<false> client{server.port(), "/some/other/path?x=1"};
    CATCH_REQUIRE(client.call(R"({"method": "ping", "params": {}})") == R"("pong")");
  }

  CATCH_SECTION("no-writes-after-close") {
    TestServer server{websocket_config(), TestHandle::make("Close")};
    WebsocketTestClient<false> client{server.port()};
    CATCH_REQUIRE(client.call(R"({"method": "ping", "params": {}})") == R"("pong")");

    client.close();
    CATCH_REQUIRE(client.try_send_text(R"({"method": "ping", "params": {}})"));
  }

  CATCH_SECTION("connections-are-independent") {
    TestServer server{websocket_config(), TestHandle::make("Independent")};
    WebsocketTestClient<false> a{server.port()};
    WebsocketTestClient<false> b{server.port()};

    CATCH_REQUIRE(a.call(R"({"method": "increment", "params": {"amount": 2}})") == "2");
    CATCH_REQUIRE(b.call(R"({"method": "increment", "params": {"amount": 3}})") == "5");
    a.close();
    CATCH_REQUIRE(b.call(R"({"method": "get_counter", "params": {}})") == "5");
  }

  CATCH_SECTION("wss") {
    auto config = websocket_config();
    config.tls = test::test_tls_config();
    TestServer server{config, TestHandle::make("WSS-E2E-Test")};
    CATCH_REQUIRE(!server.error());

    WebsocketTestClient<true> client{server.port()};
    CATCH_REQUIRE(client.call(R"({"method": "add", "params": {"a": 5, "b": 3}})") == "8");
    CATCH_REQUIRE(client.call(R"({"method": "greet", "params": {"name": "WSS"}})")
                  == R"("Hello, WSS! I'm WSS-E2E-Test")");
    client.close();
  }
}

} // namespace jsonactor::net::tests
