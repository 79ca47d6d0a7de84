
#include "stdinc.hpp"

#include "../test-clients.hpp"

#include "jsonactor/version.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::net::tests {

using test::HttpTestConnection;
using test::TestHandle;
using test::TestServer;

namespace http = boost::beast::http;

namespace {
  ServerConfig http_config() {
    ServerConfig config;
    config.transport = Transport::HTTP;
    return config;
  }

  string header(const HttpResponse& response, http::field field) {
    const auto value = response[field];
    return string{value.data(), value.size()};
  }
} // namespace

CATCH_TEST_CASE("HttpServer", "[http-server]") {
  CATCH_SECTION("end-to-end") {
    TestServer server{http_config(), TestHandle::make("HTTP-E2E-Test")};
    CATCH_REQUIRE(!server.error());
    CATCH_REQUIRE(server.port() != 0);

    HttpTestConnection<false> client{server.port()};

    const auto add = client.post("/add", R"({"a": 10, "b": 5})");
    CATCH_REQUIRE(add.result() == http::status::ok);
    CATCH_REQUIRE(add.body() == "15");
    CATCH_REQUIRE(header(add, http::field::content_type) == "application/json");
    CATCH_REQUIRE(header(add, http::field::access_control_allow_origin) == "*");
    CATCH_REQUIRE(header(add, http::field::server) == k_server_string);

    // The same connection serves several requests
    CATCH_REQUIRE(client.post("/greet", R"({"name": "World"})").body()
                  == R"("Hello, World! I'm HTTP-E2E-Test")");
    CATCH_REQUIRE(client.post("/info", "{}").body() == R"("Test server: HTTP-E2E-Test")");
    CATCH_REQUIRE(client.post("/ping", "{}").body() == R"("pong")");
    CATCH_REQUIRE(client.post("/echo", R"({"message": "Hello, Echo!"})").body()
                  == R"("Hello, Echo!")");
    CATCH_REQUIRE(client.post("/divide", R"({"a": 10.0, "b": 2.0})").body() == R"({"Ok":5.0})");
    CATCH_REQUIRE(client.post("/divide", R"({"a": 10.0, "b": 0.0})").body()
                  == R"({"Err":"Division by zero"})");
    CATCH_REQUIRE(client.post("/add?trace=1", R"({"a": 1, "b": 1})").body() == "2");

    const auto unknown = client.post("/unknown", "{}");
    CATCH_REQUIRE(unknown.result() == http::status::ok);
    CATCH_REQUIRE(unknown.body() == R"("Unknown method: unknown")");

    const auto malformed = client.post("/add", R"({"invalid": json)");
    CATCH_REQUIRE(malformed.result() == http::status::ok);
    CATCH_REQUIRE(malformed.body().starts_with(R"("Failed to parse JSON: )"));
  }

  CATCH_SECTION("verbs") {
    TestServer server{http_config(), TestHandle::make("Verbs")};
    HttpTestConnection<false> client{server.port()};

    for (const auto verb : {http::verb::get, http::verb::put, http::verb::delete_}) {
      const auto response = client.request(verb, "/add");
      CATCH_REQUIRE(response.result() == http::status::method_not_allowed);
      CATCH_REQUIRE(response.body() == "Method Not Allowed");
      CATCH_REQUIRE(header(response, http::field::content_type) == "text/plain");
    }

    const auto preflight = client.request(http::verb::options, "/add");
    CATCH_REQUIRE(preflight.result() == http::status::ok);
    CATCH_REQUIRE(preflight.body().empty());
    CATCH_REQUIRE(header(preflight, http::field::access_control_allow_methods) == "POST, OPTIONS");

    // Still serving after all of that
    CATCH_REQUIRE(client.post("/add", R"({"a": 10, "b": 5})").body() == "15");
  }

  CATCH_SECTION("invalid-utf8") {
    TestServer server{http_config(), TestHandle::make("Utf8")};
    HttpTestConnection<false> client{server.port()};

    const auto response = client.post("/echo", "{\"message\": \"\xff\xfe\"}");
    CATCH_REQUIRE(response.result() == http::status::bad_request);
    CATCH_REQUIRE(response.body() == "Invalid UTF-8 in request body");
  }

  CATCH_SECTION("connection-close") {
    TestServer server{http_config(), TestHandle::make("Close")};
    HttpTestConnection<false> client{server.port()};

    const auto response = client.post("/ping", "{}", false);
    CATCH_REQUIRE(response.body() == R"("pong")");
    CATCH_REQUIRE(!response.keep_alive());
    CATCH_REQUIRE(client.is_closed_by_peer());
  }

  CATCH_SECTION("body-limit") {
    auto config = http_config();
    config.max_body_bytes = 64;
    TestServer server{config, TestHandle::make("Limit")};
    HttpTestConnection<false> client{server.port()};

    const auto message = string(1000, 'x');
    const auto response = client.post("/echo", format(R"({{"message": "{}"}})", message));
    CATCH_REQUIRE(response.result() == http::status::payload_too_large);
    CATCH_REQUIRE(client.is_closed_by_peer());

    HttpTestConnection<false> small{server.port()};
    CATCH_REQUIRE(small.post("/echo", R"({"message": "ok"})").body() == R"("ok")");
  }

  CATCH_SECTION("connections-are-independent") {
    TestServer server{http_config(), TestHandle::make("Independent")};
    HttpTestConnection<false> a{server.port()};
    HttpTestConnection<false> b{server.port()};

    CATCH_REQUIRE(a.post("/increment", R"({"amount": 2})").body() == "2");
    CATCH_REQUIRE(b.post("/increment", R"({"amount": 3})").body() == "5");
    CATCH_REQUIRE(a.post("/ping", "{}", false).body() == R"("pong")");
    CATCH_REQUIRE(a.is_closed_by_peer());
    CATCH_REQUIRE(b.post("/get_counter", "{}").body() == "5");
  }

  CATCH_SECTION("https") {
    auto config = http_config();
    config.tls = test::test_tls_config();
    TestServer server{config, TestHandle::make("HTTPS-E2E-Test")};
    CATCH_REQUIRE(!server.error());

    HttpTestConnection<true> client{server.port()};
    CATCH_REQUIRE(client.post("/add", R"({"a": 20, "b": 20})").body() == "40");
    CATCH_REQUIRE(client.post("/greet", R"({"name": "TLS"})").body()
                  == R"("Hello, TLS! I'm HTTPS-E2E-Test")");
    CATCH_REQUIRE(client.post("/info", "{}").body() == R"("Test server: HTTPS-E2E-Test")");
  }

  CATCH_SECTION("failed-handshake-only-affects-that-connection") {
    auto config = http_config();
    config.tls = test::test_tls_config();
    TestServer server{config, TestHandle::make("Handshake")};

    {
      HttpTestConnection<false> plain{server.port()};
      CATCH_REQUIRE_THROWS(plain.post("/ping", "{}"));
    }

    HttpTestConnection<true> client{server.port()};
    CATCH_REQUIRE(client.post("/ping", "{}").body() == R"("pong")");
  }
}

CATCH_TEST_CASE("ServerLifecycle", "[server]") {
  CATCH_SECTION("serving-consumes-the-handle") {
    auto handle = TestHandle::make("Owned");
    {
      TestServer server{http_config(), std::move(handle)};
      CATCH_REQUIRE(!server.error());
      CATCH_REQUIRE(server.server().config().transport == Transport::HTTP);
    }
    CATCH_REQUIRE(handle.is_served());
    CATCH_REQUIRE_THROWS_AS(handle.dispatch("ping", "{}"), std::logic_error);
  }

  CATCH_SECTION("bad-tls-identity") {
    auto config = http_config();
    config.tls = TlsConfig{"assets/test-certificate/missing.crt", test::k_test_key_path};
    TestServer server{config, TestHandle::make("NoTls")};
    CATCH_REQUIRE(server.error() == ecode::tls_unreadable_file);
    CATCH_REQUIRE(server.port() == 0);
  }

  CATCH_SECTION("port-in-use") {
    TestServer first{http_config(), TestHandle::make("First")};
    CATCH_REQUIRE(!first.error());

    boost::asio::io_context io_context;
    auto config = http_config();
    config.address = "127.0.0.1";
    config.port = first.port();
    Server second{io_context, config, TestHandle::make("Second")};
    CATCH_REQUIRE(second.run() == ecode::listener_bind);
  }

  CATCH_SECTION("invalid-address") {
    boost::asio::io_context io_context;
    auto config = http_config();
    config.address = "not-an-address";
    Server server{io_context, config, TestHandle::make("Nowhere")};
    CATCH_REQUIRE(server.run() == ecode::listener_bind);
    CATCH_REQUIRE(server.local_port() == 0);
  }

  CATCH_SECTION("shutdown-closes-connections") {
    TestServer server{http_config(), TestHandle::make("Shutdown")};
    HttpTestConnection<false> client{server.port()};
    CATCH_REQUIRE(client.post("/ping", "{}").body() == R"("pong")");

    server.server().shutdown();
    CATCH_REQUIRE(client.is_closed_by_peer());
  }
}

} // namespace jsonactor::net::tests
