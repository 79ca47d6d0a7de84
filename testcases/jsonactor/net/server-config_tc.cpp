
#include "stdinc.hpp"

#include "jsonactor/net/server-config.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::net::tests {

namespace {
  CommandLine parse(string_view line) {
    auto args = cli::parse_cmd_args(line);
    vector<char*> argv;
    for (auto& arg : args)
      argv.push_back(arg.data());
    return parse_command_line(int(argv.size()), argv.data());
  }
} // namespace

CATCH_TEST_CASE("ServerConfig", "[server-config]") {
  CATCH_SECTION("defaults") {
    const auto command_line = parse("server");
    const auto& config = command_line.server;
    CATCH_REQUIRE(!command_line.show_help);
    CATCH_REQUIRE(!command_line.describe);
    CATCH_REQUIRE(!command_line.log_level.has_value());
    CATCH_REQUIRE(config.address == "0.0.0.0");
    CATCH_REQUIRE(config.port == 9000);
    CATCH_REQUIRE(config.transport == Transport::HTTP);
    CATCH_REQUIRE(!config.tls.has_value());
    CATCH_REQUIRE(config.envelope_policy == EnvelopePolicy::STRICT);
    CATCH_REQUIRE(config.max_body_bytes == 1024 * 1024);
    CATCH_REQUIRE(config.thread_pool_size == 0);
  }

  CATCH_SECTION("all-switches") {
    const auto command_line = parse("server -p 8443 --address 127.0.0.1 --ws --cert a.crt "
                                    "--key a.key --threads 4 --lenient --max-body 2048 "
                                    "--log-level debug --describe -h");
    const auto& config = command_line.server;
    CATCH_REQUIRE(command_line.show_help);
    CATCH_REQUIRE(command_line.describe);
    CATCH_REQUIRE(command_line.log_level == "debug");
    CATCH_REQUIRE(config.address == "127.0.0.1");
    CATCH_REQUIRE(config.port == 8443);
    CATCH_REQUIRE(config.transport == Transport::WEBSOCKET);
    CATCH_REQUIRE(config.tls.has_value());
    CATCH_REQUIRE(config.tls->cert_path == "a.crt");
    CATCH_REQUIRE(config.tls->key_path == "a.key");
    CATCH_REQUIRE(config.thread_pool_size == 4);
    CATCH_REQUIRE(config.envelope_policy == EnvelopePolicy::LENIENT);
    CATCH_REQUIRE(config.max_body_bytes == 2048);
  }

  CATCH_SECTION("errors") {
    CATCH_REQUIRE_THROWS_AS(parse("server --bogus"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --port"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --port http"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --port 70000"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --port -1"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --threads -2"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --max-body 0"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --cert a.crt"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse("server --key a.key"), std::runtime_error);
  }

  CATCH_SECTION("url") {
    ServerConfig config;
    config.address = "127.0.0.1";
    CATCH_REQUIRE(config.url(80) == "http://127.0.0.1:80");
    config.transport = Transport::WEBSOCKET;
    CATCH_REQUIRE(config.url(81) == "ws://127.0.0.1:81");
    config.tls = TlsConfig{"a.crt", "a.key"};
    CATCH_REQUIRE(config.url(82) == "wss://127.0.0.1:82");
    config.transport = Transport::HTTP;
    CATCH_REQUIRE(config.url(83) == "https://127.0.0.1:83");
  }

  CATCH_SECTION("names") {
    CATCH_REQUIRE(str(Transport::HTTP) == "http");
    CATCH_REQUIRE(str(Transport::WEBSOCKET) == "websocket");
    CATCH_REQUIRE(str(EnvelopePolicy::STRICT) == "strict");
    CATCH_REQUIRE(str(EnvelopePolicy::LENIENT) == "lenient");
  }
}

} // namespace jsonactor::net::tests
