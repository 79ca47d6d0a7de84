
#include "stdinc.hpp"

#include "../test-actor.hpp"

#include "jsonactor/net/websockets/envelope-session.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::net::tests {

namespace {
  const string k_invalid_format =
      R"({"error":"Invalid message format. Expected {\"method\": \"method_name\", \"params\": {...}}"})";

  // Exposes a method under the name reported for messages without a method
  struct UnknownActor {
    string unknown() const { return "reached"; }

    static void expose(rpc::RegistryBuilder<UnknownActor>& builder) {
      builder.expose("unknown", &UnknownActor::unknown);
    }
  };
} // namespace

CATCH_TEST_CASE("HandleEnvelope", "[envelope]") {
  auto handle = test::TestHandle::make("Envelope");
  const auto dispatcher = std::move(handle).into_dispatcher();

  auto strict = [&](string_view text) {
    return handle_envelope(*dispatcher, text, EnvelopePolicy::STRICT);
  };
  auto lenient = [&](string_view text) {
    return handle_envelope(*dispatcher, text, EnvelopePolicy::LENIENT);
  };

  CATCH_SECTION("well-formed") {
    for (const auto policy : {EnvelopePolicy::STRICT, EnvelopePolicy::LENIENT}) {
      CATCH_REQUIRE(handle_envelope(*dispatcher, R"({"method": "add", "params": {"a": 4, "b": 4}})",
                                    policy)
                    == "8");
      CATCH_REQUIRE(handle_envelope(*dispatcher, R"({"method": "nope", "params": {}})", policy)
                    == R"("Unknown method: nope")");
    }
  }

  CATCH_SECTION("strict") {
    const auto not_json = json::parse(strict("{not json"));
    CATCH_REQUIRE(not_json.is_object());
    CATCH_REQUIRE(not_json.at("error").get<string>().starts_with("JSON parse error: "));

    CATCH_REQUIRE(strict(R"({"method": "ping"})") == k_invalid_format);
    CATCH_REQUIRE(strict(R"({"params": {}})") == k_invalid_format);
    CATCH_REQUIRE(strict(R"({"method": 42, "params": {}})") == k_invalid_format);
    CATCH_REQUIRE(strict("[]") == k_invalid_format);
  }

  CATCH_SECTION("lenient") {
    CATCH_REQUIRE(lenient("{not json") == R"("Invalid JSON")");
    CATCH_REQUIRE(lenient(R"({"method": "ping"})") == R"("pong")");
    CATCH_REQUIRE(lenient(R"({"params": {}})") == R"("Unknown method: unknown")");
    CATCH_REQUIRE(lenient("{}") == R"("Unknown method: unknown")");
    CATCH_REQUIRE(lenient(R"({"method": 42, "params": {}})") == R"("Unknown method: unknown")");
  }

  CATCH_SECTION("lenient-missing-method-never-dispatches") {
    const auto unknown_dispatcher = make_shared<rpc::ActorDispatcher<UnknownActor>>(
        make_shared<const UnknownActor>(), rpc::registry_for<UnknownActor>());
    CATCH_REQUIRE(handle_envelope(*unknown_dispatcher, R"({"method": "unknown", "params": {}})",
                                  EnvelopePolicy::LENIENT)
                  == R"("reached")");
    CATCH_REQUIRE(handle_envelope(*unknown_dispatcher, R"({"params": {}})", EnvelopePolicy::LENIENT)
                  == R"("Unknown method: unknown")");
    CATCH_REQUIRE(handle_envelope(*unknown_dispatcher, "{}", EnvelopePolicy::LENIENT)
                  == R"("Unknown method: unknown")");
  }

  CATCH_SECTION("params-are-passed-through") {
    CATCH_REQUIRE(strict(R"({"method": "add", "params": [1, 2]})")
                      .starts_with(R"("Failed to deserialize parameters for add: )"));
    CATCH_REQUIRE(strict(R"({"method": "add", "params": {"a": 1}})")
                  == R"("Failed to deserialize parameters for add: missing field `b`")");
  }
}

} // namespace jsonactor::net::tests
