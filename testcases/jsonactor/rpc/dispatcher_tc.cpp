
#include "stdinc.hpp"

#include "../test-actor.hpp"

#include "jsonactor/rpc/dispatcher.hpp"

#include <catch2/catch.hpp>

#include <thread>

namespace jsonactor::rpc::tests {

using test::TestActor;

namespace {
  shared_ptr<const Dispatcher> make_dispatcher(string name) {
    return make_shared<ActorDispatcher<TestActor>>(make_shared<const TestActor>(std::move(name)),
                                                   registry_for<TestActor>());
  }

  // The decoded JSON string, for error replies
  string decode_string(const string& reply) { return json::parse(reply).get<string>(); }
} // namespace

CATCH_TEST_CASE("Dispatcher", "[dispatcher]") {
  const auto dispatcher = make_dispatcher("Direct-Test");
  auto dispatch = [&](string_view method, string_view params) {
    return dispatcher->dispatch(method, params);
  };

  CATCH_SECTION("results") {
    CATCH_REQUIRE(dispatch("add", R"({"a": 5, "b": 3})") == "8");
    CATCH_REQUIRE(dispatch("add", R"({"a": 10, "b": 5})") == "15");
    CATCH_REQUIRE(dispatch("greet", R"({"name": "Direct"})")
                  == R"("Hello, Direct! I'm Direct-Test")");
    CATCH_REQUIRE(dispatch("info", "{}") == R"("Test server: Direct-Test")");
    CATCH_REQUIRE(dispatch("ping", "{}") == R"("pong")");
    CATCH_REQUIRE(dispatch("echo", R"({"message": "test"})") == R"("test")");
    CATCH_REQUIRE(dispatch("no_params", "{}") == R"("No parameters needed")");
    CATCH_REQUIRE(dispatch("get_counter", "{}") == "0");
    CATCH_REQUIRE(dispatch("sequence", R"({"count": 3})") == "[1,2,3]");
    CATCH_REQUIRE(dispatch("reset", "{}") == "null");
  }

  CATCH_SECTION("expected-results") {
    CATCH_REQUIRE(dispatch("divide", R"({"a": 10.0, "b": 2.0})") == R"({"Ok":5.0})");
    CATCH_REQUIRE(dispatch("divide", R"({"a": 10.0, "b": 0.0})")
                  == R"({"Err":"Division by zero"})");
  }

  CATCH_SECTION("unknown-method") {
    CATCH_REQUIRE(dispatch("unknown", "{}") == R"("Unknown method: unknown")");
    CATCH_REQUIRE(dispatch("", "{}") == R"("Unknown method: ")");
    CATCH_REQUIRE(dispatch("private_method", "{}") == R"("Unknown method: private_method")");

    const auto result = dispatcher->invoke("unknown", "{}");
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().code == ecode::unknown_method);
  }

  CATCH_SECTION("malformed-json") {
    // Parsing happens before lookup
    for (const auto method : {"add", "invalid"}) {
      const auto reply = dispatch(method, R"({"invalid": json)");
      CATCH_REQUIRE(decode_string(reply).starts_with("Failed to parse JSON: "));
    }
    CATCH_REQUIRE(dispatcher->invoke("add", "").error().code == ecode::malformed_envelope);
  }

  CATCH_SECTION("bad-parameters") {
    const auto reply = dispatch("add", R"({"a": 1})");
    CATCH_REQUIRE(decode_string(reply)
                  == "Failed to deserialize parameters for add: missing field `b`");

    CATCH_REQUIRE(decode_string(dispatch("add", "[1, 2]"))
                      .starts_with("Failed to deserialize parameters for add: "));
  }

  CATCH_SECTION("parameters-are-not-coerced") {
    auto param_error = [&](string_view method, string_view params) {
      const auto result = dispatcher->invoke(method, params);
      CATCH_REQUIRE(!result.has_value());
      CATCH_REQUIRE(result.error().code == ecode::param_deserialization);
      return result.error().message;
    };

    CATCH_REQUIRE(param_error("add", R"({"a": 1.9, "b": 3})")
                  == "Failed to deserialize parameters for add: "
                     "invalid type: floating point `1.9`, expected int32");
    CATCH_REQUIRE(param_error("add", R"({"a": true, "b": 3})")
                  == "Failed to deserialize parameters for add: "
                     "invalid type: boolean `true`, expected int32");
    CATCH_REQUIRE(param_error("add", R"({"a": "1", "b": 3})")
                  == "Failed to deserialize parameters for add: invalid type: string, expected int32");
    CATCH_REQUIRE(param_error("add", R"({"a": null, "b": 3})")
                  == "Failed to deserialize parameters for add: invalid type: null, expected int32");
    CATCH_REQUIRE(param_error("add", R"({"a": 3000000000, "b": 3})")
                  == "Failed to deserialize parameters for add: "
                     "invalid value: integer `3000000000`, expected int32");
    CATCH_REQUIRE(param_error("add", R"({"a": -2147483649, "b": 3})")
                  == "Failed to deserialize parameters for add: "
                     "invalid value: integer `-2147483649`, expected int32");
    CATCH_REQUIRE(param_error("greet", R"({"name": 5})")
                  == "Failed to deserialize parameters for greet: "
                     "invalid type: integer `5`, expected string");
    CATCH_REQUIRE(param_error("greet_optional", R"({"name": false})")
                  == "Failed to deserialize parameters for greet_optional: "
                     "invalid type: boolean `false`, expected string");
    CATCH_REQUIRE(param_error("divide", R"({"a": "4", "b": 2})")
                  == "Failed to deserialize parameters for divide: invalid type: string, expected double");
  }

  CATCH_SECTION("parameters-in-range") {
    CATCH_REQUIRE(dispatch("add", R"({"a": 2147483647, "b": 1})") == "2147483648");
    CATCH_REQUIRE(dispatch("add", R"({"a": -2147483648, "b": -1})") == "-2147483649");
    CATCH_REQUIRE(dispatch("divide", R"({"a": 4, "b": 2})") == R"({"Ok":2.0})");
    CATCH_REQUIRE(dispatch("greet_optional", R"({"name": null})") == R"("Hello, stranger!")");
  }

  CATCH_SECTION("zero-parameter-methods-ignore-extra-fields") {
    CATCH_REQUIRE(dispatch("ping", R"({"unused": true})") == R"("pong")");
  }

  CATCH_SECTION("invocation-failure") {
    CATCH_REQUIRE(decode_string(dispatch("fails", "{}"))
                  == "Failed to invoke fails: deliberate failure");
    CATCH_REQUIRE(dispatcher->invoke("fails", "{}").error().code == ecode::invocation_failed);
  }

  CATCH_SECTION("result-serialization-failure") {
    const auto result = dispatcher->invoke("bad_bytes", "{}");
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().code == ecode::result_serialization);

    const auto reply = dispatch("bad_bytes", "{}");
    CATCH_REQUIRE(decode_string(reply).starts_with("Failed to serialize result for bad_bytes: "));
  }

  CATCH_SECTION("error-replies-are-always-valid-json") {
    // The method name is echoed back, and is not valid UTF-8
    const auto reply = dispatch("\xff\xfe", "{}");
    CATCH_REQUIRE_NOTHROW(json::parse(reply));
    CATCH_REQUIRE(decode_string(reply).starts_with("Unknown method: "));
  }

  CATCH_SECTION("zero-parameter-methods-always-resolve") {
    for (const auto& info : dispatcher->describe()) {
      if (!info.params.empty())
        continue;
      const auto reply = dispatch(info.name, "{}");
      CATCH_REQUIRE(reply.find("Unknown method") == string::npos);
      CATCH_REQUIRE(reply.find("Failed to deserialize") == string::npos);
    }
  }

  CATCH_SECTION("repeated-queries-are-identical") {
    const auto first = dispatch("info", "{}");
    for (int i = 0; i < 10; ++i)
      CATCH_REQUIRE(dispatch("info", "{}") == first);
  }

  CATCH_SECTION("queries") {
    CATCH_REQUIRE(dispatcher->has_method("add"));
    CATCH_REQUIRE(!dispatcher->has_method("private_method"));
    CATCH_REQUIRE(dispatcher->method_names().size() == 14);
    CATCH_REQUIRE(dispatcher->describe().size() == 14);
  }

  CATCH_SECTION("concurrent-mutation") {
    constexpr int k_threads = 8;
    constexpr int k_increments = 100;
    vector<std::thread> threads;
    for (int i = 0; i < k_threads; ++i)
      threads.emplace_back([&]() {
        for (int j = 0; j < k_increments; ++j)
          dispatch("increment", R"({"amount": 1})");
      });
    for (auto& thread : threads)
      thread.join();
    CATCH_REQUIRE(dispatch("get_counter", "{}") == std::to_string(k_threads * k_increments));
  }
}

} // namespace jsonactor::rpc::tests
