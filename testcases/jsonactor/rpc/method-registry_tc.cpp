
#include "stdinc.hpp"

#include "../test-actor.hpp"

#include "jsonactor/rpc/method-registry.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::rpc::tests {

using test::TestActor;

CATCH_TEST_CASE("MethodRegistry", "[method-registry]") {
  const auto registry = registry_for<TestActor>();
  const TestActor actor{"Registry"};

  CATCH_SECTION("only-exposed-methods") {
    CATCH_REQUIRE(registry->size() == 14);
    CATCH_REQUIRE(registry->find("add") != nullptr);
    CATCH_REQUIRE(registry->find("private_method") == nullptr);
    CATCH_REQUIRE(registry->find("Add") == nullptr);
    CATCH_REQUIRE(registry->find("") == nullptr);

    const auto names = registry->names();
    CATCH_REQUIRE(names.size() == registry->size());
    CATCH_REQUIRE(std::is_sorted(cbegin(names), cend(names)));
    CATCH_REQUIRE(names.front() == "add");
  }

  CATCH_SECTION("registry-is-built-once") { CATCH_REQUIRE(registry_for<TestActor>() == registry); }

  CATCH_SECTION("method-info") {
    const auto* add = registry->find("add");
    CATCH_REQUIRE(add->doc == "Add two integers");
    CATCH_REQUIRE(add->result_type == "int64");
    CATCH_REQUIRE(add->params.size() == 2);
    CATCH_REQUIRE(add->params[0].name == "a");
    CATCH_REQUIRE(add->params[0].type == "int32");
    CATCH_REQUIRE(add->params[0].example == "42");
    CATCH_REQUIRE(add->params[1].name == "b");

    CATCH_REQUIRE(registry->find("divide")->result_type == "expected<double, string>");
    CATCH_REQUIRE(registry->find("sequence")->result_type == "vector<int32>");
    CATCH_REQUIRE(registry->find("reset")->result_type == "void");
    CATCH_REQUIRE(registry->find("ping")->params.empty());

    const auto& optional_param = registry->find("greet_optional")->params.at(0);
    CATCH_REQUIRE(optional_param.type == "optional<string>");
    CATCH_REQUIRE(optional_param.example == "null");

    const auto descriptions = registry->describe();
    CATCH_REQUIRE(descriptions.size() == registry->size());
    CATCH_REQUIRE(descriptions.front().name == "add");
  }

  CATCH_SECTION("invoke") {
    const auto result = registry->find("add")->invoke(actor, json{{"a", 5}, {"b", 3}});
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(*result == json(8));
  }

  CATCH_SECTION("extra-fields-are-ignored") {
    const auto result =
        registry->find("add")->invoke(actor, json{{"a", 1}, {"b", 2}, {"c", "ignored"}});
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(*result == json(3));
  }

  CATCH_SECTION("missing-field") {
    const auto result = registry->find("add")->invoke(actor, json{{"a", 1}});
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().code == ecode::param_deserialization);
    CATCH_REQUIRE(result.error().message
                  == "Failed to deserialize parameters for add: missing field `b`");
  }

  CATCH_SECTION("wrong-type") {
    const auto result = registry->find("add")->invoke(actor, json{{"a", "one"}, {"b", 2}});
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().code == ecode::param_deserialization);
    CATCH_REQUIRE(result.error().message.starts_with("Failed to deserialize parameters for add: "));
  }

  CATCH_SECTION("params-must-be-an-object") {
    for (const auto& params : {json::array({1, 2}), json(nullptr), json(7), json("a")}) {
      const auto result = registry->find("add")->invoke(actor, params);
      CATCH_REQUIRE(!result.has_value());
      CATCH_REQUIRE(result.error().code == ecode::param_deserialization);
    }
  }

  CATCH_SECTION("optional-parameters") {
    const auto* method = registry->find("greet_optional");
    CATCH_REQUIRE(method->invoke(actor, json::object()).value() == json("Hello, stranger!"));
    CATCH_REQUIRE(method->invoke(actor, json{{"name", nullptr}}).value()
                  == json("Hello, stranger!"));
    CATCH_REQUIRE(method->invoke(actor, json{{"name", "Ann"}}).value() == json("Hello, Ann!"));
  }

  CATCH_SECTION("void-result-is-null") {
    const auto result = registry->find("reset")->invoke(actor, json::object());
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(result->is_null());
  }

  CATCH_SECTION("actor-exception") {
    const auto result = registry->find("fails")->invoke(actor, json::object());
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().code == ecode::invocation_failed);
    CATCH_REQUIRE(result.error().message == "Failed to invoke fails: deliberate failure");
  }

  CATCH_SECTION("duplicate-names-are-rejected") {
    RegistryBuilder<TestActor> builder;
    builder.expose("ping", &TestActor::ping).expose("ping", &TestActor::info);
    const auto result = builder.build();
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().code == ecode::duplicate_method);
    CATCH_REQUIRE(result.error().message == "Duplicate method: ping");
  }

  CATCH_SECTION("empty-registry") {
    const auto result = RegistryBuilder<TestActor>{}.build();
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE((*result)->size() == 0);
  }
}

} // namespace jsonactor::rpc::tests
