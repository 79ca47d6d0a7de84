
#include "stdinc.hpp"

#include "../test-actor.hpp"

#include "jsonactor/rpc/method-docs.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::rpc::tests {

using test::TestActor;

CATCH_TEST_CASE("MethodDocs", "[method-docs]") {
  const auto methods = registry_for<TestActor>()->describe();
  const auto doc = describe_methods(methods, "Test API", "http://localhost:8080");

  auto contains = [&doc](string_view needle) { return doc.find(needle) != string::npos; };

  CATCH_SECTION("overview") {
    CATCH_REQUIRE(doc.starts_with("# Test API\n"));
    CATCH_REQUIRE(contains("| Method | Parameters | Return Type |"));
    CATCH_REQUIRE(contains("| `add` | `a`: `int32`, `b`: `int32` | `int64` |"));
    CATCH_REQUIRE(contains("| `ping` | None | `string` |"));
    CATCH_REQUIRE(contains("| `divide` | `a`: `double`, `b`: `double` | `expected<double, string>` |"));
  }

  CATCH_SECTION("per-method") {
    CATCH_REQUIRE(contains("## Method `add`\n\nAdd two integers\n"));
    CATCH_REQUIRE(contains("- **Returns:** `int64`"));
    CATCH_REQUIRE(contains("- **Parameters:** None"));
    CATCH_REQUIRE(contains("**HTTP Body:**\n```json\n{\n  \"a\": 42,\n  \"b\": 42\n}\n```"));
    CATCH_REQUIRE(contains("\"method\": \"add\""));
    CATCH_REQUIRE(contains("fetch(\"http://localhost:8080/add\""));
    CATCH_REQUIRE(contains("\"name\": null"));
    CATCH_REQUIRE(!contains("private_method"));
  }

  CATCH_SECTION("every-method-is-described") {
    for (const auto& method : methods)
      CATCH_REQUIRE(contains(format("## Method `{}`", method.name)));
  }

  CATCH_SECTION("no-methods") {
    const auto empty = describe_methods({}, "Nothing");
    CATCH_REQUIRE(empty.starts_with("# Nothing\n"));
    CATCH_REQUIRE(empty.find("## Method") == string::npos);
  }
}

} // namespace jsonactor::rpc::tests
