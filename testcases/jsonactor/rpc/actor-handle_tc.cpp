
#include "stdinc.hpp"

#include "../test-actor.hpp"

#include "jsonactor/rpc/actor-handle.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::rpc::tests {

using test::TestActor;
using test::TestHandle;

CATCH_TEST_CASE("ActorHandle", "[actor-handle]") {
  auto handle = TestHandle::make("Handle");

  CATCH_SECTION("direct-dispatch") {
    CATCH_REQUIRE(!handle.is_served());
    CATCH_REQUIRE(handle.dispatch("info", "{}") == R"("Test server: Handle")");
    CATCH_REQUIRE(handle.invoke("add", R"({"a": 1, "b": 2})").value() == "3");
    CATCH_REQUIRE(handle->ping() == "pong");
    CATCH_REQUIRE(handle.actor().info() == "Test server: Handle");
    CATCH_REQUIRE(handle.describe().size() == 14);
  }

  CATCH_SECTION("state-is-shared-by-calls") {
    handle.dispatch("increment", R"({"amount": 5})");
    handle.dispatch("increment", R"({"amount": 2})");
    CATCH_REQUIRE(handle->get_counter() == 7);
  }

  CATCH_SECTION("into-dispatcher-empties-the-handle") {
    auto dispatcher = std::move(handle).into_dispatcher();
    CATCH_REQUIRE(dispatcher != nullptr);
    CATCH_REQUIRE(dispatcher->dispatch("ping", "{}") == R"("pong")");

    CATCH_REQUIRE(handle.is_served());
    CATCH_REQUIRE_THROWS_AS(handle.dispatch("ping", "{}"), std::logic_error);
    CATCH_REQUIRE_THROWS_AS(handle.actor(), std::logic_error);
    CATCH_REQUIRE_THROWS_AS(handle.describe(), std::logic_error);
    CATCH_REQUIRE_THROWS_AS(std::move(handle).into_dispatcher(), std::logic_error);
  }

  CATCH_SECTION("moving-the-handle") {
    auto other = std::move(handle);
    CATCH_REQUIRE(!other.is_served());
    CATCH_REQUIRE(other.dispatch("ping", "{}") == R"("pong")");
    CATCH_REQUIRE(handle.is_served());
    CATCH_REQUIRE_THROWS_AS(handle.dispatch("ping", "{}"), std::logic_error);
  }

  CATCH_SECTION("from-an-existing-actor") {
    auto from_actor = TestHandle{make_unique<TestActor>("Existing")};
    CATCH_REQUIRE(from_actor.dispatch("info", "{}") == R"("Test server: Existing")");
  }
}

} // namespace jsonactor::rpc::tests
