
#include "stdinc.hpp"

#include "jsonactor/utils/error-codes.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::tests {

CATCH_TEST_CASE("ErrorCodes", "[error-codes]") {
  CATCH_SECTION("category") {
    const error_code ec = ecode::unknown_method;
    CATCH_REQUIRE(ec);
    CATCH_REQUIRE(string{ec.category().name()} == "jsonactor");
    CATCH_REQUIRE(ec.message() == "unknown method");
    CATCH_REQUIRE(ec == ecode::unknown_method);
    CATCH_REQUIRE(ec != ecode::listener_bind);
  }

  CATCH_SECTION("okay-is-not-an-error") {
    const error_code ec = make_error_code(ecode::okay);
    CATCH_REQUIRE(!ec);
  }
}

} // namespace jsonactor::tests
