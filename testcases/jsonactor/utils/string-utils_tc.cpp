
#include "stdinc.hpp"

#include "jsonactor/utils/string-utils.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::tests {

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("trim-leading") {
    CATCH_REQUIRE(trim_leading("/add", '/') == "add");
    CATCH_REQUIRE(trim_leading("///add/sub", '/') == "add/sub");
    CATCH_REQUIRE(trim_leading("add", '/') == "add");
    CATCH_REQUIRE(trim_leading("///", '/') == "");
    CATCH_REQUIRE(trim_leading("", '/') == "");
  }

  CATCH_SECTION("utf8") {
    CATCH_REQUIRE(is_valid_utf8(""));
    CATCH_REQUIRE(is_valid_utf8(R"({"a": 1})"));
    CATCH_REQUIRE(is_valid_utf8("caf\xc3\xa9"));              // 2 bytes
    CATCH_REQUIRE(is_valid_utf8("\xe2\x82\xac"));             // euro sign
    CATCH_REQUIRE(is_valid_utf8("\xf0\x9f\x98\x80"));         // emoji
    CATCH_REQUIRE(!is_valid_utf8("\xff\xfe"));                // never valid
    CATCH_REQUIRE(!is_valid_utf8("\xc3"));                    // truncated
    CATCH_REQUIRE(!is_valid_utf8("\xc0\xaf"));                // overlong '/'
    CATCH_REQUIRE(!is_valid_utf8("\xe0\x80\xaf"));            // overlong '/'
    CATCH_REQUIRE(!is_valid_utf8("\xed\xa0\x80"));            // surrogate
    CATCH_REQUIRE(!is_valid_utf8("\xf4\x90\x80\x80"));        // > U+10FFFF
    CATCH_REQUIRE(!is_valid_utf8("abc\x80"));                 // stray continuation
  }
}

} // namespace jsonactor::tests
