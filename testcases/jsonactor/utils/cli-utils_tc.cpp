
#include "stdinc.hpp"

#include "jsonactor/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::cli::tests {

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("safe-args") {
    vector<string> args = parse_cmd_args("exec-name 1 two three -7 x9");
    vector<char*> argv_s;
    const int argc = int(args.size());
    for (auto i = 0; i < argc; ++i)
      argv_s.push_back(args[i].data());
    char** argv = argv_s.data();

    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "three");
    CATCH_REQUIRE(i == 3);
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == -7);
    CATCH_REQUIRE(i == 4);
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error); // "x9"

    i = argc - 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("parse-cmd-args") {
    const auto args = parse_cmd_args(R"(server --cert "my certs/a.crt" 'single quoted' plain)");
    CATCH_REQUIRE(args.size() == 5);
    CATCH_REQUIRE(args[0] == "server");
    CATCH_REQUIRE(args[1] == "--cert");
    CATCH_REQUIRE(args[2] == "my certs/a.crt");
    CATCH_REQUIRE(args[3] == "single quoted");
    CATCH_REQUIRE(args[4] == "plain");

    CATCH_REQUIRE(parse_cmd_args("").empty());
    CATCH_REQUIRE(parse_cmd_args(R"("a\"b")") == vector<string>{"a\"b"});
  }
}

} // namespace jsonactor::cli::tests
