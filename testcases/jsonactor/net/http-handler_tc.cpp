
#include "stdinc.hpp"

#include "../test-actor.hpp"

#include "jsonactor/net/http/http-handler.hpp"
#include "jsonactor/version.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::net::tests {

namespace http = boost::beast::http;

namespace {
  HttpRequest make_request(http::verb verb, string_view target, string body = {}) {
    HttpRequest request{verb, target, 11};
    request.set(http::field::host, "localhost");
    request.body() = std::move(body);
    request.prepare_payload();
    return request;
  }

  string header(const HttpResponse& response, http::field field) {
    const auto value = response[field];
    return string{value.data(), value.size()};
  }
} // namespace

CATCH_TEST_CASE("MethodNameFromTarget", "[http-handler]") {
  CATCH_REQUIRE(method_name_from_target("/add") == "add");
  CATCH_REQUIRE(method_name_from_target("add") == "add");
  CATCH_REQUIRE(method_name_from_target("//add") == "add");
  CATCH_REQUIRE(method_name_from_target("/add?a=1&b=2") == "add");
  CATCH_REQUIRE(method_name_from_target("/add#top") == "add");
  CATCH_REQUIRE(method_name_from_target("/api/add") == "api/add");
  CATCH_REQUIRE(method_name_from_target("/") == "");
  CATCH_REQUIRE(method_name_from_target("") == "");
}

CATCH_TEST_CASE("HttpHandler", "[http-handler]") {
  auto handle = test::TestHandle::make("Handler");
  const auto dispatcher = std::move(handle).into_dispatcher();

  CATCH_SECTION("post") {
    const auto response =
        handle_http_request(*dispatcher, make_request(http::verb::post, "/add", R"({"a":1,"b":2})"));
    CATCH_REQUIRE(response.result() == http::status::ok);
    CATCH_REQUIRE(response.body() == "3");
    CATCH_REQUIRE(header(response, http::field::content_type) == "application/json");
    CATCH_REQUIRE(header(response, http::field::access_control_allow_origin) == "*");
    CATCH_REQUIRE(header(response, http::field::access_control_allow_methods) == "POST, OPTIONS");
    CATCH_REQUIRE(header(response, http::field::access_control_allow_headers) == "Content-Type");
    CATCH_REQUIRE(header(response, http::field::server) == k_server_string);
    CATCH_REQUIRE(header(response, http::field::content_length) == "1");
  }

  CATCH_SECTION("application-errors-are-200") {
    const auto unknown =
        handle_http_request(*dispatcher, make_request(http::verb::post, "/nope", "{}"));
    CATCH_REQUIRE(unknown.result() == http::status::ok);
    CATCH_REQUIRE(unknown.body() == R"("Unknown method: nope")");

    const auto malformed =
        handle_http_request(*dispatcher, make_request(http::verb::post, "/add", "{oops"));
    CATCH_REQUIRE(malformed.result() == http::status::ok);
    CATCH_REQUIRE(malformed.body().starts_with(R"("Failed to parse JSON: )"));

    const auto empty = handle_http_request(*dispatcher, make_request(http::verb::post, "/ping"));
    CATCH_REQUIRE(empty.result() == http::status::ok);
    CATCH_REQUIRE(empty.body().starts_with(R"("Failed to parse JSON: )"));
  }

  CATCH_SECTION("options") {
    const auto response =
        handle_http_request(*dispatcher, make_request(http::verb::options, "/anything"));
    CATCH_REQUIRE(response.result() == http::status::ok);
    CATCH_REQUIRE(response.body().empty());
    CATCH_REQUIRE(header(response, http::field::content_length) == "0");
    CATCH_REQUIRE(header(response, http::field::access_control_allow_origin) == "*");
    CATCH_REQUIRE(header(response, http::field::access_control_allow_methods) == "POST, OPTIONS");
    CATCH_REQUIRE(header(response, http::field::access_control_allow_headers) == "Content-Type");
  }

  CATCH_SECTION("other-verbs") {
    for (const auto verb : {http::verb::get, http::verb::put, http::verb::delete_,
                            http::verb::patch, http::verb::head}) {
      const auto response = handle_http_request(*dispatcher, make_request(verb, "/add"));
      CATCH_REQUIRE(response.result() == http::status::method_not_allowed);
      CATCH_REQUIRE(response.body() == "Method Not Allowed");
      CATCH_REQUIRE(header(response, http::field::content_type) == "text/plain");
      CATCH_REQUIRE(header(response, http::field::access_control_allow_origin) == "*");
    }
  }

  CATCH_SECTION("invalid-utf8") {
    for (const auto verb : {http::verb::post, http::verb::get, http::verb::options}) {
      const auto response =
          handle_http_request(*dispatcher, make_request(verb, "/echo", "{\"message\": \"\xff\"}"));
      CATCH_REQUIRE(response.result() == http::status::bad_request);
      CATCH_REQUIRE(response.body() == "Invalid UTF-8 in request body");
      CATCH_REQUIRE(header(response, http::field::content_type) == "text/plain");
    }
  }

  CATCH_SECTION("keep-alive-follows-the-request") {
    auto request = make_request(http::verb::post, "/ping", "{}");
    request.keep_alive(true);
    CATCH_REQUIRE(handle_http_request(*dispatcher, request).keep_alive());
    request.keep_alive(false);
    CATCH_REQUIRE(!handle_http_request(*dispatcher, request).keep_alive());
  }
}

} // namespace jsonactor::net::tests
