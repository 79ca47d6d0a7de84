#include "stdinc.hpp"

#include "http-handler.hpp"

#include "jsonactor/version.hpp"

namespace jsonactor::net {

namespace http = boost::beast::http;

namespace {
  void set_cors_headers(HttpResponse& response) {
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
  }
} // namespace

string_view method_name_from_target(string_view target) {
  const auto end = target.find_first_of("?#");
  if (end != string_view::npos)
    target = target.substr(0, end);
  return trim_leading(target, '/');
}

HttpResponse make_text_response(http::status status, unsigned version, bool keep_alive,
                                string body) {
  HttpResponse response{status, version};
  response.set(http::field::server, k_server_string);
  if (!body.empty())
    response.set(http::field::content_type, "text/plain");
  response.keep_alive(keep_alive);
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

HttpResponse handle_http_request(const rpc::Dispatcher& dispatcher, const HttpRequest& request) {
  const auto version = request.version();
  const auto keep_alive = request.keep_alive();

  if (!is_valid_utf8(request.body())) {
    TRACE("rejecting request with invalid utf-8 body, size={}", request.body().size());
    return make_text_response(http::status::bad_request, version, keep_alive,
                              "Invalid UTF-8 in request body");
  }

  switch (request.method()) {
  case http::verb::post: {
    const auto target = request.target();
    const auto method_name = method_name_from_target(string_view{target.data(), target.size()});
    HttpResponse response{http::status::ok, version};
    response.set(http::field::server, k_server_string);
    response.set(http::field::content_type, "application/json");
    set_cors_headers(response);
    response.keep_alive(keep_alive);
    response.body() = dispatcher.dispatch(method_name, request.body());
    response.prepare_payload();
    return response;
  }

  case http::verb::options: {
    auto response = make_text_response(http::status::ok, version, keep_alive);
    set_cors_headers(response);
    return response;
  }

  default: break;
  }

  auto response =
      make_text_response(http::status::method_not_allowed, version, keep_alive, "Method Not Allowed");
  response.set(http::field::access_control_allow_origin, "*");
  return response;
}

} // namespace jsonactor::net
