#pragma once

#include "jsonactor/rpc/dispatcher.hpp"

#include "jsonactor/utils.hpp"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace jsonactor::net {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief The method named by a request target: the path, without any query string
 *        or fragment, and without its leading slashes.
 *
 * "/add" -> "add", "//add?x=1" -> "add", "/" -> "".
 */
string_view method_name_from_target(string_view target);

/**
 * @brief A response with the server header, and a `text/plain` body when `body` is
 *        not empty.
 */
HttpResponse make_text_response(boost::beast::http::status status, unsigned version,
                                bool keep_alive, string body = {});

/**
 * @brief The response to one HTTP request.
 *
 * + A body that is not valid UTF-8 gets 400 "Invalid UTF-8 in request body", whatever
 *   the verb.
 * + POST dispatches the method named by the target, with the body as its parameters.
 *   The reply is 200 with `application/json`, also when the result is an error
 *   message, so that the transport status never depends on the call's outcome.
 * + OPTIONS answers a CORS preflight with 200 and an empty body.
 * + Anything else gets 405 "Method Not Allowed".
 *
 * The response keeps the request's HTTP version and keep-alive setting.
 */
HttpResponse handle_http_request(const rpc::Dispatcher& dispatcher, const HttpRequest& request);

} // namespace jsonactor::net
