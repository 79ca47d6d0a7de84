#pragma once

#include "method-registry.hpp"

#include "jsonactor/utils.hpp"

namespace jsonactor::rpc {

/**
 * @brief Markdown reference for a set of exposed methods.
 *
 * Starts with an overview table, then for each method: its doc string, parameters,
 * return type, the HTTP request body, the websocket envelope, and a javascript
 * `fetch` call against `base_url`.
 */
string describe_methods(const vector<MethodInfo>& methods, string_view title,
                        string_view base_url = "http://localhost:9000");

} // namespace jsonactor::rpc
