#include "stdinc.hpp"

#include "dispatcher.hpp"

namespace jsonactor::rpc {

expected<string, DispatchError> Dispatcher::invoke(string_view method_name,
                                                   string_view raw_json) const {
  json params;
  try {
    params = json::parse(raw_json);
  } catch (json::parse_error& e) {
    return make_unexpected(make_dispatch_error(ecode::malformed_envelope, method_name, e.what()));
  }

  auto result = call_(method_name, params);
  if (!result)
    return make_unexpected(std::move(result.error()));

  // Strings that are not valid UTF-8 cannot be encoded
  try {
    return result->dump();
  } catch (json::exception& e) {
    return make_unexpected(make_dispatch_error(ecode::result_serialization, method_name, e.what()));
  }
}

string Dispatcher::dispatch(string_view method_name, string_view raw_json) const {
  auto result = invoke(method_name, raw_json);
  if (result)
    return std::move(*result);

  TRACE("dispatch of '{}' failed: {}", method_name, result.error().message);
  return encode_error(result.error());
}

} // namespace jsonactor::rpc
