#include "stdinc.hpp"

#include "dispatch-error.hpp"

#include "json-codec.hpp"

namespace jsonactor::rpc {

DispatchError make_dispatch_error(ecode code, string_view method, string_view reason) {
  auto make_message = [&]() -> string {
    switch (code) {
    case ecode::malformed_envelope: return format("Failed to parse JSON: {}", reason);
    case ecode::unknown_method: return format("Unknown method: {}", method);
    case ecode::param_deserialization:
      return format("Failed to deserialize parameters for {}: {}", method, reason);
    case ecode::invocation_failed: return format("Failed to invoke {}: {}", method, reason);
    case ecode::result_serialization:
      return format("Failed to serialize result for {}: {}", method, reason);
    default: break;
    }
    return string{reason};
  };
  return DispatchError{code, make_message()};
}

string encode_error(const DispatchError& error) {
  return json(error.message).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace jsonactor::rpc
