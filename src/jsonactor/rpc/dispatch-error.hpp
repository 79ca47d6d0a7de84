#pragma once

#include "jsonactor/utils.hpp"

namespace jsonactor::rpc {

/**
 * @brief Why a call could not produce a result.
 *
 * `message` is the human readable text that is sent back to the caller, JSON
 * encoded as a string. `code` classifies the failure for programmatic use.
 */
struct DispatchError {
  ecode code = ecode::okay;
  string message = {};

  error_code error() const { return make_error_code(code); }
};

/**
 * @brief Builds the caller-facing message for `code`.
 *
 * + malformed_envelope:    "Failed to parse JSON: <reason>"
 * + unknown_method:        "Unknown method: <method>"
 * + param_deserialization: "Failed to deserialize parameters for <method>: <reason>"
 * + invocation_failed:     "Failed to invoke <method>: <reason>"
 * + result_serialization:  "Failed to serialize result for <method>: <reason>"
 * + anything else:         "<reason>"
 */
DispatchError make_dispatch_error(ecode code, string_view method, string_view reason = {});

/**
 * @brief The JSON text of `error.message` as a string value.
 * Bytes that are not valid UTF-8 are replaced, so this never fails.
 */
string encode_error(const DispatchError& error);

} // namespace jsonactor::rpc
