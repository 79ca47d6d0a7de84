#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup jsonactor-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // Nothing is registered under that name
 * return make_error_code(ecode::unknown_method);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace jsonactor {
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of jsonactor error codes.
 */
enum class ecode : int {
  okay = 0,              //!< i.e., everything's okay.
  malformed_envelope,    //!< Request text is not JSON, or lacks the `method`/`params` shape.
  unknown_method,        //!< No method is registered under the requested name.
  param_deserialization, //!< Parameters do not decode into the method's signature.
  invocation_failed,     //!< The actor method threw while executing.
  result_serialization,  //!< The method's result could not be encoded as JSON text.
  duplicate_method,      //!< A method name was registered twice.
  actor_unavailable,     //!< The actor has already been handed to a server.

  transport_read,   //!< Connection failed while reading a request.
  handshake_failed, //!< TLS or websocket handshake failed.
  listener_bind,    //!< Could not listen on the configured address and port.

  tls_unreadable_file,  //!< Certificate or key file could not be read.
  tls_no_private_key,   //!< The key file holds no PKCS#8 private key.
  tls_bad_private_key,  //!< The private key was rejected, eg., it does not match the certificate.
  tls_bad_certificate,  //!< The certificate file holds no usable certificate.
};
} // namespace jsonactor

namespace std {
template <> struct is_error_code_enum<jsonactor::ecode> : true_type {};
} // namespace std

namespace jsonactor {
error_code make_error_code(ecode);
} // namespace jsonactor
