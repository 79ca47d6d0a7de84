#include "error-codes.hpp"

#include <string>

namespace jsonactor {
namespace {
  /**
   * @private
   */
  struct ECodeCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
  };

  const char* ECodeCategory::name() const noexcept { return "jsonactor"; }

  std::string ECodeCategory::message(int e) const {
    switch (static_cast<ecode>(e)) {
    case ecode::okay: return "okay";
    case ecode::malformed_envelope: return "malformed envelope";
    case ecode::unknown_method: return "unknown method";
    case ecode::param_deserialization: return "parameter deserialization failed";
    case ecode::invocation_failed: return "method invocation failed";
    case ecode::result_serialization: return "result serialization failed";
    case ecode::duplicate_method: return "duplicate method";
    case ecode::actor_unavailable: return "actor has been handed to a server";
    case ecode::transport_read: return "transport read error";
    case ecode::handshake_failed: return "handshake failed";
    case ecode::listener_bind: return "failed to bind listener";
    case ecode::tls_unreadable_file: return "unreadable tls file";
    case ecode::tls_no_private_key: return "no private key found";
    case ecode::tls_bad_private_key: return "bad private key";
    case ecode::tls_bad_certificate: return "bad certificate";
    }
    return "(unknown error)";
  }

  const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace jsonactor
