#pragma once

#include "jsonactor/rpc/dispatch-error.hpp"

#include "jsonactor/utils.hpp"

namespace boost::asio::ssl {
class context;
}

namespace jsonactor::net {

struct TlsConfig {
  string cert_path = {}; //! PEM certificate chain, leaf first
  string key_path = {};  //! PEM PKCS#8 private key ("BEGIN PRIVATE KEY")
};

/**
 * @brief A server-side TLS context, loaded from a certificate chain and private key.
 *
 * Immutable once loaded, and shared by every connection accepted on a listener.
 * Client certificates are not requested.
 */
class TlsIdentity {
private:
  struct Pimpl;
  unique_ptr<Pimpl> pimpl_;

public:
  TlsIdentity();
  TlsIdentity(const TlsIdentity&) = delete;
  TlsIdentity(TlsIdentity&&) = delete;
  ~TlsIdentity();
  TlsIdentity& operator=(const TlsIdentity&) = delete;
  TlsIdentity& operator=(TlsIdentity&&) = delete;

  /**
   * @brief The underlying context, for constructing ssl streams.
   * OpenSSL contexts may be shared between threads once configured.
   */
  boost::asio::ssl::context& context() const;
};

/**
 * @brief Reads and validates the certificate chain and key, and builds the context.
 *
 * Errors
 * + `ecode::tls_unreadable_file` if either file cannot be read.
 * + `ecode::tls_bad_certificate` if the certificate file has no certificates, or one
 *   of them does not parse.
 * + `ecode::tls_no_private_key` if the key file has no PKCS#8 private key.
 * + `ecode::tls_bad_private_key` if OpenSSL rejects the key, eg., it does not match
 *   the certificate.
 */
expected<shared_ptr<const TlsIdentity>, rpc::DispatchError>
load_tls_identity(const TlsConfig& config);

} // namespace jsonactor::net
