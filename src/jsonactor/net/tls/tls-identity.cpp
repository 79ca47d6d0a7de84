#include "stdinc.hpp"

#include "tls-identity.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ssl/context.hpp>

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace jsonactor::net {

namespace asio = boost::asio;

using rpc::DispatchError;

// ------------------------------------------------------------------------------------------- Pimpl

struct TlsIdentity::Pimpl {
  asio::ssl::context context{asio::ssl::context::tls_server};
};

TlsIdentity::TlsIdentity() : pimpl_{make_unique<Pimpl>()} {}

TlsIdentity::~TlsIdentity() = default;

asio::ssl::context& TlsIdentity::context() const { return pimpl_->context; }

// ----------------------------------------------------------------------------------- PEM helpers

namespace {
  std::size_t count_pem_blocks(string_view pem, string_view label) {
    const auto marker = format("-----BEGIN {}-----", label);
    std::size_t count = 0;
    for (auto pos = pem.find(marker); pos != string_view::npos;
         pos = pem.find(marker, pos + marker.size()))
      ++count;
    return count;
  }

  // Number of certificates that OpenSSL can parse out of `pem`
  std::size_t count_parsable_certificates(string_view pem) {
    unique_ptr<BIO, decltype(&BIO_free)> bio{BIO_new_mem_buf(pem.data(), int(pem.size())),
                                             &BIO_free};
    if (bio == nullptr)
      return 0;

    std::size_t count = 0;
    while (true) {
      X509* certificate = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
      if (certificate == nullptr)
        break;
      X509_free(certificate);
      ++count;
    }
    ERR_clear_error(); // the read that ends the loop always queues an error
    return count;
  }

  DispatchError tls_error(ecode code, string message) {
    return DispatchError{code, std::move(message)};
  }
} // namespace

// ------------------------------------------------------------------------------ load_tls_identity

expected<shared_ptr<const TlsIdentity>, DispatchError> load_tls_identity(const TlsConfig& config) {
  string cert_pem;
  if (auto ec = file_get_contents(config.cert_path, cert_pem); ec)
    return make_unexpected(tls_error(ecode::tls_unreadable_file,
                                     format("Failed to read certificate file '{}': {}",
                                            config.cert_path, ec.message())));

  string key_pem;
  if (auto ec = file_get_contents(config.key_path, key_pem); ec)
    return make_unexpected(tls_error(
        ecode::tls_unreadable_file,
        format("Failed to read private key file '{}': {}", config.key_path, ec.message())));

  const auto n_certificates = count_pem_blocks(cert_pem, "CERTIFICATE");
  if (n_certificates == 0)
    return make_unexpected(tls_error(ecode::tls_bad_certificate,
                                     format("No certificates found in '{}'", config.cert_path)));
  if (count_parsable_certificates(cert_pem) != n_certificates)
    return make_unexpected(tls_error(ecode::tls_bad_certificate,
                                     format("Invalid certificate in '{}'", config.cert_path)));

  if (count_pem_blocks(key_pem, "PRIVATE KEY") == 0)
    return make_unexpected(tls_error(ecode::tls_no_private_key,
                                     format("No private key found in '{}'", config.key_path)));

  auto identity = make_shared<TlsIdentity>();
  auto& context = identity->context();
  context.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2
                      | asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1
                      | asio::ssl::context::no_tlsv1_1 | asio::ssl::context::single_dh_use);
  context.set_verify_mode(asio::ssl::verify_none);

  boost::system::error_code ec;
  context.use_certificate_chain(asio::buffer(cert_pem.data(), cert_pem.size()), ec);
  if (ec)
    return make_unexpected(tls_error(ecode::tls_bad_certificate,
                                     format("Invalid certificate chain in '{}': {}",
                                            config.cert_path, ec.message())));

  context.use_private_key(asio::buffer(key_pem.data(), key_pem.size()), asio::ssl::context::pem,
                          ec);
  if (ec)
    return make_unexpected(tls_error(
        ecode::tls_bad_private_key,
        format("Invalid private key in '{}': {}", config.key_path, ec.message())));

  INFO("loaded tls identity, certificates={}, key='{}'", n_certificates, config.key_path);
  return shared_ptr<const TlsIdentity>{std::move(identity)};
}

} // namespace jsonactor::net
