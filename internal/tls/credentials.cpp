#include "credentials.hpp"

#include <vector>

#include <grpcpp/security/tls_certificate_provider.h>
#include <grpcpp/security/tls_credentials_options.h>

#include "internal/util/errors.hpp"
#include "pem.hpp"
#include "pinned_verifier.hpp"

namespace nodeagent::tls {

using nodeagent::runtime::config::TlsClientConfig;
using nodeagent::runtime::config::TlsServerConfig;

ServerIdentity LoadServerIdentity(const TlsServerConfig& config) {
  ServerIdentity identity;
  identity.certificate_pem = ReadPemFile(config.cert_path(), "server certificate");
  identity.private_key_pem = ReadPemFile(config.key_path(), "server private key");
  ValidateKeyPair(identity.certificate_pem, identity.private_key_pem);
  return identity;
}

std::shared_ptr<::grpc::ServerCredentials> BuildServerCredentials(const ServerIdentity& identity, const TlsServerConfig& config) {
  ::grpc::SslServerCredentialsOptions options(config.request_client_certificate() ? GRPC_SSL_REQUEST_CLIENT_CERTIFICATE_BUT_DONT_VERIFY
                                                                                 : GRPC_SSL_DONT_REQUEST_CLIENT_CERTIFICATE);
  options.pem_key_cert_pairs.push_back({identity.private_key_pem, identity.certificate_pem});
  return ::grpc::SslServerCredentials(options);
}

std::shared_ptr<::grpc::ChannelCredentials> BuildClientCredentials(const TlsClientConfig& config) {
  const std::string pinned_pem = ReadPemFile(config.pinned_server_cert_path(), "pinned server certificate");
  std::string       pinned_der = CertificatePemToDer(pinned_pem);

  std::vector<::grpc::experimental::IdentityKeyCertPair> identity;
  if (!config.cert_path().empty()) {
    ::grpc::experimental::IdentityKeyCertPair pair;
    pair.certificate_chain = ReadPemFile(config.cert_path(), "client certificate");
    pair.private_key       = ReadPemFile(config.key_path(), "client private key");
    ValidateKeyPair(pair.certificate_chain, pair.private_key);
    identity.push_back(std::move(pair));
  }

  auto provider = std::make_shared<::grpc::experimental::StaticDataCertificateProvider>(pinned_pem, identity);

  ::grpc::experimental::TlsChannelCredentialsOptions options;
  options.set_certificate_provider(provider);
  options.watch_root_certs();
  if (!identity.empty()) {
    options.watch_identity_key_cert_pairs();
  }
  options.set_verify_server_certs(false);
  options.set_check_call_host(false);
  options.set_certificate_verifier(
      ::grpc::experimental::ExternalCertificateVerifier::Create<PinnedCertificateVerifier>(std::move(pinned_der)));

  auto credentials = ::grpc::experimental::TlsCredentials(options);
  if (!credentials) {
    throw util::ConfigError("failed to build TLS channel credentials");
  }
  return credentials;
}

} // namespace nodeagent::tls
