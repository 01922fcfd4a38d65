#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <grpcpp/security/tls_certificate_verifier.h>

namespace nodeagent::tls {

// True iff `presented_pem` parses and its DER encoding equals `pinned_der` byte for byte.
bool MatchesPinnedCertificate(std::string_view presented_pem, const std::string& pinned_der);

/*
  Client-side post-handshake check.

  Accepts the server iff its end-entity certificate is byte-identical to the
  pinned one. No chain building, no CA, no hostname check: certificates are
  distributed by the operator out of band. This is trust pinning and is not
  equivalent to PKI validation.

  Owned by gRPC once handed to ExternalCertificateVerifier::Create.
*/
class PinnedCertificateVerifier : public ::grpc::experimental::ExternalCertificateVerifier {
 public:
  explicit PinnedCertificateVerifier(std::string pinned_der);

  bool Verify(::grpc::experimental::TlsCustomVerificationCheckRequest* request, std::function<void(::grpc::Status)> callback,
              ::grpc::Status* sync_status) override;

  void Cancel(::grpc::experimental::TlsCustomVerificationCheckRequest* request) override;

 private:
  std::string pinned_der_;
};

} // namespace nodeagent::tls
