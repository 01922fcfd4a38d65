#include "pinned_verifier.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "pem.hpp"

namespace nodeagent::tls {

bool MatchesPinnedCertificate(std::string_view presented_pem, const std::string& pinned_der) {
  if (presented_pem.empty() || pinned_der.empty()) return false;

  const auto presented_der = TryCertificatePemToDer(presented_pem);
  return presented_der && *presented_der == pinned_der;
}

PinnedCertificateVerifier::PinnedCertificateVerifier(std::string pinned_der) : pinned_der_(std::move(pinned_der)) {
}

bool PinnedCertificateVerifier::Verify(::grpc::experimental::TlsCustomVerificationCheckRequest* request, std::function<void(::grpc::Status)>,
                                       ::grpc::Status* sync_status) {
  const ::grpc::string_ref presented = request->peer_cert();

  if (MatchesPinnedCertificate(std::string_view(presented.data(), presented.size()), pinned_der_)) {
    *sync_status = ::grpc::Status::OK;
  } else {
    NODEAGENT_LOG_WARN("server certificate rejected",
                       {observability::StringField("target", std::string(request->target_name().data(), request->target_name().size())),
                        observability::StringField("reason", presented.empty() ? "no certificate presented" : "certificate does not match pin")});
    *sync_status = ::grpc::Status(::grpc::StatusCode::UNAUTHENTICATED, "server certificate does not match the pinned certificate");
  }

  // checked synchronously
  return true;
}

void PinnedCertificateVerifier::Cancel(::grpc::experimental::TlsCustomVerificationCheckRequest*) {
}

} // namespace nodeagent::tls
