#pragma once

#include <memory>
#include <string>

#include <grpcpp/security/credentials.h>
#include <grpcpp/security/server_credentials.h>

#include "config/config.pb.h"

namespace nodeagent::tls {

/*
  Loaded and validated server identity.
*/
struct ServerIdentity {
  std::string certificate_pem;
  std::string private_key_pem;
};

// Reads both files and checks the pair. Throws util::ConfigError.
ServerIdentity LoadServerIdentity(const nodeagent::runtime::config::TlsServerConfig& config);

std::shared_ptr<::grpc::ServerCredentials> BuildServerCredentials(const ServerIdentity& identity,
                                                                const nodeagent::runtime::config::TlsServerConfig& config);

/*
  Client credentials: chain and hostname verification off, pinned-certificate
  verifier on, the pinned certificate doubling as the only root. Presents a
  client identity when one is configured. Throws util::ConfigError.
*/
std::shared_ptr<::grpc::ChannelCredentials> BuildClientCredentials(const nodeagent::runtime::config::TlsClientConfig& config);

} // namespace nodeagent::tls
