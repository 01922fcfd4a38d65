#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "internal/wire/codec.hpp"

namespace nodeagent::runtime {

/*
  Listening side of the agent: TLS credentials, frame limits and a thread
  budget installed on one gRPC server. TLS handshakes happen inside gRPC; a
  failed handshake never reaches the services.
*/
class Server {
 public:
  struct Options {
    std::string                              bind_address;
    std::shared_ptr<::grpc::ServerCredentials> credentials;
    nodeagent::wire::FrameLimits             limits;
    int                                      max_threads = 0;  // 0 leaves gRPC's default
    std::chrono::milliseconds                shutdown_grace{5'000};
  };

  Server(Options options, std::vector<std::shared_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws util::ConfigError when the address cannot be bound.
  void Start();
  void Wait();
  // Stops accepting, lets open channels finish for shutdown_grace, then cancels them.
  void Shutdown();

  // Port actually bound; meaningful after Start (resolves ":0").
  int port() const {
    return selected_port_;
  }

 private:
  Options                                       options_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

// Sync-server thread budget: every admitted channel plus the same number waiting, plus headroom.
int ThreadBudget(uint32_t max_concurrent_channels);

} // namespace nodeagent::runtime
