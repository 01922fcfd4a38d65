#include "server.hpp"

#include <grpcpp/resource_quota.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace nodeagent::runtime {

int ThreadBudget(uint32_t max_concurrent_channels) {
  return static_cast<int>(max_concurrent_channels) * 2 + 4;
}

Server::Server(Options options, std::vector<std::shared_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Shutdown();
}

void Server::Start() {
  if (!options_.credentials) {
    throw util::ConfigError("server credentials are not set");
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, options_.credentials, &selected_port_);
  builder.SetMaxReceiveMessageSize(options_.limits.grpc_message_size());
  builder.SetMaxSendMessageSize(options_.limits.grpc_message_size());

  ::grpc::ResourceQuota quota("nodeagentd");
  if (options_.max_threads > 0) {
    quota.SetMaxThreads(options_.max_threads);
    builder.SetResourceQuota(quota);
  }

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw util::ConfigError("failed to bind " + options_.bind_address);
  }

  NODEAGENT_LOG_INFO("nodeagentd listening", {observability::StringField("bind_address", options_.bind_address),
                                              observability::IntField("port", selected_port_),
                                              observability::IntField("max_frame_length", static_cast<int64_t>(options_.limits.max_frame_length()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Shutdown() {
  if (grpc_server_) {
    NODEAGENT_LOG_INFO("nodeagentd shutting down", {observability::IntField("grace_ms", static_cast<int64_t>(options_.shutdown_grace.count()))});
    grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
    grpc_server_.reset();
  }
}

} // namespace nodeagent::runtime
