#pragma once

#include "internal/dispatch/call_context.hpp"
#include "nodeagent/v1.hpp"
#include "service_context.hpp"

namespace nodeagent::service {

/*
  The six agent operations.

  Every failure is folded into the method's error outcome; nothing throws
  out of these calls.
*/
class AgentService {
 public:
  explicit AgentService(ServiceContext ctx);

  nodeagent::v1::InstallPackageResponse InstallPackage(const nodeagent::v1::InstallPackageRequest& req, const dispatch::CallContext& call);

  nodeagent::v1::ServiceResponse StartService(const nodeagent::v1::StartServiceRequest& req, const dispatch::CallContext& call);
  nodeagent::v1::ServiceResponse StopService(const nodeagent::v1::StopServiceRequest& req, const dispatch::CallContext& call);

  nodeagent::v1::PutFileResponse      PutFile(const nodeagent::v1::PutFileRequest& req, const dispatch::CallContext& call);
  nodeagent::v1::PutFileChunkResponse PutFileChunk(const nodeagent::v1::PutFileChunkRequest& req, const dispatch::CallContext& call);
  nodeagent::v1::FetchFileResponse    FetchFile(const nodeagent::v1::FetchFileRequest& req, const dispatch::CallContext& call);

 private:
  std::string WriteTransferredFile(const std::string& target_path, uint32_t target_permissions, const std::string& filename,
                                   const std::string& compressed_bytes);

  ServiceContext ctx_;
};

} // namespace nodeagent::service
