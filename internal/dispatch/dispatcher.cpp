#include "dispatcher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/service/agent_service.hpp"

namespace nodeagent::dispatch {

using namespace nodeagent::v1;

Dispatcher::Dispatcher(std::shared_ptr<nodeagent::service::AgentService> service) : service_(std::move(service)) {
}

AgentResponse Dispatcher::Dispatch(const AgentRequest& request, const CallContext& call) const {
  AgentResponse response;
  response.set_request_id(request.request_id());

  switch (request.method_case()) {
    case AgentRequest::kInstallPackage:
      *response.mutable_install_package() = service_->InstallPackage(request.install_package(), call);
      break;
    case AgentRequest::kStartService:
      *response.mutable_start_service() = service_->StartService(request.start_service(), call);
      break;
    case AgentRequest::kStopService:
      *response.mutable_stop_service() = service_->StopService(request.stop_service(), call);
      break;
    case AgentRequest::kPutFile:
      *response.mutable_put_file() = service_->PutFile(request.put_file(), call);
      break;
    case AgentRequest::kPutFileChunk:
      *response.mutable_put_file_chunk() = service_->PutFileChunk(request.put_file_chunk(), call);
      break;
    case AgentRequest::kFetchFile:
      *response.mutable_fetch_file() = service_->FetchFile(request.fetch_file(), call);
      break;
    case AgentRequest::METHOD_NOT_SET:
    default:
      NODEAGENT_LOG_WARN("request without method", {observability::StringField("peer", call.peer),
                                                    observability::IntField("request_id", static_cast<int64_t>(request.request_id()))});
      response.mutable_rejected()->set_message("request carries no method");
      break;
  }

  return response;
}

} // namespace nodeagent::dispatch
