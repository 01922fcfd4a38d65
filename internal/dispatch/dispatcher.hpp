#pragma once

#include <memory>

#include "call_context.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::service { class AgentService; }

namespace nodeagent::dispatch {

/*
  Routes one decoded AgentRequest to its handler and wraps the handler's
  response in an AgentResponse echoing the request_id. A request with no
  method set is answered with `rejected`. Never throws for handler errors.
*/
class Dispatcher {
 public:
  explicit Dispatcher(std::shared_ptr<nodeagent::service::AgentService> service);

  nodeagent::v1::AgentResponse Dispatch(const nodeagent::v1::AgentRequest& request, const CallContext& call) const;

 private:
  std::shared_ptr<nodeagent::service::AgentService> service_;
};

} // namespace nodeagent::dispatch
