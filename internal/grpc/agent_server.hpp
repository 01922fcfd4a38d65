#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/wire/codec.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::dispatch { class Dispatcher; }
namespace nodeagent::runtime { class ChannelAdmission; }

namespace nodeagent::grpc {

/*
  gRPC adapter for AgentService.Channel.

  One call is one RPC channel: it is admitted (per-peer and global caps),
  then requests are read, dispatched and answered strictly in arrival order
  until the client half-closes. Handler errors become error responses;
  only stream failures end the channel.
*/
class AgentServer final : public nodeagent::v1::AgentService::Service {
 public:
  AgentServer(std::shared_ptr<nodeagent::dispatch::Dispatcher> dispatcher, std::shared_ptr<nodeagent::runtime::ChannelAdmission> admission,
              nodeagent::wire::FrameLimits limits, std::string local_address);

  ::grpc::Status Channel(::grpc::ServerContext* context,
                         ::grpc::ServerReaderWriter<nodeagent::v1::AgentResponse, nodeagent::v1::AgentRequest>* stream) override;

 private:
  std::shared_ptr<nodeagent::dispatch::Dispatcher>      dispatcher_;
  std::shared_ptr<nodeagent::runtime::ChannelAdmission> admission_;
  nodeagent::wire::FrameLimits                          limits_;
  std::string                                           local_address_;
  std::atomic<uint64_t>                                 next_channel_id_{1};
};

} // namespace nodeagent::grpc
