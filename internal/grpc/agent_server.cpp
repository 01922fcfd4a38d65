#include "agent_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/channel_admission.hpp"
#include "internal/transport/message_stream.hpp"
#include "internal/transport/peer_address.hpp"
#include "internal/util/time.hpp"

namespace nodeagent::grpc {

using nodeagent::observability::IntField;
using nodeagent::observability::StringField;

namespace {

std::string PeerCommonName(const ::grpc::ServerContext& context) {
  auto auth = context.auth_context();
  if (!auth) return {};
  const auto values = auth->FindPropertyValues("x509_common_name");
  if (values.empty()) return {};
  return std::string(values.front().data(), values.front().size());
}

} // namespace

AgentServer::AgentServer(std::shared_ptr<nodeagent::dispatch::Dispatcher> dispatcher,
                         std::shared_ptr<nodeagent::runtime::ChannelAdmission> admission, nodeagent::wire::FrameLimits limits,
                         std::string local_address)
    : dispatcher_(std::move(dispatcher)), admission_(std::move(admission)), limits_(limits), local_address_(std::move(local_address)) {
}

::grpc::Status AgentServer::Channel(::grpc::ServerContext* context,
                                    ::grpc::ServerReaderWriter<nodeagent::v1::AgentResponse, nodeagent::v1::AgentRequest>* stream) {
  const std::string raw_peer   = context->peer();
  const auto        parsed     = transport::ParsePeerAddress(raw_peer);
  const std::string peer       = parsed ? parsed->ToString() : raw_peer;
  const std::string peer_key   = transport::PeerKey(raw_peer);
  const uint64_t    channel_id = next_channel_id_.fetch_add(1);

  runtime::ChannelAdmission::Permit permit;
  try {
    permit = admission_->Admit(peer_key, [context] { return context->IsCancelled(); });
  } catch (const std::exception& e) {
    NODEAGENT_LOG_WARN("channel rejected", {StringField("peer", peer), StringField("reason", e.what())});
    return ToStatus(e);
  }

  const auto started_at = std::chrono::steady_clock::now();
  NODEAGENT_LOG_INFO("channel admitted", {StringField("peer", peer), StringField("local", local_address_), IntField("channel_id", static_cast<int64_t>(channel_id)),
                                          StringField("peer_cn", PeerCommonName(*context))});

  transport::ServerChannelStream channel(stream, limits_, peer, local_address_);
  uint64_t                       requests = 0;

  auto log_closed = [&](std::string_view outcome) {
    NODEAGENT_LOG_INFO("channel closed",
                       {StringField("peer", peer), IntField("channel_id", static_cast<int64_t>(channel_id)), IntField("requests", static_cast<int64_t>(requests)),
                        IntField("duration_ms", static_cast<int64_t>(util::MillisSince(started_at))),
                        StringField("outcome", outcome)});
  };

  try {
    while (auto request = channel.Receive()) {
      dispatch::CallContext call;
      call.peer        = peer;
      call.channel_id  = channel_id;
      call.request_id  = request->request_id();
      call.received_at = std::chrono::steady_clock::now();

      auto response = dispatcher_->Dispatch(*request, call);
      if (!limits_.Fits(response)) {
        NODEAGENT_LOG_WARN("response exceeds frame limit", {StringField("peer", peer), IntField("request_id", static_cast<int64_t>(call.request_id))});
        response.Clear();
        response.set_request_id(call.request_id);
        response.mutable_rejected()->set_message("response exceeds the frame limit of " + std::to_string(limits_.max_frame_length()) + " bytes");
      }
      channel.Send(response);
      ++requests;
    }
  } catch (const std::exception& e) {
    log_closed(e.what());
    return ToStatus(e);
  }

  if (context->IsCancelled()) {
    log_closed("cancelled");
    return ::grpc::Status::CANCELLED;
  }

  log_closed("ok");
  return ::grpc::Status::OK;
}

} // namespace nodeagent::grpc
