#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"
#include "internal/wire/codec.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::transport {

/*
  Typed duplex view over one channel.

  Stream is any object with `bool Write(const Outgoing&)` and
  `bool Read(Incoming*)`; in production a gRPC ServerReaderWriter or
  ClientReaderWriter, in tests an in-memory fake.

  Send is safe from several threads (writes are serialized); Receive must
  only be called from one thread at a time, which may run concurrently with
  Send.
*/
template <typename Outgoing, typename Incoming, typename Stream>
class MessageStream {
 public:
  MessageStream(Stream* stream, wire::FrameLimits limits, std::string peer_address, std::string local_address)
      : stream_(stream), limits_(limits), peer_address_(std::move(peer_address)), local_address_(std::move(local_address)) {
  }

  MessageStream(const MessageStream&)            = delete;
  MessageStream& operator=(const MessageStream&) = delete;

  // Throws util::FrameTooLarge without writing anything, util::ChannelClosed if the stream is gone.
  void Send(const Outgoing& message) {
    limits_.EnsureFits(message, message.GetTypeName());

    std::lock_guard lock(send_mutex_);
    if (send_closed_) {
      throw util::ChannelClosed("send on a closed channel to " + peer_address_);
    }
    if (!stream_->Write(message)) {
      send_closed_ = true;
      throw util::ChannelClosed("channel to " + peer_address_ + " closed while sending");
    }
  }

  // Blocks until a full message arrives; nullopt once the peer has finished or the stream broke.
  std::optional<Incoming> Receive() {
    Incoming message;
    if (!stream_->Read(&message)) {
      return std::nullopt;
    }
    return message;
  }

  // Half-close from the client side; no-op for streams without WritesDone.
  void CloseSend() {
    std::lock_guard lock(send_mutex_);
    if (send_closed_) return;
    send_closed_ = true;
    if constexpr (requires(Stream& s) { s.WritesDone(); }) {
      stream_->WritesDone();
    }
  }

  const std::string& peer_address() const {
    return peer_address_;
  }

  const std::string& local_address() const {
    return local_address_;
  }

  const wire::FrameLimits& limits() const {
    return limits_;
  }

 private:
  Stream*           stream_;
  wire::FrameLimits limits_;
  std::string       peer_address_;
  std::string       local_address_;

  std::mutex send_mutex_;
  bool       send_closed_ = false;
};

using ServerChannelStream = MessageStream<nodeagent::v1::AgentResponse, nodeagent::v1::AgentRequest,
                                          ::grpc::ServerReaderWriter<nodeagent::v1::AgentResponse, nodeagent::v1::AgentRequest>>;

using ClientChannelStream = MessageStream<nodeagent::v1::AgentRequest, nodeagent::v1::AgentResponse,
                                          ::grpc::ClientReaderWriter<nodeagent::v1::AgentRequest, nodeagent::v1::AgentResponse>>;

} // namespace nodeagent::transport
