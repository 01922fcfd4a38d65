#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/transfer/compressed_file.hpp"
#include "internal/transport/message_stream.hpp"
#include "internal/wire/codec.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::client {

/*
  Client side of one RPC channel to nodeagentd.

  Every call is written onto the same Channel stream and answered in order.
  Calls from several threads are serialized. Transport and TLS failures
  (including a pinned-certificate mismatch or an admission rejection)
  surface as a non-OK arrow::Status; operation failures come back as the
  method's Error outcome.
*/
class AgentClient {
 public:
  struct Options {
    std::string                  server_address;
    nodeagent::wire::FrameLimits limits;
    uint64_t                     chunk_size           = 0;  // resolved against limits
    uint32_t                     max_in_flight_chunks = 4;
    uint32_t                     transfer_attempts    = 3;
  };

  struct UploadResult {
    bool        chunked      = false;
    uint64_t    total_chunks = 0;
    uint32_t    attempts     = 0;
    bool        success      = false;
    std::string error;
  };

  // Opens a TLS channel with the pinned-certificate verifier and starts the Channel stream.
  static arrow::Result<std::unique_ptr<AgentClient>> Connect(const nodeagent::runtime::config::ClientConfig& config);

  AgentClient(std::shared_ptr<::grpc::Channel> channel, Options options);
  ~AgentClient();

  AgentClient(const AgentClient&)            = delete;
  AgentClient& operator=(const AgentClient&) = delete;

  arrow::Result<nodeagent::v1::InstallPackageResponse> InstallPackage(const std::string& name);

  arrow::Result<nodeagent::v1::ServiceResponse> StartService(const std::optional<std::string>& wrapper = std::nullopt);

  arrow::Result<nodeagent::v1::ServiceResponse> StopService(const std::string& service);

  // Single-frame upload. Fails with CapacityError when the request exceeds the frame limit.
  arrow::Result<nodeagent::v1::PutFileResponse> PutFile(const nodeagent::transfer::CompressedFile& file, const std::string& target_path,
                                                        uint32_t target_perms);

  arrow::Result<nodeagent::v1::PutFileChunkResponse> PutFileChunk(const nodeagent::v1::PutFileChunkRequest& request);

  /*
    Chunked upload of an already-compressed file. Chunks are pipelined up to
    max_in_flight_chunks; a duplicate counts as delivered; HASH_MISMATCH
    restarts the transfer from chunk 0 up to transfer_attempts times. Any
    other chunk error is final.
  */
  arrow::Result<UploadResult> UploadChunked(const nodeagent::transfer::CompressedFile& file, const std::string& target_path,
                                            uint32_t target_perms);

  // Compresses `local_path` and uploads it whole, or chunked when larger than chunk_size.
  arrow::Result<UploadResult> UploadFile(const std::string& local_path, const std::string& target_path, uint32_t target_perms);

  arrow::Result<nodeagent::v1::FetchFileResponse> FetchFile(const std::string& host_src_path, const std::string& filename = "");

  // Half-closes the channel and collects the final status. Idempotent.
  arrow::Status Close();

  uint64_t chunk_size() const {
    return chunk_size_;
  }

 private:
  using Stream = ::grpc::ClientReaderWriter<nodeagent::v1::AgentRequest, nodeagent::v1::AgentResponse>;

  struct ChunkAttempt {
    bool                                     completed = false;
    std::optional<nodeagent::v1::ChunkError> error;
  };

  arrow::Result<nodeagent::v1::AgentResponse> Call(nodeagent::v1::AgentRequest request);
  arrow::Status                               SendLocked(nodeagent::v1::AgentRequest* request);
  arrow::Result<nodeagent::v1::AgentResponse> ReceiveLocked(uint64_t expected_request_id);
  arrow::Status                               FinishLocked(const std::string& action);
  arrow::Result<ChunkAttempt>                 SendChunkPlanLocked(const nodeagent::transfer::CompressedFile& file, const std::string& target_path,
                                                                  uint32_t target_perms, uint64_t* total_chunks);

  std::shared_ptr<::grpc::Channel>                           channel_;
  std::unique_ptr<nodeagent::v1::AgentService::Stub>         stub_;
  std::unique_ptr<::grpc::ClientContext>                     context_;
  std::unique_ptr<Stream>                                    stream_;
  std::unique_ptr<nodeagent::transport::ClientChannelStream> channel_stream_;
  nodeagent::wire::FrameLimits                               limits_;
  uint64_t                                                   chunk_size_;
  uint32_t                                                   max_in_flight_chunks_;
  uint32_t                                                   transfer_attempts_;

  std::mutex    mutex_;
  uint64_t      next_request_id_ = 1;
  bool          finished_        = false;
  arrow::Status final_status_;
};

} // namespace nodeagent::client
