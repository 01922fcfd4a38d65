#include "client/cpp/agent_client.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <grpcpp/create_channel.h>
#include <grpcpp/support/channel_arguments.h>

#include "internal/observability/logging.hpp"
#include "internal/tls/credentials.hpp"
#include "internal/transfer/chunker.hpp"
#include "internal/util/errors.hpp"

namespace nodeagent::client {

using nodeagent::observability::IntField;
using nodeagent::observability::StringField;
using namespace nodeagent::v1;

namespace {

constexpr uint64_t kDefaultConnectTimeoutMs = 10'000;

std::string CodeName(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::CANCELLED:
      return "CANCELLED";
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return "DEADLINE_EXCEEDED";
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case ::grpc::StatusCode::UNAVAILABLE:
      return "UNAVAILABLE";
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return "UNAUTHENTICATED";
    default:
      return "code " + std::to_string(static_cast<int>(code));
  }
}

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED) {
    return arrow::Status::CapacityError(std::string(action), " rejected: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed (", CodeName(status.error_code()), "): ", status.error_message());
}

arrow::Status ExpectMethod(const AgentResponse& response, AgentResponse::MethodCase expected, std::string_view method) {
  if (response.method_case() != expected) {
    return arrow::Status::IOError("agent answered ", std::string(method), " with response case ", static_cast<int>(response.method_case()));
  }
  return arrow::Status::OK();
}

} // namespace

arrow::Result<std::unique_ptr<AgentClient>> AgentClient::Connect(const nodeagent::runtime::config::ClientConfig& config) {
  Options                                     options;
  std::shared_ptr<::grpc::ChannelCredentials> credentials;
  try {
    options.limits     = wire::FrameLimits(config.max_frame_length());
    options.chunk_size = wire::ResolveChunkSize(config.chunk_size(), options.limits);
    credentials        = tls::BuildClientCredentials(config.tls());
  } catch (const util::ConfigError& ex) {
    return arrow::Status::Invalid(ex.what());
  }
  if (config.max_in_flight_chunks() > 0) options.max_in_flight_chunks = config.max_in_flight_chunks();
  if (config.transfer_attempts() > 0) options.transfer_attempts = config.transfer_attempts();
  options.server_address = config.server_address();

  ::grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(options.limits.grpc_message_size());
  args.SetMaxSendMessageSize(options.limits.grpc_message_size());

  auto channel = ::grpc::CreateCustomChannel(config.server_address(), credentials, args);

  const uint64_t timeout_ms = config.connect_timeout_ms() == 0 ? kDefaultConnectTimeoutMs : config.connect_timeout_ms();
  if (!channel->WaitForConnected(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms))) {
    return arrow::Status::IOError("could not establish a TLS channel to ", config.server_address(), " within ", timeout_ms,
                                  " ms (unreachable, or the certificate does not match the pinned one)");
  }

  return std::make_unique<AgentClient>(std::move(channel), std::move(options));
}

AgentClient::AgentClient(std::shared_ptr<::grpc::Channel> channel, Options options)
    : channel_(std::move(channel)),
      stub_(AgentService::NewStub(channel_)),
      context_(std::make_unique<::grpc::ClientContext>()),
      limits_(options.limits),
      chunk_size_(wire::ResolveChunkSize(options.chunk_size, options.limits)),
      max_in_flight_chunks_(options.max_in_flight_chunks == 0 ? 1 : options.max_in_flight_chunks),
      transfer_attempts_(options.transfer_attempts == 0 ? 1 : options.transfer_attempts) {
  stream_         = stub_->Channel(context_.get());
  channel_stream_ = std::make_unique<transport::ClientChannelStream>(stream_.get(), limits_, options.server_address, "");
}

AgentClient::~AgentClient() {
  const auto status = Close();
  if (!status.ok()) {
    NODEAGENT_LOG_DEBUG("channel closed with error", {StringField("error", status.ToString())});
  }
}

// ------------------------------------------------------------
// Channel plumbing
// ------------------------------------------------------------

arrow::Status AgentClient::FinishLocked(const std::string& action) {
  if (!finished_) {
    finished_     = true;
    final_status_ = GrpcToArrow(stream_->Finish(), "Channel");
  }
  if (final_status_.ok()) {
    return arrow::Status::IOError(action, ": channel closed by the agent");
  }
  return arrow::Status(final_status_.code(), action + ": " + final_status_.message());
}

arrow::Status AgentClient::SendLocked(AgentRequest* request) {
  if (finished_) {
    return arrow::Status::IOError("channel to ", channel_stream_->peer_address(), " is closed");
  }
  request->set_request_id(next_request_id_++);
  try {
    channel_stream_->Send(*request);
  } catch (const util::FrameTooLarge& ex) {
    return arrow::Status::CapacityError(ex.what());
  } catch (const util::ChannelClosed& ex) {
    return FinishLocked(ex.what());
  }
  return arrow::Status::OK();
}

arrow::Result<AgentResponse> AgentClient::ReceiveLocked(uint64_t expected_request_id) {
  if (finished_) {
    return arrow::Status::IOError("channel to ", channel_stream_->peer_address(), " is closed");
  }
  auto response = channel_stream_->Receive();
  if (!response) {
    return FinishLocked("waiting for response to request " + std::to_string(expected_request_id));
  }
  if (response->request_id() != expected_request_id) {
    return arrow::Status::IOError("response ", response->request_id(), " arrived while waiting for ", expected_request_id);
  }
  if (response->method_case() == AgentResponse::kRejected) {
    return arrow::Status::Invalid("request rejected by the agent: ", response->rejected().message());
  }
  return std::move(*response);
}

arrow::Result<AgentResponse> AgentClient::Call(AgentRequest request) {
  std::lock_guard lock(mutex_);
  ARROW_RETURN_NOT_OK(SendLocked(&request));
  return ReceiveLocked(request.request_id());
}

arrow::Status AgentClient::Close() {
  std::lock_guard lock(mutex_);
  if (finished_) {
    return final_status_;
  }
  channel_stream_->CloseSend();
  while (channel_stream_->Receive()) {
  }
  finished_     = true;
  final_status_ = GrpcToArrow(stream_->Finish(), "Channel");
  return final_status_;
}

// ------------------------------------------------------------
// Operations
// ------------------------------------------------------------

arrow::Result<InstallPackageResponse> AgentClient::InstallPackage(const std::string& name) {
  AgentRequest request;
  request.mutable_install_package()->set_name(name);

  ARROW_ASSIGN_OR_RAISE(auto response, Call(std::move(request)));
  ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kInstallPackage, "install_package"));
  return response.install_package();
}

arrow::Result<ServiceResponse> AgentClient::StartService(const std::optional<std::string>& wrapper) {
  AgentRequest request;
  auto*        start = request.mutable_start_service();
  if (wrapper) start->set_wrapper(*wrapper);

  ARROW_ASSIGN_OR_RAISE(auto response, Call(std::move(request)));
  ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kStartService, "start_service"));
  return response.start_service();
}

arrow::Result<ServiceResponse> AgentClient::StopService(const std::string& service) {
  AgentRequest request;
  request.mutable_stop_service()->set_service(service);

  ARROW_ASSIGN_OR_RAISE(auto response, Call(std::move(request)));
  ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kStopService, "stop_service"));
  return response.stop_service();
}

arrow::Result<PutFileResponse> AgentClient::PutFile(const transfer::CompressedFile& file, const std::string& target_path, uint32_t target_perms) {
  AgentRequest request;
  auto*        put = request.mutable_put_file();
  put->set_target_perms(target_perms);
  put->set_target_path(target_path);
  *put->mutable_file() = file.ToProto();

  ARROW_ASSIGN_OR_RAISE(auto response, Call(std::move(request)));
  ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kPutFile, "put_file"));
  return response.put_file();
}

arrow::Result<PutFileChunkResponse> AgentClient::PutFileChunk(const PutFileChunkRequest& chunk_request) {
  AgentRequest request;
  *request.mutable_put_file_chunk() = chunk_request;

  ARROW_ASSIGN_OR_RAISE(auto response, Call(std::move(request)));
  ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kPutFileChunk, "put_file_chunk"));
  return response.put_file_chunk();
}

arrow::Result<FetchFileResponse> AgentClient::FetchFile(const std::string& host_src_path, const std::string& filename) {
  AgentRequest request;
  auto*        fetch = request.mutable_fetch_file();
  fetch->set_host_src_path(host_src_path);
  fetch->set_filename(filename);

  ARROW_ASSIGN_OR_RAISE(auto response, Call(std::move(request)));
  ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kFetchFile, "fetch_file"));
  return response.fetch_file();
}

// ------------------------------------------------------------
// Chunked upload
// ------------------------------------------------------------

arrow::Result<AgentClient::ChunkAttempt> AgentClient::SendChunkPlanLocked(const transfer::CompressedFile& file, const std::string& target_path,
                                                                          uint32_t target_perms, uint64_t* total_chunks) {
  const transfer::ChunkPlan plan(file, chunk_size_);
  *total_chunks = plan.total_chunks();

  ChunkAttempt         attempt;
  std::deque<uint64_t> in_flight;  // request ids, oldest first
  uint64_t             next_chunk = 0;

  while (next_chunk < plan.total_chunks() || !in_flight.empty()) {
    // Stop feeding new chunks after the first error, but drain what is outstanding.
    while (!attempt.error && in_flight.size() < max_in_flight_chunks_ && next_chunk < plan.total_chunks()) {
      AgentRequest request;
      *request.mutable_put_file_chunk() = plan.Request(next_chunk, target_path, target_perms);
      ARROW_RETURN_NOT_OK(SendLocked(&request));
      in_flight.push_back(request.request_id());
      ++next_chunk;
    }
    if (in_flight.empty()) break;

    const uint64_t request_id = in_flight.front();
    in_flight.pop_front();

    ARROW_ASSIGN_OR_RAISE(auto response, ReceiveLocked(request_id));
    ARROW_RETURN_NOT_OK(ExpectMethod(response, AgentResponse::kPutFileChunk, "put_file_chunk"));

    const auto& chunk_response = response.put_file_chunk();
    switch (chunk_response.outcome_case()) {
      case PutFileChunkResponse::kComplete:
        attempt.completed = true;
        break;
      case PutFileChunkResponse::kProgress:
      case PutFileChunkResponse::kDuplicate:
        break;
      case PutFileChunkResponse::kError:
        if (!attempt.error) attempt.error = chunk_response.error();
        break;
      case PutFileChunkResponse::OUTCOME_NOT_SET:
        return arrow::Status::IOError("put_file_chunk response without an outcome");
    }
  }
  return attempt;
}

arrow::Result<AgentClient::UploadResult> AgentClient::UploadChunked(const transfer::CompressedFile& file, const std::string& target_path,
                                                                    uint32_t target_perms) {
  std::lock_guard lock(mutex_);

  UploadResult result;
  result.chunked = true;

  for (uint32_t attempt = 1; attempt <= transfer_attempts_; ++attempt) {
    result.attempts = attempt;
    ARROW_ASSIGN_OR_RAISE(auto outcome, SendChunkPlanLocked(file, target_path, target_perms, &result.total_chunks));
    if (outcome.completed) {
      result.success = true;
      result.error.clear();
      return result;
    }

    result.error = outcome.error ? outcome.error->message() : "transfer ended without a completed chunk";
    if (!outcome.error || outcome.error->kind() != CHUNK_ERROR_KIND_HASH_MISMATCH) {
      return result;
    }
    NODEAGENT_LOG_WARN("hash mismatch, restarting transfer", {StringField("target", target_path), IntField("attempt", attempt),
                                                              IntField("max_attempts", transfer_attempts_)});
  }
  return result;
}

arrow::Result<AgentClient::UploadResult> AgentClient::UploadFile(const std::string& local_path, const std::string& target_path, uint32_t target_perms) {
  ARROW_ASSIGN_OR_RAISE(auto file, transfer::CompressFile(local_path));
  if (file.size() > chunk_size_) {
    return UploadChunked(file, target_path, target_perms);
  }

  ARROW_ASSIGN_OR_RAISE(auto response, PutFile(file, target_path, target_perms));

  UploadResult result;
  result.attempts = 1;
  result.success  = response.has_success();
  if (response.has_error()) result.error = response.error().message();
  return result;
}

} // namespace nodeagent::client
