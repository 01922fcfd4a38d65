#include "agent_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/system/blocking_executor.hpp"
#include "internal/system/package_manager.hpp"
#include "internal/system/service_controller.hpp"
#include "internal/transfer/assembler.hpp"
#include "internal/transfer/compressed_file.hpp"
#include "internal/transfer/transfer_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace nodeagent::service {

using namespace nodeagent::v1;
using nodeagent::observability::IntField;
using nodeagent::observability::StringField;
using nodeagent::storage::common::Unwrap;

namespace {

template <typename Fn, typename OnError>
auto ObserveRpc(std::string_view route, const dispatch::CallContext& call, Fn&& fn, OnError&& on_error) -> std::invoke_result_t<Fn> {
  nodeagent::observability::SpanScope span(route);
  span.SetAttribute("peer", call.peer);
  span.SetAttribute("request.id", static_cast<int64_t>(call.request_id));

  const auto started_at = std::chrono::steady_clock::now();
  auto       observe    = [&](bool success) {
    nodeagent::observability::Metrics::Instance().RecordRequest(route, success);
    nodeagent::observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::MillisSince(started_at));
  };

  try {
    auto result = fn();
    observe(true);
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    NODEAGENT_LOG_ERROR("RPC failed", {StringField("route", route), StringField("peer", call.peer),
                                       IntField("request_id", static_cast<int64_t>(call.request_id)), StringField("error", ex.what())});
    observe(false);
    return on_error(ex);
  }
}

template <typename Response>
Response ErrorOutcome(const std::exception& ex) {
  Response resp;
  resp.mutable_error()->set_message(ex.what());
  return resp;
}

ChunkErrorKind ToChunkErrorKind(transfer::AssemblyFailure failure) {
  switch (failure) {
    case transfer::AssemblyFailure::kEmptyChunkSet:
      return CHUNK_ERROR_KIND_EMPTY_CHUNK_SET;
    case transfer::AssemblyFailure::kWrongChunkCount:
      return CHUNK_ERROR_KIND_WRONG_CHUNK_COUNT;
    case transfer::AssemblyFailure::kSequenceGap:
      return CHUNK_ERROR_KIND_CHUNK_SEQUENCE_GAP;
    case transfer::AssemblyFailure::kHashMismatch:
      return CHUNK_ERROR_KIND_HASH_MISMATCH;
  }
  return CHUNK_ERROR_KIND_UNSPECIFIED;
}

PutFileChunkResponse ChunkError(uint64_t chunk_id, ChunkErrorKind kind, const std::string& message) {
  PutFileChunkResponse resp;
  auto*                error = resp.mutable_error();
  error->set_chunk_id(chunk_id);
  error->set_kind(kind);
  error->set_message(message);
  return resp;
}

} // namespace

AgentService::AgentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------
// Packages and services
// ------------------------------------------------------------

InstallPackageResponse AgentService::InstallPackage(const InstallPackageRequest& req, const dispatch::CallContext& call) {
  return ObserveRpc(
      "AgentService.InstallPackage", call,
      [&] {
        if (!ctx_.package_manager) {
          throw util::NotFound("no supported package manager found on this host");
        }
        nodeagent::system::ValidatePackageName(req.name());

        InstallPackageResponse resp;
        ctx_.package_executor->Run([&] {
          if (ctx_.package_manager->IsInstalled(req.name())) {
            resp.mutable_already_installed();
            return;
          }

          auto result = ctx_.package_manager->Install(req.name());
          if (!result.ok()) {
            throw util::SubprocessError(ctx_.package_manager->Name() + " install " + req.name() + " exited with " +
                                        std::to_string(result.exit_code) + (result.output.empty() ? "" : ": " + result.output));
          }
          resp.mutable_success();
        });
        return resp;
      },
      ErrorOutcome<InstallPackageResponse>);
}

ServiceResponse AgentService::StartService(const StartServiceRequest& req, const dispatch::CallContext& call) {
  return ObserveRpc(
      "AgentService.StartService", call,
      [&] {
        const std::string unit    = req.has_wrapper() ? req.wrapper() : ctx_.default_service_unit;
        const auto        outcome = ctx_.executor->Run([&] { return ctx_.services->Start(unit); });

        ServiceResponse resp;
        if (outcome == nodeagent::system::StartOutcome::kRestarted) {
          resp.mutable_restarted();
        } else {
          resp.mutable_success();
        }
        NODEAGENT_LOG_INFO("service started", {StringField("unit", unit),
                                                StringField("outcome", outcome == nodeagent::system::StartOutcome::kRestarted ? "restarted" : "started")});
        return resp;
      },
      ErrorOutcome<ServiceResponse>);
}

ServiceResponse AgentService::StopService(const StopServiceRequest& req, const dispatch::CallContext& call) {
  return ObserveRpc(
      "AgentService.StopService", call,
      [&] {
        ctx_.executor->Run([&] { ctx_.services->Stop(req.service()); });

        ServiceResponse resp;
        resp.mutable_success();
        NODEAGENT_LOG_INFO("service stopped", {StringField("unit", req.service())});
        return resp;
      },
      ErrorOutcome<ServiceResponse>);
}

// ------------------------------------------------------------
// Files
// ------------------------------------------------------------

std::string AgentService::WriteTransferredFile(const std::string& target_path, uint32_t target_permissions, const std::string& filename,
                                               const std::string& compressed_bytes) {
  const auto mode        = Unwrap(storage::ResolveFileMode(target_permissions));
  const auto destination = Unwrap(storage::ResolveTargetPath(target_path, filename));
  const auto raw         = Unwrap(transfer::Decompress(compressed_bytes, ctx_.max_decompressed_bytes));

  Unwrap(storage::WriteFileAtomic(destination, raw, mode));
  nodeagent::observability::Metrics::Instance().AddTransferBytes("in", compressed_bytes.size());
  return destination.string();
}

PutFileResponse AgentService::PutFile(const PutFileRequest& req, const dispatch::CallContext& call) {
  return ObserveRpc(
      "AgentService.PutFile", call,
      [&] {
        if (!req.has_file()) {
          throw util::InvalidArgument("put_file without a file");
        }

        const auto written = WriteTransferredFile(req.target_path(), req.target_perms(), req.file().filename(), req.file().compressed_bytes());
        NODEAGENT_LOG_INFO("file written", {StringField("path", written), IntField("compressed_bytes", static_cast<int64_t>(req.file().compressed_bytes().size()))});

        PutFileResponse resp;
        resp.mutable_success();
        return resp;
      },
      ErrorOutcome<PutFileResponse>);
}

PutFileChunkResponse AgentService::PutFileChunk(const PutFileChunkRequest& req, const dispatch::CallContext& call) {
  const uint64_t chunk_id = req.chunk().chunk_id();

  return ObserveRpc(
      "AgentService.PutFileChunk", call,
      [&]() -> PutFileChunkResponse {
        const auto key = transfer::TransferKeyFromBytes(req.file_hash());
        if (!key) {
          return ChunkError(chunk_id, CHUNK_ERROR_KIND_INVALID_REQUEST,
                            "file_hash must be " + std::to_string(transfer::kTransferKeySize) + " bytes, got " +
                                std::to_string(req.file_hash().size()));
        }
        if (!req.has_chunk()) {
          return ChunkError(chunk_id, CHUNK_ERROR_KIND_INVALID_REQUEST, "put_file_chunk without a chunk");
        }
        if (!storage::ResolveFileMode(req.target_perms()).ok()) {
          return ChunkError(chunk_id, CHUNK_ERROR_KIND_INVALID_REQUEST, "target_perms exceeds 07777");
        }

        auto result = ctx_.registry->Submit(*key, req.target_path(), req.target_perms(), req.chunk());

        PutFileChunkResponse resp;
        if (auto* accepted = std::get_if<transfer::ChunkAccepted>(&result)) {
          auto* progress = resp.mutable_progress();
          progress->set_chunk_id(accepted->chunk_id);
          progress->set_seen_count(accepted->seen_count);
          return resp;
        }
        if (auto* duplicate = std::get_if<transfer::ChunkDuplicate>(&result)) {
          resp.mutable_duplicate()->set_chunk_id(duplicate->chunk_id);
          return resp;
        }
        if (auto* rejected = std::get_if<transfer::ChunkRejected>(&result)) {
          NODEAGENT_LOG_WARN("chunk rejected", {StringField("key", transfer::ToHex(*key)), IntField("chunk_id", static_cast<int64_t>(rejected->chunk_id)),
                                                StringField("reason", rejected->message)});
          return ChunkError(rejected->chunk_id,
                            rejected->reason == transfer::RejectReason::kWrongChunkCount ? CHUNK_ERROR_KIND_WRONG_CHUNK_COUNT
                                                                                         : CHUNK_ERROR_KIND_INVALID_REQUEST,
                            rejected->message);
        }

        auto& completed = std::get<transfer::TransferCompleted>(result);
        auto  file      = transfer::Reassemble(completed.transfer.received_chunks, *key, completed.chunk_id);
        const auto written =
            WriteTransferredFile(completed.transfer.target_path, completed.transfer.target_permissions, file.filename(), file.compressed_bytes());

        NODEAGENT_LOG_INFO("transfer completed",
                           {StringField("key", transfer::ToHex(*key)), StringField("path", written),
                            IntField("chunks", static_cast<int64_t>(completed.transfer.total_chunks)),
                            IntField("compressed_bytes", static_cast<int64_t>(file.size())),
                            IntField("duration_ms", static_cast<int64_t>(util::MillisSince(completed.transfer.started_at)))});

        resp.mutable_complete()->set_chunk_id(completed.chunk_id);
        return resp;
      },
      [&](const std::exception& ex) {
        if (const auto* assembly = dynamic_cast<const transfer::AssemblyError*>(&ex)) {
          NODEAGENT_LOG_WARN("transfer integrity failure", {StringField("failure", transfer::ToString(assembly->failure())),
                                                            IntField("chunk_id", static_cast<int64_t>(assembly->chunk_id()))});
          return ChunkError(assembly->chunk_id(), ToChunkErrorKind(assembly->failure()), ex.what());
        }
        if (dynamic_cast<const util::InvalidArgument*>(&ex)) {
          return ChunkError(chunk_id, CHUNK_ERROR_KIND_INVALID_REQUEST, ex.what());
        }
        return ChunkError(chunk_id, CHUNK_ERROR_KIND_WRITE_FAILED, ex.what());
      });
}

FetchFileResponse AgentService::FetchFile(const FetchFileRequest& req, const dispatch::CallContext& call) {
  return ObserveRpc(
      "AgentService.FetchFile", call,
      [&] {
        auto file = Unwrap(transfer::CompressFile(req.host_src_path(), req.filename()));
        if (file.size() > ctx_.frame_limits.max_chunk_size()) {
          throw util::FrameTooLarge("compressed file is " + std::to_string(file.size()) + " bytes, a single frame carries at most " +
                                    std::to_string(ctx_.frame_limits.max_chunk_size()));
        }

        nodeagent::observability::Metrics::Instance().AddTransferBytes("out", file.size());

        FetchFileResponse resp;
        *resp.mutable_file() = file.ToProto();
        return resp;
      },
      ErrorOutcome<FetchFileResponse>);
}

} // namespace nodeagent::service
