#include "transfer_registry.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace nodeagent::transfer {

using observability::IntField;
using observability::StringField;

SubmitResult TransferRegistry::Submit(const TransferKey& key, const std::string& target_path, uint32_t target_permissions,
                                      nodeagent::v1::FileChunk chunk, RegistryClock::time_point now) {
  const uint64_t chunk_id     = chunk.chunk_id();
  const uint64_t total_chunks = chunk.total_chunks();

  if (total_chunks == 0) {
    return ChunkRejected{chunk_id, RejectReason::kInvalidRequest, "total_chunks must be positive"};
  }
  if (chunk_id >= total_chunks) {
    return ChunkRejected{chunk_id, RejectReason::kInvalidRequest,
                         "chunk_id " + std::to_string(chunk_id) + " is outside [0, " + std::to_string(total_chunks) + ")"};
  }

  std::lock_guard lock(mutex_);

  auto it = transfers_.find(key);
  if (it == transfers_.end()) {
    InFlightTransfer transfer;
    transfer.target_path        = target_path;
    transfer.target_permissions = target_permissions;
    transfer.total_chunks       = total_chunks;
    transfer.started_at         = now;
    transfer.last_updated       = now;
    it                          = transfers_.emplace(key, std::move(transfer)).first;

    NODEAGENT_LOG_INFO("transfer started", {StringField("key", ToHex(key)), StringField("target", target_path),
                                            IntField("total_chunks", static_cast<int64_t>(total_chunks))});
  } else if (it->second.total_chunks != total_chunks) {
    return ChunkRejected{chunk_id, RejectReason::kWrongChunkCount,
                         "chunk announces " + std::to_string(total_chunks) + " chunks, transfer expects " +
                             std::to_string(it->second.total_chunks)};
  }

  auto& transfer = it->second;
  if (transfer.received_chunks.count(chunk_id) != 0) {
    return ChunkDuplicate{chunk_id};
  }

  transfer.received_chunks.emplace(chunk_id, std::move(chunk));
  transfer.last_updated = now;

  const uint64_t seen = transfer.received_chunks.size();
  if (seen < transfer.total_chunks) {
    PublishSizeLocked();
    return ChunkAccepted{chunk_id, seen};
  }

  TransferCompleted completed{chunk_id, std::move(transfer)};
  transfers_.erase(it);
  PublishSizeLocked();
  return completed;
}

size_t TransferRegistry::EvictIdle(RegistryClock::duration idle_timeout, RegistryClock::time_point now) {
  std::lock_guard lock(mutex_);

  size_t evicted = 0;
  for (auto it = transfers_.begin(); it != transfers_.end();) {
    if (now - it->second.last_updated > idle_timeout) {
      NODEAGENT_LOG_WARN("evicting idle transfer",
                         {StringField("key", ToHex(it->first)), StringField("target", it->second.target_path),
                          IntField("seen", static_cast<int64_t>(it->second.received_chunks.size())),
                          IntField("total_chunks", static_cast<int64_t>(it->second.total_chunks)),
                          IntField("age_ms", std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.started_at).count())});
      it = transfers_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }

  if (evicted > 0) PublishSizeLocked();
  return evicted;
}

size_t TransferRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return transfers_.size();
}

std::optional<uint64_t> TransferRegistry::SeenCount(const TransferKey& key) const {
  std::lock_guard lock(mutex_);
  auto            it = transfers_.find(key);
  if (it == transfers_.end()) return std::nullopt;
  return it->second.received_chunks.size();
}

void TransferRegistry::PublishSizeLocked() const {
  observability::Metrics::Instance().SetInFlightTransfers(transfers_.size());
}

} // namespace nodeagent::transfer
