#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

#include "assembler.hpp"
#include "content_hash.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::transfer {

using RegistryClock = std::chrono::steady_clock;

/*
  Accumulation state of one chunked transfer. Purely in-memory.
*/
struct InFlightTransfer {
  std::string               target_path;
  uint32_t                  target_permissions = 0;
  uint64_t                  total_chunks       = 0;
  RegistryClock::time_point started_at;
  RegistryClock::time_point last_updated;
  ChunkSet                  received_chunks;
};

enum class RejectReason {
  kInvalidRequest,
  kWrongChunkCount,
};

// Outcomes of TransferRegistry::Submit.
struct ChunkAccepted {
  uint64_t chunk_id   = 0;
  uint64_t seen_count = 0;
};

struct ChunkDuplicate {
  uint64_t chunk_id = 0;
};

// The entry has already been removed; the caller owns its chunks.
struct TransferCompleted {
  uint64_t         chunk_id = 0;
  InFlightTransfer transfer;
};

struct ChunkRejected {
  uint64_t     chunk_id = 0;
  RejectReason reason   = RejectReason::kInvalidRequest;
  std::string  message;
};

using SubmitResult = std::variant<ChunkAccepted, ChunkDuplicate, TransferCompleted, ChunkRejected>;

/*
  Shared map TransferKey -> InFlightTransfer.

  Every Submit runs validation, duplicate check, append, completion check
  and removal inside one critical section, so exactly one caller ever sees
  TransferCompleted for a given transfer. Once removed, a key is forgotten:
  a later chunk under the same key starts a new transfer.
*/
class TransferRegistry {
 public:
  TransferRegistry() = default;

  TransferRegistry(const TransferRegistry&)            = delete;
  TransferRegistry& operator=(const TransferRegistry&) = delete;

  SubmitResult Submit(const TransferKey& key, const std::string& target_path, uint32_t target_permissions, nodeagent::v1::FileChunk chunk,
                      RegistryClock::time_point now = RegistryClock::now());

  // Drops transfers whose last_updated is older than `idle_timeout`. Returns how many were dropped.
  size_t EvictIdle(RegistryClock::duration idle_timeout, RegistryClock::time_point now = RegistryClock::now());

  size_t                  Size() const;
  std::optional<uint64_t> SeenCount(const TransferKey& key) const;

 private:
  void PublishSizeLocked() const;

  mutable std::mutex                                                 mutex_;
  std::unordered_map<TransferKey, InFlightTransfer, TransferKeyHash> transfers_;
};

} // namespace nodeagent::transfer
