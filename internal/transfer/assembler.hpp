#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "compressed_file.hpp"
#include "content_hash.hpp"
#include "internal/util/errors.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::transfer {

enum class AssemblyFailure {
  kEmptyChunkSet,
  kWrongChunkCount,
  kSequenceGap,
  kHashMismatch,
};

const char* ToString(AssemblyFailure failure);

class AssemblyError : public util::IntegrityError {
 public:
  AssemblyError(AssemblyFailure failure, uint64_t chunk_id, const std::string& msg)
      : util::IntegrityError(msg), failure_(failure), chunk_id_(chunk_id) {
  }

  AssemblyFailure failure() const {
    return failure_;
  }

  uint64_t chunk_id() const {
    return chunk_id_;
  }

 private:
  AssemblyFailure failure_;
  uint64_t        chunk_id_;
};

using ChunkSet = std::map<uint64_t, nodeagent::v1::FileChunk>;

/*
  Concatenates a complete chunk set in chunk_id order and checks the result
  against the TransferKey.

  The set must be non-empty, hold exactly the total_chunks announced by its
  first chunk, and cover ids [0, total_chunks) without gaps. Any violation
  throws AssemblyError tagged with `completing_chunk_id`; nothing is padded
  or truncated.
*/
CompressedFile Reassemble(const ChunkSet& chunks, const TransferKey& expected, uint64_t completing_chunk_id);

} // namespace nodeagent::transfer
