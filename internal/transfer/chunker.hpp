#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "compressed_file.hpp"
#include "content_hash.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::transfer {

// ceil(byte_count / chunk_size). Throws util::InvalidArgument for chunk_size == 0.
uint64_t TotalChunks(uint64_t byte_count, uint64_t chunk_size);

/*
  Splits a CompressedFile into fixed-size windows, the last one possibly
  shorter. Chunks are produced on demand and reference the file's bytes, so
  the file must outlive the plan. The TransferKey is computed once here.
*/
class ChunkPlan {
 public:
  ChunkPlan(const CompressedFile& file, uint64_t chunk_size);

  uint64_t total_chunks() const {
    return total_chunks_;
  }

  uint64_t chunk_size() const {
    return chunk_size_;
  }

  const TransferKey& key() const {
    return key_;
  }

  std::string_view Slice(uint64_t chunk_id) const;

  nodeagent::v1::FileChunk Chunk(uint64_t chunk_id) const;

  nodeagent::v1::PutFileChunkRequest Request(uint64_t chunk_id, const std::string& target_path, uint32_t target_permissions) const;

 private:
  const CompressedFile& file_;
  uint64_t              chunk_size_;
  uint64_t              total_chunks_;
  TransferKey           key_;
};

} // namespace nodeagent::transfer
