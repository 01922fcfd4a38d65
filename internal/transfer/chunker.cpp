#include "chunker.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace nodeagent::transfer {

uint64_t TotalChunks(uint64_t byte_count, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw util::InvalidArgument("chunk size must be at least one byte");
  }
  return byte_count / chunk_size + (byte_count % chunk_size != 0 ? 1 : 0);
}

ChunkPlan::ChunkPlan(const CompressedFile& file, uint64_t chunk_size)
    : file_(file), chunk_size_(chunk_size), total_chunks_(TotalChunks(file.size(), chunk_size)), key_(file.Key()) {
}

std::string_view ChunkPlan::Slice(uint64_t chunk_id) const {
  if (chunk_id >= total_chunks_) {
    throw util::InvalidArgument("chunk " + std::to_string(chunk_id) + " out of range, plan has " + std::to_string(total_chunks_));
  }
  const uint64_t offset = chunk_id * chunk_size_;
  const uint64_t length = std::min(chunk_size_, file_.size() - offset);
  return std::string_view(file_.compressed_bytes()).substr(offset, length);
}

nodeagent::v1::FileChunk ChunkPlan::Chunk(uint64_t chunk_id) const {
  const auto slice = Slice(chunk_id);

  nodeagent::v1::FileChunk chunk;
  chunk.set_filename(file_.filename());
  chunk.set_chunk_id(chunk_id);
  chunk.set_total_chunks(total_chunks_);
  chunk.set_compressed_bytes(slice.data(), slice.size());
  return chunk;
}

nodeagent::v1::PutFileChunkRequest ChunkPlan::Request(uint64_t chunk_id, const std::string& target_path, uint32_t target_permissions) const {
  nodeagent::v1::PutFileChunkRequest request;
  request.set_file_hash(ToBytes(key_));
  request.set_target_perms(target_permissions);
  request.set_target_path(target_path);
  *request.mutable_chunk() = Chunk(chunk_id);
  return request;
}

} // namespace nodeagent::transfer
