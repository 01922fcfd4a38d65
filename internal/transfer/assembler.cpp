#include "assembler.hpp"

#include <utility>

namespace nodeagent::transfer {

const char* ToString(AssemblyFailure failure) {
  switch (failure) {
    case AssemblyFailure::kEmptyChunkSet:
      return "empty_chunk_set";
    case AssemblyFailure::kWrongChunkCount:
      return "wrong_chunk_count";
    case AssemblyFailure::kSequenceGap:
      return "chunk_sequence_gap";
    case AssemblyFailure::kHashMismatch:
      return "hash_mismatch";
  }
  return "unknown";
}

CompressedFile Reassemble(const ChunkSet& chunks, const TransferKey& expected, uint64_t completing_chunk_id) {
  if (chunks.empty()) {
    throw AssemblyError(AssemblyFailure::kEmptyChunkSet, completing_chunk_id, "no chunks to reassemble");
  }

  const auto& first          = chunks.begin()->second;
  const auto  expected_count = first.total_chunks();
  if (chunks.size() != expected_count) {
    throw AssemblyError(AssemblyFailure::kWrongChunkCount, completing_chunk_id,
                        "have " + std::to_string(chunks.size()) + " chunks, first chunk announced " + std::to_string(expected_count));
  }

  size_t   total_bytes = 0;
  uint64_t next_id     = 0;
  for (const auto& [id, chunk] : chunks) {
    if (id != next_id || chunk.chunk_id() != id) {
      throw AssemblyError(AssemblyFailure::kSequenceGap, completing_chunk_id, "missing chunk " + std::to_string(next_id));
    }
    total_bytes += chunk.compressed_bytes().size();
    ++next_id;
  }

  std::string bytes;
  bytes.reserve(total_bytes);
  for (const auto& [id, chunk] : chunks) {
    bytes.append(chunk.compressed_bytes());
  }

  const auto actual = ComputeTransferKey(bytes);
  if (actual != expected) {
    throw AssemblyError(AssemblyFailure::kHashMismatch, completing_chunk_id,
                        "reassembled content hash " + ToHex(actual) + " does not match transfer key " + ToHex(expected));
  }

  return CompressedFile(first.filename(), std::move(bytes));
}

} // namespace nodeagent::transfer
