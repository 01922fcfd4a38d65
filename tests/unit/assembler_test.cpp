#include "internal/transfer/assembler.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/transfer/chunker.hpp"

namespace {

using nodeagent::transfer::AssemblyError;
using nodeagent::transfer::AssemblyFailure;
using nodeagent::transfer::ChunkPlan;
using nodeagent::transfer::ChunkSet;
using nodeagent::transfer::CompressedFile;
using nodeagent::transfer::Reassemble;

ChunkSet FullSet(const ChunkPlan& plan) {
  ChunkSet set;
  for (uint64_t id = 0; id < plan.total_chunks(); ++id) set.emplace(id, plan.Chunk(id));
  return set;
}

AssemblyFailure FailureOf(const ChunkSet& set, const nodeagent::transfer::TransferKey& key, uint64_t completing) {
  try {
    (void)Reassemble(set, key, completing);
  } catch (const AssemblyError& e) {
    assert(e.chunk_id() == completing);
    return e.failure();
  }
  assert(false && "expected an AssemblyError");
  return AssemblyFailure::kEmptyChunkSet;
}

void TestCompleteSetReassemblesExactly() {
  const CompressedFile file("genesis.json", std::string(1000, 'g') + std::string(500, 'h'));
  const ChunkPlan      plan(file, 400);

  const auto rebuilt = Reassemble(FullSet(plan), file.Key(), 2);
  assert(rebuilt.filename() == "genesis.json");
  assert(rebuilt.compressed_bytes() == file.compressed_bytes());
}

void TestEmptySet() {
  const CompressedFile file("f", "abc");
  assert(FailureOf(ChunkSet{}, file.Key(), 0) == AssemblyFailure::kEmptyChunkSet);
}

void TestWrongCount() {
  const CompressedFile file("f", std::string(900, 'x'));
  const ChunkPlan      plan(file, 300);

  auto set = FullSet(plan);
  set.erase(1);
  assert(FailureOf(set, file.Key(), 2) == AssemblyFailure::kWrongChunkCount);
}

void TestSequenceGap() {
  const CompressedFile file("f", std::string(900, 'x'));
  const ChunkPlan      plan(file, 300);

  // Three chunks present, but ids 0, 1, 3.
  auto set   = FullSet(plan);
  auto moved = set.at(2);
  moved.set_chunk_id(3);
  set.erase(2);
  set.emplace(3, moved);
  assert(FailureOf(set, file.Key(), 3) == AssemblyFailure::kSequenceGap);
}

void TestHashMismatch() {
  const CompressedFile file("f", std::string(900, 'x'));
  const ChunkPlan      plan(file, 300);

  auto set = FullSet(plan);
  set.at(1).set_compressed_bytes(std::string(300, 'y'));
  assert(FailureOf(set, file.Key(), 1) == AssemblyFailure::kHashMismatch);
}

void TestAnySingleBitFlipIsDetected() {
  std::string bytes(1000, '\0');
  for (size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<char>((i * 131 + 17) & 0xFF);
  const CompressedFile file("casper-node.zst", bytes);
  const ChunkPlan      plan(file, 256);
  assert(plan.total_chunks() == 4);

  const uint64_t last = plan.total_chunks() - 1;
  const uint64_t mid  = plan.total_chunks() / 2;
  for (const uint64_t chunk_id : {uint64_t{0}, mid, last}) {
    const size_t length = plan.Slice(chunk_id).size();
    for (const size_t offset : {size_t{0}, length / 2, length - 1}) {
      for (const int bit : {0, 7}) {
        auto  set     = FullSet(plan);
        auto& payload = *set.at(chunk_id).mutable_compressed_bytes();
        payload[offset] = static_cast<char>(payload[offset] ^ (1 << bit));
        assert(FailureOf(set, file.Key(), last) == AssemblyFailure::kHashMismatch);
      }
    }
  }

  // Untouched set still verifies.
  assert(Reassemble(FullSet(plan), file.Key(), last).compressed_bytes() == bytes);
}

void TestFailureNames() {
  assert(std::string(nodeagent::transfer::ToString(AssemblyFailure::kHashMismatch)) == "hash_mismatch");
  assert(std::string(nodeagent::transfer::ToString(AssemblyFailure::kSequenceGap)) == "chunk_sequence_gap");
}

} // namespace

int main() {
  TestCompleteSetReassemblesExactly();
  TestEmptySet();
  TestWrongCount();
  TestSequenceGap();
  TestHashMismatch();
  TestAnySingleBitFlipIsDetected();
  TestFailureNames();

  std::cout << "nodeagent_unit_assembler: pass\n";
  return 0;
}
