#include "internal/transfer/registry_sweeper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/transfer/chunker.hpp"
#include "internal/transfer/transfer_registry.hpp"

namespace {

using nodeagent::transfer::ChunkPlan;
using nodeagent::transfer::CompressedFile;
using nodeagent::transfer::RegistryClock;
using nodeagent::transfer::RegistrySweeper;
using nodeagent::transfer::TransferRegistry;

void TestSweepOnceEvictsOnlyStaleTransfers() {
  auto registry = std::make_shared<TransferRegistry>();

  const CompressedFile stale_file("stale", std::string(600, 's'));
  const CompressedFile fresh_file("fresh", std::string(600, 'f'));
  const ChunkPlan      stale(stale_file, 300);
  const ChunkPlan      fresh(fresh_file, 300);

  (void)registry->Submit(stale.key(), "/tmp/a", 0, stale.Chunk(0), RegistryClock::now() - std::chrono::hours(1));
  (void)registry->Submit(fresh.key(), "/tmp/b", 0, fresh.Chunk(0));

  RegistrySweeper sweeper(registry, std::chrono::minutes(10), std::chrono::seconds(30));
  assert(sweeper.SweepOnce() == 1);
  assert(registry->Size() == 1);
  assert(registry->SeenCount(fresh.key()) == 1u);
}

void TestBackgroundThreadSweepsAndStops() {
  auto registry = std::make_shared<TransferRegistry>();

  const CompressedFile file("f", std::string(600, 'x'));
  const ChunkPlan      plan(file, 300);
  (void)registry->Submit(plan.key(), "/tmp/a", 0, plan.Chunk(0));

  RegistrySweeper sweeper(registry, std::chrono::milliseconds(20), std::chrono::milliseconds(10));
  sweeper.Start();
  sweeper.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (registry->Size() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(registry->Size() == 0);

  const auto stop_started = std::chrono::steady_clock::now();
  sweeper.Stop();
  sweeper.Stop();
  assert(std::chrono::steady_clock::now() - stop_started < std::chrono::seconds(1));
}

} // namespace

int main() {
  TestSweepOnceEvictsOnlyStaleTransfers();
  TestBackgroundThreadSweepsAndStops();

  std::cout << "nodeagent_unit_registry_sweeper: pass\n";
  return 0;
}
