#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/service/agent_service.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/system/blocking_executor.hpp"
#include "internal/system/package_manager.hpp"
#include "internal/system/service_controller.hpp"
#include "internal/transfer/chunker.hpp"
#include "internal/transfer/compressed_file.hpp"
#include "internal/transfer/transfer_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using namespace nodeagent::v1;
using nodeagent::dispatch::CallContext;
using nodeagent::system::StartOutcome;
using nodeagent::system::SubprocessResult;

class FakePackageManager final : public nodeagent::system::PackageManager {
 public:
  std::string Name() const override {
    return "fake";
  }
  bool IsInstalled(const std::string& package) override {
    return installed.count(package) > 0;
  }
  SubprocessResult Install(const std::string& package) override {
    const int running = ++concurrent_installs;
    int       peak    = peak_concurrent_installs.load();
    while (running > peak && !peak_concurrent_installs.compare_exchange_weak(peak, running)) {
    }
    if (install_delay.count() > 0) std::this_thread::sleep_for(install_delay);
    --concurrent_installs;

    if (fail_installs) return {100, "E: Unable to locate package " + package};
    installed.insert(package);
    return {0, ""};
  }
  SubprocessResult Uninstall(const std::string& package) override {
    installed.erase(package);
    return {0, ""};
  }
  void SetNoConfirm(bool) override {
  }

  std::set<std::string>     installed;
  bool                      fail_installs = false;
  std::chrono::milliseconds install_delay{0};
  std::atomic<int>          concurrent_installs{0};
  std::atomic<int>          peak_concurrent_installs{0};
};

class FakeServiceController final : public nodeagent::system::ServiceController {
 public:
  StartOutcome Start(const std::string& unit) override {
    started.push_back(unit);
    return active.count(unit) ? StartOutcome::kRestarted : StartOutcome::kStarted;
  }
  void Stop(const std::string& unit) override {
    if (unit == "missing") throw nodeagent::util::SubprocessError("systemctl stop missing exited with 5");
    stopped.push_back(unit);
  }

  std::set<std::string>    active;
  std::vector<std::string> started;
  std::vector<std::string> stopped;
};

struct Fixture {
  std::shared_ptr<FakePackageManager>    packages = std::make_shared<FakePackageManager>();
  std::shared_ptr<FakeServiceController> services = std::make_shared<FakeServiceController>();
  std::shared_ptr<nodeagent::service::AgentService> service;

  explicit Fixture(nodeagent::wire::FrameLimits limits = nodeagent::wire::FrameLimits()) {
    nodeagent::service::ServiceContext ctx;
    ctx.registry             = std::make_shared<nodeagent::transfer::TransferRegistry>();
    ctx.package_manager      = packages;
    ctx.services             = services;
    ctx.executor             = std::make_shared<nodeagent::system::BlockingExecutor>(4);
    ctx.package_executor     = std::make_shared<nodeagent::system::BlockingExecutor>(1);
    ctx.frame_limits         = limits;
    ctx.default_service_unit = "casper-node-launcher";
    service                  = std::make_shared<nodeagent::service::AgentService>(std::move(ctx));
  }
};

CallContext Call(uint64_t request_id) {
  CallContext call;
  call.peer       = "127.0.0.1:50000";
  call.channel_id = 1;
  call.request_id = request_id;
  return call;
}

fs::path TestDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "nodeagent_agent_service_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string Pattern(size_t size) {
  std::string text;
  text.reserve(size);
  for (size_t i = 0; i < size; ++i) text.push_back(static_cast<char>('a' + (i * 7) % 26));
  return text;
}

std::string Noise(size_t size) {
  std::mt19937 rng(42);
  std::string  bytes(size, '\0');
  for (auto& b : bytes) b = static_cast<char>(rng() & 0xff);
  return bytes;
}

nodeagent::transfer::CompressedFile CompressNamed(const std::string& name, const std::string& raw) {
  auto compressed = nodeagent::transfer::Compress(raw);
  assert(compressed.ok());
  return nodeagent::transfer::CompressedFile(name, *compressed);
}

void TestInstallPackageOutcomes() {
  Fixture f;
  InstallPackageRequest req;
  req.set_name("htop");

  auto first = f.service->InstallPackage(req, Call(1));
  assert(first.has_success());
  assert(f.packages->installed.count("htop") == 1);

  auto second = f.service->InstallPackage(req, Call(2));
  assert(second.has_already_installed());

  f.packages->fail_installs = true;
  req.set_name("no-such-package");
  auto failed = f.service->InstallPackage(req, Call(3));
  assert(failed.has_error());
  assert(failed.error().message().find("Unable to locate package") != std::string::npos);

  req.set_name("--allow-downgrades");
  assert(f.service->InstallPackage(req, Call(4)).has_error());
}

void TestConcurrentInstallsRunOneAtATime() {
  Fixture f;
  f.packages->install_delay = std::chrono::milliseconds(20);

  std::vector<std::thread> channels;
  for (int i = 0; i < 6; ++i) {
    channels.emplace_back([&, i] {
      InstallPackageRequest req;
      req.set_name("pkg-" + std::to_string(i));
      assert(f.service->InstallPackage(req, Call(static_cast<uint64_t>(i) + 1)).has_success());
    });
  }
  for (auto& t : channels) t.join();

  assert(f.packages->installed.size() == 6);
  assert(f.packages->peak_concurrent_installs.load() == 1);
}

void TestInstallWithoutPackageManager() {
  nodeagent::service::ServiceContext ctx;
  ctx.registry         = std::make_shared<nodeagent::transfer::TransferRegistry>();
  ctx.services         = std::make_shared<FakeServiceController>();
  ctx.executor         = std::make_shared<nodeagent::system::BlockingExecutor>();
  ctx.package_executor = std::make_shared<nodeagent::system::BlockingExecutor>();
  nodeagent::service::AgentService service(std::move(ctx));

  InstallPackageRequest req;
  req.set_name("htop");
  auto resp = service.InstallPackage(req, Call(1));
  assert(resp.has_error());
}

void TestStartAndStopService() {
  Fixture f;

  auto started = f.service->StartService(StartServiceRequest(), Call(1));
  assert(started.has_success());
  assert(f.services->started.back() == "casper-node-launcher");

  StartServiceRequest wrapped;
  wrapped.set_wrapper("casper-sidecar");
  f.services->active.insert("casper-sidecar");
  auto restarted = f.service->StartService(wrapped, Call(2));
  assert(restarted.has_restarted());
  assert(f.services->started.back() == "casper-sidecar");

  StopServiceRequest stop;
  stop.set_service("casper-sidecar");
  assert(f.service->StopService(stop, Call(3)).has_success());

  stop.set_service("missing");
  auto failed = f.service->StopService(stop, Call(4));
  assert(failed.has_error());
  assert(failed.error().message().find("exited with 5") != std::string::npos);
}

void TestPutFileWritesIntoDirectory() {
  Fixture    f;
  const auto dir = TestDir("put");
  const auto raw = Pattern(10'000);

  PutFileRequest req;
  req.set_target_path(dir.string());
  req.set_target_perms(0600);
  *req.mutable_file() = CompressNamed("chainspec.toml", raw).ToProto();

  auto resp = f.service->PutFile(req, Call(1));
  assert(resp.has_success());
  assert(*nodeagent::storage::ReadFile((dir / "chainspec.toml").string()) == raw);

  req.set_target_path((dir / "missing" / "x").string());
  assert(f.service->PutFile(req, Call(2)).has_error());

  req.set_target_path((dir / "corrupt").string());
  req.mutable_file()->set_compressed_bytes("not zstd");
  assert(f.service->PutFile(req, Call(3)).has_error());
}

void TestChunkedTransferOutOfOrder() {
  Fixture    f;
  const auto dir  = TestDir("chunked");
  const auto raw  = Noise(3000);
  const auto file = CompressNamed("blob.bin", raw);

  const nodeagent::transfer::ChunkPlan plan(file, (file.size() + 2) / 3);
  assert(plan.total_chunks() == 3);
  const auto target = (dir / "blob.bin").string();

  auto r2 = f.service->PutFileChunk(plan.Request(2, target, 0), Call(1));
  assert(r2.has_progress());
  assert(r2.progress().chunk_id() == 2);
  assert(r2.progress().seen_count() == 1);

  auto dup = f.service->PutFileChunk(plan.Request(2, target, 0), Call(2));
  assert(dup.has_duplicate());
  assert(dup.duplicate().chunk_id() == 2);

  auto r0 = f.service->PutFileChunk(plan.Request(0, target, 0), Call(3));
  assert(r0.has_progress());
  assert(r0.progress().seen_count() == 2);
  assert(!fs::exists(target));

  auto r1 = f.service->PutFileChunk(plan.Request(1, target, 0), Call(4));
  assert(r1.has_complete());
  assert(r1.complete().chunk_id() == 1);
  assert(*nodeagent::storage::ReadFile(target) == raw);
}

void TestChunkedTransferHashMismatch() {
  Fixture    f;
  const auto dir  = TestDir("mismatch");
  const auto file = CompressNamed("blob.bin", Pattern(5000));

  const nodeagent::transfer::ChunkPlan plan(file, (file.size() + 1) / 2);
  const auto wrong  = nodeagent::transfer::ComputeTransferKey("something else entirely");
  const auto target = (dir / "blob.bin").string();

  PutFileChunkResponse last;
  for (uint64_t id = 0; id < plan.total_chunks(); ++id) {
    auto req = plan.Request(id, target, 0);
    req.set_file_hash(nodeagent::transfer::ToBytes(wrong));
    last = f.service->PutFileChunk(req, Call(id + 1));
  }
  assert(last.has_error());
  assert(last.error().kind() == CHUNK_ERROR_KIND_HASH_MISMATCH);
  assert(last.error().chunk_id() == plan.total_chunks() - 1);
  assert(!fs::exists(target));
}

void TestChunkRequestValidation() {
  Fixture    f;
  const auto file = CompressNamed("blob.bin", Pattern(100));
  const nodeagent::transfer::ChunkPlan plan(file, 64);

  auto short_hash = plan.Request(0, "/tmp/x", 0);
  short_hash.set_file_hash("abc");
  auto resp = f.service->PutFileChunk(short_hash, Call(1));
  assert(resp.has_error());
  assert(resp.error().kind() == CHUNK_ERROR_KIND_INVALID_REQUEST);

  auto bad_perms = plan.Request(0, "/tmp/x", 010000);
  resp = f.service->PutFileChunk(bad_perms, Call(2));
  assert(resp.has_error());
  assert(resp.error().kind() == CHUNK_ERROR_KIND_INVALID_REQUEST);
}

void TestFetchFile() {
  Fixture    f(nodeagent::wire::FrameLimits(nodeagent::wire::kMinFrameLength));
  const auto dir = TestDir("fetch");
  const auto raw = Pattern(20'000);
  assert(nodeagent::storage::WriteFileAtomic(dir / "config.toml", raw, 0644).ok());

  FetchFileRequest req;
  req.set_host_src_path((dir / "config.toml").string());
  auto resp = f.service->FetchFile(req, Call(1));
  assert(resp.has_file());
  assert(resp.file().filename() == "config.toml");
  assert(*nodeagent::transfer::Decompress(resp.file().compressed_bytes(), raw.size()) == raw);

  req.set_filename("renamed.toml");
  assert(f.service->FetchFile(req, Call(2)).file().filename() == "renamed.toml");

  req.set_host_src_path((dir / "absent").string());
  assert(f.service->FetchFile(req, Call(3)).has_error());

  // Incompressible content larger than one frame's chunk budget.
  assert(nodeagent::storage::WriteFileAtomic(dir / "noise.bin", Noise(2 * nodeagent::wire::kEnvelopeAllowance), 0644).ok());
  req.set_host_src_path((dir / "noise.bin").string());
  req.clear_filename();
  auto too_large = f.service->FetchFile(req, Call(4));
  assert(too_large.has_error());
  assert(too_large.error().message().find("single frame") != std::string::npos);
}

} // namespace

int main() {
  TestInstallPackageOutcomes();
  TestConcurrentInstallsRunOneAtATime();
  TestInstallWithoutPackageManager();
  TestStartAndStopService();
  TestPutFileWritesIntoDirectory();
  TestChunkedTransferOutOfOrder();
  TestChunkedTransferHashMismatch();
  TestChunkRequestValidation();
  TestFetchFile();

  std::cout << "nodeagent_unit_agent_service: pass\n";
  return 0;
}
