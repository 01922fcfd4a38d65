#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>

#include "client/cpp/agent_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/tls/pem.hpp"

namespace {

namespace fs = std::filesystem;

using nodeagent::client::AgentClient;

struct Identity {
  std::string cert_path;
  std::string key_path;
};

fs::path TestDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "nodeagent_tls_channel_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

Identity WriteIdentity(const fs::path& dir, const std::string& host) {
  const auto generated = nodeagent::tls::GenerateSelfSignedCertificate(host);
  Identity   identity{(dir / (host + "-crt.pem")).string(), (dir / (host + "-key.pem")).string()};
  assert(nodeagent::storage::WriteFileAtomic(identity.cert_path, generated.certificate_pem, 0644).ok());
  assert(nodeagent::storage::WriteFileAtomic(identity.key_path, generated.private_key_pem, 0600).ok());
  return identity;
}

nodeagent::runtime::config::RuntimeConfig DaemonConfig(const Identity& identity, const fs::path& empty_bin) {
  nodeagent::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("127.0.0.1:0");
  config.mutable_server()->set_admission_wait_ms(500);
  config.mutable_tls()->set_cert_path(identity.cert_path);
  config.mutable_tls()->set_key_path(identity.key_path);
  config.mutable_system()->add_package_manager_search_dirs(empty_bin.string());
  nodeagent::config::ConfigLoader::ApplyDefaults(&config);
  nodeagent::config::ConfigLoader::Validate(config);
  return config;
}

nodeagent::runtime::config::ClientConfig ClientConfigFor(int port, const std::string& pinned_cert_path) {
  nodeagent::runtime::config::ClientConfig config;
  config.set_server_address("127.0.0.1:" + std::to_string(port));
  config.mutable_tls()->set_pinned_server_cert_path(pinned_cert_path);
  config.set_chunk_size(64 * 1024);
  config.set_connect_timeout_ms(3000);
  nodeagent::config::ConfigLoader::ApplyDefaults(&config);
  return config;
}

std::string Noise(size_t size) {
  std::mt19937 rng(7);
  std::string  bytes(size, '\0');
  for (auto& b : bytes) b = static_cast<char>(rng() & 0xff);
  return bytes;
}

void TestPinnedChannelLifecycle() {
  const auto dir    = TestDir("lifecycle");
  const auto server = WriteIdentity(dir, "127.0.0.1");
  const auto empty  = TestDir("lifecycle_bin");
  auto       app    = nodeagent::factory::Build(DaemonConfig(server, empty));
  app.Start();
  const int port = app.server->port();
  assert(port > 0);

  // Pinned certificate matches: the channel carries requests.
  auto connected = AgentClient::Connect(ClientConfigFor(port, server.cert_path));
  assert(connected.ok());
  auto client = std::move(connected).ValueOrDie();

  auto fetched = client->FetchFile((dir / "does-not-exist").string());
  assert(fetched.ok());
  assert(fetched->has_error());

  // No package manager in the search dirs: an operation error, not a channel failure.
  auto install = client->InstallPackage("htop");
  assert(install.ok());
  assert(install->has_error());

  // Chunked upload end to end.
  const auto raw   = Noise(300 * 1024);
  const auto local = dir / "payload.bin";
  assert(nodeagent::storage::WriteFileAtomic(local, raw, 0644).ok());

  const auto out_dir = TestDir("lifecycle_out");
  auto       upload  = client->UploadFile(local.string(), out_dir.string(), 0600);
  assert(upload.ok());
  assert(upload->success);
  assert(upload->chunked);
  assert(upload->total_chunks > 1);
  assert(*nodeagent::storage::ReadFile((out_dir / "payload.bin").string()) == raw);

  auto round_trip = client->FetchFile((out_dir / "payload.bin").string(), "copy.bin");
  assert(round_trip.ok());
  assert(round_trip->file().filename() == "copy.bin");

  // Second channel from the same peer exceeds the per-peer cap of 1.
  auto second = AgentClient::Connect(ClientConfigFor(port, server.cert_path));
  assert(second.ok());
  auto rejected = (*second)->InstallPackage("htop");
  assert(!rejected.ok());
  assert(rejected.status().IsCapacityError());
  (void)(*second)->Close();

  // Closing the first channel frees the slot.
  assert(client->Close().ok());
  auto third = AgentClient::Connect(ClientConfigFor(port, server.cert_path));
  assert(third.ok());
  auto again = (*third)->FetchFile((dir / "does-not-exist").string());
  assert(again.ok());
  assert((*third)->Close().ok());

  app.Stop();
}

void TestStopWithOpenChannelEndsWithinGrace() {
  const auto dir    = TestDir("stop_open");
  const auto server = WriteIdentity(dir, "127.0.0.1");
  auto       config = DaemonConfig(server, TestDir("stop_open_bin"));
  config.mutable_server()->set_shutdown_grace_ms(300);
  auto app = nodeagent::factory::Build(config);
  app.Start();

  // Admitted channel left open and idle while the daemon stops.
  auto connected = AgentClient::Connect(ClientConfigFor(app.server->port(), server.cert_path));
  assert(connected.ok());
  auto client  = std::move(connected).ValueOrDie();
  auto fetched = client->FetchFile((dir / "does-not-exist").string());
  assert(fetched.ok());

  const auto started = std::chrono::steady_clock::now();
  app.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

  auto after = client->FetchFile((dir / "does-not-exist").string());
  assert(!after.ok());
  (void)client->Close();
}

void TestMismatchedPinFailsHandshake() {
  const auto dir      = TestDir("mismatch");
  const auto server   = WriteIdentity(dir, "127.0.0.1");
  const auto impostor = WriteIdentity(TestDir("mismatch_other"), "127.0.0.1");
  const auto empty    = TestDir("mismatch_bin");
  auto       app      = nodeagent::factory::Build(DaemonConfig(server, empty));
  app.Start();

  auto connected = AgentClient::Connect(ClientConfigFor(app.server->port(), impostor.cert_path));
  assert(!connected.ok());
  assert(connected.status().IsIOError());

  app.Stop();
}

void TestMissingServerKeyIsConfigError() {
  const auto dir    = TestDir("missing_key");
  auto       server = WriteIdentity(dir, "127.0.0.1");
  fs::remove(server.key_path);

  bool threw = false;
  try {
    auto app = nodeagent::factory::Build(DaemonConfig(server, TestDir("missing_key_bin")));
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPinnedChannelLifecycle();
  TestStopWithOpenChannelEndsWithinGrace();
  TestMismatchedPinFailsHandshake();
  TestMissingServerKeyIsConfigError();

  std::cout << "nodeagent_integration_tls_channel: pass\n";
  return 0;
}
