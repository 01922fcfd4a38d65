#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "nodeagent_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigError(Fn&& fn) {
  try {
    fn();
  } catch (const nodeagent::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestMinimalDaemonConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal", R"(tls:
  cert_path: /etc/nodeagent/node-crt.pem
  key_path: /etc/nodeagent/node-key.pem
)");

  const auto config = nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "[::]:8081");
  assert(config.server().max_frame_length() == 16ull * 1024 * 1024);
  assert(config.server().max_channels_per_peer() == 1);
  assert(config.server().max_concurrent_channels() == 10);
  assert(config.server().admission_wait_ms() == 30000);
  assert(config.server().shutdown_grace_ms() == 5000);
  assert(config.transfer().chunk_size() == 5ull * 1024 * 1024);
  assert(config.transfer().idle_timeout_ms() == 600000);
  assert(config.transfer().sweep_interval_ms() == 30000);
  assert(config.transfer().max_decompressed_bytes() == 4ull * 1024 * 1024 * 1024);
  assert(config.system().default_service_unit() == "casper-node-launcher");
  assert(config.system().package_manager_search_dirs_size() == 2);
  assert(config.system().package_manager_search_dirs(0) == "/bin");
  assert(config.system().package_manager_search_dirs(1) == "/usr/bin");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted", R"(server:
  bind_address: "127.0.0.1:9000"
tls:
  cert_path: "C:\\certs\\\"node\".pem"
  key_path: "0600"
system:
  default_service_unit: "true"
)");

  const auto config = nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:9000");
  assert(config.tls().cert_path() == "C:\\certs\\\"node\".pem");
  assert(config.tls().key_path() == "0600");
  assert(config.system().default_service_unit() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(tls:
  cert_path: a.pem
  key_path: b.pem
database:
  sqlite:
    path: /tmp/x.db
)");

  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }) &&
         "ConfigLoader must reject unknown fields.");
}

void TestMissingTlsMaterialIsFatal() {
  const auto yaml_path = WriteYaml("missing_tls", R"(server:
  bind_address: "[::]:8081"
)");

  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestUnboundedFrameIsRejected() {
  const auto yaml_path = WriteYaml("unbounded_frame", R"(server:
  max_frame_length: 1099511627776
tls:
  cert_path: a.pem
  key_path: b.pem
)");

  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestChunkSizeLargerThanFrameIsRejected() {
  const auto yaml_path = WriteYaml("chunk_too_big", R"(server:
  max_frame_length: 1048576
tls:
  cert_path: a.pem
  key_path: b.pem
transfer:
  chunk_size: 1048576
)");

  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestPerPeerCapCannotExceedGlobalCap() {
  const auto yaml_path = WriteYaml("per_peer_cap", R"(server:
  max_channels_per_peer: 5
  max_concurrent_channels: 2
tls:
  cert_path: a.pem
  key_path: b.pem
)");

  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestClientConfigDefaultsAndValidation() {
  const auto ok_path = WriteYaml("client_ok", R"(server_address: "10.0.0.5:8081"
tls:
  pinned_server_cert_path: /etc/nodeagent/node-crt.pem
)");

  const auto config = nodeagent::config::ConfigLoader::LoadClientFromYaml(ok_path.string());
  assert(config.server_address() == "10.0.0.5:8081");
  assert(config.max_frame_length() == 16ull * 1024 * 1024);
  assert(config.chunk_size() == 5ull * 1024 * 1024);
  assert(config.max_in_flight_chunks() == 4);
  assert(config.transfer_attempts() == 3);
  assert(config.connect_timeout_ms() == 10000);

  const auto no_pin_path = WriteYaml("client_no_pin", R"(server_address: "10.0.0.5:8081"
)");
  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadClientFromYaml(no_pin_path.string()); }));

  const auto half_identity_path = WriteYaml("client_half_identity", R"(server_address: "10.0.0.5:8081"
tls:
  pinned_server_cert_path: pin.pem
  cert_path: client-crt.pem
)");
  assert(ThrowsConfigError([&] { (void)nodeagent::config::ConfigLoader::LoadClientFromYaml(half_identity_path.string()); }));
}

void TestMissingFileIsConfigError() {
  assert(ThrowsConfigError([] { (void)nodeagent::config::ConfigLoader::LoadFromYaml("/nonexistent/nodeagentd.yaml"); }));
}

} // namespace

int main() {
  TestMinimalDaemonConfigGetsDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingTlsMaterialIsFatal();
  TestUnboundedFrameIsRejected();
  TestChunkSizeLargerThanFrameIsRejected();
  TestPerPeerCapCannotExceedGlobalCap();
  TestClientConfigDefaultsAndValidation();
  TestMissingFileIsConfigError();

  std::cout << "nodeagent_unit_config_loader: pass\n";
  return 0;
}
