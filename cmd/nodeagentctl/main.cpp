#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/agent_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/tls/pem.hpp"
#include "internal/transfer/compressed_file.hpp"
#include "nodeagent/v1.hpp"

using namespace nodeagent::v1;
using nodeagent::client::AgentClient;

namespace {

constexpr int kExitUsage     = 1;
constexpr int kExitTransport = 2;
constexpr int kExitOperation = 3;

constexpr uint64_t kMaxFetchedBytes = 4ull * 1024 * 1024 * 1024;

void Usage() {
  std::cout << "Usage:\n"
            << "  nodeagentctl gen-cert <host> <dir>\n"
            << "  nodeagentctl <client.yaml> install <package>\n"
            << "  nodeagentctl <client.yaml> start [wrapper]\n"
            << "  nodeagentctl <client.yaml> stop <service>\n"
            << "  nodeagentctl <client.yaml> put <local_path> <remote_path> [mode, octal]\n"
            << "  nodeagentctl <client.yaml> fetch <remote_path> <local_dir>\n";
}

std::optional<uint32_t> ParseMode(const std::string& text) {
  try {
    size_t     consumed = 0;
    const auto mode     = std::stoul(text, &consumed, 8);
    if (consumed != text.size() || mode > nodeagent::storage::kMaxFileMode) return std::nullopt;
    return static_cast<uint32_t>(mode);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

int PrintService(const ServiceResponse& resp) {
  switch (resp.outcome_case()) {
    case ServiceResponse::kSuccess:
      std::cout << "success\n";
      return 0;
    case ServiceResponse::kRestarted:
      std::cout << "restarted\n";
      return 0;
    case ServiceResponse::kError:
      std::cerr << "error: " << resp.error().message() << "\n";
      return kExitOperation;
    default:
      std::cerr << "error: response without an outcome\n";
      return kExitOperation;
  }
}

int GenerateCertificate(const std::string& host, const std::string& dir) {
  const auto generated = nodeagent::tls::GenerateSelfSignedCertificate(host);

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "cannot create " << dir << ": " << ec.message() << "\n";
    return kExitOperation;
  }

  const auto cert_path = std::filesystem::path(dir) / (host + "-crt.pem");
  const auto key_path  = std::filesystem::path(dir) / (host + "-key.pem");

  auto status = nodeagent::storage::WriteFileAtomic(cert_path, generated.certificate_pem, 0644);
  if (status.ok()) status = nodeagent::storage::WriteFileAtomic(key_path, generated.private_key_pem, 0600);
  if (!status.ok()) {
    std::cerr << status.ToString() << "\n";
    return kExitOperation;
  }

  std::cout << "certificate=" << cert_path.string() << "\n";
  std::cout << "key=" << key_path.string() << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string first = argv[1];

  // ------------------------------------------------------------

  if (first == "gen-cert") {
    if (argc < 4) {
      Usage();
      return kExitUsage;
    }
    try {
      return GenerateCertificate(argv[2], argv[3]);
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return kExitOperation;
    }
  }

  const std::string cmd = argv[2];

  std::unique_ptr<AgentClient> client;
  try {
    auto config = nodeagent::config::ConfigLoader::LoadClientFromYaml(first);
    nodeagent::observability::InitializeLogging(config.logging(), "nodeagentctl");

    auto connected = AgentClient::Connect(config);
    if (!connected.ok()) {
      std::cerr << connected.status().ToString() << "\n";
      return kExitTransport;
    }
    client = std::move(connected).ValueOrDie();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }

  // ------------------------------------------------------------

  if (cmd == "install") {
    if (argc < 4) return kExitUsage;

    auto resp = client->InstallPackage(argv[3]);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return kExitTransport;
    }

    switch (resp->outcome_case()) {
      case InstallPackageResponse::kSuccess:
        std::cout << "installed\n";
        return 0;
      case InstallPackageResponse::kAlreadyInstalled:
        std::cout << "already installed\n";
        return 0;
      case InstallPackageResponse::kError:
        std::cerr << "error: " << resp->error().message() << "\n";
        return kExitOperation;
      default:
        std::cerr << "error: response without an outcome\n";
        return kExitOperation;
    }
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    std::optional<std::string> wrapper;
    if (argc >= 4) wrapper = argv[3];

    auto resp = client->StartService(wrapper);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return kExitTransport;
    }
    return PrintService(*resp);
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    if (argc < 4) return kExitUsage;

    auto resp = client->StopService(argv[3]);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return kExitTransport;
    }
    return PrintService(*resp);
  }

  // ------------------------------------------------------------

  if (cmd == "put") {
    if (argc < 5) return kExitUsage;

    uint32_t mode = 0;
    if (argc >= 6) {
      auto parsed = ParseMode(argv[5]);
      if (!parsed) {
        std::cerr << "invalid mode: " << argv[5] << "\n";
        return kExitUsage;
      }
      mode = *parsed;
    }

    auto result = client->UploadFile(argv[3], argv[4], mode);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return kExitTransport;
    }
    if (!result->success) {
      std::cerr << "error: " << result->error << "\n";
      return kExitOperation;
    }

    if (result->chunked) {
      std::cout << "complete chunks=" << result->total_chunks << " attempts=" << result->attempts << "\n";
    } else {
      std::cout << "success\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fetch") {
    if (argc < 5) return kExitUsage;

    auto resp = client->FetchFile(argv[3]);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return kExitTransport;
    }
    if (resp->has_error()) {
      std::cerr << "error: " << resp->error().message() << "\n";
      return kExitOperation;
    }

    const auto file        = nodeagent::transfer::CompressedFile::FromProto(resp->file());
    auto       destination = nodeagent::storage::ResolveTargetPath(argv[4], file.filename());
    auto       raw         = nodeagent::transfer::Decompress(file.compressed_bytes(), kMaxFetchedBytes);
    if (!destination.ok() || !raw.ok()) {
      std::cerr << (destination.ok() ? raw.status() : destination.status()).ToString() << "\n";
      return kExitOperation;
    }

    auto status = nodeagent::storage::WriteFileAtomic(*destination, *raw, nodeagent::storage::kDefaultFileMode);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return kExitOperation;
    }
    std::cout << "fetched " << destination->string() << " (" << raw->size() << " bytes)\n";
    return 0;
  }

  Usage();
  return kExitUsage;
}
