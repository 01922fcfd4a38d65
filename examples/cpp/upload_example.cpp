#include <iostream>
#include <string>

#include "client/cpp/agent_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/transfer/compressed_file.hpp"

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "usage: upload_example <client.yaml> <local_file> <remote_path>\n";
    return 1;
  }

  nodeagent::runtime::config::ClientConfig config;
  try {
    config = nodeagent::config::ConfigLoader::LoadClientFromYaml(argv[1]);
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  auto connected = nodeagent::client::AgentClient::Connect(config);
  if (!connected.ok()) {
    std::cerr << "Connect failed: " << connected.status().ToString() << '\n';
    return 1;
  }
  auto client = std::move(connected).ValueOrDie();

  // Compress locally once so the same bytes can be sent whole or in chunks.
  auto file = nodeagent::transfer::CompressFile(argv[2]);
  if (!file.ok()) {
    std::cerr << "CompressFile failed: " << file.status().ToString() << '\n';
    return 1;
  }
  std::cout << "compressed " << argv[2] << " to " << file->size() << " bytes, chunk size " << client->chunk_size() << '\n';

  // Force the chunked path even for small files to show the protocol.
  auto uploaded = client->UploadChunked(*file, argv[3], 0644);
  if (!uploaded.ok()) {
    std::cerr << "UploadChunked failed: " << uploaded.status().ToString() << '\n';
    return 1;
  }
  if (!uploaded->success) {
    std::cerr << "transfer failed after " << uploaded->attempts << " attempt(s): " << uploaded->error << '\n';
    return 1;
  }
  std::cout << "uploaded " << uploaded->total_chunks << " chunk(s)\n";

  // Read it back through fetch_file.
  auto fetched = client->FetchFile(argv[3]);
  if (!fetched.ok()) {
    std::cerr << "FetchFile failed: " << fetched.status().ToString() << '\n';
    return 1;
  }
  if (fetched->has_error()) {
    std::cerr << "fetch error: " << fetched->error().message() << '\n';
    return 1;
  }

  std::cout << "fetched " << fetched->file().filename() << " (" << fetched->file().compressed_bytes().size() << " compressed bytes)\n";

  auto closed = client->Close();
  if (!closed.ok()) {
    std::cerr << "Close failed: " << closed.ToString() << '\n';
    return 1;
  }
  return 0;
}
