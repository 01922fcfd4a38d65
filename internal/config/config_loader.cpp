#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/wire/codec.hpp"

namespace nodeagent::config {

using nodeagent::runtime::config::ClientConfig;
using nodeagent::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress        = "[::]:8081";
constexpr uint32_t    kDefaultChannelsPerPeer    = 1;
constexpr uint32_t    kDefaultConcurrentChannels = 10;
constexpr uint64_t    kDefaultAdmissionWaitMs    = 30'000;
constexpr uint64_t    kDefaultShutdownGraceMs    = 5'000;
constexpr uint64_t    kDefaultIdleTimeoutMs      = 10 * 60 * 1000;
constexpr uint64_t    kDefaultSweepIntervalMs    = 30'000;
constexpr uint64_t    kDefaultMaxDecompressed    = 4ull * 1024 * 1024 * 1024;
constexpr const char* kDefaultServiceUnit        = "casper-node-launcher";
constexpr uint32_t    kDefaultInFlightChunks     = 4;
constexpr uint32_t    kDefaultTransferAttempts   = 3;
constexpr uint64_t    kDefaultConnectTimeoutMs   = 10'000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigError("Unsupported YAML node");
  }
}

void LoadYamlInto(const std::string& path, google::protobuf::Message* message) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
  }
}

void RequireNonEmpty(const std::string& value, const std::string& key) {
  if (value.empty()) {
    throw util::ConfigError(key + " must be set");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;
  LoadYamlInto(path, &config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

ClientConfig ConfigLoader::LoadClientFromYaml(const std::string& path) {
  ClientConfig config;
  LoadYamlInto(path, &config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);
  server->set_max_frame_length(wire::ResolveMaxFrameLength(server->max_frame_length()));
  if (server->max_channels_per_peer() == 0) server->set_max_channels_per_peer(kDefaultChannelsPerPeer);
  if (server->max_concurrent_channels() == 0) server->set_max_concurrent_channels(kDefaultConcurrentChannels);
  if (server->admission_wait_ms() == 0) server->set_admission_wait_ms(kDefaultAdmissionWaitMs);
  if (server->shutdown_grace_ms() == 0) server->set_shutdown_grace_ms(kDefaultShutdownGraceMs);

  auto* transfer = config->mutable_transfer();
  transfer->set_chunk_size(wire::ResolveChunkSize(transfer->chunk_size(), wire::FrameLimits(server->max_frame_length())));
  if (transfer->idle_timeout_ms() == 0) transfer->set_idle_timeout_ms(kDefaultIdleTimeoutMs);
  if (transfer->sweep_interval_ms() == 0) transfer->set_sweep_interval_ms(kDefaultSweepIntervalMs);
  if (transfer->max_decompressed_bytes() == 0) transfer->set_max_decompressed_bytes(kDefaultMaxDecompressed);

  auto* system = config->mutable_system();
  if (system->default_service_unit().empty()) system->set_default_service_unit(kDefaultServiceUnit);
  if (system->package_manager_search_dirs().empty()) {
    system->add_package_manager_search_dirs("/bin");
    system->add_package_manager_search_dirs("/usr/bin");
  }
}

void ConfigLoader::ApplyDefaults(ClientConfig* config) {
  config->set_max_frame_length(wire::ResolveMaxFrameLength(config->max_frame_length()));
  config->set_chunk_size(wire::ResolveChunkSize(config->chunk_size(), wire::FrameLimits(config->max_frame_length())));
  if (config->max_in_flight_chunks() == 0) config->set_max_in_flight_chunks(kDefaultInFlightChunks);
  if (config->transfer_attempts() == 0) config->set_transfer_attempts(kDefaultTransferAttempts);
  if (config->connect_timeout_ms() == 0) config->set_connect_timeout_ms(kDefaultConnectTimeoutMs);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  RequireNonEmpty(config.server().bind_address(), "server.bind_address");
  RequireNonEmpty(config.tls().cert_path(), "tls.cert_path");
  RequireNonEmpty(config.tls().key_path(), "tls.key_path");

  const wire::FrameLimits limits(config.server().max_frame_length());
  wire::ResolveChunkSize(config.transfer().chunk_size(), limits);

  if (config.server().max_channels_per_peer() > config.server().max_concurrent_channels()) {
    throw util::ConfigError("server.max_channels_per_peer must not exceed server.max_concurrent_channels");
  }
  if (config.transfer().sweep_interval_ms() > config.transfer().idle_timeout_ms()) {
    throw util::ConfigError("transfer.sweep_interval_ms must not exceed transfer.idle_timeout_ms");
  }
}

void ConfigLoader::Validate(const ClientConfig& config) {
  RequireNonEmpty(config.server_address(), "server_address");
  RequireNonEmpty(config.tls().pinned_server_cert_path(), "tls.pinned_server_cert_path");
  if (config.tls().cert_path().empty() != config.tls().key_path().empty()) {
    throw util::ConfigError("tls.cert_path and tls.key_path must be set together");
  }

  const wire::FrameLimits limits(config.max_frame_length());
  wire::ResolveChunkSize(config.chunk_size(), limits);
}

} // namespace nodeagent::config
