#pragma once

#include <string>

#include "config/config.pb.h"

namespace nodeagent::config {

/*
  Loads RuntimeConfig (daemon) and ClientConfig (ctl / client library) from
  YAML files.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Defaults are applied after parsing and the result is validated.
  Every failure surfaces as util::ConfigError.
*/
class ConfigLoader {
 public:
  static nodeagent::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static nodeagent::runtime::config::ClientConfig  LoadClientFromYaml(const std::string& path);

  static void ApplyDefaults(nodeagent::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(nodeagent::runtime::config::ClientConfig* config);

  static void Validate(const nodeagent::runtime::config::RuntimeConfig& config);
  static void Validate(const nodeagent::runtime::config::ClientConfig& config);
};

} // namespace nodeagent::config
