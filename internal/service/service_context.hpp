#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/wire/codec.hpp"

namespace nodeagent::transfer { class TransferRegistry; }
namespace nodeagent::system { class PackageManager; class ServiceController; class BlockingExecutor; }

namespace nodeagent::service {

/*
  Dependency container for the agent service.

  package_manager is null when no supported package manager was detected.
  Package-manager jobs run on package_executor, systemctl jobs on executor.
*/
struct ServiceContext {
  std::shared_ptr<nodeagent::transfer::TransferRegistry>  registry;
  std::shared_ptr<nodeagent::system::PackageManager>      package_manager;
  std::shared_ptr<nodeagent::system::ServiceController>   services;
  std::shared_ptr<nodeagent::system::BlockingExecutor>    executor;
  std::shared_ptr<nodeagent::system::BlockingExecutor>    package_executor;  // one worker; package managers hold a global lock

  nodeagent::wire::FrameLimits frame_limits;
  uint64_t                     max_decompressed_bytes = 4ull * 1024 * 1024 * 1024;
  std::string                  default_service_unit;
};

} // namespace nodeagent::service
