#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace nodeagent::runtime { class Server; }
namespace nodeagent::system { class BlockingExecutor; }
namespace nodeagent::transfer { class RegistrySweeper; }

namespace nodeagent::factory {

/*
  Application

  Owns every long-lived object of the daemon. Everything here lives for the
  lifetime of the process; Stop tears it down in reverse dependency order.
*/
struct Application {
  std::unique_ptr<nodeagent::runtime::Server>               server;
  std::shared_ptr<nodeagent::transfer::RegistrySweeper>     sweeper;
  std::shared_ptr<nodeagent::system::BlockingExecutor>      executor;
  std::shared_ptr<nodeagent::system::BlockingExecutor>      package_executor;

  Application();
  ~Application();
  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;

  void Start();
  void Stop();
};

/*
  Build

  Composition root. The only place that knows concrete collaborator types
  (systemd, apt/pacman, gRPC credentials). Throws util::ConfigError when the
  TLS identity cannot be loaded.
*/
Application Build(const nodeagent::runtime::config::RuntimeConfig& config);

} // namespace nodeagent::factory
