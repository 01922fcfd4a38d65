#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/grpc/agent_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/channel_admission.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/agent_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/system/blocking_executor.hpp"
#include "internal/system/package_manager.hpp"
#include "internal/system/service_controller.hpp"
#include "internal/tls/credentials.hpp"
#include "internal/transfer/registry_sweeper.hpp"
#include "internal/transfer/transfer_registry.hpp"
#include "internal/wire/codec.hpp"

namespace nodeagent::factory {

using nodeagent::observability::IntField;
using nodeagent::observability::StringField;

namespace {

// apt and pacman serialize on their own lock; never run two at once.
constexpr size_t kPackageManagerWorkers = 1;

} // namespace

Application::Application()                                  = default;
Application::~Application()                                 = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;

void Application::Start() {
  sweeper->Start();
  server->Start();
}

void Application::Stop() {
  if (server) server->Shutdown();
  if (sweeper) sweeper->Stop();
  if (executor) executor->Shutdown();
  if (package_executor) package_executor->Shutdown();
}

/*
    Build full application dependency graph
*/
Application Build(const nodeagent::runtime::config::RuntimeConfig& config) {
  Application app;

  const wire::FrameLimits limits(config.server().max_frame_length());

  // ------------------------------------------------------------------
  // TLS identity
  // ------------------------------------------------------------------
  const auto identity    = tls::LoadServerIdentity(config.tls());
  auto       credentials = tls::BuildServerCredentials(identity, config.tls());

  // ------------------------------------------------------------------
  // Host collaborators
  // ------------------------------------------------------------------
  const std::vector<std::string> search_dirs(config.system().package_manager_search_dirs().begin(),
                                             config.system().package_manager_search_dirs().end());
  std::shared_ptr<system::PackageManager> package_manager = system::DetectPackageManager(search_dirs, config.system().package_no_confirm());
  if (package_manager) {
    NODEAGENT_LOG_INFO("package manager detected", {StringField("name", package_manager->Name())});
  } else {
    NODEAGENT_LOG_WARN("no supported package manager found; install requests will fail");
  }

  auto services         = std::make_shared<system::SystemdServiceController>();
  app.executor         = std::make_shared<system::BlockingExecutor>(config.server().max_concurrent_channels());
  app.package_executor = std::make_shared<system::BlockingExecutor>(kPackageManagerWorkers);

  // ------------------------------------------------------------------
  // Transfers
  // ------------------------------------------------------------------
  auto registry = std::make_shared<transfer::TransferRegistry>();
  app.sweeper   = std::make_shared<transfer::RegistrySweeper>(registry, std::chrono::milliseconds(config.transfer().idle_timeout_ms()),
                                                              std::chrono::milliseconds(config.transfer().sweep_interval_ms()));

  // ------------------------------------------------------------------
  // Service + dispatch
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry               = registry;
  ctx.package_manager        = package_manager;
  ctx.services               = services;
  ctx.executor               = app.executor;
  ctx.package_executor       = app.package_executor;
  ctx.frame_limits           = limits;
  ctx.max_decompressed_bytes = config.transfer().max_decompressed_bytes();
  ctx.default_service_unit   = config.system().default_service_unit();

  auto agent_service = std::make_shared<service::AgentService>(std::move(ctx));
  auto dispatcher    = std::make_shared<dispatch::Dispatcher>(agent_service);

  runtime::ChannelAdmission::Limits admission_limits;
  admission_limits.max_per_peer   = config.server().max_channels_per_peer();
  admission_limits.max_concurrent = config.server().max_concurrent_channels();
  admission_limits.wait           = std::chrono::milliseconds(config.server().admission_wait_ms());
  auto admission                  = std::make_shared<runtime::ChannelAdmission>(admission_limits);

  // ------------------------------------------------------------------
  // gRPC server
  // ------------------------------------------------------------------
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
  grpc_services.push_back(std::make_shared<grpc::AgentServer>(dispatcher, admission, limits, config.server().bind_address()));

  runtime::Server::Options options;
  options.bind_address   = config.server().bind_address();
  options.credentials    = std::move(credentials);
  options.limits         = limits;
  options.max_threads    = runtime::ThreadBudget(config.server().max_concurrent_channels());
  options.shutdown_grace = std::chrono::milliseconds(config.server().shutdown_grace_ms());

  app.server = std::make_unique<runtime::Server>(std::move(options), std::move(grpc_services));

  NODEAGENT_LOG_DEBUG("application built", {IntField("max_channels_per_peer", admission_limits.max_per_peer),
                                            IntField("max_concurrent_channels", admission_limits.max_concurrent),
                                            IntField("chunk_size", static_cast<int64_t>(config.transfer().chunk_size()))});
  return app;
}

} // namespace nodeagent::factory
