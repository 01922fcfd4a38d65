#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: nodeagentd <config.yaml> OR nodeagentd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = nodeagent::config::ConfigLoader::LoadFromYaml(config_path);

    nodeagent::observability::InitializeTracing(config.observability());
    nodeagent::observability::InitializeMetrics(config.observability());
    nodeagent::observability::InitializeLogging(config.logging(), "nodeagentd");

    // ------------------------------------------------------------
    // Build application (dependency graph, TLS identity)
    // ------------------------------------------------------------
    auto app = nodeagent::factory::Build(config);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    NODEAGENT_LOG_INFO("nodeagentd started", {nodeagent::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    NODEAGENT_LOG_INFO("Shutting down nodeagentd");

    app.Stop();
    nodeagent::observability::ShutdownLogging();
    nodeagent::observability::ShutdownMetrics();
    nodeagent::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    NODEAGENT_LOG_ERROR("Fatal error", {nodeagent::observability::StringField("error", e.what())});
    nodeagent::observability::ShutdownLogging();
    nodeagent::observability::ShutdownMetrics();
    nodeagent::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
