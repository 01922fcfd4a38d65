#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace {

using nodeagent::observability::IntField;
using nodeagent::observability::StringField;

void TestFieldsRenderAsKeyValue() {
  std::ostringstream out;
  auto               sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto               logger = std::make_shared<spdlog::logger>("nodeagent_logging_test", sink);
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);

  NODEAGENT_LOG_INFO("transfer completed", {StringField("path", "/var/lib/casper/bin"), IntField("chunks", 3)});
  NODEAGENT_LOG_WARN("no fields");
  logger->flush();

  const auto text = out.str();
  assert(text.find("info transfer completed path=/var/lib/casper/bin chunks=3\n") != std::string::npos);
  assert(text.find("warning no fields\n") != std::string::npos);
}

void TestLevelFromConfigAndEnvironment() {
  nodeagent::runtime::config::LoggingConfig config;
  config.set_level("warn");

  ::unsetenv("NODEAGENT_LOG_LEVEL");
  nodeagent::observability::InitializeLogging(config, "nodeagent_logging_level_test");
  assert(spdlog::default_logger()->level() == spdlog::level::warn);

  ::setenv("NODEAGENT_LOG_LEVEL", "debug", 1);
  nodeagent::observability::InitializeLogging(config, "nodeagent_logging_level_test");
  assert(spdlog::default_logger()->level() == spdlog::level::debug);
  ::unsetenv("NODEAGENT_LOG_LEVEL");
}

} // namespace

int main() {
  TestFieldsRenderAsKeyValue();
  TestLevelFromConfigAndEnvironment();

  std::cout << "nodeagent_unit_logging: pass\n";
  return 0;
}
