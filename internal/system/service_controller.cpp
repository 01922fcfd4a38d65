#include "service_controller.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace nodeagent::system {

void ValidateUnitName(const std::string& unit) {
  if (unit.empty()) {
    throw util::InvalidArgument("service name is empty");
  }
  if (unit.front() == '-') {
    throw util::InvalidArgument("service name '" + unit + "' must not start with '-'");
  }
  if (std::any_of(unit.begin(), unit.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c) || c == '/'; })) {
    throw util::InvalidArgument("service name '" + unit + "' contains invalid characters");
  }
}

SystemdServiceController::SystemdServiceController(CommandRunner runner) : runner_(std::move(runner)) {
}

StartOutcome SystemdServiceController::Start(const std::string& unit) {
  ValidateUnitName(unit);

  if (runner_({"systemctl", "is-active", "--quiet", unit}).ok()) {
    Systemctl("restart", unit);
    return StartOutcome::kRestarted;
  }

  Systemctl("start", unit);
  return StartOutcome::kStarted;
}

void SystemdServiceController::Stop(const std::string& unit) {
  ValidateUnitName(unit);
  Systemctl("stop", unit);
}

void SystemdServiceController::Systemctl(const std::string& verb, const std::string& unit) {
  auto result = runner_({"systemctl", verb, unit});
  if (!result.ok()) {
    throw util::SubprocessError("systemctl " + verb + " " + unit + " exited with " + std::to_string(result.exit_code) +
                                (result.output.empty() ? "" : ": " + result.output));
  }
}

} // namespace nodeagent::system
