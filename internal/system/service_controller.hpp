#pragma once

#include <string>

#include "subprocess.hpp"

namespace nodeagent::system {

enum class StartOutcome {
  kStarted,
  kRestarted,
};

/*
  Service lifecycle hooks. Failures throw util::SubprocessError carrying
  the command output.
*/
class ServiceController {
 public:
  virtual ~ServiceController() = default;

  // Starts `unit`, or restarts it when it is already active.
  virtual StartOutcome Start(const std::string& unit) = 0;
  virtual void         Stop(const std::string& unit)  = 0;
};

class SystemdServiceController final : public ServiceController {
 public:
  explicit SystemdServiceController(CommandRunner runner = RunSubprocess);

  StartOutcome Start(const std::string& unit) override;
  void         Stop(const std::string& unit) override;

 private:
  void Systemctl(const std::string& verb, const std::string& unit);

  CommandRunner runner_;
};

// Throws util::InvalidArgument for names that are empty, start with '-' or contain whitespace or '/'.
void ValidateUnitName(const std::string& unit);

} // namespace nodeagent::system
