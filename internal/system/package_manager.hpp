#pragma once

#include <memory>
#include <string>
#include <vector>

#include "subprocess.hpp"

namespace nodeagent::system {

/*
  OS package-manager shim.

  One concrete variant is chosen at startup by probing the search
  directories for its executable.
*/
class PackageManager {
 public:
  virtual ~PackageManager() = default;

  virtual std::string      Name() const                            = 0;
  virtual bool             IsInstalled(const std::string& package) = 0;
  virtual SubprocessResult Install(const std::string& package)     = 0;
  virtual SubprocessResult Uninstall(const std::string& package)   = 0;
  virtual void             SetNoConfirm(bool no_confirm)           = 0;
};

// Debian family: dpkg -s / apt-get install / apt-get remove.
class Apt final : public PackageManager {
 public:
  explicit Apt(CommandRunner runner = RunSubprocess);

  std::string      Name() const override;
  bool             IsInstalled(const std::string& package) override;
  SubprocessResult Install(const std::string& package) override;
  SubprocessResult Uninstall(const std::string& package) override;
  void             SetNoConfirm(bool no_confirm) override;

 private:
  CommandRunner runner_;
  bool          no_confirm_ = false;
};

// Arch family: pacman -Q / -Sy / -Rns.
class Pacman final : public PackageManager {
 public:
  explicit Pacman(CommandRunner runner = RunSubprocess);

  std::string      Name() const override;
  bool             IsInstalled(const std::string& package) override;
  SubprocessResult Install(const std::string& package) override;
  SubprocessResult Uninstall(const std::string& package) override;
  void             SetNoConfirm(bool no_confirm) override;

 private:
  CommandRunner runner_;
  bool          no_confirm_ = false;
};

// Throws util::InvalidArgument for names that are empty, start with '-' or contain whitespace.
void ValidatePackageName(const std::string& package);

/*
  Returns the first candidate (pacman, then apt) whose executable exists in
  one of `search_dirs`, with no-confirm applied; nullptr when none matches.
*/
std::unique_ptr<PackageManager> DetectPackageManager(const std::vector<std::string>& search_dirs, bool no_confirm,
                                                     CommandRunner runner = RunSubprocess);

} // namespace nodeagent::system
