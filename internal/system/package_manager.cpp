#include "package_manager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "internal/util/errors.hpp"

namespace nodeagent::system {

void ValidatePackageName(const std::string& package) {
  if (package.empty()) {
    throw util::InvalidArgument("package name is empty");
  }
  if (package.front() == '-') {
    throw util::InvalidArgument("package name '" + package + "' must not start with '-'");
  }
  if (std::any_of(package.begin(), package.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
    throw util::InvalidArgument("package name '" + package + "' contains whitespace or control characters");
  }
}

// ------------------------------------------------------------
// Apt
// ------------------------------------------------------------

Apt::Apt(CommandRunner runner) : runner_(std::move(runner)) {
}

std::string Apt::Name() const {
  return "apt";
}

bool Apt::IsInstalled(const std::string& package) {
  ValidatePackageName(package);
  return runner_({"dpkg", "-s", package}).ok();
}

SubprocessResult Apt::Install(const std::string& package) {
  ValidatePackageName(package);
  std::vector<std::string> argv{"apt-get", "install", package};
  if (no_confirm_) argv.push_back("-y");
  return runner_(argv);
}

SubprocessResult Apt::Uninstall(const std::string& package) {
  ValidatePackageName(package);
  std::vector<std::string> argv{"apt-get", "remove", package};
  if (no_confirm_) argv.push_back("-y");
  return runner_(argv);
}

void Apt::SetNoConfirm(bool no_confirm) {
  no_confirm_ = no_confirm;
}

// ------------------------------------------------------------
// Pacman
// ------------------------------------------------------------

Pacman::Pacman(CommandRunner runner) : runner_(std::move(runner)) {
}

std::string Pacman::Name() const {
  return "pacman";
}

bool Pacman::IsInstalled(const std::string& package) {
  ValidatePackageName(package);
  return runner_({"pacman", "-Q", package}).ok();
}

SubprocessResult Pacman::Install(const std::string& package) {
  ValidatePackageName(package);
  std::vector<std::string> argv{"pacman", "-Sy", package};
  if (no_confirm_) argv.push_back("--noconfirm");
  return runner_(argv);
}

SubprocessResult Pacman::Uninstall(const std::string& package) {
  ValidatePackageName(package);
  std::vector<std::string> argv{"pacman", "-Rns", package};
  if (no_confirm_) argv.push_back("--noconfirm");
  return runner_(argv);
}

void Pacman::SetNoConfirm(bool no_confirm) {
  no_confirm_ = no_confirm;
}

// ------------------------------------------------------------
// Detection
// ------------------------------------------------------------

std::unique_ptr<PackageManager> DetectPackageManager(const std::vector<std::string>& search_dirs, bool no_confirm, CommandRunner runner) {
  std::vector<std::unique_ptr<PackageManager>> candidates;
  candidates.push_back(std::make_unique<Pacman>(runner));
  candidates.push_back(std::make_unique<Apt>(runner));

  for (auto& candidate : candidates) {
    for (const auto& dir : search_dirs) {
      std::error_code ec;
      if (std::filesystem::exists(std::filesystem::path(dir) / candidate->Name(), ec)) {
        candidate->SetNoConfirm(no_confirm);
        return std::move(candidate);
      }
    }
  }
  return nullptr;
}

} // namespace nodeagent::system
