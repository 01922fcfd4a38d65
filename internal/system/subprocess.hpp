#pragma once

#include <functional>
#include <string>
#include <vector>

namespace nodeagent::system {

struct SubprocessResult {
  int         exit_code = -1;
  std::string output;  // stdout and stderr interleaved, tail-truncated

  bool ok() const {
    return exit_code == 0;
  }
};

inline constexpr size_t kMaxCapturedOutput = 64 * 1024;

/*
  Runs argv[0] (looked up on PATH) with stdin on /dev/null and waits for it.
  Throws util::SubprocessError only when the process cannot be spawned; a
  non-zero exit is reported through the result. A missing executable exits
  with 127.
*/
SubprocessResult RunSubprocess(const std::vector<std::string>& argv);

// Seam for tests and for running commands elsewhere.
using CommandRunner = std::function<SubprocessResult(const std::vector<std::string>&)>;

} // namespace nodeagent::system
