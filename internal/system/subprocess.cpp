#include "subprocess.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace nodeagent::system {

namespace {

std::string Describe(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out.push_back(' ');
    out += arg;
  }
  return out;
}

} // namespace

SubprocessResult RunSubprocess(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw util::InvalidArgument("empty command line");
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw util::SubprocessError("pipe failed for '" + Describe(argv) + "': " + std::strerror(errno));
  }

  std::vector<std::string> argv_storage(argv);
  std::vector<char*>       argv_ptrs;
  argv_ptrs.reserve(argv_storage.size() + 1);
  for (auto& value : argv_storage) {
    argv_ptrs.push_back(value.data());
  }
  argv_ptrs.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    throw util::SubprocessError("fork failed for '" + Describe(argv) + "': " + std::strerror(errno));
  }

  if (pid == 0) {
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
      ::dup2(dev_null, STDIN_FILENO);
      if (dev_null > STDERR_FILENO) ::close(dev_null);
    }
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);

    ::execvp(argv_ptrs.front(), argv_ptrs.data());
    _exit(127);
  }

  ::close(fds[1]);

  SubprocessResult result;
  char             buffer[4096];
  while (true) {
    const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      result.output.append(buffer, static_cast<size_t>(n));
      if (result.output.size() > kMaxCapturedOutput) {
        result.output.erase(0, result.output.size() - kMaxCapturedOutput);
      }
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  ::close(fds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw util::SubprocessError("waitpid failed for '" + Describe(argv) + "': " + std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace nodeagent::system
