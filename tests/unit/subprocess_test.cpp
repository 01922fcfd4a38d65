#include "internal/system/subprocess.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using nodeagent::system::RunSubprocess;

void TestCapturesOutputAndExitCode() {
  const auto ok = RunSubprocess({"sh", "-c", "echo hello; echo oops 1>&2"});
  assert(ok.ok());
  assert(ok.output.find("hello") != std::string::npos);
  assert(ok.output.find("oops") != std::string::npos);

  const auto failed = RunSubprocess({"sh", "-c", "exit 3"});
  assert(!failed.ok());
  assert(failed.exit_code == 3);
}

void TestMissingExecutableExits127() {
  const auto result = RunSubprocess({"nodeagent-definitely-not-a-command"});
  assert(result.exit_code == 127);
}

void TestSignalledChildReports128PlusSignal() {
  const auto result = RunSubprocess({"sh", "-c", "kill -9 $$"});
  assert(result.exit_code == 128 + 9);
}

void TestStdinIsClosed() {
  // cat on /dev/null terminates immediately instead of blocking.
  const auto result = RunSubprocess({"cat"});
  assert(result.ok());
  assert(result.output.empty());
}

void TestOutputIsTailTruncated() {
  const auto result = RunSubprocess({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' a; echo END"});
  assert(result.ok());
  assert(result.output.size() == nodeagent::system::kMaxCapturedOutput);
  assert(result.output.substr(result.output.size() - 4) == "END\n");
}

void TestEmptyArgvIsRejected() {
  bool threw = false;
  try {
    (void)RunSubprocess({});
  } catch (const nodeagent::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCapturesOutputAndExitCode();
  TestMissingExecutableExits127();
  TestSignalledChildReports128PlusSignal();
  TestStdinIsClosed();
  TestOutputIsTailTruncated();
  TestEmptyArgvIsRejected();

  std::cout << "nodeagent_unit_subprocess: pass\n";
  return 0;
}
