#include "internal/storage/file_store.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;

using nodeagent::storage::ResolveFileMode;
using nodeagent::storage::ResolveTargetPath;
using nodeagent::storage::WriteFileAtomic;

fs::path TestDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "nodeagent_file_store_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

// Anything in `dir` besides `keep`, e.g. a leaked temp file.
size_t StrayEntries(const fs::path& dir, const fs::path& keep) {
  size_t stray = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path() != keep) ++stray;
  }
  return stray;
}

uint32_t ModeOf(const fs::path& path) {
  struct stat st {};
  const int rc = ::stat(path.c_str(), &st);
  assert(rc == 0);
  return st.st_mode & 07777;
}

void TestFileModeResolution() {
  assert(*ResolveFileMode(0) == 0644);
  assert(*ResolveFileMode(0755) == 0755);
  assert(*ResolveFileMode(07777) == 07777);
  assert(!ResolveFileMode(010000).ok());
}

void TestTargetPathResolution() {
  const auto dir = TestDir("resolve");

  auto plain = ResolveTargetPath((dir / "out.bin").string(), "ignored.bin");
  assert(plain.ok());
  assert(*plain == dir / "out.bin");

  auto into_dir = ResolveTargetPath(dir.string(), "artifact.tar");
  assert(into_dir.ok());
  assert(*into_dir == dir / "artifact.tar");

  auto trailing = ResolveTargetPath(dir.string() + "/", "../../escape.bin");
  assert(trailing.ok());
  assert(*trailing == dir / "escape.bin");

  auto missing_parent = ResolveTargetPath((dir / "nope" / "out.bin").string(), "x");
  assert(!missing_parent.ok());

  auto empty = ResolveTargetPath("", "x");
  assert(!empty.ok());
}

void TestAtomicWriteAppliesMode() {
  const auto dir  = TestDir("write");
  const auto path = dir / "secret.pem";

  auto status = WriteFileAtomic(path, "-----BEGIN-----\n", 0600);
  assert(status.ok());
  assert(StrayEntries(dir, path) == 0);
  assert(ModeOf(path) == 0600);

  auto read = nodeagent::storage::ReadFile(path.string());
  assert(read.ok());
  assert(*read == "-----BEGIN-----\n");

  // Overwrite replaces contents and mode.
  status = WriteFileAtomic(path, "v2", 0640);
  assert(status.ok());
  assert(*nodeagent::storage::ReadFile(path.string()) == "v2");
  assert(ModeOf(path) == 0640);
}

void TestWriteIntoMissingDirectoryFailsCleanly() {
  const auto dir    = TestDir("write_fail");
  const auto path   = dir / "missing" / "file";
  auto       status = WriteFileAtomic(path, "x", 0644);
  assert(!status.ok());
  assert(fs::is_empty(dir));
}

void TestConcurrentWritersOfOneDestination() {
  const auto dir  = TestDir("concurrent");
  const auto path = dir / "casper-node";

  constexpr int            kWriters = 8;
  std::vector<std::string> contents;
  for (int i = 0; i < kWriters; ++i) contents.push_back(std::string(64 * 1024, static_cast<char>('a' + i)));

  std::atomic<int>         failures{0};
  std::vector<std::thread> writers;
  for (int i = 0; i < kWriters; ++i) {
    writers.emplace_back([&, i] {
      for (int round = 0; round < 20; ++round) {
        if (!WriteFileAtomic(path, contents[i], 0755).ok()) ++failures;
      }
    });
  }
  for (auto& t : writers) t.join();

  assert(failures.load() == 0);
  assert(StrayEntries(dir, path) == 0);

  // Whole contents of exactly one writer, never a mix.
  const auto final_contents = *nodeagent::storage::ReadFile(path.string());
  assert(std::find(contents.begin(), contents.end(), final_contents) != contents.end());
}

void TestReadFileErrors() {
  const auto dir = TestDir("read");
  assert(!nodeagent::storage::ReadFile((dir / "absent").string()).ok());
  assert(!nodeagent::storage::ReadFile(dir.string()).ok());
}

void TestFileNameOf() {
  assert(*nodeagent::storage::FileNameOf("/var/lib/casper/bin/casper-node") == "casper-node");
  assert(!nodeagent::storage::FileNameOf("/").ok());
  assert(!nodeagent::storage::FileNameOf("").ok());
}

} // namespace

int main() {
  TestFileModeResolution();
  TestTargetPathResolution();
  TestAtomicWriteAppliesMode();
  TestWriteIntoMissingDirectoryFailsCleanly();
  TestConcurrentWritersOfOneDestination();
  TestReadFileErrors();
  TestFileNameOf();

  std::cout << "nodeagent_unit_file_store: pass\n";
  return 0;
}
