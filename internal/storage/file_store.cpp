#include "file_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/file.h>

#include <unistd.h>

#include <atomic>
#include <system_error>

namespace nodeagent::storage {

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> g_next_temp_id{1};

// Unique per process and per call, so concurrent writers of one destination never share a temp file.
std::string TempPathFor(const fs::path& destination) {
  return destination.string() + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_next_temp_id.fetch_add(1));
}

} // namespace

arrow::Result<std::string> ReadFile(const std::string& path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return arrow::Status::IOError("cannot read ", path, ": is a directory");
  }

  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto size, file->GetSize());
  ARROW_ASSIGN_OR_RAISE(auto buffer, file->Read(size));
  ARROW_RETURN_NOT_OK(file->Close());
  return buffer->ToString();
}

arrow::Result<std::string> FileNameOf(const std::string& path) {
  const auto name = fs::path(path).filename().string();
  if (name.empty() || name == "." || name == "..") {
    return arrow::Status::Invalid("no filename derivable from path '", path, "'");
  }
  return name;
}

arrow::Result<uint32_t> ResolveFileMode(uint32_t requested) {
  if (requested == 0) return kDefaultFileMode;
  if (requested > kMaxFileMode) {
    return arrow::Status::Invalid("file mode ", requested, " exceeds 07777");
  }
  return requested;
}

arrow::Result<fs::path> ResolveTargetPath(const std::string& target_path, const std::string& filename) {
  if (target_path.empty()) {
    return arrow::Status::Invalid("target path is empty");
  }

  std::error_code ec;
  fs::path        destination(target_path);
  if (target_path.back() == '/' || fs::is_directory(destination, ec)) {
    ARROW_ASSIGN_OR_RAISE(auto name, FileNameOf(filename));
    destination /= name;
  }

  const auto parent = destination.parent_path();
  if (!parent.empty() && !fs::is_directory(parent, ec)) {
    return arrow::Status::IOError("target directory ", parent.string(), " does not exist");
  }
  return destination;
}

arrow::Status WriteFileAtomic(const fs::path& destination, std::string_view contents, uint32_t mode) {
  const auto tmp_path = TempPathFor(destination);

  auto write = [&]() -> arrow::Status {
    ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(tmp_path));
    ARROW_RETURN_NOT_OK(out->Write(contents.data(), static_cast<int64_t>(contents.size())));
    ARROW_RETURN_NOT_OK(out->Flush());
    ARROW_RETURN_NOT_OK(out->Close());

    std::error_code ec;
    fs::permissions(tmp_path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    if (ec) return arrow::Status::IOError("chmod ", tmp_path, ": ", ec.message());

    fs::rename(tmp_path, destination, ec);
    if (ec) return arrow::Status::IOError("rename ", tmp_path, " -> ", destination.string(), ": ", ec.message());
    return arrow::Status::OK();
  };

  auto status = write();
  if (!status.ok()) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
  }
  return status;
}

} // namespace nodeagent::storage
