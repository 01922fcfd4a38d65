#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <arrow/result.h>
#include <arrow/status.h>

namespace nodeagent::storage {

inline constexpr uint32_t kDefaultFileMode = 0644;
inline constexpr uint32_t kMaxFileMode     = 07777;

/*
  Local file access for the put/fetch operations.
*/

arrow::Result<std::string> ReadFile(const std::string& path);

// Last path component; Invalid when the path has none ("", "/", "..").
arrow::Result<std::string> FileNameOf(const std::string& path);

// 0 -> kDefaultFileMode; anything above kMaxFileMode is Invalid.
arrow::Result<uint32_t> ResolveFileMode(uint32_t requested);

/*
  Destination for an incoming file. A target naming an existing directory,
  or ending in '/', receives `filename` (its last component only).
*/
arrow::Result<std::filesystem::path> ResolveTargetPath(const std::string& target_path, const std::string& filename);

/*
  Atomic write:
      write <dest>.tmp.<pid>.<n> -> chmod -> rename
  The temporary file is removed on failure.
*/
arrow::Status WriteFileAtomic(const std::filesystem::path& destination, std::string_view contents, uint32_t mode);

} // namespace nodeagent::storage
