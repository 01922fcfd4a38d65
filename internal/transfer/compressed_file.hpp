#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <arrow/result.h>
#include <arrow/status.h>

#include "content_hash.hpp"
#include "nodeagent/v1.hpp"

namespace nodeagent::transfer {

inline constexpr int kCompressionLevel = 3;

/*
  A file's name plus its zstd-compressed contents.

  Immutable once constructed; moved across the wire as
  nodeagent.v1.CompressedFile or split into FileChunks.
*/
class CompressedFile {
 public:
  CompressedFile(std::string filename, std::string compressed_bytes);

  const std::string& filename() const {
    return filename_;
  }

  const std::string& compressed_bytes() const {
    return compressed_bytes_;
  }

  uint64_t size() const {
    return compressed_bytes_.size();
  }

  TransferKey Key() const;

  nodeagent::v1::CompressedFile ToProto() const;
  static CompressedFile         FromProto(const nodeagent::v1::CompressedFile& proto);

 private:
  std::string filename_;
  std::string compressed_bytes_;
};

arrow::Result<std::string> Compress(std::string_view raw, int level = kCompressionLevel);

// Fails once the output would exceed `max_output_bytes` or the input is not one complete zstd frame.
arrow::Result<std::string> Decompress(std::string_view compressed, uint64_t max_output_bytes);

// Reads `path` fully and compresses it; the filename is the last path component.
arrow::Result<CompressedFile> CompressFile(const std::string& path);

// Same, naming the result `filename` when it is non-empty.
arrow::Result<CompressedFile> CompressFile(const std::string& path, const std::string& filename);

} // namespace nodeagent::transfer
