#include "compressed_file.hpp"

#include <arrow/util/compression.h>

#include <algorithm>
#include <utility>

#include "internal/storage/file_store.hpp"

namespace nodeagent::transfer {

CompressedFile::CompressedFile(std::string filename, std::string compressed_bytes)
    : filename_(std::move(filename)), compressed_bytes_(std::move(compressed_bytes)) {
}

TransferKey CompressedFile::Key() const {
  return ComputeTransferKey(compressed_bytes_);
}

nodeagent::v1::CompressedFile CompressedFile::ToProto() const {
  nodeagent::v1::CompressedFile proto;
  proto.set_filename(filename_);
  proto.set_compressed_bytes(compressed_bytes_);
  return proto;
}

CompressedFile CompressedFile::FromProto(const nodeagent::v1::CompressedFile& proto) {
  return CompressedFile(proto.filename(), proto.compressed_bytes());
}

arrow::Result<std::string> Compress(std::string_view raw, int level) {
  ARROW_ASSIGN_OR_RAISE(auto codec, arrow::util::Codec::Create(arrow::Compression::ZSTD, level));

  const auto* input   = reinterpret_cast<const uint8_t*>(raw.data());
  const auto  max_len = codec->MaxCompressedLen(static_cast<int64_t>(raw.size()), input);

  std::string out(static_cast<size_t>(max_len), '\0');
  ARROW_ASSIGN_OR_RAISE(auto written,
                        codec->Compress(static_cast<int64_t>(raw.size()), input, max_len, reinterpret_cast<uint8_t*>(out.data())));
  out.resize(static_cast<size_t>(written));
  return out;
}

arrow::Result<std::string> Decompress(std::string_view compressed, uint64_t max_output_bytes) {
  constexpr uint64_t kInitialWindow = 1 << 20;

  ARROW_ASSIGN_OR_RAISE(auto codec, arrow::util::Codec::Create(arrow::Compression::ZSTD));
  ARROW_ASSIGN_OR_RAISE(auto decompressor, codec->MakeDecompressor());

  std::string out;
  out.resize(static_cast<size_t>(std::min<uint64_t>(kInitialWindow, std::max<uint64_t>(max_output_bytes, 1))));

  const auto* input     = reinterpret_cast<const uint8_t*>(compressed.data());
  int64_t     remaining = static_cast<int64_t>(compressed.size());
  uint64_t    produced  = 0;

  while (!decompressor->IsFinished()) {
    if (produced == out.size()) {
      if (out.size() >= max_output_bytes) {
        return arrow::Status::CapacityError("decompressed size exceeds limit of ", max_output_bytes, " bytes");
      }
      out.resize(static_cast<size_t>(std::min<uint64_t>(out.size() * 2, max_output_bytes)));
    }

    ARROW_ASSIGN_OR_RAISE(auto step, decompressor->Decompress(remaining, input, static_cast<int64_t>(out.size() - produced),
                                                              reinterpret_cast<uint8_t*>(out.data()) + produced));
    input += step.bytes_read;
    remaining -= step.bytes_read;
    produced += static_cast<uint64_t>(step.bytes_written);

    if (step.bytes_read == 0 && step.bytes_written == 0 && !step.need_more_output) {
      // no progress and no pending output: the frame is truncated
      return arrow::Status::IOError("truncated zstd frame");
    }
  }

  if (remaining != 0) {
    return arrow::Status::IOError("trailing bytes after zstd frame");
  }

  out.resize(static_cast<size_t>(produced));
  return out;
}

arrow::Result<CompressedFile> CompressFile(const std::string& path) {
  return CompressFile(path, "");
}

arrow::Result<CompressedFile> CompressFile(const std::string& path, const std::string& filename) {
  std::string name = filename;
  if (name.empty()) {
    ARROW_ASSIGN_OR_RAISE(name, storage::FileNameOf(path));
  }

  ARROW_ASSIGN_OR_RAISE(auto raw, storage::ReadFile(path));
  ARROW_ASSIGN_OR_RAISE(auto compressed, Compress(raw));
  return CompressedFile(std::move(name), std::move(compressed));
}

} // namespace nodeagent::transfer
