#pragma once

#include <cstdint>
#include <string_view>

#include <google/protobuf/message_lite.h>

namespace nodeagent::wire {

/*
  Wire codec bounds.

  Messages are protobuf-encoded and carried as gRPC length-prefixed frames.
  The schema (proto/nodeagent/v1/agent.proto) is compiled into both binaries
  and never negotiated. Every frame is bounded by a finite max_frame_length
  on both the send and the receive side.
*/

inline constexpr uint64_t kKiB = 1024;
inline constexpr uint64_t kMiB = 1024 * kKiB;

inline constexpr uint64_t kDefaultMaxFrameLength = 16 * kMiB;
inline constexpr uint64_t kMinFrameLength        = 128 * kKiB;
inline constexpr uint64_t kMaxFrameLengthCeiling = 64 * kMiB;

// Room reserved in a chunk frame for hash, path, filename and field tags.
inline constexpr uint64_t kEnvelopeAllowance = 64 * kKiB;

inline constexpr uint64_t kDefaultChunkSize = 5 * kMiB;

// 0 selects the default; values outside [kMinFrameLength, kMaxFrameLengthCeiling] throw ConfigError.
uint64_t ResolveMaxFrameLength(uint64_t configured);

class FrameLimits {
 public:
  explicit FrameLimits(uint64_t max_frame_length = kDefaultMaxFrameLength);

  uint64_t max_frame_length() const {
    return max_frame_length_;
  }

  // Value handed to gRPC's max send/receive message size knobs.
  int grpc_message_size() const;

  uint64_t max_chunk_size() const {
    return max_frame_length_ - kEnvelopeAllowance;
  }

  bool Fits(const google::protobuf::MessageLite& message) const;

  // Throws util::FrameTooLarge naming `what` when the encoded message exceeds the bound.
  void EnsureFits(const google::protobuf::MessageLite& message, std::string_view what) const;

 private:
  uint64_t max_frame_length_;
};

// 0 selects min(kDefaultChunkSize, limits.max_chunk_size()); oversized values throw ConfigError.
uint64_t ResolveChunkSize(uint64_t configured, const FrameLimits& limits);

} // namespace nodeagent::wire
