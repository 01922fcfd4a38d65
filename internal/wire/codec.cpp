#include "codec.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace nodeagent::wire {

uint64_t ResolveMaxFrameLength(uint64_t configured) {
  if (configured == 0) {
    return kDefaultMaxFrameLength;
  }
  if (configured < kMinFrameLength) {
    throw util::ConfigError("max_frame_length " + std::to_string(configured) + " is below the minimum of " +
                            std::to_string(kMinFrameLength) + " bytes");
  }
  if (configured > kMaxFrameLengthCeiling) {
    throw util::ConfigError("max_frame_length " + std::to_string(configured) + " exceeds the ceiling of " +
                            std::to_string(kMaxFrameLengthCeiling) + " bytes");
  }
  return configured;
}

FrameLimits::FrameLimits(uint64_t max_frame_length) : max_frame_length_(ResolveMaxFrameLength(max_frame_length)) {
}

int FrameLimits::grpc_message_size() const {
  return static_cast<int>(max_frame_length_);
}

bool FrameLimits::Fits(const google::protobuf::MessageLite& message) const {
  return static_cast<uint64_t>(message.ByteSizeLong()) <= max_frame_length_;
}

void FrameLimits::EnsureFits(const google::protobuf::MessageLite& message, std::string_view what) const {
  const auto encoded = static_cast<uint64_t>(message.ByteSizeLong());
  if (encoded > max_frame_length_) {
    throw util::FrameTooLarge(std::string(what) + " encodes to " + std::to_string(encoded) + " bytes, frame limit is " +
                              std::to_string(max_frame_length_));
  }
}

uint64_t ResolveChunkSize(uint64_t configured, const FrameLimits& limits) {
  if (configured == 0) {
    return std::min(kDefaultChunkSize, limits.max_chunk_size());
  }
  if (configured > limits.max_chunk_size()) {
    throw util::ConfigError("chunk_size " + std::to_string(configured) + " does not fit a " + std::to_string(limits.max_frame_length()) +
                            " byte frame (at most " + std::to_string(limits.max_chunk_size()) + ")");
  }
  return configured;
}

} // namespace nodeagent::wire
