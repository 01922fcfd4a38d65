#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace nodeagent::transfer {

inline constexpr size_t kTransferKeySize = 32;

// SHA-256 over the complete compressed payload of one transfer.
using TransferKey = std::array<uint8_t, kTransferKeySize>;

TransferKey ComputeTransferKey(std::string_view compressed_bytes);

// nullopt unless `bytes` is exactly kTransferKeySize long.
std::optional<TransferKey> TransferKeyFromBytes(std::string_view bytes);

std::string ToBytes(const TransferKey& key);
std::string ToHex(const TransferKey& key);

struct TransferKeyHash {
  size_t operator()(const TransferKey& key) const noexcept {
    size_t value = 0;
    std::memcpy(&value, key.data(), sizeof(value));
    return value;
  }
};

} // namespace nodeagent::transfer
