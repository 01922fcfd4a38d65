#include "content_hash.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace nodeagent::transfer {

TransferKey ComputeTransferKey(std::string_view compressed_bytes) {
  TransferKey  key{};
  unsigned int length = 0;
  if (EVP_Digest(compressed_bytes.data(), compressed_bytes.size(), key.data(), &length, EVP_sha256(), nullptr) != 1 ||
      length != kTransferKeySize) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return key;
}

std::optional<TransferKey> TransferKeyFromBytes(std::string_view bytes) {
  if (bytes.size() != kTransferKeySize) return std::nullopt;
  TransferKey key{};
  std::memcpy(key.data(), bytes.data(), kTransferKeySize);
  return key;
}

std::string ToBytes(const TransferKey& key) {
  return std::string(reinterpret_cast<const char*>(key.data()), key.size());
}

std::string ToHex(const TransferKey& key) {
  static constexpr char kDigits[] = "0123456789abcdef";

  std::string out;
  out.reserve(key.size() * 2);
  for (uint8_t byte : key) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0f]);
  }
  return out;
}

} // namespace nodeagent::transfer
