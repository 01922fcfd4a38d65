#include "peer_address.hpp"

#include <charconv>

namespace nodeagent::transport {

namespace {

std::string DecodeBrackets(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      const std::string_view code = text.substr(i + 1, 2);
      if (code == "5B" || code == "5b") {
        out.push_back('[');
        i += 2;
        continue;
      }
      if (code == "5D" || code == "5d") {
        out.push_back(']');
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::optional<uint16_t> ParsePort(std::string_view text) {
  if (text.empty()) return std::nullopt;
  unsigned int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value > 65535) return std::nullopt;
  return static_cast<uint16_t>(value);
}

} // namespace

std::string PeerAddress::ToString() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::optional<PeerAddress> ParsePeerAddress(std::string_view grpc_peer) {
  constexpr std::string_view kIpv4 = "ipv4:";
  constexpr std::string_view kIpv6 = "ipv6:";

  if (grpc_peer.substr(0, kIpv4.size()) == kIpv4) {
    const std::string_view rest  = grpc_peer.substr(kIpv4.size());
    const auto             colon = rest.rfind(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    auto port = ParsePort(rest.substr(colon + 1));
    if (!port) return std::nullopt;
    return PeerAddress{std::string(rest.substr(0, colon)), *port};
  }

  if (grpc_peer.substr(0, kIpv6.size()) == kIpv6) {
    const std::string decoded = DecodeBrackets(grpc_peer.substr(kIpv6.size()));
    if (decoded.empty() || decoded.front() != '[') return std::nullopt;
    const auto close = decoded.find(']');
    if (close == std::string::npos || close + 1 >= decoded.size() || decoded[close + 1] != ':') return std::nullopt;
    auto port = ParsePort(std::string_view(decoded).substr(close + 2));
    if (!port) return std::nullopt;
    return PeerAddress{decoded.substr(1, close - 1), *port};
  }

  return std::nullopt;
}

std::string PeerKey(std::string_view grpc_peer) {
  if (auto parsed = ParsePeerAddress(grpc_peer)) {
    return parsed->host;
  }
  return std::string(grpc_peer);
}

} // namespace nodeagent::transport
