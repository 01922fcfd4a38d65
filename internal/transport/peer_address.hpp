#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nodeagent::transport {

/*
  Socket address of a channel endpoint.

  gRPC reports peers as URIs: "ipv4:10.0.0.5:40112",
  "ipv6:[::1]:40112" (older releases) or "ipv6:%5B::1%5D:40112".
*/
struct PeerAddress {
  std::string host;
  uint16_t    port = 0;

  std::string ToString() const;
};

std::optional<PeerAddress> ParsePeerAddress(std::string_view grpc_peer);

// Key used for per-peer admission: the IP when parsable, the raw string otherwise.
std::string PeerKey(std::string_view grpc_peer);

} // namespace nodeagent::transport
