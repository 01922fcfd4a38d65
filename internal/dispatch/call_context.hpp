#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nodeagent::dispatch {

/*
  Per-call context, created fresh for every decoded request.
*/
struct CallContext {
  std::string                           peer;
  uint64_t                              channel_id = 0;
  uint64_t                              request_id = 0;
  std::chrono::steady_clock::time_point received_at;
};

} // namespace nodeagent::dispatch
