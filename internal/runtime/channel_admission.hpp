#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nodeagent::runtime {

/*
  Admission control for RPC channels.

  Two limits, checked atomically under one mutex:
    - per peer IP: at most max_per_peer channels; one more is rejected at once
    - global:      at most max_concurrent channels; one more waits up to
                   `wait` for a slot and is then rejected

  A waiting channel already holds its per-peer reservation, so concurrent
  attempts from the same peer cannot be over-admitted. The wait also ends
  when the caller's `cancelled` check turns true; it is polled every
  kCancelCheckInterval.
*/
class ChannelAdmission {
 public:
  struct Limits {
    uint32_t                  max_per_peer   = 1;
    uint32_t                  max_concurrent = 10;
    std::chrono::milliseconds wait{30'000};
  };

  static constexpr std::chrono::milliseconds kCancelCheckInterval{50};

  /*
    Releases its slot on destruction. Move-only.
  */
  class Permit {
   public:
    Permit() = default;
    ~Permit();

    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;

    Permit(const Permit&)            = delete;
    Permit& operator=(const Permit&) = delete;

    bool valid() const {
      return owner_ != nullptr;
    }

    const std::string& peer() const {
      return peer_;
    }

    void Release();

   private:
    friend class ChannelAdmission;
    Permit(ChannelAdmission* owner, std::string peer);

    ChannelAdmission* owner_ = nullptr;
    std::string       peer_;
  };

  explicit ChannelAdmission(Limits limits);

  ChannelAdmission(const ChannelAdmission&)            = delete;
  ChannelAdmission& operator=(const ChannelAdmission&) = delete;

  // Throws util::ResourceExhausted when either limit refuses the channel,
  // util::ChannelClosed when `cancelled` reports true while waiting.
  Permit Admit(const std::string& peer, const std::function<bool()>& cancelled = {});

  uint32_t ActiveChannels() const;
  uint32_t ChannelsForPeer(const std::string& peer) const;

  const Limits& limits() const {
    return limits_;
  }

 private:
  void ReleasePeer(const std::string& peer, bool holds_global_slot);

  Limits limits_;

  mutable std::mutex                        mutex_;
  std::condition_variable                   slot_freed_;
  std::unordered_map<std::string, uint32_t> per_peer_;
  uint32_t                                  active_ = 0;
};

} // namespace nodeagent::runtime
