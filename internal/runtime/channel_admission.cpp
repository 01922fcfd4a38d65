#include "channel_admission.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace nodeagent::runtime {

// ------------------------------------------------------------
// Permit
// ------------------------------------------------------------

ChannelAdmission::Permit::Permit(ChannelAdmission* owner, std::string peer) : owner_(owner), peer_(std::move(peer)) {
}

ChannelAdmission::Permit::~Permit() {
  Release();
}

ChannelAdmission::Permit::Permit(Permit&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)), peer_(std::move(other.peer_)) {
}

ChannelAdmission::Permit& ChannelAdmission::Permit::operator=(Permit&& other) noexcept {
  if (this != &other) {
    Release();
    owner_ = std::exchange(other.owner_, nullptr);
    peer_  = std::move(other.peer_);
  }
  return *this;
}

void ChannelAdmission::Permit::Release() {
  if (owner_) {
    owner_->ReleasePeer(peer_, true);
    owner_ = nullptr;
  }
}

// ------------------------------------------------------------
// ChannelAdmission
// ------------------------------------------------------------

ChannelAdmission::ChannelAdmission(Limits limits) : limits_(limits) {
  if (limits_.max_per_peer == 0 || limits_.max_concurrent == 0) {
    throw util::ConfigError("channel admission limits must be positive");
  }
}

ChannelAdmission::Permit ChannelAdmission::Admit(const std::string& peer, const std::function<bool()>& cancelled) {
  std::unique_lock lock(mutex_);

  auto& count = per_peer_[peer];
  if (count >= limits_.max_per_peer) {
    if (count == 0) per_peer_.erase(peer);
    throw util::ResourceExhausted("peer " + peer + " already has " + std::to_string(limits_.max_per_peer) + " active channel(s)");
  }
  ++count;

  const auto deadline  = std::chrono::steady_clock::now() + limits_.wait;
  auto       has_slot  = [this] { return active_ < limits_.max_concurrent; };
  bool       slot      = has_slot();
  bool       abandoned = false;
  while (!slot) {
    if (cancelled && cancelled()) {
      abandoned = true;
      break;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    slot = slot_freed_.wait_until(lock, std::min(deadline, now + kCancelCheckInterval), has_slot);
  }

  if (!slot) {
    lock.unlock();
    ReleasePeer(peer, false);
    if (abandoned) {
      throw util::ChannelClosed("channel from " + peer + " cancelled while waiting for a slot");
    }
    throw util::ResourceExhausted("no channel slot freed within " + std::to_string(limits_.wait.count()) + " ms (" +
                                  std::to_string(limits_.max_concurrent) + " active)");
  }

  ++active_;
  return Permit(this, peer);
}

void ChannelAdmission::ReleasePeer(const std::string& peer, bool holds_global_slot) {
  {
    std::lock_guard lock(mutex_);
    auto            it = per_peer_.find(peer);
    if (it != per_peer_.end() && --it->second == 0) {
      per_peer_.erase(it);
    }
    if (holds_global_slot && active_ > 0) {
      --active_;
    }
  }
  slot_freed_.notify_all();
}

uint32_t ChannelAdmission::ActiveChannels() const {
  std::lock_guard lock(mutex_);
  return active_;
}

uint32_t ChannelAdmission::ChannelsForPeer(const std::string& peer) const {
  std::lock_guard lock(mutex_);
  auto            it = per_peer_.find(peer);
  return it == per_peer_.end() ? 0 : it->second;
}

} // namespace nodeagent::runtime
