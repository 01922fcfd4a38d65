#include "registry_sweeper.hpp"

#include "internal/observability/logging.hpp"

namespace nodeagent::transfer {

RegistrySweeper::RegistrySweeper(std::shared_ptr<TransferRegistry> registry, std::chrono::milliseconds idle_timeout,
                                 std::chrono::milliseconds interval)
    : registry_(std::move(registry)), idle_timeout_(idle_timeout), interval_(interval) {
}

RegistrySweeper::~RegistrySweeper() {
  Stop();
}

void RegistrySweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RegistrySweeper::Loop, this);
}

void RegistrySweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

size_t RegistrySweeper::SweepOnce() {
  return registry_->EvictIdle(idle_timeout_);
}

void RegistrySweeper::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (wake_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    const auto evicted = SweepOnce();
    if (evicted > 0) {
      NODEAGENT_LOG_INFO("registry sweep", {observability::IntField("evicted", static_cast<int64_t>(evicted))});
    }
    lock.lock();
  }
}

} // namespace nodeagent::transfer
