#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "transfer_registry.hpp"

namespace nodeagent::transfer {

/*
  Background thread that evicts abandoned transfers.

  Every `interval` it drops registry entries idle for longer than
  `idle_timeout`.
*/
class RegistrySweeper {
 public:
  RegistrySweeper(std::shared_ptr<TransferRegistry> registry, std::chrono::milliseconds idle_timeout, std::chrono::milliseconds interval);
  ~RegistrySweeper();

  RegistrySweeper(const RegistrySweeper&)            = delete;
  RegistrySweeper& operator=(const RegistrySweeper&) = delete;

  void Start();
  void Stop();

  // One sweep, on the caller's thread.
  size_t SweepOnce();

 private:
  void Loop();

  std::shared_ptr<TransferRegistry> registry_;
  std::chrono::milliseconds         idle_timeout_;
  std::chrono::milliseconds         interval_;

  std::mutex              mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace nodeagent::transfer
