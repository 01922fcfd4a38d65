#include "blocking_executor.hpp"

namespace nodeagent::system {

BlockingExecutor::BlockingExecutor(size_t workers) {
  if (workers == 0) workers = 1;
  workers_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(&BlockingExecutor::WorkerLoop, this);
  }
}

BlockingExecutor::~BlockingExecutor() {
  Shutdown();
}

void BlockingExecutor::Enqueue(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::ResourceExhausted("blocking executor is shut down");
    }
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
}

void BlockingExecutor::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

void BlockingExecutor::WorkerLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !jobs_.empty(); });

      // drain queued jobs before exiting so no caller waits forever
      if (jobs_.empty()) return;

      job = std::move(jobs_.front());
      jobs_.pop();
    }
    job();
  }
}

} // namespace nodeagent::system
