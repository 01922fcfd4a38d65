#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/util/errors.hpp"

namespace nodeagent::system {

/*
  Dedicated worker thread(s) for blocking subprocess work.

  Channel handlers hand a job over with Run() and get its result (or its
  exception) back; package-manager and systemctl calls never execute on a
  channel thread. With one worker, jobs run strictly one at a time.
*/
class BlockingExecutor {
 public:
  explicit BlockingExecutor(size_t workers = 1);
  ~BlockingExecutor();

  BlockingExecutor(const BlockingExecutor&)            = delete;
  BlockingExecutor& operator=(const BlockingExecutor&) = delete;

  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> Submit(Fn&& fn) {
    using R   = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut  = task->get_future();
    Enqueue([task] { (*task)(); });
    return fut;
  }

  // Submit and wait; rethrows whatever the job threw.
  template <typename Fn>
  std::invoke_result_t<Fn> Run(Fn&& fn) {
    return Submit(std::forward<Fn>(fn)).get();
  }

  void Shutdown();

 private:
  void Enqueue(std::function<void()> job);
  void WorkerLoop();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> jobs_;
  bool                              shutdown_ = false;
  std::vector<std::thread>          workers_;
};

} // namespace nodeagent::system
