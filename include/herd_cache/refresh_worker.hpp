#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace herd_cache {

// Runs fire-and-forget refreshes. Tasks already queued still run when the
// worker is destroyed; the destructor joins after the queue drains.
class RefreshWorker {
public:
  RefreshWorker(std::size_t threads, std::size_t max_pending);
  ~RefreshWorker();
  RefreshWorker(const RefreshWorker &) = delete;
  RefreshWorker &operator=(const RefreshWorker &) = delete;

  // False when the queue is full, there are no threads to run the task, or
  // the worker is shutting down. A throwing task is logged and skipped.
  bool submit(std::function<void()> task);
  void wait_idle();
  std::size_t pending() const;

private:
  void run();

  std::size_t max_pending_;
  mutable std::mutex mu_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> queue_;
  std::size_t active_{0};
  bool stop_{false};
  std::vector<std::thread> threads_;
};

} // namespace herd_cache
