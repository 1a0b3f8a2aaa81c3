#include "herd_cache/refresh_worker.hpp"

#include <exception>
#include <iostream>

namespace herd_cache {

RefreshWorker::RefreshWorker(std::size_t threads, std::size_t max_pending)
    : max_pending_(max_pending) {
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i)
    threads_.emplace_back([this] { run(); });
}

RefreshWorker::~RefreshWorker() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  work_cv_.notify_all();
  for (auto &t : threads_)
    t.join();
}

bool RefreshWorker::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stop_ || threads_.empty() || queue_.size() >= max_pending_)
      return false;
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
  return true;
}

void RefreshWorker::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return queue_.empty() && active_ == 0; });
}

std::size_t RefreshWorker::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size() + active_;
}

void RefreshWorker::run() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      work_cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
      if (queue_.empty())
        return;
      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }
    try {
      task();
    } catch (const std::exception &e) {
      std::cerr << "herd_cache: refresh task threw: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "herd_cache: refresh task threw a non-standard exception\n";
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      --active_;
      if (queue_.empty() && active_ == 0)
        idle_cv_.notify_all();
    }
  }
}

} // namespace herd_cache
