#include "judgebox/worker_pool.hpp"

#include <utility>

namespace judgebox {

WorkerPool::WorkerPool(std::size_t threads, std::size_t max_queue_size)
    : max_queue_size_(max_queue_size) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  cv_capacity_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
}

std::size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

bool WorkerPool::enqueue(std::function<void()> job) {
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (max_queue_size_ > 0) {
      cv_capacity_.wait(lock, [this] { return stopping_ || queue_.size() < max_queue_size_; });
    }
    // Workers may already have drained and exited.
    if (stopping_) return false;
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::worker_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop_front();
      if (max_queue_size_ > 0) cv_capacity_.notify_one();
    }
    job();
  }
}

}  // namespace judgebox
