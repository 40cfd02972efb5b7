#pragma once

// judgebox/worker_pool.hpp: Bounded pool of dedicated threads for blocking
// platform work (run, evaluate).
//
// QUEUE POLICY:
//   max_queue_size > 0 bounds the number of pending (not yet started) tasks.
//   submit() blocks the caller while the queue is full. Tasks are started in
//   submission order.
//
// SHUTDOWN:
//   shutdown() (also run by the destructor) stops accepting work, drains
//   every queued task, then joins. Once it has begun, including for a
//   submitter that was blocked on a full queue, the queue refuses the task and
//   submit() runs it on the calling thread. A future obtained from submit() is
//   therefore always satisfied.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace judgebox {

class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads, std::size_t max_queue_size = 1024);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename Fn>
  auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> fut = task->get_future();
    std::function<void()> job = [task] { (*task)(); };
    if (!enqueue(job)) job();
    return fut;
  }

  void shutdown();

  std::size_t size() const { return workers_.size(); }
  std::size_t pending() const;

 private:
  // False once shutdown has begun; the job is not queued then.
  bool enqueue(std::function<void()> job);
  void worker_loop();

  std::size_t max_queue_size_;
  std::vector<std::thread> workers_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_capacity_;
  std::deque<std::function<void()>> queue_;
  bool stopping_{false};
};

}  // namespace judgebox
