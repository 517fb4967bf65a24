/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

namespace tfleet {

/**
 * @brief Fixed-size worker pool with an optional bound on outstanding tasks. Once `max_pending`
 * tasks are queued or running, enqueue() blocks until one finishes.
 */
class ThreadPool {
public:
  explicit ThreadPool(size_t threads, size_t max_pending = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  // WARNING: a task must not enqueue into its own pool and wait on the result; with a bound
  // this deadlocks as soon as the pool is full.
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>;

  // Queued plus running.
  size_t pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size() + active_;
  }

  // Blocks until every task accepted so far has finished.
  void wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
  }

  size_t size() const { return workers_.size(); }
  size_t max_pending() const { return max_pending_; }

private:
  void worker_loop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  size_t active_ = 0;
  size_t max_pending_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::condition_variable space_condition_;
  std::condition_variable idle_condition_;
  bool stop_ = false;
};

inline ThreadPool::ThreadPool(size_t threads, size_t max_pending) : max_pending_(max_pending) {
  if (threads == 0) {
    throw std::invalid_argument("ThreadPool needs at least one thread");
  }
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&ThreadPool::worker_loop, this);
  }
}

inline void ThreadPool::worker_loop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty())
        return;
      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_;
    }

    // packaged_task stores exceptions in the future
    task();

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      --active_;
      if (tasks_.empty() && active_ == 0) {
        idle_condition_.notify_all();
      }
    }
    space_condition_.notify_one();
  }
}

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using return_type = std::invoke_result_t<F, Args...>;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      [f = std::forward<F>(f), args = std::make_tuple(std::forward<Args>(args)...)]() mutable {
        return std::apply(f, std::move(args));
      });

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (max_pending_ > 0) {
      space_condition_.wait(lock,
                            [this] { return stop_ || tasks_.size() + active_ < max_pending_; });
    }
    if (stop_)
      throw std::runtime_error("enqueue on stopped ThreadPool");
    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

inline ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    stop_ = true;
  }
  condition_.notify_all();
  space_condition_.notify_all();
  for (std::thread &worker : workers_) {
    worker.join();
  }
}

} // namespace tfleet
