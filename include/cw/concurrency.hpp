#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>

namespace cw {

// Cancellation handle shared between a caller and a running batch.
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Fixed-size worker pool. Tasks run in FIFO order, at most size() at a time;
// a queued task starts as soon as any worker frees up.
// The destructor drains the queue and joins every worker.
class ThreadPool {
public:
  explicit ThreadPool(int threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  std::size_t size() const;

  // Enqueue a non-cancelable task
  void submit(std::function<void()> task);

  // Enqueue a task that can observe pool's cancellation flag
  void submit_cancelable(std::function<void(const std::atomic<bool>&)> task);

  // Wait until the queue is empty and all tasks complete
  void wait_idle();

  // Request cooperative cancellation (tasks should check cancel_flag())
  void cancel();
  const std::atomic<bool>& cancel_flag() const;

  // First exception thrown by a task, nullptr if none. A throwing task also
  // sets the cancel flag.
  std::exception_ptr first_exception() const;

private:
  struct Impl;
  Impl* impl_;
};

} // namespace cw
