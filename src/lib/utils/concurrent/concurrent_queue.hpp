#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace seqpart {

// ConcurrentQueue is an unbounded, thread-safe FIFO guarded by a single mutex. Closing the queue wakes all waiting
// consumers; values already in the queue can still be popped afterwards.
template <typename T>
// NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
class ConcurrentQueue {
 public:
  size_t Size() const {
    const std::lock_guard<std::mutex> guard(queue_mutex_);
    return queue_.size();
  }

  // Returns `false` without enqueuing if the queue has been closed.
  bool Push(T&& value) {
    std::unique_lock<std::mutex> guard(queue_mutex_);
    if (closed_) {
      return false;
    }

    queue_.push(std::move(value));
    guard.unlock();
    queue_can_read_.notify_one();
    return true;
  }

  // Blocks until a value is available or the queue is closed. Returns `false` if the queue is closed and drained.
  bool Pop(T* result) {
    std::unique_lock<std::mutex> guard(queue_mutex_);
    queue_can_read_.wait(guard, [&] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
      return false;
    }

    *result = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  // Non-blocking variant of Pop().
  bool TryPop(T* result) {
    const std::lock_guard<std::mutex> guard(queue_mutex_);
    if (queue_.empty() || closed_) {
      return false;
    }

    *result = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void Close() {
    std::unique_lock<std::mutex> guard(queue_mutex_);
    closed_ = true;
    guard.unlock();
    queue_can_read_.notify_all();
  }

 private:
  std::queue<T> queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_can_read_;
  bool closed_ = false;
};

}  // namespace seqpart
