#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

// Bounded multi-producer/multi-consumer queue. push() blocks while the
// queue is full; consumers drain what is left after shutdown().
template <typename T> class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  // Returns false if the queue was shut down before the value fit
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return capacity_ == 0 || queue_.size() < capacity_ || shutdown_requested_;
    });
    if (shutdown_requested_)
      return false;
    queue_.push(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  // Blocks until a value is available; nullopt once shut down and drained
  std::optional<T> wait_and_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock,
                    [this] { return !queue_.empty() || shutdown_requested_; });
    if (queue_.empty())
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    not_full_.notify_one();
    return value;
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

private:
  std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t capacity_;
  bool shutdown_requested_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
