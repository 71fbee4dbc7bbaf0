#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded multi-producer queue. Producers never block: try_push fails when
// the queue is full or closed, and the caller decides what to drop.
// A capacity of 0 means unbounded.
template <typename T> class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  bool try_push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || (capacity_ > 0 && items_.size() >= capacity_))
        return false;
      items_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // Blocks until an item is available. After shutdown() the remaining items
  // are still handed out; returns false once the queue is closed and drained.
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty())
      return false;
    value = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
  }

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  std::mutex mutex_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
  bool closed_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
