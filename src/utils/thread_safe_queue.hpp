#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

// Unbounded multi-producer, multi-consumer channel. Once closed, pushes are
// rejected and consumers drain whatever is left before seeing nullopt.
template <typename T> class ThreadSafeQueue {
public:
  // Returns false when the queue has been closed
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      queue_.push(std::move(value));
    }
    cond_.notify_one();
    return true;
  }

  // A non-blocking try_pop
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  // Blocks until a value is available; nullopt once closed and drained
  std::optional<T> wait_and_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty())
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  // Like wait_and_pop, but gives up after `timeout` with nullopt
  template <typename Rep, typename Period>
  std::optional<T>
  wait_and_pop_for(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_for(lock, timeout,
                   [this] { return !queue_.empty() || closed_; });
    if (queue_.empty())
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  // Wake every waiting consumer; values already queued stay readable
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cond_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  mutable std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable cond_;
  bool closed_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
