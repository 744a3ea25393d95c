#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Blocking FIFO for the pool workers. After Close() producers are refused,
// consumers still take what is left
template <typename T> class UnboundedMRMWQueue {
public:
  bool Put(T value) {
    std::lock_guard lock(mutex_);
    if (is_closed_) {
      return false;
    }
    buffer_.push_back(std::move(value));
    not_empty_or_closed_.notify_one();
    return true;
  }

  std::optional<T> Take() {
    std::unique_lock lock(mutex_);
    while (buffer_.empty() && !is_closed_) {
      not_empty_or_closed_.wait(lock);
    }
    if (buffer_.empty()) {
      return std::nullopt;
    }
    auto value = std::move(buffer_.front());
    buffer_.pop_front();
    return {std::move(value)};
  }

  void Close() {
    std::lock_guard lock(mutex_);
    is_closed_ = true;
    not_empty_or_closed_.notify_all();
  }

  // Closes the queue and hands the items that were never taken to the caller
  std::deque<T> Drain() {
    std::lock_guard lock(mutex_);
    is_closed_ = true;
    std::deque<T> remaining;
    remaining.swap(buffer_);
    not_empty_or_closed_.notify_all();
    return remaining;
  }

  bool IsClosed() const {
    std::lock_guard lock(mutex_);
    return is_closed_;
  }

  size_t Size() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
  }

private:
  mutable std::mutex mutex_;
  std::deque<T> buffer_;  // guarded by mutex_
  bool is_closed_{false}; // guarded by mutex_
  std::condition_variable not_empty_or_closed_;
};
