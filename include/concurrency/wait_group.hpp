#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "concurrency/futex.hpp"

class WaitGroup {
public:
  void Add(uint32_t num = 1) { counter_.fetch_add(num); }

  void Done(uint32_t num = 1) {
    auto key = AtomicAddr(counter_);
    if (counter_.fetch_sub(num) - num == 0) {
      AtomicWakeAll(key);
    }
  }

  void Wait() {
    auto count = counter_.load();
    while (count != 0) {
      AtomicWait(counter_, count);
      count = counter_.load();
    }
  }

  // Returns false if the counter did not reach zero within the timeout
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;

    auto count = counter_.load();
    while (count != 0) {
      auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(
          deadline - Clock::now());
      if (left.count() <= 0) {
        return false;
      }
      AtomicWaitFor(counter_, count, left);
      count = counter_.load();
    }
    return true;
  }

  uint32_t Count() const { return counter_.load(); }

private:
  std::atomic<uint32_t> counter_{0};
};
