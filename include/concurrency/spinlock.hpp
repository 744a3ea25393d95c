#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

// Exponential backoff
class Spinner {
public:
  void Spin() {
    for (size_t i = 0; i < (1ul << counter_); ++i) {
      CpuRelax();
    }

    if (counter_ > kYieldCount) {
      std::this_thread::yield();
    } else {
      ++counter_;
    }
  }

  void Reset() { counter_ = 0; }

private:
  static constexpr size_t kYieldCount = 10;
  size_t counter_{0};

  static void CpuRelax() {
#if defined(__x86_64__) || defined(__i386__)
    // https://stackoverflow.com/questions/50428450/what-does-asm-volatile-pause-memory-do
    asm volatile("pause\n" : : : "memory");
#elif defined(__aarch64__)
    asm volatile("yield\n" : : : "memory");
#else
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
  }
};

// SpinLock without unnecessary cache invalidation
class SpinLock {
public:
  void Lock() {
    Spinner spinner;
    while (locked_.exchange(true, std::memory_order_acquire)) {
      while (locked_.load(std::memory_order_relaxed)) {
        spinner.Spin();
      }
    }
  }

  bool TryLock() { return !locked_.exchange(true, std::memory_order_acquire); }

  void Unlock() { locked_.store(false, std::memory_order_release); }

  void lock() { Lock(); }

  bool try_lock() { return TryLock(); }

  void unlock() { Unlock(); }

private:
  std::atomic<bool> locked_{false};
};
