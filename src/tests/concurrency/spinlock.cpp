#include <gtest/gtest.h>
#include <mutex>

#include "concurrency/spinlock.hpp"
#include "runtime/task.hpp"
#include "runtime/thread_pool.hpp"

using Mutex = SpinLock;

TEST(SpinLock, SmokeTest) {
  Mutex mutex;
  std::lock_guard lock(mutex);
}

TEST(SpinLock, TryLock) {
  Mutex mutex;
  ASSERT_TRUE(mutex.TryLock());
  ASSERT_FALSE(mutex.TryLock());
  mutex.Unlock();
  ASSERT_TRUE(mutex.TryLock());
  mutex.Unlock();
}

class Counter {
public:
  void Increment() {
    std::lock_guard lock(mutex_);
    ++counter_;
  }

  size_t Get() {
    std::lock_guard lock(mutex_);
    return counter_;
  }

private:
  Mutex mutex_;
  size_t counter_ = 0; // guarded by mutex_
};

TEST(SpinLock, Concurrency) {
  Counter counter;

  constexpr size_t num_workers = 5;
  constexpr size_t num_increments = 100'000;

  ThreadPool thread_pool(num_workers);
  thread_pool.Start();

  for (size_t worker = 0; worker < num_workers; ++worker) {
    auto submitted =
        thread_pool.Submit(Lambda::Create([&counter, num_increments]() {
          for (size_t i = 0; i < num_increments; ++i) {
            counter.Increment();
          }
        }));
    ASSERT_TRUE(submitted.HasValue());
  }

  thread_pool.WaitIdle();

  ASSERT_EQ(num_workers * num_increments, counter.Get());

  thread_pool.Shutdown();
  ASSERT_TRUE(thread_pool.AwaitTermination(std::chrono::seconds(1)));
}
