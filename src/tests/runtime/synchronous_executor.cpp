#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

#include "runtime/synchronous_executor.hpp"
#include "runtime/task.hpp"
#include "util/result.hpp"

using namespace std::chrono_literals;

TEST(SynchronousExecutor, SmokeTest) {
  SynchronousExecutor executor;
  ASSERT_EQ(ExecutorState::kRunning, executor.State());
  ASSERT_FALSE(executor.IsShutdown());
  ASSERT_FALSE(executor.IsTerminated());
}

TEST(SynchronousExecutor, RunsBeforeSubmitReturns) {
  SynchronousExecutor executor;

  bool flag = false;
  auto result = executor.Submit(Lambda::Create([&flag]() { flag = true; }));

  ASSERT_TRUE(result.HasValue());
  ASSERT_TRUE(flag);
}

TEST(SynchronousExecutor, RunsOnCallerThread) {
  SynchronousExecutor executor;

  std::thread::id task_thread;
  auto result = executor.Submit(Lambda::Create(
      [&task_thread]() { task_thread = std::this_thread::get_id(); }));

  ASSERT_TRUE(result.HasValue());
  ASSERT_EQ(std::this_thread::get_id(), task_thread);
}

TEST(SynchronousExecutor, KeepsSubmissionOrder) {
  SynchronousExecutor executor;

  std::vector<int32_t> order;
  for (int32_t i = 0; i < 10; ++i) {
    auto result =
        executor.Submit(Lambda::Create([&order, i]() { order.push_back(i); }));
    ASSERT_TRUE(result.HasValue());
    ASSERT_EQ(static_cast<size_t>(i + 1), order.size());
  }

  for (int32_t i = 0; i < 10; ++i) {
    ASSERT_EQ(i, order[static_cast<size_t>(i)]);
  }
}

TEST(SynchronousExecutor, NestedSubmit) {
  SynchronousExecutor executor;

  std::vector<int32_t> order;
  auto result = executor.Submit(Lambda::Create([&executor, &order]() {
    order.push_back(1);
    auto nested =
        executor.Submit(Lambda::Create([&order]() { order.push_back(2); }));
    ASSERT_TRUE(nested.HasValue());
    order.push_back(3);
  }));

  ASSERT_TRUE(result.HasValue());
  ASSERT_EQ((std::vector<int32_t>{1, 2, 3}), order);
}

TEST(SynchronousExecutor, TaskFailurePropagates) {
  SynchronousExecutor executor;

  ASSERT_THROW(executor.Submit(Lambda::Create(
                   []() { throw std::runtime_error("task failure"); })),
               std::runtime_error);

  // Executor is still usable after a failed task
  bool flag = false;
  ASSERT_TRUE(
      executor.Submit(Lambda::Create([&flag]() { flag = true; })).HasValue());
  ASSERT_TRUE(flag);
}

TEST(SynchronousExecutor, ShutdownTerminatesImmediately) {
  SynchronousExecutor executor;

  executor.Shutdown();

  ASSERT_TRUE(executor.IsShutdown());
  ASSERT_TRUE(executor.IsTerminated());
  ASSERT_EQ(ExecutorState::kTerminated, executor.State());
  ASSERT_TRUE(executor.AwaitTermination(0ms));
}

TEST(SynchronousExecutor, ShutdownIsIdempotent) {
  SynchronousExecutor executor;

  executor.Shutdown();
  executor.Shutdown();

  for (size_t i = 0; i < 3; ++i) {
    ASSERT_TRUE(executor.IsShutdown());
    ASSERT_TRUE(executor.IsTerminated());
  }
}

TEST(SynchronousExecutor, RejectsAfterShutdown) {
  SynchronousExecutor executor;
  executor.Shutdown();

  bool flag = false;
  auto result = executor.Submit(Lambda::Create([&flag]() { flag = true; }));

  ASSERT_TRUE(result.HasError());
  ASSERT_EQ(Error::rejected_execution, result.Error());
  ASSERT_FALSE(flag);
}

TEST(SynchronousExecutor, ShutdownFromRunningTask) {
  SynchronousExecutor executor;

  ExecutorState state_inside = ExecutorState::kRunning;
  auto result = executor.Submit(Lambda::Create([&]() {
    executor.Shutdown();
    state_inside = executor.State();
  }));

  ASSERT_TRUE(result.HasValue());
  ASSERT_EQ(ExecutorState::kShuttingDown, state_inside);
  ASSERT_TRUE(executor.IsTerminated());
}

TEST(SynchronousExecutor, AwaitTerminationExpires) {
  SynchronousExecutor executor;

  auto start = std::chrono::steady_clock::now();
  ASSERT_FALSE(executor.AwaitTermination(50ms));
  ASSERT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(SynchronousExecutor, ConcurrentSubmitters) {
  SynchronousExecutor executor;

  constexpr size_t num_threads = 8;
  constexpr size_t num_tasks = 10'000;
  std::atomic<size_t> counter{0};

  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&]() {
      for (size_t task = 0; task < num_tasks; ++task) {
        auto result = executor.Submit(
            Lambda::Create([&counter]() { counter.fetch_add(1); }));
        ASSERT_TRUE(result.HasValue());
      }
    });
  }

  for (auto &thread : threads) {
    thread.join();
  }

  ASSERT_EQ(num_threads * num_tasks, counter.load());
}

TEST(SynchronousExecutor, JustExecute) {
  auto *executor = JustExecute();
  ASSERT_NE(nullptr, executor);
  ASSERT_EQ(executor, JustExecute());
  ASSERT_EQ(ExecutorState::kRunning, executor->State());

  bool flag = false;
  ASSERT_TRUE(
      executor->Submit(Lambda::Create([&flag]() { flag = true; })).HasValue());
  ASSERT_TRUE(flag);
}
