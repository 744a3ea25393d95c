#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>

#include "concurrency/wait_group.hpp"
#include "runtime/executor_config.hpp"
#include "runtime/manual_executor.hpp"
#include "runtime/synchronous_executor.hpp"
#include "runtime/thread_pool.hpp"

using namespace std::chrono_literals;

static Result<ExecutorConfig> Parse(const std::string &text) {
  std::istringstream input(text);
  return ParseExecutorConfig(input);
}

TEST(ExecutorConfig, Defaults) {
  auto config = Parse("");
  ASSERT_TRUE(config.HasValue());
  auto value = config.Value();
  ASSERT_EQ(ExecutorKind::kThreadPool, value.kind);
  ASSERT_EQ(4, value.threadpool_workers);
}

TEST(ExecutorConfig, ParseKinds) {
  ASSERT_EQ(ExecutorKind::kSynchronous,
            ParseExecutorKind("synchronous").Value());
  ASSERT_EQ(ExecutorKind::kSynchronous, ParseExecutorKind("sync").Value());
  ASSERT_EQ(ExecutorKind::kThreadPool, ParseExecutorKind("threadpool").Value());
  ASSERT_EQ(ExecutorKind::kManual, ParseExecutorKind("manual").Value());

  auto unknown = ParseExecutorKind("fibers");
  ASSERT_TRUE(unknown.HasError());
  ASSERT_EQ(Error::invalid_config, unknown.Error());
}

TEST(ExecutorConfig, KindNamesRoundTrip) {
  for (auto kind : {ExecutorKind::kSynchronous, ExecutorKind::kThreadPool,
                    ExecutorKind::kManual}) {
    ASSERT_EQ(kind, ParseExecutorKind(ToString(kind)).Value());
  }
}

TEST(ExecutorConfig, ParsePairs) {
  auto config = Parse("executor synchronous\nworkers 8\n");
  ASSERT_TRUE(config.HasValue());
  auto value = config.Value();
  ASSERT_EQ(ExecutorKind::kSynchronous, value.kind);
  ASSERT_EQ(8, value.threadpool_workers);
}

TEST(ExecutorConfig, InvalidInput) {
  for (const auto *text :
       {"workers 0", "workers -3", "workers many", "executor", "threads 4",
        "executor fibers"}) {
    auto config = Parse(text);
    ASSERT_TRUE(config.HasError()) << text;
    ASSERT_EQ(Error::invalid_config, config.Error()) << text;
  }
}

TEST(ExecutorConfig, LoadMissingFile) {
  auto config = LoadExecutorConfig("/nonexistent/executor.conf");
  ASSERT_TRUE(config.HasError());
  ASSERT_EQ(Error::config_not_found, config.Error());
}

TEST(ExecutorConfig, LoadFile) {
  std::string path = ::testing::TempDir() + "executor_config_test.conf";
  {
    std::ofstream output(path);
    output << "executor manual\n";
  }

  auto config = LoadExecutorConfig(path);
  std::remove(path.c_str());

  ASSERT_TRUE(config.HasValue());
  ASSERT_EQ(ExecutorKind::kManual, config.Value().kind);
}

TEST(ExecutorConfig, MakeExecutor) {
  ExecutorConfig config;

  config.kind = ExecutorKind::kSynchronous;
  auto sync = MakeExecutor(config);
  ASSERT_NE(nullptr, dynamic_cast<SynchronousExecutor *>(sync.get()));

  config.kind = ExecutorKind::kManual;
  auto manual = MakeExecutor(config);
  ASSERT_NE(nullptr, dynamic_cast<ManualExecutor *>(manual.get()));

  config.kind = ExecutorKind::kThreadPool;
  config.threadpool_workers = 2;
  auto pool = MakeExecutor(config);
  auto *thread_pool = dynamic_cast<ThreadPool *>(pool.get());
  ASSERT_NE(nullptr, thread_pool);
  ASSERT_EQ(2, thread_pool->NumWorkers());

  // Pool is started, so submitted work completes
  std::atomic<bool> flag{false};
  ASSERT_TRUE(
      pool->Submit(Lambda::Create([&flag]() { flag.store(true); })).HasValue());
  pool->Shutdown();
  ASSERT_TRUE(pool->AwaitTermination(1s));
  ASSERT_TRUE(flag.load());
}

TEST(ExecutorConfig, MakeExecutorUnknownKind) {
  ExecutorConfig config;
  config.kind = static_cast<ExecutorKind>(42);
  ASSERT_TRUE(MakeExecutor(config) == nullptr);
}

TEST(ExecutorConfig, StopExecutorRunsManualToCompletion) {
  ExecutorConfig config;
  config.kind = ExecutorKind::kManual;
  auto executor = MakeExecutor(config);

  size_t counter = 0;
  for (size_t i = 0; i < 3; ++i) {
    ASSERT_TRUE(
        executor->Submit(Lambda::Create([&counter]() { ++counter; }))
            .HasValue());
  }

  ASSERT_EQ(ExecutorState::kTerminated,
            StopExecutor(std::move(executor), 1s));
  ASSERT_EQ(3, counter);
}

TEST(ExecutorConfig, StopExecutorJoinsPoolOnTimeout) {
  ExecutorConfig config;
  config.kind = ExecutorKind::kThreadPool;
  config.threadpool_workers = 1;
  auto executor = MakeExecutor(config);

  WaitGroup gate;
  gate.Add();
  WaitGroup blocker_started;
  blocker_started.Add();
  std::atomic<bool> blocker_finished{false};
  std::atomic<size_t> counter{0};

  ASSERT_TRUE(executor
                  ->Submit(Lambda::Create([&]() {
                    blocker_started.Done();
                    gate.Wait();
                    blocker_finished.store(true);
                  }))
                  .HasValue());
  blocker_started.Wait();
  for (size_t i = 0; i < 10; ++i) {
    ASSERT_TRUE(
        executor->Submit(Lambda::Create([&counter]() { counter.fetch_add(1); }))
            .HasValue());
  }

  std::thread releaser([&gate]() {
    std::this_thread::sleep_for(200ms);
    gate.Done();
  });

  auto state = StopExecutor(std::move(executor), 20ms);
  releaser.join();

  ASSERT_NE(ExecutorState::kRunning, state);
  // Running task was joined and the queued ones were dropped
  ASSERT_TRUE(blocker_finished.load());
  ASSERT_EQ(0, counter.load());
}
