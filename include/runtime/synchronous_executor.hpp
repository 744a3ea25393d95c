#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>

#include "runtime/executor.hpp"
#include "runtime/executor_lifecycle.hpp"
#include "runtime/task.hpp"
#include "util/noncopyable.hpp"

// Runs every task on the calling thread before Submit returns. A task that
// throws propagates the exception to the caller of Submit.
//
// Nested Submit from a running task runs inline as well. Shutdown requested
// from a running task completes when the outermost task returns.
class SynchronousExecutor : public IExecutor,
                            private NonCopyable,
                            private NonMoveable {
public:
  SynchronousExecutor() = default;

  Result<Unit> Submit(ITaskPtr task) final;

  void Shutdown() final;

  ExecutorState State() const final { return lifecycle_.State(); }

  bool AwaitTermination(std::chrono::milliseconds timeout) final;

private:
  ExecutorLifecycle lifecycle_;
  std::atomic<size_t> running_{0};

  void FinishTask();
};

// Process-wide synchronous executor for work that has no executor of its own,
// such as Async without one. It lives until exit and must not be shut down
IExecutorPtr JustExecute();
