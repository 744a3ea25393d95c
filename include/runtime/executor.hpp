#pragma once

#include <chrono>
#include <string>

#include "runtime/executor_lifecycle.hpp"
#include "runtime/task.hpp"
#include "util/result.hpp"

class IExecutor {
public:
  virtual ~IExecutor() = default;

  // Err(Error::rejected_execution) once shutdown was requested, the task is
  // discarded then
  virtual Result<Unit> Submit(ITaskPtr task) = 0;

  // Idempotent
  virtual void Shutdown() = 0;

  virtual ExecutorState State() const = 0;

  // False if the executor has not terminated within the timeout
  virtual bool AwaitTermination(std::chrono::milliseconds timeout) = 0;

  bool IsShutdown() const { return State() != ExecutorState::kRunning; }

  bool IsTerminated() const { return State() == ExecutorState::kTerminated; }
};

using IExecutorPtr = IExecutor *;

// Discards the task, accounts and logs the rejection under the tag
Result<Unit> RejectTask(ITaskPtr task, const std::string &tag);
