#pragma once

#include <chrono>
#include <cstddef>
#include <istream>
#include <memory>
#include <string>

#include "runtime/executor.hpp"
#include "util/result.hpp"

enum class ExecutorKind {
  kSynchronous,
  kThreadPool,
  kManual,
};

Result<ExecutorKind> ParseExecutorKind(const std::string &name);
std::string ToString(ExecutorKind kind);

// Decides whether the work submitted by a component runs inline, on a pool or
// when a test steps it
struct ExecutorConfig {
  ExecutorKind kind{ExecutorKind::kThreadPool};
  size_t threadpool_workers{4};
};

// Whitespace separated pairs:
//   executor synchronous|threadpool|manual
//   workers <positive number>
Result<ExecutorConfig> ParseExecutorConfig(std::istream &input);

Result<ExecutorConfig> LoadExecutorConfig(const std::string &path);

// Thread pool is returned already started, nullptr for an unknown kind
std::unique_ptr<IExecutor> MakeExecutor(const ExecutorConfig &config);

// Shuts the executor down and destroys it. A manual executor is run to
// completion first. A thread pool that misses the timeout drops its queued
// tasks and is joined. Returns the state observed before destruction, so on
// return no task of the executor is running or will ever run
ExecutorState StopExecutor(std::unique_ptr<IExecutor> executor,
                           std::chrono::milliseconds timeout);
