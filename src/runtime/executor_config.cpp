#include "runtime/executor_config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

#include "runtime/manual_executor.hpp"
#include "runtime/synchronous_executor.hpp"
#include "runtime/thread_pool.hpp"
#include "util/logging.hpp"

Result<ExecutorKind> ParseExecutorKind(const std::string &name) {
  if (name == "synchronous" || name == "sync") {
    return Ok(ExecutorKind::kSynchronous);
  } else if (name == "threadpool" || name == "pool") {
    return Ok(ExecutorKind::kThreadPool);
  } else if (name == "manual") {
    return Ok(ExecutorKind::kManual);
  }
  LOG_ERROR("CONFIG", "unknown executor kind '" + name + "'");
  return Err<ExecutorKind>(Error::invalid_config);
}

std::string ToString(ExecutorKind kind) {
  switch (kind) {
  case ExecutorKind::kSynchronous:
    return "synchronous";
  case ExecutorKind::kThreadPool:
    return "threadpool";
  case ExecutorKind::kManual:
    return "manual";
  default:
    return "unknown";
  }
}

static Result<size_t> ParseWorkers(const std::string &value) {
  bool all_digits = !value.empty();
  for (char symbol : value) {
    all_digits = all_digits && std::isdigit(static_cast<unsigned char>(symbol));
  }

  size_t workers = 0;
  std::istringstream stream(value);
  if (!all_digits || !(stream >> workers) || workers == 0) {
    LOG_ERROR("CONFIG", "workers must be a positive number, got '" + value +
                            "'");
    return Err<size_t>(Error::invalid_config);
  }
  return Ok(workers);
}

Result<ExecutorConfig> ParseExecutorConfig(std::istream &input) {
  ExecutorConfig config;

  std::string key;
  while (input >> key) {
    std::string value;
    if (!(input >> value)) {
      LOG_ERROR("CONFIG", "key '" + key + "' has no value");
      return Err<ExecutorConfig>(Error::invalid_config);
    }

    if (key == "executor") {
      auto kind = ParseExecutorKind(value);
      if (kind.HasError()) {
        return Err<ExecutorConfig>(kind.Error());
      }
      config.kind = kind.Value();
    } else if (key == "workers") {
      auto workers = ParseWorkers(value);
      if (workers.HasError()) {
        return Err<ExecutorConfig>(workers.Error());
      }
      config.threadpool_workers = workers.Value();
    } else {
      LOG_ERROR("CONFIG", "unknown key '" + key + "'");
      return Err<ExecutorConfig>(Error::invalid_config);
    }
  }

  LOG_INFO("CONFIG", "executor " + ToString(config.kind) + " with " +
                         std::to_string(config.threadpool_workers) +
                         " workers");
  return Ok(config);
}

Result<ExecutorConfig> LoadExecutorConfig(const std::string &path) {
  std::ifstream ifstream(path);
  if (!ifstream.is_open()) {
    LOG_ERROR("CONFIG", "cannot open " + path);
    return Err<ExecutorConfig>(Error::config_not_found);
  }
  return ParseExecutorConfig(ifstream);
}

std::unique_ptr<IExecutor> MakeExecutor(const ExecutorConfig &config) {
  switch (config.kind) {
  case ExecutorKind::kSynchronous:
    return std::make_unique<SynchronousExecutor>();
  case ExecutorKind::kManual:
    return std::make_unique<ManualExecutor>();
  case ExecutorKind::kThreadPool: {
    auto pool = std::make_unique<ThreadPool>(config.threadpool_workers);
    pool->Start();
    return pool;
  }
  default:
    LOG_ERROR("CONFIG", "unknown executor kind " +
                            std::to_string(static_cast<int>(config.kind)));
    return nullptr;
  }
}

ExecutorState StopExecutor(std::unique_ptr<IExecutor> executor,
                           std::chrono::milliseconds timeout) {
  executor->Shutdown();
  if (auto *manual = dynamic_cast<ManualExecutor *>(executor.get())) {
    manual->RunAll();
  }

  if (!executor->AwaitTermination(timeout)) {
    LOG_ERROR("EXEC", "executor did not terminate in " +
                          std::to_string(timeout.count()) + "ms");
    if (auto *pool = dynamic_cast<ThreadPool *>(executor.get())) {
      pool->ShutdownNow();
    }
  }

  auto state = executor->State();
  // Joins workers still running a task, so nothing outlives this call
  executor.reset();
  return state;
}
