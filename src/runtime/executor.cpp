#include "runtime/executor.hpp"

#include "util/logging.hpp"
#include "util/statistics.hpp"

std::string ToString(ExecutorState state) {
  switch (state) {
  case ExecutorState::kRunning:
    return "running";
  case ExecutorState::kShuttingDown:
    return "shutting down";
  case ExecutorState::kTerminated:
    return "terminated";
  default:
    return "unknown state";
  }
}

Result<Unit> RejectTask(ITaskPtr task, const std::string &tag) {
  task->Discard();
  Statistics::Instance().Change("tasks_rejected", 1);
  LOG_ERROR(tag, "task rejected, executor is shut down");
  return Err<Unit>(Error::rejected_execution);
}
