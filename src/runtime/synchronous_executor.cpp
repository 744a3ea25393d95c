#include "runtime/synchronous_executor.hpp"

#include "util/logging.hpp"
#include "util/statistics.hpp"

Result<Unit> SynchronousExecutor::Submit(ITaskPtr task) {
  // Announce the task before checking the state, so that a concurrent
  // Shutdown either rejects it here or waits for it in FinishTask
  running_.fetch_add(1);
  if (lifecycle_.State() != ExecutorState::kRunning) {
    FinishTask();
    return RejectTask(task, "SYNC");
  }

  Statistics::Instance().Change("tasks_submitted", 1);

  try {
    task->Run();
  } catch (...) {
    Statistics::Instance().Change("tasks_failed", 1);
    LOG_ERROR("SYNC", "task failed, rethrow to the submitter");
    FinishTask();
    throw;
  }

  Statistics::Instance().Change("tasks_executed", 1);
  FinishTask();
  return Ok();
}

void SynchronousExecutor::Shutdown() {
  if (!lifecycle_.RequestShutdown()) {
    return;
  }
  LOG_INFO("SYNC", "shutdown requested");

  if (running_.load() == 0 && lifecycle_.MarkTerminated()) {
    LOG_INFO("SYNC", "terminated");
  }
}

bool SynchronousExecutor::AwaitTermination(std::chrono::milliseconds timeout) {
  return lifecycle_.WaitTerminated(timeout);
}

void SynchronousExecutor::FinishTask() {
  if (running_.fetch_sub(1) == 1 &&
      lifecycle_.State() == ExecutorState::kShuttingDown &&
      lifecycle_.MarkTerminated()) {
    LOG_INFO("SYNC", "terminated after the last running task");
  }
}

IExecutorPtr JustExecute() {
  static SynchronousExecutor executor;
  return &executor;
}
