#include "runtime/manual_executor.hpp"

#include <string>

#include "util/logging.hpp"
#include "util/statistics.hpp"

ManualExecutor::~ManualExecutor() {
  Lock lock(mutex_);
  size_t discarded = 0;
  while (auto *task = tasks_.PopFront()) {
    task->Discard();
    ++discarded;
  }
  if (discarded != 0) {
    Statistics::Instance().Change("tasks_discarded",
                                  static_cast<Statistics::Type>(discarded));
    LOG_INFO("MANUAL",
             "discarded " + std::to_string(discarded) + " unstepped tasks");
  }
}

Result<Unit> ManualExecutor::Submit(ITaskPtr task) {
  {
    Lock lock(mutex_);
    if (lifecycle_.State() == ExecutorState::kRunning) {
      tasks_.PushBack(task);
      Statistics::Instance().Change("tasks_submitted", 1);
      return Ok();
    }
  }
  return RejectTask(task, "MANUAL");
}

bool ManualExecutor::Step() {
  ITaskPtr task = nullptr;

  {
    Lock lock(mutex_);
    task = tasks_.PopFront();
    if (task == nullptr) {
      return false;
    }
    ++running_;
  }

  try {
    task->Run();
  } catch (...) {
    Statistics::Instance().Change("tasks_failed", 1);
    LOG_ERROR("MANUAL", "task failed, rethrow to the stepping thread");
    FinishStep();
    throw;
  }

  Statistics::Instance().Change("tasks_executed", 1);
  FinishStep();
  return true;
}

size_t ManualExecutor::RunAll() {
  size_t steps = 0;
  while (Step()) {
    ++steps;
  }
  return steps;
}

bool ManualExecutor::HasStep() const {
  Lock lock(mutex_);
  return !tasks_.Empty();
}

size_t ManualExecutor::Pending() const {
  Lock lock(mutex_);
  return tasks_.Size();
}

void ManualExecutor::Shutdown() {
  Lock lock(mutex_);
  if (!lifecycle_.RequestShutdown()) {
    return;
  }
  LOG_INFO("MANUAL", "shutdown requested with " +
                         std::to_string(tasks_.Size()) + " queued tasks");
  TryTerminate(lock);
}

bool ManualExecutor::AwaitTermination(std::chrono::milliseconds timeout) {
  return lifecycle_.WaitTerminated(timeout);
}

void ManualExecutor::FinishStep() {
  Lock lock(mutex_);
  --running_;
  TryTerminate(lock);
}

void ManualExecutor::TryTerminate(Lock &) {
  if (lifecycle_.State() == ExecutorState::kShuttingDown && tasks_.Empty() &&
      running_ == 0 && lifecycle_.MarkTerminated()) {
    LOG_INFO("MANUAL", "queue drained, terminated");
  }
}
