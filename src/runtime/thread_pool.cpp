#include "runtime/thread_pool.hpp"

#include <string>

#include "util/logging.hpp"
#include "util/statistics.hpp"

static thread_local IExecutorPtr current_threadpool = nullptr;

ThreadPool::ThreadPool(size_t num_workers) : num_workers_(num_workers) {}

ThreadPool::~ThreadPool() {
  Shutdown();
  JoinWorkers();
}

void ThreadPool::Start() {
  if (started_.exchange(true)) {
    LOG_ERROR("POOL", "start is called twice or after shutdown, ignored");
    return;
  }

  std::lock_guard lock(workers_mutex_);
  alive_workers_.store(num_workers_);
  workers_.reserve(num_workers_);
  for (size_t worker_idx = 0; worker_idx < num_workers_; ++worker_idx) {
    workers_.emplace_back([this]() { WorkerRoutine(); });
  }
  LOG_INFO("POOL", "started " + std::to_string(num_workers_) + " workers");
}

Result<Unit> ThreadPool::Submit(ITaskPtr task) {
  if (lifecycle_.State() != ExecutorState::kRunning) {
    return RejectTask(task, "POOL");
  }

  pending_tasks_.Add();
  if (!tasks_.Put(task)) {
    // Lost the race with Shutdown
    pending_tasks_.Done();
    return RejectTask(task, "POOL");
  }

  Statistics::Instance().Change("tasks_submitted", 1);
  return Ok();
}

void ThreadPool::Shutdown() {
  if (!lifecycle_.RequestShutdown()) {
    return;
  }

  if (ClaimIdleShutdown()) {
    auto discarded = DiscardTasks(tasks_.Drain());
    lifecycle_.MarkTerminated();
    LOG_INFO("POOL", "terminated without workers, discarded " +
                         std::to_string(discarded) + " tasks");
    return;
  }

  tasks_.Close();
  LOG_INFO("POOL", "shutdown requested, draining " +
                       std::to_string(tasks_.Size()) + " queued tasks");
}

size_t ThreadPool::ShutdownNow() {
  lifecycle_.RequestShutdown();

  bool idle = ClaimIdleShutdown();
  auto discarded = DiscardTasks(tasks_.Drain());
  if (idle) {
    lifecycle_.MarkTerminated();
  }

  LOG_INFO("POOL", "immediate shutdown, discarded " +
                       std::to_string(discarded) + " tasks");
  return discarded;
}

bool ThreadPool::AwaitTermination(std::chrono::milliseconds timeout) {
  if (!lifecycle_.WaitTerminated(timeout)) {
    return false;
  }
  JoinWorkers();
  return true;
}

void ThreadPool::WaitIdle() { pending_tasks_.Wait(); }

std::exception_ptr ThreadPool::TakeFailure() {
  std::lock_guard lock(failure_mutex_);
  auto failure = failure_;
  failure_ = nullptr;
  return failure;
}

IExecutorPtr ThreadPool::Current() { return current_threadpool; }

void ThreadPool::WorkerRoutine() {
  current_threadpool = this;
  while (auto task = tasks_.Take()) {
    RunTask(task.value());
    pending_tasks_.Done();
  }
  current_threadpool = nullptr;

  // Queue is closed and empty here, so shutdown was requested
  if (alive_workers_.fetch_sub(1) == 1 && lifecycle_.MarkTerminated()) {
    LOG_INFO("POOL", "last worker exited, terminated");
  }
}

void ThreadPool::RunTask(ITaskPtr task) {
  try {
    task->Run();
    Statistics::Instance().Change("tasks_executed", 1);
  } catch (const std::exception &e) {
    RecordFailure(std::current_exception(), e.what());
  } catch (...) {
    RecordFailure(std::current_exception(), "unknown exception");
  }
}

void ThreadPool::RecordFailure(std::exception_ptr failure,
                               const std::string &what) {
  Statistics::Instance().Change("tasks_failed", 1);
  LOG_ERROR("POOL", "task failed: " + what);

  std::lock_guard lock(failure_mutex_);
  if (failure_ == nullptr) {
    failure_ = std::move(failure);
  }
}

size_t ThreadPool::DiscardTasks(std::deque<ITaskPtr> tasks) {
  auto discarded = tasks.size();
  for (auto *task : tasks) {
    task->Discard();
    pending_tasks_.Done();
  }
  Statistics::Instance().Change("tasks_discarded",
                                static_cast<Statistics::Type>(discarded));
  return discarded;
}

bool ThreadPool::ClaimIdleShutdown() {
  // Forbids a later Start as well
  bool was_started = started_.exchange(true);
  return !was_started || num_workers_ == 0;
}

void ThreadPool::JoinWorkers() {
  std::lock_guard lock(workers_mutex_);
  for (auto &worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
      // Called from a task of this pool
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
}
