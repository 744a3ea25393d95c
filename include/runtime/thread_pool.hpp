#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#include "concurrency/queue.hpp"
#include "concurrency/spinlock.hpp"
#include "concurrency/wait_group.hpp"
#include "runtime/executor.hpp"
#include "runtime/executor_lifecycle.hpp"
#include "runtime/task.hpp"
#include "util/noncopyable.hpp"

class ThreadPool : public IExecutor, private NonCopyable, private NonMoveable {
public:
  explicit ThreadPool(size_t num_workers);
  // Shuts down and joins the workers, queued tasks are drained first
  ~ThreadPool();

  void Start();

  Result<Unit> Submit(ITaskPtr task) final;

  // Refuses new tasks, workers drain the queue and exit. A pool that was
  // never started discards its queue
  void Shutdown() final;
  // Refuses new tasks and discards the queued ones, returns how many
  size_t ShutdownNow();

  ExecutorState State() const final { return lifecycle_.State(); }

  bool AwaitTermination(std::chrono::milliseconds timeout) final;

  // Blocks until every accepted task has finished or been discarded
  void WaitIdle();

  // First exception thrown by a task since the last call, nullptr if none
  std::exception_ptr TakeFailure();

  size_t NumWorkers() const { return num_workers_; }

  static IExecutorPtr Current();

private:
  const size_t num_workers_;

  std::mutex workers_mutex_;
  std::vector<std::thread> workers_; // guarded by workers_mutex_
  std::atomic<bool> started_{false};
  std::atomic<size_t> alive_workers_{0};

  UnboundedMRMWQueue<ITaskPtr> tasks_;
  WaitGroup pending_tasks_;

  ExecutorLifecycle lifecycle_;

  SpinLock failure_mutex_;
  std::exception_ptr failure_; // guarded by failure_mutex_

  void WorkerRoutine();
  void RunTask(ITaskPtr task);
  void RecordFailure(std::exception_ptr failure, const std::string &what);
  size_t DiscardTasks(std::deque<ITaskPtr> tasks);
  // True if no worker will ever drain the queue
  bool ClaimIdleShutdown();
  void JoinWorkers();
};
