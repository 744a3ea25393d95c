#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>

#include "runtime/executor.hpp"
#include "runtime/executor_lifecycle.hpp"
#include "runtime/task.hpp"
#include "util/intrusive_list.hpp"
#include "util/noncopyable.hpp"

// Queues tasks until the test runs them with Step() or RunAll(). Tasks run on
// the stepping thread, exceptions propagate to it.
//
// After Shutdown the queued tasks are still runnable; the executor stays in
// kShuttingDown until the queue is stepped empty.
class ManualExecutor : public IExecutor,
                       private NonCopyable,
                       private NonMoveable {
public:
  ManualExecutor() = default;
  // Tasks that were never stepped are discarded
  ~ManualExecutor();

  Result<Unit> Submit(ITaskPtr task) final;

  bool Step();

  size_t RunAll();

  bool HasStep() const;

  size_t Pending() const;

  void Shutdown() final;

  ExecutorState State() const final { return lifecycle_.State(); }

  bool AwaitTermination(std::chrono::milliseconds timeout) final;

private:
  using Lock = std::lock_guard<std::mutex>;

  mutable std::mutex mutex_;
  IntrusiveList<ITask> tasks_; // guarded by mutex_
  size_t running_{0};          // guarded by mutex_

  ExecutorLifecycle lifecycle_;

  void FinishStep();
  void TryTerminate(Lock &);
};
