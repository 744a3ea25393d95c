#pragma once

#include <memory>

#include "runtime/routine.hpp"
#include "util/intrusive_list.hpp"

// Executor takes ownership of a submitted task and releases it with exactly
// one of Run() or Discard()
class ITaskBase {
public:
  virtual ~ITaskBase() = default;

  virtual void Run() = 0;
  // Release without running, used for rejected and dropped tasks
  virtual void Discard() = 0;
};

using ITaskBasePtr = ITaskBase *;

class ITask : public ITaskBase, public IntrusiveNode<ITask> {};

using ITaskPtr = ITask *;

class Lambda : public ITask {
public:
  static ITaskPtr Create(Routine routine) {
    auto *lambda = new Lambda(std::move(routine));
    return static_cast<ITaskPtr>(lambda);
  }

  void Run() final {
    // Released even if the routine throws
    std::unique_ptr<Lambda> self(this);
    self->routine_();
  }

  void Discard() final { delete this; }

private:
  explicit Lambda(Routine routine) : routine_(std::move(routine)) {}

  Routine routine_;
};
