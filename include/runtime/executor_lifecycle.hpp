#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>

#include "concurrency/wait_group.hpp"
#include "util/noncopyable.hpp"

enum class ExecutorState {
  kRunning,
  kShuttingDown,
  kTerminated,
};

std::string ToString(ExecutorState state);

// kRunning -> kShuttingDown -> kTerminated, never backwards
class ExecutorLifecycle : private NonCopyable {
public:
  ExecutorLifecycle() { terminated_.Add(); }

  ExecutorState State() const { return state_.load(); }

  // True only for the call that left kRunning
  bool RequestShutdown() {
    auto expected = ExecutorState::kRunning;
    return state_.compare_exchange_strong(expected,
                                          ExecutorState::kShuttingDown);
  }

  // True only for the call that entered kTerminated
  bool MarkTerminated() {
    auto previous = state_.exchange(ExecutorState::kTerminated);
    assert(previous != ExecutorState::kRunning &&
           "Executor terminated without a shutdown request");
    if (previous == ExecutorState::kTerminated) {
      return false;
    }
    terminated_.Done();
    return true;
  }

  template <typename Rep, typename Period>
  bool WaitTerminated(std::chrono::duration<Rep, Period> timeout) {
    return terminated_.WaitFor(timeout);
  }

private:
  std::atomic<ExecutorState> state_{ExecutorState::kRunning};
  WaitGroup terminated_;
};
