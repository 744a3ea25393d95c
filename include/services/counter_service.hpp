#pragma once

#include <atomic>
#include <cstdint>

#include "runtime/executor.hpp"
#include "util/noncopyable.hpp"
#include "util/result.hpp"

// Counter mutated only by tasks submitted to the injected executor.
//
// The executor is owned by whoever injected it: the service never creates,
// shuts down or destroys it. With a synchronous executor Get() observes every
// completed Increment() without waiting; with a pool the caller has to wait
// for the executor first.
class CounterService : private NonCopyable, private NonMoveable {
public:
  explicit CounterService(IExecutorPtr executor);

  void Start();

  // Err(Error::rejected_execution) leaves the counter unchanged
  Result<Unit> Increment();

  uint64_t Get() const;

  // Leaves the executor running
  void Stop();

  bool IsStarted() const { return started_.load(); }

private:
  IExecutorPtr executor_;
  std::atomic<uint64_t> counter_{0};
  std::atomic<bool> started_{false};
};
