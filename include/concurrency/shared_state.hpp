#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "concurrency/wait_group.hpp"
#include "util/noncopyable.hpp"
#include "util/result.hpp"

// One-shot slot between a Promise and a Future
template <typename T> class SharedState : private NonCopyable {
public:
  using ResultType = Result<T>;

  SharedState() { ready_.Add(); }

  // Only the first result is stored
  void Produce(ResultType result) {
    if (produced_.exchange(true)) {
      return;
    }
    result_ = std::move(result);
    ready_.Done();
  }

  ResultType Consume() {
    ready_.Wait();
    return std::move(result_);
  }

  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    return ready_.WaitFor(timeout);
  }

  bool IsReady() const { return ready_.Count() == 0; }

private:
  std::atomic<bool> produced_{false};
  ResultType result_; // written once before ready_ is released
  WaitGroup ready_;
};

template <typename T> using SharedStatePtr = std::shared_ptr<SharedState<T>>;
