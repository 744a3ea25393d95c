#pragma once

#include <cassert>
#include <chrono>

#include "concurrency/shared_state.hpp"
#include "util/noncopyable.hpp"
#include "util/result.hpp"

template <typename T> class Future : private NonCopyable {
public:
  using ValueType = T;
  using ResultType = Result<ValueType>;

  explicit Future(SharedStatePtr<T> shared_state)
      : shared_state_(std::move(shared_state)) {}

  Future(Future &&other) noexcept = default;
  Future &operator=(Future &&other) noexcept = default;

  // Blocks until the result is produced, the future is consumed afterwards
  ResultType Get() {
    assert(shared_state_ != nullptr && "Future::Get on a consumed future");
    auto result = shared_state_->Consume();
    shared_state_.reset();
    return result;
  }

  // False if nothing was produced within the timeout
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    assert(shared_state_ != nullptr && "Future::WaitFor on a consumed future");
    return shared_state_->WaitFor(timeout);
  }

  bool IsReady() const {
    return shared_state_ != nullptr && shared_state_->IsReady();
  }

  bool IsValid() const { return shared_state_ != nullptr; }

private:
  SharedStatePtr<T> shared_state_;
};
