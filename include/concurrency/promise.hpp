#pragma once

#include <system_error>

#include "concurrency/shared_state.hpp"
#include "util/result.hpp"

// Copies share the same state, so a Promise fits into a Routine. The first
// Set wins, later ones are ignored
template <typename T> class Promise {
public:
  using ValueType = T;
  using ResultType = Result<ValueType>;

  explicit Promise(SharedStatePtr<T> shared_state)
      : shared_state_(std::move(shared_state)) {}

  void Set(ResultType result) const {
    shared_state_->Produce(std::move(result));
  }

  void SetValue(ValueType value) const { Set(Ok(std::move(value))); }

  void SetError(std::error_code ec) const { Set(Err<T>(ec)); }

private:
  SharedStatePtr<T> shared_state_;
};
