#pragma once

#include <memory>
#include <tuple>

#include "concurrency/future.hpp"
#include "concurrency/promise.hpp"
#include "concurrency/shared_state.hpp"

template <typename T> std::tuple<Future<T>, Promise<T>> MakeContract() {
  auto shared_state = std::make_shared<SharedState<T>>();
  Future<T> future(shared_state);
  Promise<T> promise(std::move(shared_state));
  return std::make_tuple(std::move(future), std::move(promise));
}
