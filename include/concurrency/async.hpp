#pragma once

#include <exception>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "concurrency/contract.hpp"
#include "concurrency/future.hpp"
#include "concurrency/promise.hpp"
#include "runtime/executor.hpp"
#include "runtime/synchronous_executor.hpp"
#include "runtime/task.hpp"
#include "util/logging.hpp"
#include "util/result.hpp"

// Task that resolves its promise exactly once: with the result of the
// function when run, with Error::rejected_execution when discarded
template <typename T, typename F> class AsyncTask : public ITask {
public:
  static ITaskPtr Create(F function, Promise<T> promise) {
    return new AsyncTask(std::move(function), std::move(promise));
  }

  void Run() final {
    std::unique_ptr<AsyncTask> self(this);
    try {
      promise_.Set(function_());
    } catch (const std::exception &e) {
      LOG_ERROR("ASYNC", std::string("task failed: ") + e.what());
      promise_.SetError(make_error_code(Error::task_failed));
    } catch (...) {
      LOG_ERROR("ASYNC", "task failed with an unknown exception");
      promise_.SetError(make_error_code(Error::task_failed));
    }
  }

  void Discard() final {
    std::unique_ptr<AsyncTask> self(this);
    LOG_DEBUG("ASYNC", "task dropped by the executor");
    promise_.SetError(make_error_code(Error::rejected_execution));
  }

private:
  AsyncTask(F function, Promise<T> promise)
      : function_(std::move(function)), promise_(std::move(promise)) {}

  F function_;
  Promise<T> promise_;
};

// Runs `function` (returning Result<T>) on the executor. A throwing function
// resolves the future with Error::task_failed. A rejected submission or a
// task the executor drops before running resolves it with
// Error::rejected_execution
template <typename F>
Future<GetType<std::invoke_result_t<F>>> Async(IExecutorPtr executor,
                                               F function) {
  using T = GetType<std::invoke_result_t<F>>;

  auto [f, p] = MakeContract<T>();

  // On rejection the executor discards the task, which sets the error
  auto submitted =
      executor->Submit(AsyncTask<T, F>::Create(std::move(function), p));
  if (submitted.HasError()) {
    LOG_DEBUG("ASYNC", "submission rejected: " + ToString(submitted.Error()));
  }

  return std::move(f);
}

// Runs `function` inline on the calling thread, the future is ready on return
template <typename F>
Future<GetType<std::invoke_result_t<F>>> Async(F function) {
  return Async(JustExecute(), std::move(function));
}
