#include "services/counter_service.hpp"

#include <cassert>
#include <string>

#include "runtime/task.hpp"
#include "util/logging.hpp"

CounterService::CounterService(IExecutorPtr executor) : executor_(executor) {
  assert(executor_ != nullptr && "CounterService requires an executor");
}

void CounterService::Start() {
  if (!started_.exchange(true)) {
    LOG_INFO("COUNTER", "started");
  }
}

Result<Unit> CounterService::Increment() {
  auto submitted = executor_->Submit(
      Lambda::Create([this]() { counter_.fetch_add(1); }));
  if (submitted.HasError()) {
    LOG_ERROR("COUNTER", "increment is not scheduled, " +
                             ToString(submitted.Error()));
  }
  return submitted;
}

uint64_t CounterService::Get() const { return counter_.load(); }

void CounterService::Stop() {
  if (started_.exchange(false)) {
    LOG_INFO("COUNTER", "stopped at " + std::to_string(counter_.load()));
  }
}
