#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "runtime/executor_config.hpp"
#include "services/counter_service.hpp"
#include "util/statistics.hpp"

using namespace std::chrono_literals;

static void Usage(const char *binary) {
  std::cerr << "Usage: " << binary << " <config-path> <increments>"
            << std::endl;
}

static bool ParseIncrements(const std::string &value, uint64_t &increments) {
  if (value.empty() || value.find_first_not_of("0123456789") != value.npos) {
    return false;
  }
  std::istringstream stream(value);
  return static_cast<bool>(stream >> increments);
}

int main(int argc, char **argv) {
  if (argc != 3) {
    Usage(argv[0]);
    return EXIT_FAILURE;
  }

  uint64_t increments = 0;
  if (!ParseIncrements(argv[2], increments)) {
    Usage(argv[0]);
    return EXIT_FAILURE;
  }

  auto config = LoadExecutorConfig(argv[1]);
  if (config.HasError()) {
    std::cerr << "Cannot load " << argv[1] << ": " << config.Error().message()
              << std::endl;
    return EXIT_FAILURE;
  }
  auto executor_config = config.Value();

  auto executor = MakeExecutor(executor_config);
  if (executor == nullptr) {
    return EXIT_FAILURE;
  }

  CounterService counter(executor.get());
  counter.Start();

  uint64_t rejected = 0;
  for (uint64_t i = 0; i < increments; ++i) {
    if (counter.Increment().HasError()) {
      ++rejected;
    }
  }

  // Destroys the executor while the counter its tasks refer to is alive
  auto state = StopExecutor(std::move(executor), 5s);

  counter.Stop();

  std::cout << "Executor: " << ToString(executor_config.kind) << " ("
            << ToString(state) << ")\n";
  std::cout << "Counter: " << counter.Get() << "\n";
  std::cout << Statistics::Instance().GetSnapshot().Print();

  if (state != ExecutorState::kTerminated) {
    return EXIT_FAILURE;
  }
  return rejected == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
