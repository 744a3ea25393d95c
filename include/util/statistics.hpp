#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

// Process-wide execution counters, updated by every executor
class Statistics {
public:
  using Type = int64_t;
  using AtomicT = std::atomic<int64_t>;

  struct Snapshot {
    Type tasks_submitted;
    Type tasks_executed;
    Type tasks_rejected;
    Type tasks_failed;
    Type tasks_discarded;

    std::string Print() const {
      std::stringstream ss;
      ss << std::setw(20) << std::left << "Tasks submitted:" << tasks_submitted
         << "\n";
      ss << std::setw(20) << std::left << "Tasks executed:" << tasks_executed
         << "\n";
      ss << std::setw(20) << std::left << "Tasks rejected:" << tasks_rejected
         << "\n";
      ss << std::setw(20) << std::left << "Tasks failed:" << tasks_failed
         << "\n";
      ss << std::setw(20) << std::left << "Tasks discarded:" << tasks_discarded
         << "\n";
      return ss.str();
    }
  };

  static Statistics &Instance() {
    static Statistics statistics;
    return statistics;
  }

  void Change(const std::string &name, Type difference) noexcept {
    Mapping(name, [&difference](AtomicT &atomic) noexcept {
      atomic.fetch_add(difference, std::memory_order_relaxed);
    });
  }

  Type Get(const std::string &name) noexcept {
    Type result{0};
    Mapping(name, [&result](AtomicT &atomic) noexcept {
      result = atomic.load(std::memory_order_relaxed);
    });
    return result;
  }

  Snapshot GetSnapshot() noexcept {
    Snapshot snapshot;
    snapshot.tasks_submitted = tasks_submitted.load(std::memory_order_relaxed);
    snapshot.tasks_executed = tasks_executed.load(std::memory_order_relaxed);
    snapshot.tasks_rejected = tasks_rejected.load(std::memory_order_relaxed);
    snapshot.tasks_failed = tasks_failed.load(std::memory_order_relaxed);
    snapshot.tasks_discarded = tasks_discarded.load(std::memory_order_relaxed);
    return snapshot;
  }

private:
  using Operation = std::function<void(AtomicT &)>;

  AtomicT tasks_submitted{0};
  AtomicT tasks_executed{0};
  AtomicT tasks_rejected{0};
  AtomicT tasks_failed{0};
  AtomicT tasks_discarded{0};

  Statistics() = default;

  void Mapping(const std::string &name, const Operation &op) {
    if (name == "tasks_submitted") {
      op(tasks_submitted);
    } else if (name == "tasks_executed") {
      op(tasks_executed);
    } else if (name == "tasks_rejected") {
      op(tasks_rejected);
    } else if (name == "tasks_failed") {
      op(tasks_failed);
    } else if (name == "tasks_discarded") {
      op(tasks_discarded);
    } else {
      assert(false && "Statistics::Mapping is called on the invalid name");
    }
  }
};
