#include "concurrency/futex.hpp"

#include <atomic>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <ctime>
#include <linux/futex.h>
#include <sys/syscall.h>
#include <type_traits>
#include <unistd.h>

#include "util/syscall.hpp"

static long Futex(uint32_t *uaddr, int futex_op, uint32_t val,
                  const timespec *timeout) {
  return syscall(SYS_futex, uaddr, futex_op, val, timeout, nullptr, 0);
}

void AtomicWait(std::atomic<uint32_t> &atomic, uint32_t value) {
  auto uaddr = AtomicAddr(atomic);
  auto errcode = Futex(uaddr, FUTEX_WAIT_PRIVATE, value, nullptr);
  if (errcode == -1 && (errno == EAGAIN || errno == EINTR)) {
    return;
  }
  CANNOT_FAIL(errcode, "futex wait failed");
}

bool AtomicWaitFor(std::atomic<uint32_t> &atomic, uint32_t value,
                   std::chrono::nanoseconds timeout) {
  if (timeout.count() <= 0) {
    return atomic.load() != value;
  }

  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  timespec relative;
  relative.tv_sec = static_cast<time_t>(seconds.count());
  relative.tv_nsec = static_cast<long>((timeout - seconds).count());

  auto uaddr = AtomicAddr(atomic);
  auto errcode = Futex(uaddr, FUTEX_WAIT_PRIVATE, value, &relative);
  if (errcode == -1) {
    if (errno == ETIMEDOUT) {
      return false;
    }
    if (errno == EAGAIN || errno == EINTR) {
      return true;
    }
  }
  CANNOT_FAIL(errcode, "futex timed wait failed");
  return true;
}

Key AtomicAddr(std::atomic<uint32_t> &atomic) {
  static_assert(std::is_standard_layout_v<std::atomic<uint32_t>>);
  return reinterpret_cast<uint32_t *>(&atomic);
}

void AtomicWakeOne(Key key) {
  CANNOT_FAIL(Futex(key, FUTEX_WAKE_PRIVATE, 1, nullptr), "futex wake failed");
}

void AtomicWakeAll(Key key) {
  // According to the futex(2) / Futex operations / FUTEX_WAKE
  uint32_t all_waiters = static_cast<uint32_t>(INT_MAX);
  CANNOT_FAIL(Futex(key, FUTEX_WAKE_PRIVATE, all_waiters, nullptr),
              "futex wake failed");
}
