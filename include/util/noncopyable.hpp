#pragma once

class NonCopyable {
public:
  NonCopyable(const NonCopyable &) = delete;
  NonCopyable &operator=(const NonCopyable &) = delete;

protected:
  NonCopyable() = default;
  ~NonCopyable() = default;

  NonCopyable(NonCopyable &&) = default;
  NonCopyable &operator=(NonCopyable &&) = default;
};

// Executors are referenced by raw pointers from the tasks they run
class NonMoveable {
public:
  NonMoveable(NonMoveable &&) = delete;
  NonMoveable &operator=(NonMoveable &&) = delete;

protected:
  NonMoveable() = default;
  ~NonMoveable() = default;
};
