#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

// Custom std::error_code implementation details are taken from:
// http://blog.think-async.com/2010/04/system-error-support-in-c0x-part-5.html
enum Error {
  internal = 1,
  rejected_execution,
  task_failed,
  invalid_config,
  config_not_found,
};

class ErrorImpl : public std::error_category {
public:
  using std::error_category::equivalent;

  const char *name() const noexcept final { return "Error"; }
  virtual std::string message(int ev) const {
    switch (ev) {
    case Error::internal: {
      return "Internal error";
    }
    case Error::rejected_execution: {
      return "Task rejected: executor is shut down";
    }
    case Error::task_failed: {
      return "Task failed with an exception";
    }
    case Error::invalid_config: {
      return "Invalid configuration";
    }
    case Error::config_not_found: {
      return "Configuration file cannot be opened";
    }
    default: {
      return "Unknown error";
    }
    }
  }
  bool equivalent(const std::error_code & /*code*/,
                  int /*condition*/) const noexcept final {
    return false;
  }
};

inline const std::error_category &ErrorCategory() {
  static ErrorImpl instance;
  return instance;
}

inline std::error_condition make_error_condition(Error e) {
  return std::error_condition(static_cast<int>(e), ErrorCategory());
}

inline std::error_code make_error_code(Error e) {
  return std::error_code(static_cast<int>(e), ErrorCategory());
}

namespace std {
template <> struct is_error_condition_enum<Error> : public true_type {};
} // namespace std

// https://doc.rust-lang.org/std/primitive.unit.html
using Unit = std::monostate;

// Inspiried by std::expected proposal
template <typename T> class Result {
public:
  using ValueType = T;

  Result() = default;

  explicit Result(T value) {
    placeholder_.template emplace<T>(std::move(value));
  }

  explicit Result(std::error_code ec) {
    placeholder_.template emplace<std::error_code>(ec);
  }

  Result(const Result &other) = default;
  Result &operator=(const Result &other) = default;

  Result(Result &&other) noexcept {
    placeholder_ = std::move(other.placeholder_);
  }

  Result &operator=(Result<T> &&other) noexcept {
    placeholder_ = std::move(other.placeholder_);
    return *this;
  }

  bool HasValue() const { return placeholder_.index() == kValueIndex; }

  bool HasError() const { return placeholder_.index() == kErrorIndex; }

  T Value() { return std::move(std::get<T>(placeholder_)); }

  const T &ValueRef() const { return std::get<T>(placeholder_); }

  void SetValue(T value) { placeholder_.template emplace<T>(std::move(value)); }

  std::error_code Error() const {
    return std::get<std::error_code>(placeholder_);
  }

  void SetError(std::error_code ec) {
    placeholder_.template emplace<std::error_code>(ec);
  }

private:
  static constexpr size_t kErrorIndex = 0;
  static constexpr size_t kValueIndex = 1;

  std::variant<std::error_code, T> placeholder_;
};

template <typename T> inline Result<T> Ok(T value) {
  return Result<T>(std::move(value));
}

inline Result<Unit> Ok() { return Result<Unit>(Unit{}); }

template <typename T> inline Result<T> Err(std::error_code ec) {
  return Result<T>(ec);
}

template <typename T> inline Result<T> Err(Error e) {
  return Result<T>(make_error_code(e));
}

namespace traits {
template <typename T> struct Type {};

template <typename T> struct Type<Result<T>> {
  using InnerType = T;
};
} // namespace traits

template <typename Result>
using GetType = typename traits::Type<Result>::InnerType;
