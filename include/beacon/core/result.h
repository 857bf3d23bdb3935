#pragma once

#include <utility>
#include <variant>

namespace beacon::core {

// Purpose-designed error indicators (E.14). Each enumeration names a failure
// family; callers switch on them instead of parsing message strings.

enum class StorageError {
  kNotFound,
  kConflict,
  kUnavailable,
};

// Result<T, E> encodes success (T) or failure (E) explicitly (E.27).
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// has_value() must be checked before value() or error() is read.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace beacon::core
