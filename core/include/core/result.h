#pragma once

#include <cassert>
#include <optional>
#include <utility>
#include <variant>

namespace taskrun::core {

/// Result<T, E> — explicit success/error return used across module
/// boundaries instead of exceptions.
///
///   auto created = factory.create_task(desc);
///   if (created.is_err()) { ... created.error().category ... }
///   auto task = std::move(created).value();
template <typename T, typename E> class Result {
public:
  static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  /// Success value. Must only be called when is_ok().
  [[nodiscard]] const T &value() const & {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(std::move(storage_));
  }

  /// Error value. Must only be called when is_err().
  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(std::move(storage_));
  }

private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V &&v) : storage_(tag, std::forward<V>(v)) {}

  // Index-based so that T and E may be the same type.
  std::variant<T, E> storage_;
};

/// Result<void, E> — success carries no value.
template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(); }

  static Result Err(E error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
  [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result<void,E>::error() called on Ok");
    return *error_;
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result<void,E>::error() called on Ok");
    return std::move(*error_);
  }

private:
  Result() = default;
  std::optional<E> error_;
};

} // namespace taskrun::core
