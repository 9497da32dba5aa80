#pragma once

/// @file expected.hpp
/// @brief Minimal std::expected stand-in used when the standard library lacks it.

#include <memory>
#include <type_traits>
#include <utility>

namespace procsup {

/// @brief Error wrapper used to construct an expected in the error state.
template <typename E>
class unexpected {
 public:
  explicit unexpected(const E& error) : error_(error) {}
  explicit unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& noexcept { return error_; }
  [[nodiscard]] E& error() & noexcept { return error_; }
  [[nodiscard]] E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/// @brief Value-or-error holder with the subset of the std::expected API procsup uses.
template <typename T, typename E>
class expected {
 public:
  using value_type = T;
  using error_type = E;

  expected(const T& value) : has_value_(true) { std::construct_at(&value_, value); }
  expected(T&& value) : has_value_(true) { std::construct_at(&value_, std::move(value)); }
  expected(const unexpected<E>& err) { std::construct_at(&error_, err.error()); }
  expected(unexpected<E>&& err) { std::construct_at(&error_, std::move(err).error()); }
  expected(const E& err) { std::construct_at(&error_, err); }
  expected(E&& err) { std::construct_at(&error_, std::move(err)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      std::construct_at(&value_, other.value_);
    } else {
      std::construct_at(&error_, other.error_);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                      std::is_nothrow_move_constructible_v<E>)
      : has_value_(other.has_value_) {
    if (has_value_) {
      std::construct_at(&value_, std::move(other.value_));
    } else {
      std::construct_at(&error_, std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected copy(other);
      destroy();
      adopt(std::move(copy));
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                 std::is_nothrow_move_constructible_v<E>) {
    if (this != &other) {
      destroy();
      adopt(std::move(other));
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  [[nodiscard]] T& value() & { return value_; }
  [[nodiscard]] const T& value() const& { return value_; }
  [[nodiscard]] T&& value() && { return std::move(value_); }

  [[nodiscard]] T& operator*() & noexcept { return value_; }
  [[nodiscard]] const T& operator*() const& noexcept { return value_; }
  [[nodiscard]] T* operator->() noexcept { return &value_; }
  [[nodiscard]] const T* operator->() const noexcept { return &value_; }

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value_ ? value_ : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  void destroy() noexcept {
    if (has_value_) {
      std::destroy_at(&value_);
    } else {
      std::destroy_at(&error_);
    }
  }

  void adopt(expected&& other) {
    has_value_ = other.has_value_;
    if (has_value_) {
      std::construct_at(&value_, std::move(other.value_));
    } else {
      std::construct_at(&error_, std::move(other.error_));
    }
  }

  bool has_value_{false};
  union {
    T value_;
    E error_;
  };
};

/// @brief Specialization for operations that only report success or an error.
template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() : has_value_(true) {}
  expected(const unexpected<E>& err) : error_(err.error()) {}
  expected(unexpected<E>&& err) : error_(std::move(err).error()) {}
  expected(const E& err) : error_(err) {}
  expected(E&& err) : error_(std::move(err)) {}

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }
  void value() const {}

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  bool has_value_{false};
  E error_{};
};

}  // namespace procsup
