/**
 * @file expected.h
 * @brief Minimal Expected<T, E> for value-or-error returns
 *
 * Mirrors the subset of std::expected (C++23) used in this codebase:
 * construction from a value or Unexpected, value()/error() access,
 * value_or, and the monadic transform/and_then/or_else/transform_error.
 */

#pragma once

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace binlogsync::utils {

template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  [[nodiscard]] const char* what() const noexcept override { return "Bad Expected access: contains error"; }

  [[nodiscard]] const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {

template <typename U>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

template <typename U>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !std::is_same_v<std::decay_t<U>, Expected> &&
                                        !detail::IsUnexpected<std::decay_t<U>>::value &&
                                        !std::is_same_v<std::decay_t<U>, std::in_place_t>>>
  // NOLINTNEXTLINE(google-explicit-constructor,bugprone-forwarding-reference-overload)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  const T& value() const& {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  T&& value() && {
    ThrowIfError();
    return std::get<0>(std::move(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::get<0>(std::move(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & { return std::get<1>(storage_); }
  const E& error() const& { return std::get<1>(storage_); }
  E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename F>
  auto transform(F&& func) const& {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::forward<F>(func)(**this);
      return Expected<U, E>();
    } else {
      return Expected<U, E>(std::forward<F>(func)(**this));
    }
  }

  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<Result>::value, "and_then must return an Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(**this);
  }

  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  void ThrowIfError() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

/**
 * @brief Expected specialization for operations that return no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & { return *error_; }
  const E& error() const& { return *error_; }
  E&& error() && { return std::move(*error_); }

  template <typename F>
  auto transform(F&& func) const& {
    using U = std::invoke_result_t<F>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(*error_));
    }
    if constexpr (std::is_void_v<U>) {
      std::forward<F>(func)();
      return Expected<U, E>();
    } else {
      return Expected<U, E>(std::forward<F>(func)());
    }
  }

  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<Result>::value, "and_then must return an Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(*error_));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(*error_);
  }

  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::forward<F>(func)(*error_)));
  }

 private:
  std::optional<E> error_;
};

}  // namespace binlogsync::utils
