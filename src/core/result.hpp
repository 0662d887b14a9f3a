/**
 * @file result.hpp
 * @brief Success-or-failure value type for the railway runtime.
 *
 * Result<T> holds either a success value of type T or an Error. Expected
 * failures travel as values; touching the wrong side of a Result is a
 * programming error and throws ContractViolation.
 */

#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <concepts>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace railway {

/**
 * @brief Thrown on misuse of the algebra: wrong-side access or an
 *        unhandled match_error. Never represented as a Result.
 */
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

template <typename T>
class Result;

namespace detail {

template <typename T>
struct is_result : std::false_type {};

template <typename T>
struct is_result<Result<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_result_v = is_result<std::remove_cvref_t<T>>::value;

template <typename T>
struct is_tuple : std::false_type {};

template <typename... Ts>
struct is_tuple<std::tuple<Ts...>> : std::true_type {};

template <typename T>
inline constexpr bool is_tuple_v = is_tuple<std::remove_cvref_t<T>>::value;

template <typename F, typename Tuple, std::size_t... I>
constexpr bool applicable_impl(std::index_sequence<I...>) {
    return std::is_invocable_v<F, decltype(std::get<I>(std::declval<Tuple>()))...>;
}

template <typename F, typename V>
constexpr bool is_applicable() {
    if constexpr (is_tuple_v<V>) {
        return applicable_impl<F, V>(
            std::make_index_sequence<std::tuple_size_v<std::remove_cvref_t<V>>>{});
    } else {
        return false;
    }
}

template <typename F, typename V>
constexpr bool is_nullary_on_unit() {
    return std::is_same_v<std::remove_cvref_t<V>, Unit> && std::is_invocable_v<F>;
}

}  // namespace detail

/**
 * @brief Callable accepting a success value: directly, spread over the
 *        elements of a tuple value, or with no arguments for Unit.
 */
template <typename F, typename V>
concept ValueInvocable = std::is_invocable_v<F, V> || detail::is_applicable<F, V>() ||
                         detail::is_nullary_on_unit<F, V>();

namespace detail {

/// Invokes @p f with a success value, applying tuple elements as arguments.
template <typename F, typename V>
    requires ValueInvocable<F, V>
decltype(auto) invoke_value(F&& f, V&& value) {
    if constexpr (std::is_invocable_v<F, V>) {
        return std::invoke(std::forward<F>(f), std::forward<V>(value));
    } else if constexpr (is_applicable<F, V>()) {
        return std::apply(std::forward<F>(f), std::forward<V>(value));
    } else {
        return std::invoke(std::forward<F>(f));
    }
}

template <typename F, typename V>
using invoke_value_t = decltype(invoke_value(std::declval<F>(), std::declval<V>()));

/// void maps to Unit so every success carries a value.
template <typename T>
using lift_void_t = std::conditional_t<std::is_void_v<T>, Unit, T>;

}  // namespace detail

// ─────────────────────────────────────────────
// Result
// ─────────────────────────────────────────────

/**
 * @brief Success(T) | Failure(Error).
 *
 * Exactly one side is populated and it never changes after construction.
 */
template <typename T>
class Result {
    static_assert(!std::is_reference_v<T>, "Result<T> requires a non-reference value type");
    static_assert(!std::is_void_v<T>, "use Result<Unit> for operations without a value");
    static_assert(!std::is_same_v<std::remove_cv_t<T>, Error>,
                  "Result<Error> would make both sides ambiguous");

public:
    using value_type = T;

    // ── Constructors ──────────────────────────

    /// Construct a success result.
    template <typename U = T>
        requires(std::is_constructible_v<T, U &&> &&
                 !std::is_same_v<std::remove_cvref_t<U>, Result> &&
                 !std::is_same_v<std::remove_cvref_t<U>, Error> &&
                 !detail::is_variant_alternative<std::remove_cvref_t<U>, Error::Variant>::value)
    explicit(!std::is_convertible_v<U&&, T>) Result(U&& value)  // NOLINT(implicit)
        : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    /// Construct a failure result.
    Result(Error error)  // NOLINT(implicit)
        : storage_(std::in_place_index<1>, std::move(error)) {}

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool is_success() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool is_failure() const noexcept { return storage_.index() == 1; }

    [[nodiscard]] explicit operator bool() const noexcept { return is_success(); }

    [[nodiscard]] const T& value() const& {
        if (!is_success()) throw ContractViolation("value() called on a failed Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T value() && {
        if (!is_success()) throw ContractViolation("value() called on a failed Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        if (!is_failure()) throw ContractViolation("error() called on a successful Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] Error error() && {
        if (!is_failure()) throw ContractViolation("error() called on a successful Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T operator*() && { return std::move(*this).value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Provide a fallback value.
    template <typename U>
    [[nodiscard]] T value_or(U&& fallback) const& {
        if (is_success()) return std::get<0>(storage_);
        return static_cast<T>(std::forward<U>(fallback));
    }

    template <typename U>
    [[nodiscard]] T value_or(U&& fallback) && {
        if (is_success()) return std::get<0>(std::move(storage_));
        return static_cast<T>(std::forward<U>(fallback));
    }

    friend bool operator==(const Result& lhs, const Result& rhs)
        requires std::equality_comparable<T>
    {
        return lhs.storage_ == rhs.storage_;
    }

private:
    std::variant<T, Error> storage_;
};

// ─────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────

template <typename T>
[[nodiscard]] Result<std::decay_t<T>> success(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline Result<Unit> success() {
    return Result<Unit>(Unit{});
}

template <typename T>
[[nodiscard]] Result<T> failure(Error error) {
    return Result<T>(std::move(error));
}

/// Success(value) when @p condition holds, otherwise Failure(error).
template <typename T>
[[nodiscard]] Result<std::decay_t<T>> success_if(bool condition, T&& value, Error error) {
    if (condition) return Result<std::decay_t<T>>(std::forward<T>(value));
    return Result<std::decay_t<T>>(std::move(error));
}

[[nodiscard]] inline Result<Unit> success_if(bool condition, Error error) {
    if (condition) return success();
    return Result<Unit>(std::move(error));
}

/// Failure(error) when @p condition holds, otherwise Success(value).
template <typename T>
[[nodiscard]] Result<std::decay_t<T>> failure_if(bool condition, T&& value, Error error) {
    return success_if(!condition, std::forward<T>(value), std::move(error));
}

[[nodiscard]] inline Result<Unit> failure_if(bool condition, Error error) {
    return success_if(!condition, std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> from_optional(std::optional<T> value, Error error) {
    if (value) return Result<T>(std::move(*value));
    return Result<T>(std::move(error));
}

// ─────────────────────────────────────────────
// try_invoke
// ─────────────────────────────────────────────

namespace detail {

template <typename F>
struct try_result {
    using raw = std::invoke_result_t<F>;
    using type = std::conditional_t<is_result_v<raw>,
                                    std::remove_cvref_t<raw>,
                                    Result<lift_void_t<std::remove_cvref_t<raw>>>>;
};

inline Error exception_to_unexpected(const std::exception& ex) {
    return Error::unexpected(ex.what());
}

}  // namespace detail

/**
 * @brief Runs a throwing callable and captures the outcome as a Result.
 *
 * A std::exception becomes Failure(on_exception(ex)). ContractViolation is
 * rethrown because it signals a bug, not an expected failure. A callable
 * that already returns a Result is passed through unchanged.
 */
template <typename F, typename Mapper>
    requires std::is_invocable_r_v<Error, Mapper, const std::exception&>
[[nodiscard]] typename detail::try_result<F>::type try_invoke(F&& func, Mapper&& on_exception) {
    using Raw = std::invoke_result_t<F>;
    try {
        if constexpr (std::is_void_v<Raw>) {
            std::invoke(std::forward<F>(func));
            return Unit{};
        } else {
            return std::invoke(std::forward<F>(func));
        }
    } catch (const ContractViolation&) {
        throw;
    } catch (const std::exception& ex) {
        return std::invoke(std::forward<Mapper>(on_exception), ex);
    }
}

template <typename F>
[[nodiscard]] typename detail::try_result<F>::type try_invoke(F&& func) {
    return try_invoke(std::forward<F>(func), &detail::exception_to_unexpected);
}

}  // namespace railway
