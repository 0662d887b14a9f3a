/**
 * @file sequential.hpp
 * @brief Short-circuit combinators over Result<T>.
 *
 * Every combinator consumes its input Result by value and returns a new
 * one. Success-side functions are never invoked on a failure and
 * failure-side functions never on a success. A function applied to a
 * tuple-valued Result may take the tuple elements as separate parameters.
 *
 * Call bind qualified (railway::bind) when the value type lives in std,
 * otherwise argument-dependent lookup also finds std::bind.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/error.hpp"
#include "core/result.hpp"

#include <functional>
#include <type_traits>
#include <utility>

namespace railway {

// ─────────────────────────────────────────────
// bind / map
// ─────────────────────────────────────────────

/// Chain with a function returning a Result; failure passes through.
template <typename T, typename F>
    requires ValueInvocable<F, T&&>
auto bind(Result<T> result, F&& func) -> std::remove_cvref_t<detail::invoke_value_t<F, T&&>> {
    using R = std::remove_cvref_t<detail::invoke_value_t<F, T&&>>;
    static_assert(detail::is_result_v<R>, "bind requires a function returning Result<U>");
    if (result.is_failure()) return R(std::move(result).error());
    return detail::invoke_value(std::forward<F>(func), std::move(result).value());
}

/// Transform the success value. A void-returning function maps to Unit.
template <typename T, typename F>
    requires ValueInvocable<F, T&&>
auto map(Result<T> result, F&& func)
    -> Result<detail::lift_void_t<std::remove_cvref_t<detail::invoke_value_t<F, T&&>>>> {
    using Raw = detail::invoke_value_t<F, T&&>;
    using R = Result<detail::lift_void_t<std::remove_cvref_t<Raw>>>;
    if (result.is_failure()) return R(std::move(result).error());
    if constexpr (std::is_void_v<Raw>) {
        detail::invoke_value(std::forward<F>(func), std::move(result).value());
        return R(Unit{});
    } else {
        return R(detail::invoke_value(std::forward<F>(func), std::move(result).value()));
    }
}

// ─────────────────────────────────────────────
// ensure
// ─────────────────────────────────────────────

/**
 * @brief Turns a success into Failure(error) when @p predicate is false.
 *
 * @p error is an Error, a factory taking the value, or a nullary factory.
 * Neither the predicate nor the factory runs on a failure.
 */
template <typename T, typename Pred, typename E>
    requires ValueInvocable<Pred, const T&>
Result<T> ensure(Result<T> result, Pred&& predicate, E&& error) {
    if (result.is_failure()) return result;

    const T& value = result.value();
    if (static_cast<bool>(detail::invoke_value(predicate, value))) return result;

    if constexpr (std::is_convertible_v<E, Error>) {
        return Error(std::forward<E>(error));
    } else if constexpr (ValueInvocable<E, const T&>) {
        return Error(detail::invoke_value(std::forward<E>(error), value));
    } else {
        static_assert(std::is_invocable_r_v<Error, E>,
                      "ensure requires an Error or a factory producing one");
        return Error(std::invoke(std::forward<E>(error)));
    }
}

// ─────────────────────────────────────────────
// compensate
// ─────────────────────────────────────────────

/// Recover from any failure. @p func takes the Error or nothing.
template <typename T, typename F>
Result<T> compensate(Result<T> result, F&& func) {
    if (result.is_success()) return result;
    if constexpr (std::is_invocable_v<F, const Error&>) {
        static_assert(std::is_convertible_v<std::invoke_result_t<F, const Error&>, Result<T>>,
                      "compensate requires a function returning Result<T>");
        return std::invoke(std::forward<F>(func), result.error());
    } else {
        static_assert(std::is_convertible_v<std::invoke_result_t<F>, Result<T>>,
                      "compensate requires a function returning Result<T>");
        return std::invoke(std::forward<F>(func));
    }
}

/// Recover only from failures matching @p predicate.
template <typename T, ErrorPredicate Pred, typename F>
Result<T> compensate(Result<T> result, Pred&& predicate, F&& func) {
    if (result.is_success()) return result;
    if (!std::invoke(std::forward<Pred>(predicate), result.error())) return result;
    return compensate(std::move(result), std::forward<F>(func));
}

// ─────────────────────────────────────────────
// tap / tap_on_failure
// ─────────────────────────────────────────────

/// Side effect on success. The action's return value is discarded.
template <typename T, typename F>
Result<T> tap(Result<T> result, F&& action) {
    if (result.is_success()) {
        if constexpr (ValueInvocable<F, const T&>) {
            static_cast<void>(detail::invoke_value(std::forward<F>(action), result.value()));
        } else {
            static_assert(std::is_invocable_v<F>, "tap action must take the value or nothing");
            static_cast<void>(std::invoke(std::forward<F>(action)));
        }
    }
    return result;
}

/// Side effect on failure. The action's return value is discarded.
template <typename T, typename F>
Result<T> tap_on_failure(Result<T> result, F&& action) {
    if (result.is_failure()) {
        if constexpr (std::is_invocable_v<F, const Error&>) {
            static_cast<void>(std::invoke(std::forward<F>(action), result.error()));
        } else {
            static_assert(std::is_invocable_v<F>,
                          "tap_on_failure action must take the Error or nothing");
            static_cast<void>(std::invoke(std::forward<F>(action)));
        }
    }
    return result;
}

// ─────────────────────────────────────────────
// map_error
// ─────────────────────────────────────────────

template <typename T, ErrorMapper F>
Result<T> map_error(Result<T> result, F&& func) {
    if (result.is_success()) return result;
    return Error(std::invoke(std::forward<F>(func), std::move(result).error()));
}

// ─────────────────────────────────────────────
// when / unless
// ─────────────────────────────────────────────

namespace detail {

template <typename T, typename Cond>
bool evaluate_condition(Cond&& condition, const T& value) {
    if constexpr (std::is_same_v<std::remove_cvref_t<Cond>, bool>) {
        return condition;
    } else {
        return static_cast<bool>(invoke_value(std::forward<Cond>(condition), value));
    }
}

template <typename T, typename Op>
Result<T> run_conditional(Result<T> result, Op&& operation) {
    using R = std::remove_cvref_t<invoke_value_t<Op, T&&>>;
    static_assert(std::is_same_v<R, Result<T>>, "conditional operation must return Result<T>");
    return invoke_value(std::forward<Op>(operation), std::move(result).value());
}

}  // namespace detail

/**
 * @brief Runs @p operation on the success value only when @p condition
 *        holds. @p condition is a bool or a predicate over the value.
 */
template <typename T, typename Cond, typename Op>
Result<T> when(Result<T> result, Cond&& condition, Op&& operation) {
    if (result.is_failure()) return result;
    if (!detail::evaluate_condition(std::forward<Cond>(condition), result.value())) return result;
    return detail::run_conditional(std::move(result), std::forward<Op>(operation));
}

/// Inverse of when.
template <typename T, typename Cond, typename Op>
Result<T> unless(Result<T> result, Cond&& condition, Op&& operation) {
    if (result.is_failure()) return result;
    if (detail::evaluate_condition(std::forward<Cond>(condition), result.value())) return result;
    return detail::run_conditional(std::move(result), std::forward<Op>(operation));
}

// ─────────────────────────────────────────────
// finally
// ─────────────────────────────────────────────

/// Folds the whole Result, either side, into any type.
template <typename T, typename F>
    requires std::is_invocable_v<F, Result<T>&&>
decltype(auto) finally(Result<T> result, F&& func) {
    return std::invoke(std::forward<F>(func), std::move(result));
}

}  // namespace railway
