/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for callables passed to the combinators.
 *
 * These constrain the higher-order entry points (retry, traverse, the
 * error-side combinators) so misuse fails at the call site.
 */

#pragma once

#include "core/error.hpp"
#include "core/result.hpp"

#include <concepts>
#include <functional>
#include <stop_token>
#include <type_traits>

namespace railway {

// ─────────────────────────────────────────────
// ResultType
// ─────────────────────────────────────────────

/**
 * @concept ResultType
 * @brief Satisfied by any Result<T>.
 */
template <typename R>
concept ResultType = detail::is_result_v<R>;

// ─────────────────────────────────────────────
// ErrorPredicate / ErrorMapper
// ─────────────────────────────────────────────

template <typename F>
concept ErrorPredicate = std::is_invocable_r_v<bool, F, const Error&>;

template <typename F>
concept ErrorMapper = std::is_invocable_r_v<Error, F, const Error&>;

// ─────────────────────────────────────────────
// RetryableOperation
// ─────────────────────────────────────────────

/**
 * @concept RetryableOperation
 * @brief A callable producing a fresh Result per attempt.
 *
 * Either nullary or taking the retry's std::stop_token so a long attempt
 * can observe cancellation itself.
 */
template <typename F>
concept RetryableOperation =
    (std::is_invocable_v<F&> && ResultType<std::invoke_result_t<F&>>) ||
    (std::is_invocable_v<F&, std::stop_token> &&
     ResultType<std::invoke_result_t<F&, std::stop_token>>);

namespace detail {

template <typename F>
auto invoke_attempt(F& op, const std::stop_token& stop) {
    if constexpr (std::is_invocable_v<F&, std::stop_token>) {
        return std::invoke(op, stop);
    } else {
        return std::invoke(op);
    }
}

template <typename F>
using attempt_result_t = std::remove_cvref_t<decltype(invoke_attempt(
    std::declval<F&>(), std::declval<const std::stop_token&>()))>;

}  // namespace detail

}  // namespace railway
