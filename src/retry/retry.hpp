/**
 * @file retry.hpp
 * @brief Retry with exponential backoff and cooperative cancellation.
 *
 * The loop runs the operation once, then up to max_retries more times while
 * it keeps failing. It stops early when should_retry rejects the error or
 * the stop_token is triggered. The caller always receives the most recent
 * Result; the retry itself never invents an error.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/observer.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string_view>
#include <utility>

namespace railway {

// ─────────────────────────────────────────────
// Policy
// ─────────────────────────────────────────────

struct RetryPolicy {
    uint32_t max_retries = 3;
    Milliseconds initial_delay{100};
    double backoff_multiplier = 2.0;
    std::function<bool(const Error&)> should_retry;   ///< unset = retry every failure
};

[[nodiscard]] RetryPolicy to_retry_policy(const RetryConfig& config);

enum class RetryOutcome : uint8_t {
    Succeeded,
    Exhausted,
    StoppedByPolicy,
    Cancelled
};

[[nodiscard]] std::string_view to_string(RetryOutcome outcome) noexcept;

/**
 * @brief Waits for @p delay unless @p stop is triggered first.
 * @return false when the wait was cut short by cancellation.
 */
using DelayFn = std::function<bool(Milliseconds delay, std::stop_token stop)>;

/// Upper bound of a single backoff delay; longer delays saturate here.
inline constexpr Milliseconds kMaxRetryDelay = std::chrono::hours{24};

/// Default DelayFn: condition-variable wait woken by the stop_token.
/// Delays above kMaxRetryDelay are shortened to it.
bool interruptible_sleep(Milliseconds delay, std::stop_token stop);

/**
 * @brief Collaborators for one retry call. All optional.
 */
struct RetryContext {
    std::stop_token stop;
    Logger* logger = nullptr;
    IResultObserver* observer = nullptr;
    DelayFn delay = interruptible_sleep;
    std::string_view operation = "retry";
};

template <typename T>
struct RetryReport {
    Result<T> result;
    RetryOutcome outcome;
    uint32_t attempts;
};

namespace detail {

using BackoffDelay = std::chrono::duration<double, std::milli>;

/// @p current scaled by @p multiplier, saturated at kMaxRetryDelay.
BackoffDelay grow_delay(BackoffDelay current, double multiplier);

/// Whole milliseconds to wait for @p delay, clamped to [0, kMaxRetryDelay].
Milliseconds to_wait(BackoffDelay delay);

/**
 * @brief Terminal outcome for the attempt just finished, or nullopt to
 *        wait and try again. @p error is null for a success.
 */
std::optional<RetryOutcome> classify_attempt(const Error* error, uint32_t attempt,
                                             const RetryPolicy& policy,
                                             const std::stop_token& stop);

void log_attempt_failed(Logger* logger, std::string_view operation, uint32_t attempt,
                        const Error& error, Milliseconds next_delay);
void log_retry_finished(Logger* logger, std::string_view operation, RetryOutcome outcome,
                        uint32_t attempts);

}  // namespace detail

// ─────────────────────────────────────────────
// retry
// ─────────────────────────────────────────────

/**
 * @brief Runs @p operation until it succeeds or the policy gives up.
 *
 * The first attempt always runs. Before each further attempt, and during
 * each delay, the context's stop_token is checked; cancellation returns the
 * last failure with outcome Cancelled.
 */
template <RetryableOperation Op>
RetryReport<typename detail::attempt_result_t<Op>::value_type>
retry_with_report(Op&& operation, const RetryPolicy& policy, const RetryContext& context = {}) {
    using R = detail::attempt_result_t<Op>;
    using Report = RetryReport<typename R::value_type>;
    detail::BackoffDelay delay = policy.initial_delay;
    uint32_t attempt = 0;

    while (true) {
        R result = detail::invoke_attempt(operation, context.stop);
        detail::record_outcome(context.observer, context.operation, result);
        const uint32_t attempts = attempt + 1;

        auto finish = [&](RetryOutcome outcome) {
            detail::log_retry_finished(context.logger, context.operation, outcome, attempts);
            return Report{std::move(result), outcome, attempts};
        };

        const Error* error = result.is_failure() ? &result.error() : nullptr;
        if (auto done = detail::classify_attempt(error, attempt, policy, context.stop)) {
            return finish(*done);
        }

        const Milliseconds wait = detail::to_wait(delay);
        detail::log_attempt_failed(context.logger, context.operation, attempts, result.error(), wait);

        const bool waited = context.delay ? context.delay(wait, context.stop) : true;
        if (!waited || context.stop.stop_requested()) return finish(RetryOutcome::Cancelled);

        delay = detail::grow_delay(delay, policy.backoff_multiplier);
        ++attempt;
    }
}

/// retry_with_report() without the diagnostics.
template <RetryableOperation Op>
detail::attempt_result_t<Op> retry(Op&& operation, const RetryPolicy& policy,
                                   const RetryContext& context = {}) {
    return retry_with_report(std::forward<Op>(operation), policy, context).result;
}

}  // namespace railway
