/**
 * @file retry.cpp
 * @brief Retry diagnostics and the default interruptible delay.
 */

#include "retry/retry.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <sstream>

namespace railway {

RetryPolicy to_retry_policy(const RetryConfig& config) {
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.initial_delay = config.initial_delay;
    policy.backoff_multiplier = config.backoff_multiplier;
    return policy;
}

std::string_view to_string(RetryOutcome outcome) noexcept {
    switch (outcome) {
        case RetryOutcome::Succeeded:       return "succeeded";
        case RetryOutcome::Exhausted:       return "exhausted";
        case RetryOutcome::StoppedByPolicy: return "stopped_by_policy";
        case RetryOutcome::Cancelled:       return "cancelled";
    }
    return "unknown";
}

bool interruptible_sleep(Milliseconds delay, std::stop_token stop) {
    if (delay <= Milliseconds::zero()) return !stop.stop_requested();
    delay = std::min(delay, kMaxRetryDelay);

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Nothing notifies cv; only the timeout or the stop request ends the wait.
    static_cast<void>(cv.wait_for(lock, stop, delay, [] { return false; }));
    return !stop.stop_requested();
}

namespace detail {

BackoffDelay grow_delay(BackoffDelay current, double multiplier) {
    const BackoffDelay limit{kMaxRetryDelay};
    const BackoffDelay next = current * multiplier;
    // NaN and infinity fail the comparison and saturate too.
    if (!(next < limit)) return limit;
    return next;
}

Milliseconds to_wait(BackoffDelay delay) {
    if (!(delay > BackoffDelay::zero())) return Milliseconds::zero();
    if (delay >= BackoffDelay{kMaxRetryDelay}) return kMaxRetryDelay;
    return std::chrono::duration_cast<Milliseconds>(delay);
}

std::optional<RetryOutcome> classify_attempt(const Error* error, uint32_t attempt,
                                             const RetryPolicy& policy,
                                             const std::stop_token& stop) {
    if (error == nullptr) return RetryOutcome::Succeeded;
    if (attempt >= policy.max_retries) return RetryOutcome::Exhausted;
    if (policy.should_retry && !policy.should_retry(*error)) return RetryOutcome::StoppedByPolicy;
    if (stop.stop_requested()) return RetryOutcome::Cancelled;
    return std::nullopt;
}

void log_attempt_failed(Logger* logger, std::string_view operation, uint32_t attempt,
                        const Error& error, Milliseconds next_delay) {
    if (logger == nullptr || !logger->enabled(LogLevel::Debug)) return;

    std::ostringstream oss;
    oss << operation << ": attempt " << attempt << " failed with " << error.code()
        << ", retrying in " << next_delay.count() << "ms";
    logger->debug(oss.str());
}

void log_retry_finished(Logger* logger, std::string_view operation, RetryOutcome outcome,
                        uint32_t attempts) {
    if (logger == nullptr) return;

    std::ostringstream oss;
    oss << operation << ": ";
    switch (outcome) {
        case RetryOutcome::Succeeded:
            if (attempts == 1) return;
            oss << "succeeded after " << attempts << " attempts";
            logger->info(oss.str());
            break;
        case RetryOutcome::Exhausted:
            oss << "exhausted after " << attempts << " attempts";
            logger->warn(oss.str());
            break;
        case RetryOutcome::StoppedByPolicy:
            oss << "stopped by policy after " << attempts << " attempts";
            logger->warn(oss.str());
            break;
        case RetryOutcome::Cancelled:
            oss << "cancelled after " << attempts << " attempts";
            logger->info(oss.str());
            break;
    }
}

}  // namespace detail

}  // namespace railway
