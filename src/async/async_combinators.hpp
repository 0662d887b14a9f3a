/**
 * @file async_combinators.hpp
 * @brief The combinators lifted over Task<T>.
 *
 * Sequential combinators attach a continuation that runs once the previous
 * task settles. Each takes an optional std::stop_token, checked just before
 * the continuation would run user code:
 * - bind/map/ensure turn a pending success into the cancelled failure;
 * - compensate, tap, tap_on_failure and map_error skip their function and
 *   pass the Result through unchanged.
 * A Result that has already been produced is never rolled back.
 */

#pragma once

#include "async/task.hpp"
#include "combinators/match.hpp"
#include "combinators/parallel.hpp"
#include "combinators/sequential.hpp"
#include "core/concepts.hpp"
#include "core/error.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "retry/retry.hpp"

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <stop_token>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace railway {

inline constexpr std::string_view kCancelledCode = "operation.cancelled";

/// Unexpected failure reported when a continuation is cancelled before it runs.
[[nodiscard]] inline Error cancelled_error() {
    return Error::unexpected("operation cancelled", std::string{kCancelledCode});
}

// ─────────────────────────────────────────────
// Sequential
// ─────────────────────────────────────────────

/**
 * @brief bind over a task. @p func returns Result<U> or Task<U>.
 */
template <typename T, typename F>
auto bind_async(Task<T> task, F&& func, std::stop_token stop = {}) {
    return task.then([f = std::forward<F>(func), stop](Result<T> result) mutable {
        using Raw = std::remove_cvref_t<detail::invoke_value_t<std::decay_t<F>&, T&&>>;
        if constexpr (detail::is_task_v<Raw>) {
            using U = typename Raw::value_type;
            if (result.is_failure()) return make_ready_task(Result<U>(std::move(result).error()));
            if (stop.stop_requested()) return make_ready_task(Result<U>(cancelled_error()));
            return Raw(detail::invoke_value(f, std::move(result).value()));
        } else {
            if (result.is_success() && stop.stop_requested()) return Raw(cancelled_error());
            return railway::bind(std::move(result), f);
        }
    });
}

template <typename T, typename F>
auto map_async(Task<T> task, F&& func, std::stop_token stop = {}) {
    return task.then([f = std::forward<F>(func), stop](Result<T> result) mutable {
        using R = decltype(railway::map(std::move(result), f));
        if (result.is_success() && stop.stop_requested()) return R(cancelled_error());
        return railway::map(std::move(result), f);
    });
}

template <typename T, typename Pred, typename E>
Task<T> ensure_async(Task<T> task, Pred&& predicate, E&& error, std::stop_token stop = {}) {
    return task.then([p = std::forward<Pred>(predicate), e = std::forward<E>(error),
                      stop](Result<T> result) mutable {
        if (result.is_success() && stop.stop_requested()) return Result<T>(cancelled_error());
        return ensure(std::move(result), p, e);
    });
}

template <typename T, typename F>
Task<T> compensate_async(Task<T> task, F&& func, std::stop_token stop = {}) {
    return task.then([f = std::forward<F>(func), stop](Result<T> result) mutable {
        if (stop.stop_requested()) return result;
        return compensate(std::move(result), f);
    });
}

template <typename T, ErrorPredicate Pred, typename F>
Task<T> compensate_async(Task<T> task, Pred&& predicate, F&& func, std::stop_token stop = {}) {
    return task.then([p = std::forward<Pred>(predicate), f = std::forward<F>(func),
                      stop](Result<T> result) mutable {
        if (stop.stop_requested()) return result;
        return compensate(std::move(result), p, f);
    });
}

template <typename T, typename F>
Task<T> tap_async(Task<T> task, F&& action, std::stop_token stop = {}) {
    return task.then([f = std::forward<F>(action), stop](Result<T> result) mutable {
        if (stop.stop_requested()) return result;
        return tap(std::move(result), f);
    });
}

template <typename T, typename F>
Task<T> tap_on_failure_async(Task<T> task, F&& action, std::stop_token stop = {}) {
    return task.then([f = std::forward<F>(action), stop](Result<T> result) mutable {
        if (stop.stop_requested()) return result;
        return tap_on_failure(std::move(result), f);
    });
}

template <typename T, ErrorMapper F>
Task<T> map_error_async(Task<T> task, F&& func, std::stop_token stop = {}) {
    return task.then([f = std::forward<F>(func), stop](Result<T> result) mutable {
        if (stop.stop_requested()) return result;
        return map_error(std::move(result), f);
    });
}

/**
 * @brief match over a task; the folded value arrives through a future.
 *
 * An exception from either handler, or from an abandoned task, is stored
 * in the future.
 */
template <typename T, typename OnSuccess, typename OnFailure>
auto match_async(Task<T> task, OnSuccess&& on_success, OnFailure&& on_failure) {
    using R = decltype(match(std::declval<Result<T>>(), on_success, on_failure));
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();

    task.subscribe([promise, s = std::forward<OnSuccess>(on_success),
                    f = std::forward<OnFailure>(on_failure)](detail::Settled<T> outcome) mutable {
        if (outcome.index() == 1) {
            promise->set_exception(std::get<1>(std::move(outcome)));
            return;
        }
        try {
            if constexpr (std::is_void_v<R>) {
                match(std::get<0>(std::move(outcome)), s, f);
                promise->set_value();
            } else {
                promise->set_value(match(std::get<0>(std::move(outcome)), s, f));
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    return future;
}

// ─────────────────────────────────────────────
// combine_async
// ─────────────────────────────────────────────

namespace detail {

/**
 * @brief Collects the settled inputs of combine_async by position.
 */
template <typename... Ts>
class Gather {
public:
    Gather() : target_(std::make_shared<TaskState<std::tuple<Ts...>>>()) {}

    std::shared_ptr<TaskState<std::tuple<Ts...>>> target() const { return target_; }

    template <std::size_t I, typename T>
    void arrive(Settled<T> outcome) {
        {
            std::lock_guard lock(mutex_);
            if (outcome.index() == 1) {
                if (!fatal_) fatal_ = std::get<1>(std::move(outcome));
            } else {
                std::get<I>(slots_).emplace(std::get<0>(std::move(outcome)));
            }
        }
        if (remaining_.fetch_sub(1) == 1) finish();
    }

private:
    void finish() {
        std::exception_ptr fatal;
        {
            std::lock_guard lock(mutex_);
            fatal = fatal_;
        }
        if (fatal) {
            target_->abandon(fatal);
            return;
        }
        target_->complete(std::apply(
            [](auto&... slot) { return combine_all(std::move(*slot)...); }, slots_));
    }

    std::shared_ptr<TaskState<std::tuple<Ts...>>> target_;
    std::tuple<std::optional<Result<Ts>>...> slots_;
    std::atomic<std::size_t> remaining_{sizeof...(Ts)};
    std::exception_ptr fatal_;
    std::mutex mutex_;
};

template <typename... Ts, std::size_t... I>
void start_gather(const std::shared_ptr<Gather<Ts...>>& gather, std::index_sequence<I...>,
                  Task<Ts>&... tasks) {
    (tasks.subscribe([gather](Settled<Ts> outcome) {
         gather->template arrive<I, Ts>(std::move(outcome));
     }),
     ...);
}

}  // namespace detail

/**
 * @brief combine over tasks that may already be running concurrently.
 *
 * The tuple and the error fold follow input position, never completion
 * order.
 */
template <typename... Ts>
    requires(sizeof...(Ts) > 0)
Task<std::tuple<Ts...>> combine_async(Task<Ts>... tasks) {
    auto gather = std::make_shared<detail::Gather<Ts...>>();
    auto target = gather->target();
    detail::start_gather(gather, std::index_sequence_for<Ts...>{}, tasks...);
    return Task<std::tuple<Ts...>>(std::move(target));
}

// ─────────────────────────────────────────────
// traverse_async
// ─────────────────────────────────────────────

namespace detail {

/**
 * @brief Walks the items one at a time, starting the next selector call
 *        only after the previous task has settled.
 */
template <typename Item, typename Out, typename F>
class Traversal : public std::enable_shared_from_this<Traversal<Item, Out, F>> {
public:
    Traversal(std::vector<Item> items, F selector, std::stop_token stop)
        : items_(std::move(items)), selector_(std::move(selector)), stop_(std::move(stop)),
          target_(std::make_shared<TaskState<std::vector<Out>>>()) {
        values_.reserve(items_.size());
    }

    Task<std::vector<Out>> start() {
        Task<std::vector<Out>> task(target_);
        advance();
        return task;
    }

private:
    void advance() {
        while (next_ < items_.size()) {
            if (stop_.stop_requested()) {
                target_->complete(cancelled_error());
                return;
            }

            Item& item = items_[next_++];
            Task<Out> task = invoke_to_task([&]() { return std::invoke(selector_, item); });
            if (!task.is_ready()) {
                task.subscribe([self = this->shared_from_this()](Settled<Out> outcome) {
                    if (self->accept(std::move(outcome))) self->advance();
                });
                return;
            }

            // Already settled: the callback runs inline, keeping the stack flat.
            std::optional<Settled<Out>> settled;
            task.subscribe([&settled](Settled<Out> outcome) { settled.emplace(std::move(outcome)); });
            if (!accept(std::move(*settled))) return;
        }
        target_->complete(std::move(values_));
    }

    /// Records one settled item; false once the traversal has finished.
    bool accept(Settled<Out> outcome) {
        if (outcome.index() == 1) {
            target_->abandon(std::get<1>(std::move(outcome)));
            return false;
        }
        Result<Out> result = std::get<0>(std::move(outcome));
        if (result.is_failure()) {
            target_->complete(std::move(result).error());
            return false;
        }
        values_.push_back(std::move(result).value());
        return true;
    }

    std::vector<Item> items_;
    F selector_;
    std::stop_token stop_;
    std::shared_ptr<TaskState<std::vector<Out>>> target_;
    std::vector<Out> values_;
    std::size_t next_ = 0;
};

}  // namespace detail

/**
 * @brief traverse with a selector returning Task<U> or Result<U>.
 *
 * Items are copied, then visited strictly in order with one selector task
 * in flight. The first failure settles the result; later items are never
 * visited. A stop request between items yields the cancelled failure.
 */
template <std::ranges::input_range Range, typename F>
auto traverse_async(Range&& items, F&& selector, std::stop_token stop = {}) {
    using Item = std::ranges::range_value_t<Range>;
    using Out = detail::task_value_t<std::invoke_result_t<std::decay_t<F>&, Item&>>;
    using Walker = detail::Traversal<Item, Out, std::decay_t<F>>;

    std::vector<Item> copied;
    for (auto&& item : items) copied.push_back(item);
    auto walker = std::make_shared<Walker>(std::move(copied), std::forward<F>(selector),
                                           std::move(stop));
    return walker->start();
}

// ─────────────────────────────────────────────
// retry_async
// ─────────────────────────────────────────────

namespace detail {

/**
 * @brief Non-blocking retry loop. Attempts chain through task
 *        continuations; each backoff delay is posted to the pool.
 */
template <typename Op, typename T>
class RetryLoop : public std::enable_shared_from_this<RetryLoop<Op, T>> {
public:
    RetryLoop(ThreadPool& pool, Op operation, RetryPolicy policy, RetryContext context)
        : pool_(pool), operation_(std::move(operation)), policy_(std::move(policy)),
          context_(std::move(context)), delay_(policy_.initial_delay),
          target_(std::make_shared<TaskState<T>>()) {}

    Task<T> start() {
        Task<T> task(target_);
        run_attempt();
        return task;
    }

private:
    void run_attempt() {
        Task<T> attempt = invoke_to_task([this]() { return invoke_attempt(operation_, context_.stop); });
        attempt.subscribe([self = this->shared_from_this()](Settled<T> outcome) {
            self->on_attempt(std::move(outcome));
        });
    }

    void on_attempt(Settled<T> outcome) {
        if (outcome.index() == 1) {
            target_->abandon(std::get<1>(std::move(outcome)));
            return;
        }
        Result<T> result = std::get<0>(std::move(outcome));
        record_outcome(context_.observer, context_.operation, result);
        const uint32_t attempts = attempt_ + 1;

        const Error* error = result.is_failure() ? &result.error() : nullptr;
        if (auto done = classify_attempt(error, attempt_, policy_, context_.stop)) {
            finish(std::move(result), *done, attempts);
            return;
        }

        const Milliseconds wait = to_wait(delay_);
        log_attempt_failed(context_.logger, context_.operation, attempts, result.error(), wait);
        delay_ = grow_delay(delay_, policy_.backoff_multiplier);
        ++attempt_;

        last_.emplace(std::move(result));
        pool_.post([self = this->shared_from_this(), wait](std::stop_token) {
            const bool waited =
                self->context_.delay ? self->context_.delay(wait, self->context_.stop) : true;
            if (!waited || self->context_.stop.stop_requested()) {
                Result<T> last = std::move(*self->last_);
                self->finish(std::move(last), RetryOutcome::Cancelled, self->attempt_);
                return;
            }
            self->run_attempt();
        });
    }

    void finish(Result<T> result, RetryOutcome outcome, uint32_t attempts) {
        log_retry_finished(context_.logger, context_.operation, outcome, attempts);
        target_->complete(std::move(result));
    }

    ThreadPool& pool_;
    Op operation_;
    RetryPolicy policy_;
    RetryContext context_;
    BackoffDelay delay_;
    uint32_t attempt_ = 0;
    std::optional<Result<T>> last_;
    std::shared_ptr<TaskState<T>> target_;
};

}  // namespace detail

/**
 * @brief retry() over an operation returning Result<T> or Task<T>.
 *
 * Same policy semantics as the synchronous form. The pool runs the backoff
 * delays, so a waiting retry occupies one worker. The context's logger,
 * observer and operation name must outlive the returned task.
 */
template <typename Op>
auto retry_async(ThreadPool& pool, Op&& operation, RetryPolicy policy, RetryContext context = {}) {
    using Decayed = std::decay_t<Op>;
    using Raw = decltype(detail::invoke_attempt(std::declval<Decayed&>(),
                                                std::declval<const std::stop_token&>()));
    using T = detail::task_value_t<Raw>;

    auto loop = std::make_shared<detail::RetryLoop<Decayed, T>>(
        pool, std::forward<Op>(operation), std::move(policy), std::move(context));
    return loop->start();
}

}  // namespace railway
