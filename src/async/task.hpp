/**
 * @file task.hpp
 * @brief Single-consumer awaitable Result, scheduled on the ThreadPool.
 *
 * A Task<T> eventually settles with a Result<T>. It has exactly one
 * consumer: get() blocks for the Result, then() or subscribe() attach a
 * continuation that runs on whichever thread settles the task (or inline,
 * if it already has). A ContractViolation or a non-std exception thrown by
 * user code abandons the task and is rethrown from get(); a std::exception
 * becomes an Unexpected failure.
 */

#pragma once

#include "core/error.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>
#include <variant>

namespace railway {

template <typename T>
class Task;

namespace detail {

template <typename T>
struct is_task : std::false_type {};

template <typename T>
struct is_task<Task<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_task_v = is_task<std::remove_cvref_t<T>>::value;

/// Value type carried by a Result<U> or a Task<U>.
template <typename R>
struct task_value;

template <typename U>
struct task_value<Result<U>> {
    using type = U;
};

template <typename U>
struct task_value<Task<U>> {
    using type = U;
};

template <typename R>
using task_value_t = typename task_value<std::remove_cvref_t<R>>::type;

/// A settled task: its Result, or the exception that abandoned it.
template <typename T>
using Settled = std::variant<Result<T>, std::exception_ptr>;

/**
 * @brief Shared state between a task's producer and its single consumer.
 */
template <typename T>
class TaskState {
public:
    using Callback = std::function<void(Settled<T>)>;

    void complete(Result<T> result) {
        settle(Settled<T>(std::in_place_index<0>, std::move(result)));
    }

    void abandon(std::exception_ptr error) {
        settle(Settled<T>(std::in_place_index<1>, std::move(error)));
    }

    void settle(Settled<T> outcome) {
        Callback callback;
        {
            std::lock_guard lock(mutex_);
            if (settled_) throw ContractViolation("task settled twice");
            settled_ = true;
            if (callback_) {
                callback = std::move(callback_);
                callback_ = nullptr;
            } else {
                outcome_.emplace(std::move(outcome));
            }
        }
        if (callback) {
            callback(std::move(outcome));
        } else {
            cv_.notify_all();
        }
    }

    /// Registers the continuation. Runs it inline if already settled.
    void subscribe(Callback callback) {
        std::unique_lock lock(mutex_);
        claim();
        if (!settled_) {
            callback_ = std::move(callback);
            return;
        }
        Settled<T> outcome = take();
        lock.unlock();
        callback(std::move(outcome));
    }

    /// Blocks until settled; rethrows the exception of an abandoned task.
    Result<T> wait() {
        std::unique_lock lock(mutex_);
        claim();
        cv_.wait(lock, [this] { return settled_; });
        Settled<T> outcome = take();
        lock.unlock();
        if (outcome.index() == 1) std::rethrow_exception(std::get<1>(std::move(outcome)));
        return std::get<0>(std::move(outcome));
    }

    [[nodiscard]] bool ready() const {
        std::lock_guard lock(mutex_);
        return settled_;
    }

private:
    void claim() {
        if (consumed_) throw ContractViolation("task already has a consumer");
        consumed_ = true;
    }

    Settled<T> take() {
        Settled<T> outcome = std::move(*outcome_);
        outcome_.reset();
        return outcome;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Settled<T>> outcome_;
    Callback callback_;
    bool settled_ = false;
    bool consumed_ = false;
};

}  // namespace detail

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

template <typename T>
class Task {
public:
    using value_type = T;
    using State = detail::TaskState<T>;

    explicit Task(std::shared_ptr<State> state) : state_(std::move(state)) {}

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
    [[nodiscard]] bool is_ready() const { return state().ready(); }

    /// Blocks until the task settles. Consumes the task.
    [[nodiscard]] Result<T> get() { return release()->wait(); }

    /// Low-level continuation over the settled outcome. Consumes the task.
    void subscribe(typename State::Callback callback) {
        release()->subscribe(std::move(callback));
    }

    /**
     * @brief Chains a continuation over the settled Result.
     *
     * @p continuation takes Result<T> and returns Result<U> or Task<U>; a
     * returned Task is flattened. Consumes this task.
     */
    template <typename F>
        requires std::is_invocable_v<F&, Result<T>>
    auto then(F&& continuation) -> Task<detail::task_value_t<std::invoke_result_t<F&, Result<T>>>>;

private:
    State& state() const {
        if (!state_) throw ContractViolation("task has no state");
        return *state_;
    }

    std::shared_ptr<State> release() {
        if (!state_) throw ContractViolation("task has no state");
        return std::move(state_);
    }

    std::shared_ptr<State> state_;
};

/**
 * @brief Producer handle for a Task settled by hand.
 */
template <typename T>
class TaskSource {
public:
    TaskSource() : state_(std::make_shared<detail::TaskState<T>>()) {}

    /// The task observing this source. Call at most once.
    [[nodiscard]] Task<T> task() {
        if (task_taken_) throw ContractViolation("task already taken from source");
        task_taken_ = true;
        return Task<T>(state_);
    }

    void set_result(Result<T> result) { state_->complete(std::move(result)); }
    void set_exception(std::exception_ptr error) { state_->abandon(std::move(error)); }

private:
    std::shared_ptr<detail::TaskState<T>> state_;
    bool task_taken_ = false;
};

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

template <typename T>
[[nodiscard]] Task<T> make_ready_task(Result<T> result) {
    auto state = std::make_shared<detail::TaskState<T>>();
    state->complete(std::move(result));
    return Task<T>(std::move(state));
}

namespace detail {

/// Settles @p target with whatever @p source settles with.
template <typename U>
void forward_into(Task<U> source, std::shared_ptr<TaskState<U>> target) {
    source.subscribe([target = std::move(target)](Settled<U> outcome) {
        target->settle(std::move(outcome));
    });
}

/**
 * @brief Runs @p thunk and settles @p target with its Result or Task.
 */
template <typename U, typename Thunk>
void invoke_into(const std::shared_ptr<TaskState<U>>& target, Thunk&& thunk) {
    using Raw = std::remove_cvref_t<std::invoke_result_t<Thunk>>;

    std::optional<Raw> produced;
    std::exception_ptr fatal;
    try {
        produced.emplace(std::invoke(std::forward<Thunk>(thunk)));
    } catch (const ContractViolation&) {
        fatal = std::current_exception();
    } catch (const std::exception& ex) {
        if constexpr (is_task_v<Raw>) {
            target->complete(Result<U>(Error::unexpected(ex.what())));
            return;
        } else {
            produced.emplace(Error::unexpected(ex.what()));
        }
    } catch (...) {
        fatal = std::current_exception();
    }

    if (fatal) {
        target->abandon(fatal);
    } else if constexpr (is_task_v<Raw>) {
        forward_into(std::move(*produced), target);
    } else {
        target->complete(std::move(*produced));
    }
}

/// Runs @p thunk now and wraps its Result or Task.
template <typename Thunk>
auto invoke_to_task(Thunk&& thunk) -> Task<task_value_t<std::invoke_result_t<Thunk>>> {
    using U = task_value_t<std::invoke_result_t<Thunk>>;
    auto state = std::make_shared<TaskState<U>>();
    invoke_into(state, std::forward<Thunk>(thunk));
    return Task<U>(std::move(state));
}

}  // namespace detail

template <typename T>
template <typename F>
    requires std::is_invocable_v<F&, Result<T>>
auto Task<T>::then(F&& continuation)
    -> Task<detail::task_value_t<std::invoke_result_t<F&, Result<T>>>> {
    using U = detail::task_value_t<std::invoke_result_t<F&, Result<T>>>;
    auto next = std::make_shared<detail::TaskState<U>>();

    release()->subscribe(
        [next, f = std::forward<F>(continuation)](detail::Settled<T> outcome) mutable {
            if (outcome.index() == 1) {
                next->abandon(std::get<1>(std::move(outcome)));
                return;
            }
            detail::invoke_into(next, [&]() { return std::invoke(f, std::get<0>(std::move(outcome))); });
        });
    return Task<U>(std::move(next));
}

/**
 * @brief Runs @p func on @p pool. It returns Result<U> or Task<U>.
 */
template <typename F>
    requires std::is_invocable_v<std::decay_t<F>&>
auto spawn(ThreadPool& pool, F&& func)
    -> Task<detail::task_value_t<std::invoke_result_t<std::decay_t<F>&>>> {
    using U = detail::task_value_t<std::invoke_result_t<std::decay_t<F>&>>;
    auto state = std::make_shared<detail::TaskState<U>>();
    pool.post([state, f = std::forward<F>(func)](std::stop_token) mutable {
        detail::invoke_into(state, [&]() { return std::invoke(f); });
    });
    return Task<U>(std::move(state));
}

}  // namespace railway
