/**
 * @file observer.hpp
 * @brief Injected, write-only hook for recording Result outcomes.
 *
 * The core never owns a tracer. Callers that want telemetry pass an
 * IResultObserver; a null observer records nothing.
 */

#pragma once

#include "core/error.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <string_view>

namespace railway {

enum class Outcome : uint8_t { Success, Failure };

[[nodiscard]] constexpr std::string_view to_string(Outcome outcome) noexcept {
    return outcome == Outcome::Success ? "success" : "failure";
}

/**
 * @brief Receives one event per observed Result.
 *
 * Implementations must not throw; @p error is non-null only for failures
 * and is valid for the duration of the call.
 */
class IResultObserver {
public:
    virtual ~IResultObserver() = default;
    virtual void record(std::string_view operation, Outcome outcome, const Error* error) noexcept = 0;
};

namespace detail {

template <typename T>
void record_outcome(IResultObserver* observer, std::string_view operation, const Result<T>& result) noexcept {
    if (observer == nullptr) return;
    if (result.is_success()) {
        observer->record(operation, Outcome::Success, nullptr);
    } else {
        observer->record(operation, Outcome::Failure, &result.error());
    }
}

}  // namespace detail

/// Reports @p result to @p observer and returns it unchanged.
template <typename T>
Result<T> observe(Result<T> result, IResultObserver* observer, std::string_view operation) {
    detail::record_outcome(observer, operation, result);
    return result;
}

}  // namespace railway
