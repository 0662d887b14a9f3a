/**
 * @file match.hpp
 * @brief Exhaustive folds of a Result: match and per-kind match_error.
 */

#pragma once

#include "core/error.hpp"
#include "core/result.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace railway {

// ─────────────────────────────────────────────
// match
// ─────────────────────────────────────────────

template <typename T, typename OnSuccess, typename OnFailure>
    requires ValueInvocable<OnSuccess, T&&> && std::is_invocable_v<OnFailure, Error&&>
auto match(Result<T> result, OnSuccess&& on_success, OnFailure&& on_failure)
    -> std::remove_cvref_t<detail::invoke_value_t<OnSuccess, T&&>> {
    if (result.is_success()) {
        return detail::invoke_value(std::forward<OnSuccess>(on_success), std::move(result).value());
    }
    return std::invoke(std::forward<OnFailure>(on_failure), std::move(result).error());
}

// ─────────────────────────────────────────────
// match_error
// ─────────────────────────────────────────────

/**
 * @brief Per-kind failure handlers, tried in declaration order.
 *
 * Unset handlers fall through to on_error. Aggregate errors always go to
 * on_error. Use designated initializers to set only what you need:
 *
 *     ErrorHandlers<int>{.on_not_found = [](const NotFoundError&) { return 404; },
 *                        .on_error = [](const Error&) { return 500; }}
 *
 * ErrorHandlers<void> dispatches side effects only.
 */
template <typename R>
struct ErrorHandlers {
    std::function<R(const ValidationError&)> on_validation;
    std::function<R(const NotFoundError&)> on_not_found;
    std::function<R(const ConflictError&)> on_conflict;
    std::function<R(const BadRequestError&)> on_bad_request;
    std::function<R(const UnauthorizedError&)> on_unauthorized;
    std::function<R(const ForbiddenError&)> on_forbidden;
    std::function<R(const DomainError&)> on_domain;
    std::function<R(const RateLimitError&)> on_rate_limit;
    std::function<R(const ServiceUnavailableError&)> on_service_unavailable;
    std::function<R(const UnexpectedError&)> on_unexpected;
    std::function<R(const Error&)> on_error;
};

namespace detail {

template <typename R, typename E>
bool has_handler(const std::function<R(const E&)>& handler, const Error& error) {
    return handler && error.is<E>();
}

template <typename R, typename E>
R call_handler(const std::function<R(const E&)>& handler, const Error& error) {
    return handler(*error.as<E>());
}

}  // namespace detail

/**
 * @brief Dispatches a failure to the handler for its kind.
 *
 * @throws ContractViolation when no kind-specific handler matches and
 *         on_error is unset.
 */
template <typename T, typename R, typename OnSuccess>
    requires ValueInvocable<OnSuccess, T&&>
R match_error(Result<T> result, OnSuccess&& on_success, const ErrorHandlers<R>& handlers) {
    if (result.is_success()) {
        return detail::invoke_value(std::forward<OnSuccess>(on_success), std::move(result).value());
    }

    const Error& error = result.error();
    switch (error.kind()) {
        case ErrorKind::Validation:
            if (detail::has_handler(handlers.on_validation, error))
                return detail::call_handler(handlers.on_validation, error);
            break;
        case ErrorKind::NotFound:
            if (detail::has_handler(handlers.on_not_found, error))
                return detail::call_handler(handlers.on_not_found, error);
            break;
        case ErrorKind::Conflict:
            if (detail::has_handler(handlers.on_conflict, error))
                return detail::call_handler(handlers.on_conflict, error);
            break;
        case ErrorKind::BadRequest:
            if (detail::has_handler(handlers.on_bad_request, error))
                return detail::call_handler(handlers.on_bad_request, error);
            break;
        case ErrorKind::Unauthorized:
            if (detail::has_handler(handlers.on_unauthorized, error))
                return detail::call_handler(handlers.on_unauthorized, error);
            break;
        case ErrorKind::Forbidden:
            if (detail::has_handler(handlers.on_forbidden, error))
                return detail::call_handler(handlers.on_forbidden, error);
            break;
        case ErrorKind::Domain:
            if (detail::has_handler(handlers.on_domain, error))
                return detail::call_handler(handlers.on_domain, error);
            break;
        case ErrorKind::RateLimit:
            if (detail::has_handler(handlers.on_rate_limit, error))
                return detail::call_handler(handlers.on_rate_limit, error);
            break;
        case ErrorKind::ServiceUnavailable:
            if (detail::has_handler(handlers.on_service_unavailable, error))
                return detail::call_handler(handlers.on_service_unavailable, error);
            break;
        case ErrorKind::Unexpected:
            if (detail::has_handler(handlers.on_unexpected, error))
                return detail::call_handler(handlers.on_unexpected, error);
            break;
        case ErrorKind::Aggregate:
            break;
    }

    if (handlers.on_error) return handlers.on_error(error);
    throw ContractViolation("match_error: no handler for " + error.to_string());
}

}  // namespace railway
