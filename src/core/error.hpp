/**
 * @file error.hpp
 * @brief Closed error model and the error-combination algorithm.
 *
 * An Error is a tagged union over ten leaf kinds plus the structural
 * Aggregate. Validation errors carry per-field messages and merge with each
 * other; every other pairing is wrapped in a flat Aggregate.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace railway {

// ─────────────────────────────────────────────
// Error Kinds
// ─────────────────────────────────────────────

/// Declaration order is the dispatch order used by match_error.
enum class ErrorKind : uint8_t {
    Validation,
    NotFound,
    Conflict,
    BadRequest,
    Unauthorized,
    Forbidden,
    Domain,
    RateLimit,
    ServiceUnavailable,
    Unexpected,
    Aggregate
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:         return "validation";
        case ErrorKind::NotFound:           return "not_found";
        case ErrorKind::Conflict:           return "conflict";
        case ErrorKind::BadRequest:         return "bad_request";
        case ErrorKind::Unauthorized:       return "unauthorized";
        case ErrorKind::Forbidden:          return "forbidden";
        case ErrorKind::Domain:             return "domain";
        case ErrorKind::RateLimit:          return "rate_limit";
        case ErrorKind::ServiceUnavailable: return "service_unavailable";
        case ErrorKind::Unexpected:         return "unexpected";
        case ErrorKind::Aggregate:          return "aggregate";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

/// Default codes, one per kind.
namespace codes {
inline constexpr std::string_view kValidation = "validation.error";
inline constexpr std::string_view kNotFound = "not.found.error";
inline constexpr std::string_view kConflict = "conflict.error";
inline constexpr std::string_view kBadRequest = "bad.request.error";
inline constexpr std::string_view kUnauthorized = "unauthorized.error";
inline constexpr std::string_view kForbidden = "forbidden.error";
inline constexpr std::string_view kDomain = "domain.error";
inline constexpr std::string_view kRateLimit = "rate.limit.error";
inline constexpr std::string_view kServiceUnavailable = "service.unavailable.error";
inline constexpr std::string_view kUnexpected = "unexpected.error";
inline constexpr std::string_view kAggregate = "aggregate.error";
}  // namespace codes

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

/**
 * @brief All failure messages reported for one field.
 *
 * A FieldError always carries at least one message.
 */
struct FieldError {
    std::string field_name;
    std::vector<std::string> details;

    FieldError(std::string field_name, std::vector<std::string> details);

    /// "email: Required, Invalid format"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const FieldError&, const FieldError&) = default;
};

/**
 * @brief Per-field validation report sharing one error code.
 *
 * Construction requires at least one field error.
 */
struct ValidationError {
    std::vector<FieldError> field_errors;
    std::string code;
    std::string detail;
    std::optional<std::string> instance;

    explicit ValidationError(std::vector<FieldError> field_errors,
                             std::string code = std::string{codes::kValidation},
                             std::string detail = {},
                             std::optional<std::string> instance = std::nullopt);

    /// Single-field report. The message must not be blank.
    [[nodiscard]] static ValidationError for_field(std::string field_name, std::string message);

    /// Copy of this report with one more field entry appended.
    [[nodiscard]] ValidationError and_field(std::string field_name,
                                            std::vector<std::string> messages) const;

    template <typename... Messages>
        requires(sizeof...(Messages) > 0 &&
                 (std::is_convertible_v<Messages, std::string> && ...))
    [[nodiscard]] ValidationError and_field(std::string field_name, Messages&&... messages) const {
        return and_field(std::move(field_name),
                         std::vector<std::string>{std::string(std::forward<Messages>(messages))...});
    }

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ValidationError&, const ValidationError&) = default;
};

// ─────────────────────────────────────────────
// Leaf Errors
// ─────────────────────────────────────────────

/**
 * @brief Message-and-code error; one distinct type per leaf kind.
 *
 * @p instance optionally names the resource or request the failure is about.
 */
template <ErrorKind K>
struct BasicError {
    static constexpr ErrorKind kind = K;

    std::string message;
    std::string code;
    std::optional<std::string> instance;

    friend bool operator==(const BasicError&, const BasicError&) = default;
};

using NotFoundError = BasicError<ErrorKind::NotFound>;
using ConflictError = BasicError<ErrorKind::Conflict>;
using BadRequestError = BasicError<ErrorKind::BadRequest>;
using UnauthorizedError = BasicError<ErrorKind::Unauthorized>;
using ForbiddenError = BasicError<ErrorKind::Forbidden>;
using DomainError = BasicError<ErrorKind::Domain>;
using RateLimitError = BasicError<ErrorKind::RateLimit>;
using ServiceUnavailableError = BasicError<ErrorKind::ServiceUnavailable>;
using UnexpectedError = BasicError<ErrorKind::Unexpected>;

// ─────────────────────────────────────────────
// Aggregate
// ─────────────────────────────────────────────

class Error;

/**
 * @brief Ordered siblings that failed independently.
 *
 * Holds at least one error and never another AggregateError directly.
 * Only Error::aggregate() creates one; combine() goes through it.
 */
struct AggregateError {
    std::vector<Error> errors;
    std::string code{codes::kAggregate};

    friend bool operator==(const AggregateError& lhs, const AggregateError& rhs);

private:
    AggregateError() = default;

    friend class Error;
};

// ─────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────

namespace detail {

template <typename T, typename Variant>
struct is_variant_alternative : std::false_type {};

template <typename T, typename... Ts>
struct is_variant_alternative<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

}  // namespace detail

/**
 * @brief Closed sum over every error kind.
 *
 * Alternative order matches ErrorKind, so kind() is the variant index.
 * Leaf and validation errors convert implicitly; aggregates come only from
 * aggregate() and combine().
 */
class Error {
public:
    using Variant = std::variant<ValidationError,
                                 NotFoundError,
                                 ConflictError,
                                 BadRequestError,
                                 UnauthorizedError,
                                 ForbiddenError,
                                 DomainError,
                                 RateLimitError,
                                 ServiceUnavailableError,
                                 UnexpectedError,
                                 AggregateError>;

    template <typename E>
        requires(detail::is_variant_alternative<std::remove_cvref_t<E>, Variant>::value &&
                 !std::is_same_v<std::remove_cvref_t<E>, AggregateError>)
    Error(E&& alternative)  // NOLINT(implicit)
        : data_(std::forward<E>(alternative)) {}

    // ── Factories ─────────────────────────────

    using Instance = std::optional<std::string>;

    [[nodiscard]] static Error validation(std::string message,
                                          std::string field_name = {},
                                          std::string code = std::string{codes::kValidation},
                                          Instance instance = std::nullopt);
    [[nodiscard]] static Error validation(std::vector<FieldError> field_errors,
                                          std::string code = std::string{codes::kValidation},
                                          std::string detail = {},
                                          Instance instance = std::nullopt);
    [[nodiscard]] static Error not_found(std::string message,
                                         std::string code = std::string{codes::kNotFound},
                                         Instance instance = std::nullopt);
    [[nodiscard]] static Error conflict(std::string message,
                                        std::string code = std::string{codes::kConflict},
                                        Instance instance = std::nullopt);
    [[nodiscard]] static Error bad_request(std::string message,
                                           std::string code = std::string{codes::kBadRequest},
                                           Instance instance = std::nullopt);
    [[nodiscard]] static Error unauthorized(std::string message,
                                            std::string code = std::string{codes::kUnauthorized},
                                            Instance instance = std::nullopt);
    [[nodiscard]] static Error forbidden(std::string message,
                                         std::string code = std::string{codes::kForbidden},
                                         Instance instance = std::nullopt);
    [[nodiscard]] static Error domain(std::string message,
                                      std::string code = std::string{codes::kDomain},
                                      Instance instance = std::nullopt);
    [[nodiscard]] static Error rate_limit(std::string message,
                                          std::string code = std::string{codes::kRateLimit},
                                          Instance instance = std::nullopt);
    [[nodiscard]] static Error service_unavailable(
        std::string message, std::string code = std::string{codes::kServiceUnavailable},
        Instance instance = std::nullopt);
    [[nodiscard]] static Error unexpected(std::string message,
                                          std::string code = std::string{codes::kUnexpected},
                                          Instance instance = std::nullopt);

    /// Flattens nested aggregates. Throws std::invalid_argument when empty.
    [[nodiscard]] static Error aggregate(std::vector<Error> errors);

    // ── Observers ─────────────────────────────

    [[nodiscard]] ErrorKind kind() const noexcept {
        return static_cast<ErrorKind>(data_.index());
    }

    [[nodiscard]] const std::string& code() const noexcept;

    /// Instance of a leaf or validation error; aggregates have none.
    [[nodiscard]] Instance instance() const;

    /// Human-readable summary; aggregates and validations join their parts.
    [[nodiscard]] std::string message() const;

    template <typename E>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<E>(data_);
    }

    template <typename E>
    [[nodiscard]] const E* as() const noexcept {
        return std::get_if<E>(&data_);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return data_; }

    /// "NotFoundError(not.found.error): user 42", plus " @ <instance>" when set.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Error& lhs, const Error& rhs);

private:
    explicit Error(AggregateError aggregate) : data_(std::move(aggregate)) {}

    Variant data_;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

// ─────────────────────────────────────────────
// Combination
// ─────────────────────────────────────────────

/**
 * @brief Merges two errors into one.
 *
 * - absent left yields right unchanged;
 * - Validation + Validation concatenates field errors, keeping the left code;
 * - anything else becomes a flat Aggregate in left-then-right order.
 *
 * @throws std::invalid_argument when right is absent.
 */
[[nodiscard]] Error combine(std::optional<Error> left, std::optional<Error> right);

}  // namespace railway
