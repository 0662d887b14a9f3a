/**
 * @file error.cpp
 * @brief Error construction, rendering and combination.
 */

#include "core/error.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace railway {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

template <ErrorKind K>
std::string_view type_name(const BasicError<K>&) {
    switch (K) {
        case ErrorKind::NotFound:           return "NotFoundError";
        case ErrorKind::Conflict:           return "ConflictError";
        case ErrorKind::BadRequest:         return "BadRequestError";
        case ErrorKind::Unauthorized:       return "UnauthorizedError";
        case ErrorKind::Forbidden:          return "ForbiddenError";
        case ErrorKind::Domain:             return "DomainError";
        case ErrorKind::RateLimit:          return "RateLimitError";
        case ErrorKind::ServiceUnavailable: return "ServiceUnavailableError";
        case ErrorKind::Unexpected:         return "UnexpectedError";
        default:                            return "Error";
    }
}

template <ErrorKind K>
Error make_leaf(std::string message, std::string code, Error::Instance instance) {
    return Error{BasicError<K>{std::move(message), std::move(code), std::move(instance)}};
}

std::string with_instance(std::string text, const Error::Instance& instance) {
    if (instance) text += " @ " + *instance;
    return text;
}

void append_flattened(std::vector<Error>& out, Error error) {
    if (const auto* agg = error.as<AggregateError>()) {
        out.insert(out.end(), agg->errors.begin(), agg->errors.end());
    } else {
        out.push_back(std::move(error));
    }
}

}  // namespace

// ─────────────────────────────────────────────
// ErrorKind
// ─────────────────────────────────────────────

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << to_string(kind);
}

// ─────────────────────────────────────────────
// FieldError / ValidationError
// ─────────────────────────────────────────────

FieldError::FieldError(std::string field_name, std::vector<std::string> details)
    : field_name(std::move(field_name)), details(std::move(details)) {
    if (this->details.empty()) {
        throw std::invalid_argument("field error '" + this->field_name +
                                    "' requires at least one detail");
    }
}

std::string FieldError::to_string() const {
    return field_name + ": " + join(details, ", ");
}

ValidationError::ValidationError(std::vector<FieldError> field_errors,
                                 std::string code,
                                 std::string detail,
                                 std::optional<std::string> instance)
    : field_errors(std::move(field_errors)), code(std::move(code)), detail(std::move(detail)),
      instance(std::move(instance)) {
    if (this->field_errors.empty()) {
        throw std::invalid_argument("validation error requires at least one field error");
    }
}

ValidationError ValidationError::for_field(std::string field_name, std::string message) {
    if (is_blank(message)) {
        throw std::invalid_argument("validation message for '" + field_name + "' is blank");
    }
    std::vector<FieldError> fields;
    fields.emplace_back(std::move(field_name), std::vector<std::string>{std::move(message)});
    return ValidationError{std::move(fields)};
}

ValidationError ValidationError::and_field(std::string field_name,
                                           std::vector<std::string> messages) const {
    for (const auto& m : messages) {
        if (is_blank(m)) {
            throw std::invalid_argument("validation message for '" + field_name + "' is blank");
        }
    }
    ValidationError copy = *this;
    copy.field_errors.emplace_back(std::move(field_name), std::move(messages));
    return copy;
}

std::string ValidationError::to_string() const {
    std::vector<std::string> parts;
    parts.reserve(field_errors.size());
    for (const auto& fe : field_errors) parts.push_back(fe.to_string());
    return join(parts, "; ");
}

bool operator==(const AggregateError& lhs, const AggregateError& rhs) {
    return lhs.code == rhs.code && lhs.errors == rhs.errors;
}

// ─────────────────────────────────────────────
// Error Factories
// ─────────────────────────────────────────────

Error Error::validation(std::string message, std::string field_name, std::string code,
                        Instance instance) {
    auto single = ValidationError::for_field(std::move(field_name), std::move(message));
    single.code = std::move(code);
    single.instance = std::move(instance);
    return Error{std::move(single)};
}

Error Error::validation(std::vector<FieldError> field_errors, std::string code, std::string detail,
                        Instance instance) {
    return Error{ValidationError{std::move(field_errors), std::move(code), std::move(detail),
                                 std::move(instance)}};
}

Error Error::not_found(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::NotFound>(std::move(message), std::move(code), std::move(instance));
}

Error Error::conflict(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::Conflict>(std::move(message), std::move(code), std::move(instance));
}

Error Error::bad_request(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::BadRequest>(std::move(message), std::move(code), std::move(instance));
}

Error Error::unauthorized(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::Unauthorized>(std::move(message), std::move(code), std::move(instance));
}

Error Error::forbidden(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::Forbidden>(std::move(message), std::move(code), std::move(instance));
}

Error Error::domain(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::Domain>(std::move(message), std::move(code), std::move(instance));
}

Error Error::rate_limit(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::RateLimit>(std::move(message), std::move(code), std::move(instance));
}

Error Error::service_unavailable(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::ServiceUnavailable>(std::move(message), std::move(code), std::move(instance));
}

Error Error::unexpected(std::string message, std::string code, Instance instance) {
    return make_leaf<ErrorKind::Unexpected>(std::move(message), std::move(code), std::move(instance));
}

Error Error::aggregate(std::vector<Error> errors) {
    if (errors.empty()) {
        throw std::invalid_argument("aggregate error requires at least one error");
    }
    AggregateError agg;
    agg.errors.reserve(errors.size());
    for (auto& e : errors) append_flattened(agg.errors, std::move(e));
    return Error{std::move(agg)};
}

// ─────────────────────────────────────────────
// Error Observers
// ─────────────────────────────────────────────

const std::string& Error::code() const noexcept {
    return std::visit([](const auto& e) -> const std::string& { return e.code; }, data_);
}

Error::Instance Error::instance() const {
    return std::visit(
        [](const auto& e) -> Instance {
            if constexpr (std::is_same_v<std::decay_t<decltype(e)>, AggregateError>) {
                return std::nullopt;
            } else {
                return e.instance;
            }
        },
        data_);
}

std::string Error::message() const {
    return std::visit(
        [](const auto& e) -> std::string {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, ValidationError>) {
                return e.detail.empty() ? e.to_string() : e.detail;
            } else if constexpr (std::is_same_v<E, AggregateError>) {
                std::vector<std::string> parts;
                parts.reserve(e.errors.size());
                for (const auto& inner : e.errors) parts.push_back(inner.message());
                return join(parts, "; ");
            } else {
                return e.message;
            }
        },
        data_);
}

std::string Error::to_string() const {
    return std::visit(
        [](const auto& e) -> std::string {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, ValidationError>) {
                return with_instance("ValidationError(" + e.code + "): " + e.to_string(),
                                     e.instance);
            } else if constexpr (std::is_same_v<E, AggregateError>) {
                std::ostringstream ss;
                ss << "AggregateError(" << e.code << ")[";
                for (std::size_t i = 0; i < e.errors.size(); ++i) {
                    if (i > 0) ss << ", ";
                    ss << e.errors[i].to_string();
                }
                ss << "]";
                return ss.str();
            } else {
                return with_instance(std::string{type_name(e)} + "(" + e.code + "): " + e.message,
                                     e.instance);
            }
        },
        data_);
}

bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.data_ == rhs.data_;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.to_string();
}

// ─────────────────────────────────────────────
// Combination
// ─────────────────────────────────────────────

Error combine(std::optional<Error> left, std::optional<Error> right) {
    if (!right) {
        throw std::invalid_argument("combine requires a right-hand error");
    }
    if (!left) {
        return std::move(*right);
    }

    const auto* lv = left->as<ValidationError>();
    const auto* rv = right->as<ValidationError>();
    if (lv && rv) {
        ValidationError merged = *lv;
        merged.field_errors.insert(merged.field_errors.end(),
                                   rv->field_errors.begin(), rv->field_errors.end());
        if (!merged.instance) merged.instance = rv->instance;
        if (merged.detail.empty()) {
            merged.detail = rv->detail;
        } else if (!rv->detail.empty() && rv->detail != merged.detail) {
            merged.detail += " | " + rv->detail;
        }
        return Error{std::move(merged)};
    }

    std::vector<Error> parts;
    parts.reserve(2);
    parts.push_back(std::move(*left));
    parts.push_back(std::move(*right));
    return Error::aggregate(std::move(parts));
}

}  // namespace railway
