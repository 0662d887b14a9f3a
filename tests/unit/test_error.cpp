/**
 * @file test_error.cpp
 * @brief Unit tests for the error model and error combination.
 */

#include "core/error.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <type_traits>

using namespace railway;

// ═══════════════════════════════════════════════
// Factories and Observers
// ═══════════════════════════════════════════════

TEST(ErrorTest, FactoriesUseDefaultCodes) {
    EXPECT_EQ(Error::validation("bad", "f").code(), "validation.error");
    EXPECT_EQ(Error::not_found("x").code(), "not.found.error");
    EXPECT_EQ(Error::conflict("x").code(), "conflict.error");
    EXPECT_EQ(Error::bad_request("x").code(), "bad.request.error");
    EXPECT_EQ(Error::unauthorized("x").code(), "unauthorized.error");
    EXPECT_EQ(Error::forbidden("x").code(), "forbidden.error");
    EXPECT_EQ(Error::domain("x").code(), "domain.error");
    EXPECT_EQ(Error::rate_limit("x").code(), "rate.limit.error");
    EXPECT_EQ(Error::service_unavailable("x").code(), "service.unavailable.error");
    EXPECT_EQ(Error::unexpected("x").code(), "unexpected.error");
    EXPECT_EQ(Error::aggregate({Error::not_found("x")}).code(), "aggregate.error");
}

TEST(ErrorTest, CustomCode) {
    auto e = Error::not_found("user 42 missing", "user.not_found");
    EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    EXPECT_EQ(e.code(), "user.not_found");
    EXPECT_EQ(e.message(), "user 42 missing");
}

TEST(ErrorTest, KindMatchesAlternative) {
    EXPECT_EQ(Error::conflict("x").kind(), ErrorKind::Conflict);
    EXPECT_EQ(Error::rate_limit("x").kind(), ErrorKind::RateLimit);
    EXPECT_TRUE(Error::forbidden("x").is<ForbiddenError>());
    EXPECT_FALSE(Error::forbidden("x").is<UnauthorizedError>());
    EXPECT_EQ(Error::forbidden("x").as<NotFoundError>(), nullptr);
}

TEST(ErrorTest, ToString) {
    EXPECT_EQ(Error::not_found("user 42").to_string(), "NotFoundError(not.found.error): user 42");
    EXPECT_EQ(to_string(ErrorKind::ServiceUnavailable), "service_unavailable");
}

TEST(ErrorTest, StructuralEquality) {
    EXPECT_EQ(Error::not_found("a"), Error::not_found("a"));
    EXPECT_NE(Error::not_found("a"), Error::not_found("b"));
    EXPECT_NE(Error::not_found("a"), Error::conflict("a"));
    EXPECT_NE(Error::not_found("a"), Error::not_found("a", "other.code"));
}

TEST(ErrorTest, InstanceDefaultsToAbsent) {
    EXPECT_FALSE(Error::not_found("x").instance().has_value());
    EXPECT_FALSE(Error::validation("bad", "f").instance().has_value());
}

TEST(ErrorTest, FactoriesCarryInstance) {
    auto e = Error::not_found("user 42", std::string{codes::kNotFound}, "/users/42");
    ASSERT_TRUE(e.instance().has_value());
    EXPECT_EQ(*e.instance(), "/users/42");
    EXPECT_EQ(e.as<NotFoundError>()->instance.value_or(""), "/users/42");

    auto v = Error::validation("Required", "email", std::string{codes::kValidation}, "signup-7");
    EXPECT_EQ(v.as<ValidationError>()->instance.value_or(""), "signup-7");

    auto u = Error::unexpected("boom", "io.failure", "job-3");
    EXPECT_EQ(u.code(), "io.failure");
    EXPECT_EQ(*u.instance(), "job-3");
}

TEST(ErrorTest, ToStringShowsInstance) {
    auto e = Error::conflict("version clash", std::string{codes::kConflict}, "order-9");
    EXPECT_EQ(e.to_string(), "ConflictError(conflict.error): version clash @ order-9");

    auto v = Error::validation("Required", "email", std::string{codes::kValidation}, "form-1");
    EXPECT_EQ(v.to_string(), "ValidationError(validation.error): email: Required @ form-1");
}

TEST(ErrorTest, InstanceTakesPartInEquality) {
    EXPECT_NE(Error::forbidden("x", std::string{codes::kForbidden}, "a"),
              Error::forbidden("x", std::string{codes::kForbidden}, "b"));
    EXPECT_NE(Error::forbidden("x"), Error::forbidden("x", std::string{codes::kForbidden}, "a"));
}

TEST(ErrorTest, AggregateHasNoInstance) {
    auto agg = Error::aggregate(
        {Error::not_found("a", std::string{codes::kNotFound}, "/a"), Error::conflict("b")});
    EXPECT_FALSE(agg.instance().has_value());
    EXPECT_EQ(agg.as<AggregateError>()->errors[0].instance().value_or(""), "/a");
}

// ═══════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════

TEST(ValidationErrorTest, ForFieldAndAndField) {
    auto v = ValidationError::for_field("email", "Required")
                 .and_field("email", "Invalid format")
                 .and_field("age", "Too young", "Not a number");

    ASSERT_EQ(v.field_errors.size(), 3u);
    EXPECT_EQ(v.field_errors[0].field_name, "email");
    EXPECT_EQ(v.field_errors[2].details.size(), 2u);
    EXPECT_EQ(v.code, "validation.error");
}

TEST(ValidationErrorTest, FieldErrorToString) {
    FieldError fe("email", {"Required", "Invalid format"});
    EXPECT_EQ(fe.to_string(), "email: Required, Invalid format");
}

TEST(ValidationErrorTest, InvariantsThrow) {
    EXPECT_THROW(FieldError("email", {}), std::invalid_argument);
    EXPECT_THROW(ValidationError(std::vector<FieldError>{}), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(ValidationError::for_field("email", "   ")),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(Error::aggregate({})), std::invalid_argument);
}

TEST(ValidationErrorTest, MessageJoinsFields) {
    auto e = Error::validation({FieldError("a", {"x"}), FieldError("b", {"y", "z"})});
    EXPECT_EQ(e.message(), "a: x; b: y, z");
}

// ═══════════════════════════════════════════════
// combine
// ═══════════════════════════════════════════════

TEST(CombineErrorTest, AbsentLeftIsIdentity) {
    auto e = Error::not_found("x");
    EXPECT_EQ(combine(std::nullopt, e), e);

    auto v = Error::validation("Required", "email");
    EXPECT_EQ(combine(std::nullopt, v), v);
}

TEST(CombineErrorTest, AbsentRightThrows) {
    EXPECT_THROW(static_cast<void>(combine(Error::not_found("x"), std::nullopt)),
                 std::invalid_argument);
}

TEST(CombineErrorTest, ValidationMergeKeepsOrderAndLeftCode) {
    auto left = Error::validation("Required", "email", "signup.invalid");
    auto right = Error::validation("Too short", "name");

    auto merged = combine(left, right);
    ASSERT_EQ(merged.kind(), ErrorKind::Validation);

    const auto* v = merged.as<ValidationError>();
    ASSERT_NE(v, nullptr);
    ASSERT_EQ(v->field_errors.size(), 2u);
    EXPECT_EQ(v->field_errors[0].field_name, "email");
    EXPECT_EQ(v->field_errors[1].field_name, "name");
    EXPECT_EQ(v->code, "signup.invalid");
}

TEST(CombineErrorTest, ThreeValidationsConcatenateInOrder) {
    auto v1 = Error::validation({FieldError("email", {"Required"}),
                                 FieldError("email", {"Invalid format"})},
                                "signup.invalid");
    auto v2 = Error::validation("Too short", "name");
    auto v3 = Error::validation({FieldError("age", {"Too young", "Not a number"})},
                                "age.invalid");

    auto left_first = combine(combine(v1, v2), v3);
    auto right_first = combine(v1, combine(v2, v3));

    const auto* v = left_first.as<ValidationError>();
    ASSERT_NE(v, nullptr);
    ASSERT_EQ(v->field_errors.size(), 4u);
    EXPECT_EQ(v->field_errors[0], FieldError("email", {"Required"}));
    EXPECT_EQ(v->field_errors[1], FieldError("email", {"Invalid format"}));
    EXPECT_EQ(v->field_errors[2], FieldError("name", {"Too short"}));
    EXPECT_EQ(v->field_errors[3], FieldError("age", {"Too young", "Not a number"}));
    EXPECT_EQ(v->code, "signup.invalid");

    EXPECT_EQ(left_first, right_first);
}

TEST(CombineErrorTest, ValidationMergeKeepsFirstInstance) {
    auto left = Error::validation("Required", "email");
    auto right = Error::validation("Too short", "name", std::string{codes::kValidation}, "form-2");
    EXPECT_EQ(combine(left, right).instance().value_or(""), "form-2");

    auto tagged = Error::validation("Required", "email", std::string{codes::kValidation}, "form-1");
    EXPECT_EQ(combine(tagged, right).instance().value_or(""), "form-1");
}

TEST(CombineErrorTest, ValidationDetailsJoined) {
    auto left = Error::validation({FieldError("a", {"x"})}, "validation.error", "first");
    auto right = Error::validation({FieldError("b", {"y"})}, "validation.error", "second");

    auto merged = combine(left, right);
    EXPECT_EQ(merged.as<ValidationError>()->detail, "first | second");
}

TEST(CombineErrorTest, TwoLeavesMakeAggregate) {
    auto merged = combine(Error::not_found("a"), Error::conflict("b"));
    ASSERT_EQ(merged.kind(), ErrorKind::Aggregate);

    const auto& errors = merged.as<AggregateError>()->errors;
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], Error::not_found("a"));
    EXPECT_EQ(errors[1], Error::conflict("b"));
}

TEST(CombineErrorTest, ValidationWithLeafIsSingleEntry) {
    auto merged = combine(Error::validation("Required", "email"), Error::not_found("x"));
    ASSERT_EQ(merged.kind(), ErrorKind::Aggregate);

    const auto& errors = merged.as<AggregateError>()->errors;
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].kind(), ErrorKind::Validation);
    EXPECT_EQ(errors[1].kind(), ErrorKind::NotFound);
}

TEST(CombineErrorTest, AggregateIsFlattened) {
    auto left = combine(Error::not_found("a"), Error::conflict("b"));
    auto right = combine(Error::domain("c"), Error::forbidden("d"));

    auto merged = combine(left, right);
    const auto& errors = merged.as<AggregateError>()->errors;
    ASSERT_EQ(errors.size(), 4u);
    for (const auto& e : errors) {
        EXPECT_NE(e.kind(), ErrorKind::Aggregate);
    }
    EXPECT_EQ(errors[2], Error::domain("c"));
}

TEST(CombineErrorTest, AggregateFactoryFlattens) {
    auto inner = Error::aggregate({Error::not_found("a"), Error::conflict("b")});
    auto outer = Error::aggregate({inner, Error::domain("c")});

    const auto& errors = outer.as<AggregateError>()->errors;
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], Error::not_found("a"));
}

TEST(CombineErrorTest, NestedCombineStaysFlat) {
    auto ab = combine(Error::not_found("a"), Error::conflict("b"));
    auto abc = combine(ab, Error::domain("c"));
    auto abcd = combine(abc, Error::forbidden("d"));
    auto all = combine(abcd, combine(Error::unauthorized("e"), Error::rate_limit("f")));

    const auto& errors = all.as<AggregateError>()->errors;
    ASSERT_EQ(errors.size(), 6u);
    for (const auto& e : errors) {
        EXPECT_NE(e.kind(), ErrorKind::Aggregate);
    }
    EXPECT_EQ(errors[3], Error::forbidden("d"));
    EXPECT_EQ(errors[5], Error::rate_limit("f"));
}

TEST(CombineErrorTest, AggregateOnlyFromFactories) {
    static_assert(!std::is_default_constructible_v<AggregateError>);
    static_assert(!std::is_constructible_v<Error, AggregateError>);
    static_assert(!std::is_convertible_v<AggregateError, Error>);
    static_assert(!std::is_constructible_v<Error, const AggregateError&>);
    static_assert(std::is_convertible_v<NotFoundError, Error>);
    static_assert(std::is_convertible_v<ValidationError, Error>);

    auto agg = Error::aggregate({Error::domain("c")});
    ASSERT_EQ(agg.as<AggregateError>()->errors.size(), 1u);
}
