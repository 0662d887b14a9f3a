/**
 * @file test_retry.cpp
 * @brief Unit tests for synchronous retry with backoff.
 */

#include "retry/retry.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

using namespace railway;

namespace {

/// Records the requested delays instead of sleeping.
struct DelayRecorder {
    std::vector<Milliseconds> delays;

    DelayFn fn() {
        return [this](Milliseconds delay, std::stop_token stop) {
            delays.push_back(delay);
            return !stop.stop_requested();
        };
    }
};

class CapturingSink : public ILogSink {
public:
    explicit CapturingSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

class CountingObserver : public IResultObserver {
public:
    void record(std::string_view operation, Outcome outcome, const Error*) noexcept override {
        last_operation = std::string(operation);
        if (outcome == Outcome::Success) {
            ++successes;
        } else {
            ++failures;
        }
    }

    int successes = 0;
    int failures = 0;
    std::string last_operation;
};

RetryPolicy policy_with(uint32_t max_retries) {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.initial_delay = Milliseconds{10};
    policy.backoff_multiplier = 2.0;
    return policy;
}

}  // namespace

class RetryTest : public ::testing::Test {
protected:
    RetryContext context() {
        RetryContext ctx;
        ctx.delay = recorder_.fn();
        return ctx;
    }

    DelayRecorder recorder_;
};

// ═══════════════════════════════════════════════
// Attempt counting
// ═══════════════════════════════════════════════

TEST_F(RetryTest, SucceedsFirstTime) {
    int calls = 0;
    auto report = retry_with_report([&] {
        ++calls;
        return success(1);
    }, policy_with(3), context());

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(report.outcome, RetryOutcome::Succeeded);
    EXPECT_EQ(report.attempts, 1u);
    EXPECT_TRUE(recorder_.delays.empty());
}

TEST_F(RetryTest, ExhaustsAfterMaxRetriesPlusOne) {
    int calls = 0;
    auto report = retry_with_report([&]() -> Result<int> {
        ++calls;
        return Error::service_unavailable("down " + std::to_string(calls));
    }, policy_with(2), context());

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(report.outcome, RetryOutcome::Exhausted);
    EXPECT_EQ(report.attempts, 3u);
    // The caller receives the last failure, not an invented one.
    EXPECT_EQ(report.result.error(), Error::service_unavailable("down 3"));
}

TEST_F(RetryTest, ZeroRetriesRunsOnce) {
    int calls = 0;
    auto r = retry([&]() -> Result<int> {
        ++calls;
        return Error::domain("no");
    }, policy_with(0), context());

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(r.is_failure());
}

TEST_F(RetryTest, SucceedsAfterTransientFailures) {
    int calls = 0;
    auto report = retry_with_report([&]() -> Result<std::string> {
        if (++calls < 3) return Error::service_unavailable("busy");
        return std::string{"done"};
    }, policy_with(5), context());

    EXPECT_EQ(report.outcome, RetryOutcome::Succeeded);
    EXPECT_EQ(report.attempts, 3u);
    EXPECT_EQ(report.result.value(), "done");
}

TEST_F(RetryTest, DelaysGrowByMultiplier) {
    static_cast<void>(retry([]() -> Result<int> { return Error::rate_limit("slow"); },
                            policy_with(3), context()));

    ASSERT_EQ(recorder_.delays.size(), 3u);
    EXPECT_EQ(recorder_.delays[0], Milliseconds{10});
    EXPECT_EQ(recorder_.delays[1], Milliseconds{20});
    EXPECT_EQ(recorder_.delays[2], Milliseconds{40});
}

TEST_F(RetryTest, FractionalMultiplierAccumulates) {
    auto policy = policy_with(3);
    policy.initial_delay = Milliseconds{100};
    policy.backoff_multiplier = 1.5;
    static_cast<void>(retry([]() -> Result<int> { return Error::rate_limit("slow"); }, policy,
                            context()));

    ASSERT_EQ(recorder_.delays.size(), 3u);
    EXPECT_EQ(recorder_.delays[1], Milliseconds{150});
    EXPECT_EQ(recorder_.delays[2], Milliseconds{225});
}

TEST_F(RetryTest, HugeMultiplierSaturatesDelay) {
    auto policy = policy_with(3);
    policy.initial_delay = Milliseconds{1000};
    policy.backoff_multiplier = 1e17;
    static_cast<void>(retry([]() -> Result<int> { return Error::rate_limit("slow"); }, policy,
                            context()));

    ASSERT_EQ(recorder_.delays.size(), 3u);
    EXPECT_EQ(recorder_.delays[0], Milliseconds{1000});
    EXPECT_EQ(recorder_.delays[1], kMaxRetryDelay);
    EXPECT_EQ(recorder_.delays[2], kMaxRetryDelay);
}

TEST_F(RetryTest, LongBackoffNeverWrapsNegative) {
    auto policy = policy_with(64);
    static_cast<void>(retry([]() -> Result<int> { return Error::rate_limit("slow"); }, policy,
                            context()));

    ASSERT_EQ(recorder_.delays.size(), 64u);
    for (size_t i = 1; i < recorder_.delays.size(); ++i) {
        EXPECT_GE(recorder_.delays[i], recorder_.delays[i - 1]) << "at retry " << i;
        EXPECT_LE(recorder_.delays[i], kMaxRetryDelay);
    }
    EXPECT_EQ(recorder_.delays.back(), kMaxRetryDelay);
}

TEST_F(RetryTest, NonPositiveMultiplierNeverWaitsNegative) {
    auto policy = policy_with(2);
    policy.backoff_multiplier = -3.0;
    static_cast<void>(retry([]() -> Result<int> { return Error::rate_limit("slow"); }, policy,
                            context()));

    ASSERT_EQ(recorder_.delays.size(), 2u);
    EXPECT_EQ(recorder_.delays[0], Milliseconds{10});
    EXPECT_EQ(recorder_.delays[1], Milliseconds::zero());
}

// ═══════════════════════════════════════════════
// Policy and cancellation
// ═══════════════════════════════════════════════

TEST_F(RetryTest, ShouldRetryStopsEarly) {
    auto policy = policy_with(5);
    policy.should_retry = [](const Error& e) { return e.kind() == ErrorKind::ServiceUnavailable; };

    int calls = 0;
    auto report = retry_with_report([&]() -> Result<int> {
        ++calls;
        return Error::validation("bad input", "body");
    }, policy, context());

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(report.outcome, RetryOutcome::StoppedByPolicy);
    EXPECT_EQ(report.result.error().kind(), ErrorKind::Validation);
}

TEST_F(RetryTest, CancelledBeforeRetry) {
    std::stop_source source;
    auto ctx = context();
    ctx.stop = source.get_token();

    int calls = 0;
    auto report = retry_with_report([&]() -> Result<int> {
        ++calls;
        source.request_stop();
        return Error::service_unavailable("down");
    }, policy_with(5), ctx);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(report.outcome, RetryOutcome::Cancelled);
    EXPECT_EQ(report.result.error(), Error::service_unavailable("down"));
}

TEST_F(RetryTest, CancelledDuringDelay) {
    std::stop_source source;
    RetryContext ctx;
    ctx.stop = source.get_token();
    ctx.delay = [&source](Milliseconds, std::stop_token) {
        source.request_stop();
        return false;
    };

    int calls = 0;
    auto report = retry_with_report([&]() -> Result<int> {
        ++calls;
        return Error::service_unavailable("down");
    }, policy_with(5), ctx);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(report.outcome, RetryOutcome::Cancelled);
}

TEST_F(RetryTest, OperationReceivesStopToken) {
    std::stop_source source;
    auto ctx = context();
    ctx.stop = source.get_token();

    bool token_connected = false;
    static_cast<void>(retry([&](std::stop_token stop) {
        token_connected = stop.stop_possible();
        return success(1);
    }, policy_with(1), ctx));

    EXPECT_TRUE(token_connected);
}

TEST(InterruptibleSleepTest, ReturnsFalseWhenStopped) {
    std::stop_source source;
    source.request_stop();
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(interruptible_sleep(Milliseconds{5000}, source.get_token()));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(InterruptibleSleepTest, ReturnsTrueAfterTimeout) {
    std::stop_source source;
    EXPECT_TRUE(interruptible_sleep(Milliseconds{5}, source.get_token()));
}

// ═══════════════════════════════════════════════
// Observer and logging
// ═══════════════════════════════════════════════

TEST_F(RetryTest, ObserverSeesEveryAttempt) {
    CountingObserver observer;
    auto ctx = context();
    ctx.observer = &observer;
    ctx.operation = "fetch_user";

    int calls = 0;
    static_cast<void>(retry([&]() -> Result<int> {
        if (++calls < 3) return Error::service_unavailable("busy");
        return 7;
    }, policy_with(5), ctx));

    EXPECT_EQ(observer.failures, 2);
    EXPECT_EQ(observer.successes, 1);
    EXPECT_EQ(observer.last_operation, "fetch_user");
}

TEST_F(RetryTest, LogsAttemptsAndExhaustion) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CapturingSink>(lines), LogLevel::Debug, "test");
    auto ctx = context();
    ctx.logger = &logger;
    ctx.operation = "charge";

    static_cast<void>(retry([]() -> Result<int> { return Error::rate_limit("slow"); },
                            policy_with(1), ctx));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("charge: attempt 1 failed with rate.limit.error"), std::string::npos);
    EXPECT_NE(lines[0].find("\"level\":\"debug\""), std::string::npos);
    EXPECT_NE(lines[1].find("exhausted after 2 attempts"), std::string::npos);
    EXPECT_NE(lines[1].find("\"level\":\"warn\""), std::string::npos);
}

TEST(RetryPolicyTest, FromConfig) {
    RetryConfig config;
    config.max_retries = 7;
    config.initial_delay = Milliseconds{250};
    config.backoff_multiplier = 3.0;

    auto policy = to_retry_policy(config);
    EXPECT_EQ(policy.max_retries, 7u);
    EXPECT_EQ(policy.initial_delay, Milliseconds{250});
    EXPECT_DOUBLE_EQ(policy.backoff_multiplier, 3.0);
    EXPECT_FALSE(static_cast<bool>(policy.should_retry));
}
