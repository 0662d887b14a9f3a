/**
 * @file test_task.cpp
 * @brief Unit tests for Task, TaskSource and spawn.
 */

#include "async/task.hpp"
#include "combinators/sequential.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace railway;

TEST(TaskTest, ReadyTask) {
    auto task = make_ready_task(success(5));
    EXPECT_TRUE(task.valid());
    EXPECT_TRUE(task.is_ready());
    EXPECT_EQ(task.get().value(), 5);
    EXPECT_FALSE(task.valid());
}

TEST(TaskTest, SourceSettlesFromAnotherThread) {
    TaskSource<std::string> source;
    auto task = source.task();
    EXPECT_FALSE(task.is_ready());

    std::thread producer([&source] { source.set_result(std::string{"late"}); });
    auto r = task.get();
    producer.join();
    EXPECT_EQ(r.value(), "late");
}

TEST(TaskTest, SourceHandsOutOneTask) {
    TaskSource<int> source;
    auto task = source.task();
    EXPECT_THROW(static_cast<void>(source.task()), ContractViolation);
}

TEST(TaskTest, SettlingTwiceIsContractViolation) {
    TaskSource<int> source;
    auto task = source.task();
    source.set_result(1);
    EXPECT_THROW(source.set_result(2), ContractViolation);
}

TEST(TaskTest, ConsumedTaskIsContractViolation) {
    auto task = make_ready_task(success(1));
    static_cast<void>(task.get());
    EXPECT_THROW(static_cast<void>(task.get()), ContractViolation);
}

TEST(TaskTest, SubscribeAfterSettleRunsInline) {
    auto task = make_ready_task(success(3));
    int seen = 0;
    task.subscribe([&seen](detail::Settled<int> outcome) {
        seen = std::get<0>(std::move(outcome)).value();
    });
    EXPECT_EQ(seen, 3);
}

TEST(TaskTest, AbandonedTaskRethrowsFromGet) {
    TaskSource<int> source;
    auto task = source.task();
    source.set_exception(std::make_exception_ptr(ContractViolation("broken invariant")));
    EXPECT_THROW(static_cast<void>(task.get()), ContractViolation);
}

// ═══════════════════════════════════════════════
// then
// ═══════════════════════════════════════════════

TEST(TaskThenTest, ChainsResult) {
    TaskSource<int> source;
    auto next = source.task().then([](Result<int> r) {
        return railway::map(std::move(r), [](int v) { return v * 2; });
    });

    source.set_result(21);
    EXPECT_EQ(next.get().value(), 42);
}

TEST(TaskThenTest, FlattensReturnedTask) {
    TaskSource<int> inner;
    auto inner_task = std::make_shared<Task<int>>(inner.task());

    auto chained = make_ready_task(success(1)).then([inner_task](Result<int>) mutable {
        return std::move(*inner_task);
    });
    EXPECT_FALSE(chained.is_ready());

    inner.set_result(9);
    EXPECT_EQ(chained.get().value(), 9);
}

TEST(TaskThenTest, StdExceptionBecomesUnexpected) {
    auto next = make_ready_task(success(1)).then([](Result<int>) -> Result<int> {
        throw std::runtime_error("continuation failed");
    });
    auto r = next.get();
    ASSERT_TRUE(r.is_failure());
    EXPECT_EQ(r.error(), Error::unexpected("continuation failed"));
}

TEST(TaskThenTest, ContractViolationAbandonsDownstream) {
    auto next = make_ready_task(success(1))
                    .then([](Result<int>) -> Result<int> { throw ContractViolation("bug"); })
                    .then([](Result<int> r) { return r; });
    EXPECT_THROW(static_cast<void>(next.get()), ContractViolation);
}

// ═══════════════════════════════════════════════
// spawn
// ═══════════════════════════════════════════════

TEST(SpawnTest, RunsOnPool) {
    ThreadPool pool(2);
    const auto caller = std::this_thread::get_id();
    auto task = spawn(pool, [caller] { return success(std::this_thread::get_id() != caller); });
    EXPECT_TRUE(task.get().value());
}

TEST(SpawnTest, ManyTasksComplete) {
    ThreadPool pool(4);
    std::atomic<int> sum{0};
    std::vector<Task<int>> tasks;
    for (int i = 1; i <= 20; ++i) {
        tasks.push_back(spawn(pool, [i, &sum] {
            sum += i;
            return success(i);
        }));
    }
    for (auto& t : tasks) EXPECT_TRUE(t.get().is_success());
    EXPECT_EQ(sum.load(), 210);
}
