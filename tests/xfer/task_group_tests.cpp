// tests/xfer/task_group_tests.cpp
// Detached task ownership and joining

#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "xfer/io.hpp"
#include "xfer/io_context.hpp"
#include "xfer/notifier.hpp"
#include "xfer/task_group.hpp"

using namespace xfer;
using namespace xfer::test;
using namespace std::chrono_literals;

class TaskGroupTest : public ::testing::Test {
protected:
    IoContext ctx{256};
};

TEST_F(TaskGroupTest, DefaultConstruction) {
    TaskGroup<> group;
    EXPECT_EQ(group.Size(), 0u);
    EXPECT_EQ(group.ActiveCount(), 0u);
    EXPECT_EQ(group.TotalSpawned(), 0u);
}

TEST_F(TaskGroupTest, JoinAllWaitsForEveryTask) {
    int finished = 0;

    auto sleeper = [&](std::chrono::milliseconds d) -> Task<> {
        co_await AsyncSleep(ctx, d);
        ++finished;
    };

    auto test = [&]() -> Task<> {
        TaskGroup<> group;
        for (int i = 0; i < 10; ++i) {
            group.Spawn(sleeper(std::chrono::milliseconds(1 + i)));
        }
        EXPECT_EQ(group.ActiveCount(), 10u);
        EXPECT_EQ(group.TotalSpawned(), 10u);

        co_await group.JoinAll(ctx);
        EXPECT_EQ(group.ActiveCount(), 0u);
        EXPECT_EQ(group.Size(), 0u);
    };

    auto t = test();
    RunTask(ctx, t);
    EXPECT_EQ(finished, 10);
}

TEST_F(TaskGroupTest, SynchronousTasksFinishOnSpawn) {
    auto test = [&]() -> Task<> {
        TaskGroup<> group;
        group.Spawn([]() -> Task<> { co_return; }());
        EXPECT_EQ(group.ActiveCount(), 0u);
        EXPECT_EQ(group.Sweep(), 1u);
        co_await group.JoinAll(ctx);
    };

    auto t = test();
    RunTask(ctx, t);
}

TEST_F(TaskGroupTest, ThrowingTaskStillCountsAsDone) {
    auto test = [&]() -> Task<> {
        TaskGroup<> group;
        group.Spawn([](IoContext& c) -> Task<> {
            co_await AsyncSleep(c, 1ms);
            throw std::runtime_error("connection failed");
        }(ctx));
        co_await group.JoinAll(ctx);
        EXPECT_EQ(group.ActiveCount(), 0u);
    };

    auto t = test();
    RunTask(ctx, t);
}

TEST_F(TaskGroupTest, JoinAllTimeoutGivesUp) {
    Notifier never;

    auto test = [&]() -> Task<> {
        TaskGroup<> group;
        group.Spawn([](IoContext& c, Notifier& n) -> Task<> {
            (void)co_await n.Wait(c);
        }(ctx, never));

        const auto start = std::chrono::steady_clock::now();
        const bool joined = co_await group.JoinAllTimeout(ctx, 30ms);
        EXPECT_FALSE(joined);
        EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
        EXPECT_EQ(group.ActiveCount(), 1u);

        // Let the straggler finish so the group can go.
        never.Signal();
        EXPECT_TRUE(co_await group.JoinAllTimeout(ctx, 1s));
    };

    auto t = test();
    RunTask(ctx, t);
}
