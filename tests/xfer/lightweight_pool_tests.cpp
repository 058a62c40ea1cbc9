// tests/xfer/lightweight_pool_tests.cpp
// Fibers on carrier threads, and results handed back to the calling loop

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "xfer/file_store.hpp"
#include "xfer/io.hpp"
#include "xfer/io_context.hpp"
#include "xfer/lightweight_pool.hpp"
#include "xfer/task_group.hpp"
#include "xfer/whole_file_loader.hpp"

using namespace xfer;
using namespace xfer::test;
using namespace std::chrono_literals;

class LightweightPoolTest : public ::testing::Test {
protected:
    IoContext ctx{256};
    LightweightThreadPool pool{2};
};

TEST_F(LightweightPoolTest, RunsOnCarrierAndResumesOnLoop) {
    const auto loop_thread = std::this_thread::get_id();

    auto test = [&]() -> Task<> {
        auto on_carrier = co_await RunOnLightweightThread(ctx, pool, [](Carrier& c) -> Task<bool> {
            co_return c.OnCarrierThread();
        });
        EXPECT_TRUE(on_carrier);
        EXPECT_EQ(std::this_thread::get_id(), loop_thread);
    };

    auto t = test();
    RunTask(ctx, t);
    EXPECT_GE(pool.FibersStarted(), 1u);
}

TEST_F(LightweightPoolTest, FiberCanAwaitCarrierIo) {
    auto test = [&]() -> Task<> {
        auto slept = co_await RunOnLightweightThread(ctx, pool, [](Carrier& c) -> Task<int> {
            auto r = co_await AsyncSleep(c.Io(), 5ms);
            co_return r.has_value() ? 1 : 0;
        });
        EXPECT_EQ(slept, 1);
    };

    auto t = test();
    RunTask(ctx, t);
}

TEST_F(LightweightPoolTest, ManyFibersShareFewCarriers) {
    std::atomic<int> done{0};

    auto one = [&](int i) -> Task<> {
        auto v = co_await RunOnLightweightThread(ctx, pool, [i](Carrier& c) -> Task<int> {
            co_await AsyncSleep(c.Io(), 2ms);
            co_return i;
        });
        EXPECT_EQ(v, i);
        done.fetch_add(1);
    };

    auto test = [&]() -> Task<> {
        TaskGroup<> group;
        for (int i = 0; i < 100; ++i) {
            group.Spawn(one(i));
        }
        co_await group.JoinAll(ctx);
    };

    auto t = test();
    RunTask(ctx, t);
    EXPECT_EQ(done.load(), 100);
    EXPECT_EQ(pool.Carriers(), 2u);
    EXPECT_EQ(pool.FibersStarted(), 100u);
}

TEST_F(LightweightPoolTest, FiberExceptionReachesCaller) {
    auto test = [&]() -> Task<> {
        bool caught = false;
        try {
            co_await RunOnLightweightThread(ctx, pool, [](Carrier&) -> Task<int> {
                throw std::runtime_error("fiber failed");
                co_return 0;
            });
        } catch (const std::runtime_error&) {
            caught = true;
        }
        EXPECT_TRUE(caught);
    };

    auto t = test();
    RunTask(ctx, t);
}

TEST_F(LightweightPoolTest, PinCountsBlockingCalls) {
    auto test = [&]() -> Task<> {
        auto v = co_await RunOnLightweightThread(ctx, pool, [](Carrier& c) -> Task<int> {
            co_return c.Pin([] { return 7; });
        });
        EXPECT_EQ(v, 7);
    };

    auto t = test();
    RunTask(ctx, t);
    EXPECT_EQ(pool.PinnedCalls(), 1u);
}

TEST_F(LightweightPoolTest, LoadsFileThroughCarrierRing) {
    TempDir dir;
    const auto content = GenerateTestData(3 * WholeFileLoader::kReadSlice / 2);
    dir.Write("f.bin", content);
    LocalFileStore store(dir.Path());
    auto handle = store.Resolve("f.bin");
    ASSERT_TRUE(handle.has_value());

    auto test = [&]() -> Task<> {
        auto data = co_await RunOnLightweightThread(ctx, pool, [&handle](Carrier& c) {
            return WholeFileLoader::LoadOn(c.Io(), *handle);
        });
        EXPECT_TRUE(data.has_value());
        if (data) {
            EXPECT_EQ(*data, content);
        }
    };

    auto t = test();
    RunTask(ctx, t);
}

TEST(LightweightPoolLifecycleTest, StoppedPoolRejectsFibers) {
    IoContext ctx(64);
    LightweightThreadPool pool(1);
    pool.Stop();

    auto test = [&]() -> Task<> {
        bool caught = false;
        try {
            co_await RunOnLightweightThread(ctx, pool, [](Carrier&) -> Task<int> { co_return 1; });
        } catch (const std::runtime_error&) {
            caught = true;
        }
        EXPECT_TRUE(caught);
    };

    auto t = test();
    RunTask(ctx, t);
}
