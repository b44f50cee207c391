#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "periodictask.h"
#include "testing/testcontext.h"

using namespace std::chrono;


TEST(PeriodicTaskTest, TickCatchesFailures)
{
    TestContext context(LogLevel::NONE);
    int calls = 0;
    PeriodicTask task(context, "Mouse", milliseconds(50), [&]
    {
        if (++calls == 2)
            throw std::runtime_error("XQueryPointer failed");
    });

    EXPECT_TRUE(task.tick());
    EXPECT_FALSE(task.tick());
    EXPECT_TRUE(task.tick());
    EXPECT_EQ(3, calls);
    EXPECT_EQ(3u, task.get_tick_count());
    EXPECT_EQ(1u, task.get_failure_count());
}

TEST(PeriodicTaskTest, KeepsRunningAfterFailingTicks)
{
    TestContext context(LogLevel::NONE);
    std::atomic<int> calls{0};
    PeriodicTask task(context, "Browser", milliseconds(1), [&]
    {
        calls++;
        throw std::runtime_error("BadWindow");
    });

    task.start();
    EXPECT_TRUE(task.is_running());
    auto deadline = steady_clock::now() + seconds(10);
    while (calls < 5 && steady_clock::now() < deadline)
        std::this_thread::sleep_for(milliseconds(1));
    task.stop();

    EXPECT_FALSE(task.is_running());
    EXPECT_GE(calls, 5);
    EXPECT_EQ(task.get_tick_count(), task.get_failure_count());
}

TEST(PeriodicTaskTest, StopInterruptsLongInterval)
{
    TestContext context(LogLevel::NONE);
    std::atomic<int> calls{0};
    PeriodicTask task(context, "Slow", seconds(60), [&]{calls++;});

    task.start();
    while (calls == 0)
        std::this_thread::sleep_for(milliseconds(1));

    auto start = steady_clock::now();
    task.stop();
    EXPECT_LT(steady_clock::now() - start, seconds(10));
    EXPECT_EQ(1, calls);

    // stopping twice is harmless
    task.stop();
    EXPECT_FALSE(task.is_running());
}
