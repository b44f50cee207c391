#include <atomic>
#include <chrono>

#include <unistd.h>

#include <gtest/gtest.h>

#include "thread_helpers.h"

using namespace std::chrono;


TEST(ThreadFdTest, StopWakesSleepingThread)
{
    ThreadFd thread;
    std::atomic<bool> woken_early{false};
    thread.start([&]
    {
        woken_early = !thread.sleep_for(seconds(60));
    });

    auto start = steady_clock::now();
    EXPECT_TRUE(thread.stop());
    EXPECT_FALSE(thread.is_running());
    EXPECT_TRUE(woken_early);
    EXPECT_LT(steady_clock::now() - start, seconds(10));
}

TEST(ThreadFdTest, SleepRunsToCompletion)
{
    ThreadFd thread;
    std::atomic<bool> completed{false};
    thread.start([&]
    {
        completed = thread.sleep_for(milliseconds(10));
    });

    while (!completed)
        std::this_thread::sleep_for(milliseconds(1));
    thread.stop();
    EXPECT_TRUE(completed);
}

TEST(ThreadFdTest, WaitsForDataOnPollFd)
{
    int fds[2];
    ASSERT_EQ(0, pipe(fds));

    ThreadFd thread;
    std::atomic<int> wakeups{0};
    thread.start(fds[0], [&]
    {
        while (thread.wait_for_data())
        {
            char buf[16];
            if (read(fds[0], buf, sizeof(buf)) <= 0)
                break;
            wakeups++;
        }
    });

    ASSERT_EQ(1, write(fds[1], "x", 1));
    while (wakeups == 0)
        std::this_thread::sleep_for(milliseconds(1));
    thread.stop();
    EXPECT_EQ(1, wakeups);

    close(fds[0]);
    close(fds[1]);
}
