#include <signal.h>

#include <gtest/gtest.h>

#include "signal_helpers.h"


TEST(ShutdownSignalTest, WaitReturnsPendingSignal)
{
    ShutdownSignal shutdown_signal;
    ASSERT_EQ(0, raise(SIGTERM));
    EXPECT_EQ(SIGTERM, shutdown_signal.wait());

    ASSERT_EQ(0, raise(SIGINT));
    EXPECT_EQ(SIGINT, shutdown_signal.wait());
}

TEST(ShutdownSignalTest, TerminalHangupShutsDown)
{
    ShutdownSignal shutdown_signal;
    ASSERT_EQ(0, raise(SIGHUP));
    EXPECT_EQ(SIGHUP, shutdown_signal.wait());
}

TEST(ShutdownSignalTest, DestructorRestoresHandlers)
{
    struct sigaction before{};
    ASSERT_EQ(0, sigaction(SIGHUP, nullptr, &before));
    {
        ShutdownSignal shutdown_signal;
        struct sigaction during{};
        ASSERT_EQ(0, sigaction(SIGHUP, nullptr, &during));
        EXPECT_NE(before.sa_handler, during.sa_handler);
    }
    struct sigaction after{};
    ASSERT_EQ(0, sigaction(SIGHUP, nullptr, &after));
    EXPECT_EQ(before.sa_handler, after.sa_handler);
}
