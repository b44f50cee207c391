#include <gtest/gtest.h>

#include "processfilter.h"
#include "testing/fakedesktopprobe.h"
#include "testing/testcontext.h"


class ProcessFilterTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            m_probe = m_context.set_desktop_probe(std::make_unique<FakeDesktopProbe>(m_context));
        }

        ProcessFilter* filter()
        {
            return m_context.get_process_filter();
        }

    protected:
        TestContext m_context{LogLevel::NONE};
        FakeDesktopProbe* m_probe{};
};

TEST_F(ProcessFilterTest, UnfilteredPassesEverything)
{
    EXPECT_FALSE(filter()->get_state().enabled);
    EXPECT_TRUE(filter()->passes(7));
    EXPECT_TRUE(filter()->passes(PropertyError::STALE_ELEMENT));
}

TEST_F(ProcessFilterTest, ToggleFollowsForegroundProcess)
{
    m_probe->foreground_pid = 4242;
    auto state = filter()->toggle();
    EXPECT_TRUE(state.enabled);
    EXPECT_EQ(4242, state.pid);

    EXPECT_TRUE(filter()->passes(4242));
    EXPECT_FALSE(filter()->passes(4243));
    EXPECT_FALSE(filter()->passes(PropertyError::ACCESS_DENIED));

    // the foreground window changing doesn't move the filter
    m_probe->foreground_pid = 99;
    EXPECT_FALSE(filter()->passes(99));

    state = filter()->toggle();
    EXPECT_FALSE(state.enabled);
    EXPECT_TRUE(filter()->passes(4243));
}

TEST_F(ProcessFilterTest, NoForegroundWindowStaysUnfiltered)
{
    m_probe->foreground_pid.set_none();
    EXPECT_FALSE(filter()->toggle().enabled);
    EXPECT_TRUE(filter()->passes(1));
}

TEST_F(ProcessFilterTest, ProbeFailureStaysUnfiltered)
{
    m_probe->fail = true;
    EXPECT_FALSE(filter()->toggle().enabled);
    EXPECT_TRUE(filter()->passes(1));
}

TEST_F(ProcessFilterTest, SetPid)
{
    filter()->set_pid(12);
    EXPECT_TRUE(filter()->get_state().enabled);
    EXPECT_EQ(12, filter()->get_state().pid);

    filter()->set_pid(-3);
    EXPECT_FALSE(filter()->get_state().enabled);
}

TEST(ProcessFilterNoDisplayTest, ToggleWithoutProbeStaysUnfiltered)
{
    TestContext context(LogLevel::NONE);
    EXPECT_FALSE(context.get_process_filter()->toggle().enabled);
}

TEST(ProcessFilterStateTest, Printing)
{
    std::ostringstream ss;
    ss << ProcessFilterState{true, 5} << " " << ProcessFilterState{};
    EXPECT_EQ("Foreground-Only(pid=5) Unfiltered", ss.str());
}
