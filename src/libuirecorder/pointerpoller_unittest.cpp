#include <gtest/gtest.h>

#include "eventaggregator.h"
#include "exception.h"
#include "pointerpoller.h"
#include "testing/fakedesktopprobe.h"
#include "testing/testcontext.h"


class PointerPollerTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            m_probe = m_context.set_desktop_probe(std::make_unique<FakeDesktopProbe>(m_context));
        }

        std::vector<PointerClickEvent> clicks()
        {
            return m_context.get_event_aggregator()->get_pointer_clicks().snapshot();
        }

    protected:
        TestContext m_context{LogLevel::NONE};
        FakeDesktopProbe* m_probe{};
        PointerPoller m_poller{m_context};
};

TEST_F(PointerPollerTest, NothingHeldRecordsNothing)
{
    m_probe->pointer = {10, 20, false, false};
    EXPECT_TRUE(m_poller.poll().is_none());
    EXPECT_TRUE(clicks().empty());
}

TEST_F(PointerPollerTest, HeldButtonRecordsEverySample)
{
    m_probe->pointer = {640, 480, true, false};
    for (int i = 0; i < 3; i++)
        EXPECT_FALSE(m_poller.poll().is_none());

    auto recorded = clicks();
    ASSERT_EQ(3u, recorded.size());
    for (auto& c : recorded)
    {
        EXPECT_EQ(640, c.x);
        EXPECT_EQ(480, c.y);
        EXPECT_EQ(PointerButton::LEFT, c.button);
    }
    EXPECT_LE(recorded[0].timestamp, recorded[2].timestamp);
}

TEST_F(PointerPollerTest, RightButton)
{
    m_probe->pointer = {5, 6, false, true};
    auto e = m_poller.poll();
    ASSERT_FALSE(e.is_none());
    EXPECT_EQ(PointerButton::RIGHT, e.value.button);
}

TEST_F(PointerPollerTest, LeftWinsWhenBothHeld)
{
    m_probe->pointer = {5, 6, true, true};
    auto e = m_poller.poll();
    ASSERT_FALSE(e.is_none());
    EXPECT_EQ(PointerButton::LEFT, e.value.button);
    EXPECT_EQ(1u, clicks().size());
}

TEST_F(PointerPollerTest, ProbeFailureThrows)
{
    m_probe->fail = true;
    EXPECT_THROW(m_poller.poll(), X11Exception);
    EXPECT_TRUE(clicks().empty());
}

TEST(PointerPollerNoDisplayTest, Throws)
{
    TestContext context(LogLevel::NONE);
    PointerPoller poller(context);
    EXPECT_THROW(poller.poll(), X11Exception);
}
