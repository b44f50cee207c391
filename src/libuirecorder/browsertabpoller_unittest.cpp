#include <gtest/gtest.h>

#include "browsertabpoller.h"
#include "eventaggregator.h"
#include "exception.h"
#include "testing/fakedesktopprobe.h"
#include "testing/testcontext.h"


class BrowserTabPollerTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            m_probe = m_context.set_desktop_probe(std::make_unique<FakeDesktopProbe>(m_context));
        }

        std::vector<BrowserUrlEvent> urls()
        {
            return m_context.get_event_aggregator()->get_browser_urls().snapshot();
        }

    protected:
        TestContext m_context{LogLevel::NONE};
        FakeDesktopProbe* m_probe{};
        BrowserTabPoller m_poller{m_context};
};

TEST(BrowserTabPollerStaticTest, ExtractUrl)
{
    EXPECT_EQ("https://example.com/a",
              BrowserTabPoller::extract_url("https://example.com/a - Google Chrome",
                                            " - Google Chrome"));
    EXPECT_EQ("http://localhost:8080",
              BrowserTabPoller::extract_url("  http://localhost:8080  - Chromium", " - Chromium"));

    // page titles aren't URLs
    EXPECT_EQ("", BrowserTabPoller::extract_url("Example Domain - Google Chrome",
                                                " - Google Chrome"));
    EXPECT_EQ("", BrowserTabPoller::extract_url("ftp://example.com - Google Chrome",
                                                " - Google Chrome"));
    // wrong or missing suffix
    EXPECT_EQ("", BrowserTabPoller::extract_url("https://example.com - Chromium",
                                                " - Google Chrome"));
    EXPECT_EQ("", BrowserTabPoller::extract_url("https://example.com", ""));
}

TEST(BrowserTabPollerStaticTest, FindBrowser)
{
    auto chrome = BrowserTabPoller::find_browser("google-chrome", "Google-chrome");
    ASSERT_NE(nullptr, chrome);
    EXPECT_STREQ("chrome", chrome->process_name);

    auto firefox = BrowserTabPoller::find_browser("Navigator", "firefox");
    ASSERT_NE(nullptr, firefox);
    EXPECT_STREQ("firefox", firefox->process_name);

    EXPECT_EQ(nullptr, BrowserTabPoller::find_browser("gedit", "Gedit"));
}

TEST_F(BrowserTabPollerTest, RecordsUrlOnlyWhenChanged)
{
    m_probe->set_browser_title("Google-chrome", "https://example.com/a - Google Chrome");
    auto first = m_poller.poll();
    ASSERT_FALSE(first.is_none());
    EXPECT_EQ("chrome", first.value.process_name);
    EXPECT_EQ("https://example.com/a", first.value.url);

    EXPECT_TRUE(m_poller.poll().is_none());
    EXPECT_TRUE(m_poller.poll().is_none());

    m_probe->set_browser_title("Google-chrome", "https://example.com/b - Google Chrome");
    EXPECT_FALSE(m_poller.poll().is_none());

    auto recorded = urls();
    ASSERT_EQ(2u, recorded.size());
    EXPECT_EQ("https://example.com/a", recorded[0].url);
    EXPECT_EQ("https://example.com/b", recorded[1].url);
}

TEST_F(BrowserTabPollerTest, IgnoresNonBrowserWindows)
{
    m_probe->windows = {{"gedit", "Gedit", "https://example.com - gedit", 7}};
    EXPECT_TRUE(m_poller.poll().is_none());
    EXPECT_TRUE(urls().empty());
}

TEST_F(BrowserTabPollerTest, OnlyTopMostBrowserCounts)
{
    m_probe->windows = {
        {"gedit", "Gedit", "notes.txt - gedit", 7},
        {"google-chrome", "Google-chrome", "Example Domain - Google Chrome", 8},
        {"chromium", "Chromium", "https://example.org - Chromium", 9},
    };
    // the top-most browser shows a page title, not a URL
    EXPECT_TRUE(m_poller.poll().is_none());
    EXPECT_TRUE(urls().empty());
}

TEST_F(BrowserTabPollerTest, ProbeFailureThrows)
{
    m_probe->fail = true;
    EXPECT_THROW(m_poller.poll(), X11Exception);
}
