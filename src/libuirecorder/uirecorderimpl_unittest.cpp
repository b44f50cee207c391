#include <experimental/filesystem>

#include <gtest/gtest.h>

#include "tools/file_helpers.h"
#include "tools/logger.h"

#include "browsertabpoller.h"
#include "configuration.h"
#include "eventaggregator.h"
#include "eventjson.h"
#include "exception.h"
#include "periodictask.h"
#include "pointerpoller.h"
#include "processfilter.h"
#include "testing/fakeaccessibilityeventsource.h"
#include "testing/fakedesktopprobe.h"
#include "testing/fakeelement.h"
#include "uirecorderimpl.h"

namespace fs = std::experimental::filesystem;


// A recorder wired to fakes, running without its poller threads.
class TestRecorder
{
    public:
        TestRecorder(const std::string& output_dir, bool merge=false)
        {
            recorder.init_essentials(LogLevel::NONE);
            recorder.config()->set_output_dir(output_dir);
            recorder.config()->set_merge_uia_log(merge);

            auto source_ptr = std::make_unique<FakeAccessibilityEventSource>(recorder);
            auto probe_ptr = std::make_unique<FakeDesktopProbe>(recorder);
            source = source_ptr.get();
            probe = probe_ptr.get();
            recorder.start(std::move(source_ptr), std::move(probe_ptr), false);
        }

        void emit(AccessibilityEventCategory category,
                  const std::string& name, int32_t pid)
        {
            source->emit(category, FakeElement::make(recorder, name, "ControlType.Button", pid));
        }

    public:
        UIRecorderImpl recorder;
        FakeAccessibilityEventSource* source{};
        FakeDesktopProbe* probe{};
};


class UIRecorderImplTest : public ::testing::Test
{
    protected:
        std::string get_output_dir() const
        {
            return (fs::path(m_tmp.dir) / "resources" / "output_logs").string();
        }

        std::string read_log(const std::string& filename)
        {
            std::string text;
            EXPECT_TRUE(read_file(text, (fs::path(get_output_dir()) / filename).string()));
            return text;
        }

        std::vector<UIEvent> read_ui_log()
        {
            return parse_ui_events(read_log(Config::UIA_LOG_FILENAME));
        }

    protected:
        TempDir m_tmp{"uirecorder_test_"};
};

TEST_F(UIRecorderImplTest, AllEventsRecordedInOrder)
{
    {
        TestRecorder r(get_output_dir());
        EXPECT_TRUE(r.source->is_subscribed());
        r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "A", 100);
        r.emit(AccessibilityEventCategory::ELEMENT_INVOKED, "B", 200);
        EXPECT_TRUE(r.recorder.shutdown());
    }

    auto events = read_ui_log();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(UIEventType::FOCUS, events[0].event_type);
    EXPECT_EQ("A", events[0].name);
    EXPECT_EQ(100, events[0].process_id);
    EXPECT_EQ(UIEventType::INVOKE, events[1].event_type);
    EXPECT_EQ("B", events[1].name);
    EXPECT_EQ(200, events[1].process_id);
}

TEST_F(UIRecorderImplTest, ForegroundFilterKeepsOnlyForegroundProcess)
{
    TestRecorder r(get_output_dir());
    r.probe->foreground_pid = 100;
    r.recorder.toggle_filter();
    EXPECT_TRUE(r.recorder.get_process_filter()->get_state().enabled);

    r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "A", 100);
    r.emit(AccessibilityEventCategory::ELEMENT_INVOKED, "B", 200);
    EXPECT_TRUE(r.recorder.shutdown());

    auto events = read_ui_log();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(UIEventType::FOCUS, events[0].event_type);
    EXPECT_EQ(100, events[0].process_id);
}

TEST_F(UIRecorderImplTest, TogglingBackListensToAll)
{
    TestRecorder r(get_output_dir());
    r.probe->foreground_pid = 100;
    r.recorder.toggle_filter();
    r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "dropped", 300);
    r.recorder.toggle_filter();
    r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "kept", 300);

    auto events = r.recorder.get_event_aggregator()->get_ui_events().snapshot();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("kept", events[0].name);
}

TEST_F(UIRecorderImplTest, MergeModeAppendsToPreviousRun)
{
    {
        TestRecorder r(get_output_dir());
        r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "existing", 100);
        ASSERT_TRUE(r.recorder.shutdown());
    }
    auto before = read_ui_log();
    ASSERT_EQ(1u, before.size());

    {
        TestRecorder r(get_output_dir(), true);
        r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "new1", 100);
        r.emit(AccessibilityEventCategory::ELEMENT_INVOKED, "new2", 100);
        ASSERT_TRUE(r.recorder.shutdown());
    }

    auto events = read_ui_log();
    ASSERT_EQ(3u, events.size());
    EXPECT_EQ(before[0], events[0]);
    EXPECT_EQ("new1", events[1].name);
    EXPECT_EQ("new2", events[2].name);
}

TEST_F(UIRecorderImplTest, ShutdownAndExitHookDoNotDuplicate)
{
    TestRecorder r(get_output_dir(), true);
    r.emit(AccessibilityEventCategory::FOCUS_CHANGED, "A", 100);

    EXPECT_TRUE(r.recorder.shutdown());
    EXPECT_FALSE(r.source->is_subscribed());
    EXPECT_EQ(1, r.source->unsubscribe_count);

    // the exit hook persists once more
    EXPECT_TRUE(r.recorder.persist());
    EXPECT_TRUE(r.recorder.shutdown());
    EXPECT_EQ(1, r.source->unsubscribe_count);

    EXPECT_EQ(1u, read_ui_log().size());
}

TEST_F(UIRecorderImplTest, PollersFeedTheirLogs)
{
    TestRecorder r(get_output_dir());
    r.probe->pointer = {300, 400, true, false};
    r.probe->set_browser_title("Google-chrome", "https://example.com - Google Chrome");

    r.recorder.get_pointer_poller()->poll();
    r.recorder.get_pointer_poller()->poll();
    r.recorder.get_browser_tab_poller()->poll();
    r.recorder.get_browser_tab_poller()->poll();
    ASSERT_TRUE(r.recorder.shutdown());

    auto clicks = parse_pointer_click_events(read_log(Config::POINTER_CLICKS_FILENAME));
    EXPECT_EQ(2u, clicks.size());
    auto urls = parse_browser_url_events(read_log(Config::BROWSER_URLS_FILENAME));
    ASSERT_EQ(1u, urls.size());
    EXPECT_EQ("https://example.com", urls[0].url);
    EXPECT_EQ("chrome", urls[0].process_name);
}

TEST_F(UIRecorderImplTest, FailedSubscriptionThrows)
{
    UIRecorderImpl recorder;
    recorder.init_essentials(LogLevel::NONE);
    recorder.config()->set_output_dir(get_output_dir());

    auto source = std::make_unique<FakeAccessibilityEventSource>(recorder);
    source->fail_subscribe = true;
    EXPECT_THROW(recorder.start(std::move(source), nullptr, false), AtspiException);
}

TEST_F(UIRecorderImplTest, WorksWithoutDisplay)
{
    UIRecorderImpl recorder;
    recorder.init_essentials(LogLevel::NONE);
    recorder.config()->set_output_dir(get_output_dir());
    recorder.start(std::make_unique<FakeAccessibilityEventSource>(recorder), nullptr, false);

    recorder.toggle_filter();
    EXPECT_FALSE(recorder.get_process_filter()->get_state().enabled);
    EXPECT_THROW(recorder.get_pointer_poller()->poll(), X11Exception);
    EXPECT_TRUE(recorder.shutdown());
}

TEST_F(UIRecorderImplTest, NoPollingTasksWithoutDisplay)
{
    UIRecorderImpl recorder;
    recorder.init_essentials(LogLevel::NONE);
    recorder.config()->set_output_dir(get_output_dir());
    recorder.start(std::make_unique<FakeAccessibilityEventSource>(recorder), nullptr);

    EXPECT_EQ(nullptr, recorder.get_pointer_task());
    EXPECT_EQ(nullptr, recorder.get_browser_task());
    EXPECT_TRUE(recorder.shutdown());
}

TEST_F(UIRecorderImplTest, PollingTasksCreatedWithDisplay)
{
    TestRecorder r(get_output_dir());
    ASSERT_NE(nullptr, r.recorder.get_pointer_task());
    ASSERT_NE(nullptr, r.recorder.get_browser_task());
    EXPECT_EQ("Mouse", r.recorder.get_pointer_task()->get_name());
    EXPECT_EQ("Browser", r.recorder.get_browser_task()->get_name());
    EXPECT_FALSE(r.recorder.get_pointer_task()->is_running());
}

TEST_F(UIRecorderImplTest, GetLoggerFollowsConfiguredLevel)
{
    UIRecorderImpl recorder;
    EXPECT_EQ(Logger::get_default().get(), recorder.get_logger());

    recorder.init_essentials(LogLevel::ERROR);
    Logger* logger = recorder.get_logger();
    ASSERT_NE(Logger::get_default().get(), logger);
    EXPECT_EQ(LogLevel::ERROR, logger->get_level());
    EXPECT_FALSE(logger->can_log(LogLevel::DEBUG));
}
