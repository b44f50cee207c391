#include <experimental/filesystem>

#include <gtest/gtest.h>

#include "tools/file_helpers.h"

#include "configuration.h"
#include "eventaggregator.h"
#include "eventjson.h"
#include "eventlogwriter.h"
#include "exception.h"
#include "testing/testcontext.h"

namespace fs = std::experimental::filesystem;


class EventLogWriterTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            m_context.config()->set_output_dir((fs::path(m_tmp.dir) / "output_logs").string());
        }

        UIEvent make_event(const std::string& name)
        {
            UIEvent e;
            e.event_type = UIEventType::FOCUS;
            e.timestamp = now_utc();
            e.control_type = "ControlType.Button";
            e.name = name;
            e.process_id = 100;
            e.process_name = "gedit";
            return e;
        }

        std::vector<UIEvent> read_ui_log()
        {
            std::string text;
            EXPECT_TRUE(read_file(text, m_writer.get_file_path(Config::UIA_LOG_FILENAME)));
            return parse_ui_events(text);
        }

        std::vector<std::string> names(const std::vector<UIEvent>& events)
        {
            std::vector<std::string> result;
            for (auto& e : events)
                result.emplace_back(e.name);
            return result;
        }

    protected:
        TempDir m_tmp{"uirecorder_test_"};
        TestContext m_context{LogLevel::NONE};
        EventLogWriter m_writer{m_context};
};

TEST_F(EventLogWriterTest, OverwriteWritesSessionEvents)
{
    m_writer.write_ui_events({make_event("old")}, UIALogMode::OVERWRITE);
    m_writer.write_ui_events({make_event("a"), make_event("b")}, UIALogMode::OVERWRITE);

    auto events = read_ui_log();
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), names(events));
}

TEST_F(EventLogWriterTest, MergeAppendsToExistingLog)
{
    m_writer.write_ui_events({make_event("earlier")}, UIALogMode::OVERWRITE);

    EventLogWriter session_writer(m_context);
    session_writer.write_ui_events({make_event("a"), make_event("b")}, UIALogMode::MERGE);

    auto events = read_ui_log();
    EXPECT_EQ((std::vector<std::string>{"earlier", "a", "b"}), names(events));
}

TEST_F(EventLogWriterTest, MergeIntoMissingFile)
{
    m_writer.write_ui_events({make_event("a")}, UIALogMode::MERGE);
    EXPECT_EQ((std::vector<std::string>{"a"}), names(read_ui_log()));
}

TEST_F(EventLogWriterTest, RepeatedMergeDoesNotDuplicate)
{
    std::vector<UIEvent> session{make_event("a"), make_event("b")};
    m_writer.write_ui_events(session, UIALogMode::MERGE);
    m_writer.write_ui_events(session, UIALogMode::MERGE);
    EXPECT_EQ(2u, m_writer.get_merged_count());

    // events captured after the first merge are still added
    session.push_back(make_event("c"));
    m_writer.write_ui_events(session, UIALogMode::MERGE);

    EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), names(read_ui_log()));
}

TEST_F(EventLogWriterTest, MergeOfConsecutiveSessionsKeepsOrder)
{
    // merging A then B gives the same file as one session A+B
    {
        EventLogWriter writer(m_context);
        writer.write_ui_events({make_event("a1"), make_event("a2")}, UIALogMode::MERGE);
    }
    {
        EventLogWriter writer(m_context);
        writer.write_ui_events({make_event("b1")}, UIALogMode::MERGE);
    }
    EXPECT_EQ((std::vector<std::string>{"a1", "a2", "b1"}), names(read_ui_log()));
}

TEST_F(EventLogWriterTest, MalformedLogIsReplaced)
{
    std::string error;
    fs::create_directories(m_context.config()->get_output_dir());
    ASSERT_TRUE(replace_file_contents(m_writer.get_file_path(Config::UIA_LOG_FILENAME),
                                      "{ not json", error));

    m_writer.write_ui_events({make_event("a")}, UIALogMode::MERGE);
    EXPECT_EQ((std::vector<std::string>{"a"}), names(read_ui_log()));
}

TEST_F(EventLogWriterTest, MergeKeepsReadableRecordsOfDamagedLog)
{
    std::string error;
    fs::create_directories(m_context.config()->get_output_dir());
    ASSERT_TRUE(replace_file_contents(m_writer.get_file_path(Config::UIA_LOG_FILENAME), R"([
        {"EventType": "Focus", "TimestampUtc": "2024-05-01T10:11:12Z", "Name": "earlier"},
        {"EventType": "Focus", "Name": "no timestamp"}
    ])", error));

    m_writer.write_ui_events({make_event("a")}, UIALogMode::MERGE);
    EXPECT_EQ((std::vector<std::string>{"earlier", "a"}), names(read_ui_log()));
}

TEST_F(EventLogWriterTest, UIALogModeFollowsConfig)
{
    m_context.config()->set_merge_uia_log(false);
    EXPECT_EQ(UIALogMode::OVERWRITE, m_writer.get_uia_log_mode());
    EXPECT_EQ("overwrite", to_string(m_writer.get_uia_log_mode()));

    m_context.config()->set_merge_uia_log(true);
    EXPECT_EQ(UIALogMode::MERGE, m_writer.get_uia_log_mode());
    EXPECT_EQ("merge", to_string(m_writer.get_uia_log_mode()));
}

TEST_F(EventLogWriterTest, WriteAllWritesThreeFiles)
{
    auto aggregator = m_context.get_event_aggregator();
    aggregator->get_ui_events().append(make_event("a"));
    aggregator->get_pointer_clicks().append({now_utc(), 1, 2, PointerButton::LEFT});
    aggregator->get_browser_urls().append({now_utc(), "chrome", "https://example.com"});

    EXPECT_TRUE(m_writer.write_all());

    std::string text;
    ASSERT_TRUE(read_file(text, m_writer.get_file_path(Config::POINTER_CLICKS_FILENAME)));
    EXPECT_EQ(1u, parse_pointer_click_events(text).size());
    ASSERT_TRUE(read_file(text, m_writer.get_file_path(Config::BROWSER_URLS_FILENAME)));
    EXPECT_EQ(1u, parse_browser_url_events(text).size());
    EXPECT_EQ(1u, read_ui_log().size());
}

TEST_F(EventLogWriterTest, WriteAllTwiceInMergeModeDoesNotDuplicate)
{
    m_context.config()->set_merge_uia_log(true);
    m_writer.write_ui_events({make_event("earlier")}, UIALogMode::OVERWRITE);

    EventLogWriter writer(m_context);
    m_context.get_event_aggregator()->get_ui_events().append(make_event("a"));
    EXPECT_TRUE(writer.write_all());
    EXPECT_TRUE(writer.write_all());

    EXPECT_EQ((std::vector<std::string>{"earlier", "a"}), names(read_ui_log()));
}

TEST_F(EventLogWriterTest, EmptySessionWritesEmptyArrays)
{
    EXPECT_TRUE(m_writer.write_all());
    std::string text;
    ASSERT_TRUE(read_file(text, m_writer.get_file_path(Config::POINTER_CLICKS_FILENAME)));
    EXPECT_EQ("[]", text);
}

TEST_F(EventLogWriterTest, UnwritableDirectoryFails)
{
    // a file where the output directory should be
    std::string blocker = (fs::path(m_tmp.dir) / "blocker").string();
    std::string error;
    ASSERT_TRUE(replace_file_contents(blocker, "x", error));
    m_context.config()->set_output_dir((fs::path(blocker) / "logs").string());

    EXPECT_THROW(m_writer.write_pointer_clicks({}), PersistenceException);
    EXPECT_FALSE(m_writer.write_all());
}
