#include <sstream>

#include <gtest/gtest.h>

#include "tools/string_helpers.h"

#include "logger.h"


class LoggerTest : public ::testing::Test
{
    protected:
        const Logger* logger() const {return &m_logger;}

        void log_something()
        {
            LOG_WARNING << "pointer poll failed";
            LOG_DEBUG << "not shown";
        }

    protected:
        std::ostringstream m_out;
        LoggerConsole m_logger{m_out};
};

TEST_F(LoggerTest, FiltersByLevel)
{
    m_logger.set_level(LogLevel::WARNING);
    log_something();

    auto lines = split(m_out.str(), '\n');
    ASSERT_EQ(1u, lines.size());
    EXPECT_TRUE(contains(lines[0], "WARNING"));
    EXPECT_TRUE(contains(lines[0], "LoggerTest::log_something: "));
    EXPECT_TRUE(endswith(lines[0], "pointer poll failed"));
}

TEST_F(LoggerTest, NoneSilencesEverything)
{
    m_logger.set_level(LogLevel::NONE);
    LOG_CRITICAL << "lost";
    EXPECT_EQ("", m_out.str());
}

TEST(LoggerLevelsTest, Names)
{
    EXPECT_EQ("ATSPI", to_string(LogLevel::ATSPI));

    LogLevel level;
    ASSERT_TRUE(parse_log_level(" Trace ", level));
    EXPECT_EQ(LogLevel::TRACE, level);
    EXPECT_FALSE(parse_log_level("verbose", level));
}

TEST(LoggerLevelsTest, ExtractSrcLocation)
{
    EXPECT_EQ("EventLogWriter::write_all",
              extract_src_location("bool EventLogWriter::write_all()"));
    EXPECT_EQ("UIEventRecorder::record",
              extract_src_location("Noneable<UIEvent> UIEventRecorder::record(const AccessibilityEvent&)"));
    EXPECT_EQ("main", extract_src_location("int main()"));
    EXPECT_EQ("", extract_src_location("no function"));
}
