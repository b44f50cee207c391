#include <map>
#include <string>

#include <gtest/gtest.h>

#include "tools/string_helpers.h"

#include "configuration.h"
#include "testing/testcontext.h"

using namespace std::chrono;


class ConfigTest : public ::testing::Test
{
    protected:
        void load(const std::map<std::string, std::string>& env)
        {
            m_env = env;
            m_context.config()->load_environment([this](const char* name) -> const char*
            {
                auto it = m_env.find(name);
                return it == m_env.end() ? nullptr : it->second.c_str();
            });
        }

    protected:
        TestContext m_context{LogLevel::NONE};
        std::map<std::string, std::string> m_env;
};

TEST_F(ConfigTest, Defaults)
{
    load({});
    auto config = m_context.config();
    EXPECT_EQ(LogLevel::INFO, config->get_log_level());
    EXPECT_FALSE(config->get_merge_uia_log());
    EXPECT_EQ(milliseconds(50), config->get_pointer_interval());
    EXPECT_EQ(milliseconds(1000), config->get_browser_interval());
    EXPECT_EQ(10u, config->get_max_ancestor_depth());
    EXPECT_TRUE(endswith(config->get_output_dir(), "resources/output_logs"));
}

TEST_F(ConfigTest, EnvironmentOverrides)
{
    load({{Config::ENV_LOG_LEVEL, "debug"},
          {Config::ENV_OUTPUT_DIR, "/tmp/uirecorder-logs"},
          {Config::ENV_MERGE_UIA_LOG, " True "},
          {Config::ENV_POINTER_INTERVAL, "20"},
          {Config::ENV_BROWSER_INTERVAL, "250"}});
    auto config = m_context.config();
    EXPECT_EQ(LogLevel::DEBUG, config->get_log_level());
    EXPECT_EQ("/tmp/uirecorder-logs", config->get_output_dir());
    EXPECT_TRUE(config->get_merge_uia_log());
    EXPECT_EQ(milliseconds(20), config->get_pointer_interval());
    EXPECT_EQ(milliseconds(250), config->get_browser_interval());
}

TEST_F(ConfigTest, MalformedValuesKeepDefaults)
{
    load({{Config::ENV_LOG_LEVEL, "chatty"},
          {Config::ENV_OUTPUT_DIR, ""},
          {Config::ENV_MERGE_UIA_LOG, "maybe"},
          {Config::ENV_POINTER_INTERVAL, "fast"},
          {Config::ENV_BROWSER_INTERVAL, "-5"}});
    auto config = m_context.config();
    EXPECT_EQ(LogLevel::INFO, config->get_log_level());
    EXPECT_TRUE(endswith(config->get_output_dir(), "resources/output_logs"));
    EXPECT_FALSE(config->get_merge_uia_log());
    EXPECT_EQ(milliseconds(50), config->get_pointer_interval());
    EXPECT_EQ(milliseconds(1000), config->get_browser_interval());
}

TEST_F(ConfigTest, KnownBrowsers)
{
    auto& browsers = Config::get_known_browsers();
    ASSERT_EQ(3u, browsers.size());
    EXPECT_STREQ("google-chrome", browsers[0].wm_class);
    EXPECT_STREQ(" - Google Chrome", browsers[0].title_suffix);
    EXPECT_STREQ("chrome", browsers[0].process_name);
}
