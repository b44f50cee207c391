#include <experimental/filesystem>
#include <system_error>

#include <glib.h>

#include "tools/path_helpers.h"
#include "tools/string_helpers.h"
#include "tools/logger.h"

#include "configuration.h"

namespace fs = std::experimental::filesystem;


Config::Config(const ContextBase& context) :
    ContextBase(context)
{}

std::unique_ptr<Config> Config::make(const ContextBase& context)
{
    return std::make_unique<Config>(context);
}

void Config::load_environment()
{
    load_environment([](const char* name) {return g_getenv(name);});
}

void Config::load_environment(const GetEnvFunc& get_env)
{
    const char* value = get_env(ENV_LOG_LEVEL);
    if (value)
    {
        LogLevel level;
        if (parse_log_level(strip(value), level))
            m_log_level = level;
        else
            LOG_WARNING << ENV_LOG_LEVEL << ": unknown log level "
                        << repr(std::string(value)) << ", keeping "
                        << to_string(m_log_level);
    }

    value = get_env(ENV_OUTPUT_DIR);
    if (value && value[0])
        m_output_dir = value;

    value = get_env(ENV_MERGE_UIA_LOG);
    if (value)
    {
        std::string s = lower(strip(value));
        if (s == "1" || s == "true" || s == "yes")
            m_merge_uia_log = true;
        else if (s == "0" || s == "false" || s == "no" || s.empty())
            m_merge_uia_log = false;
        else
            LOG_WARNING << ENV_MERGE_UIA_LOG << ": expected a boolean, got "
                        << repr(std::string(value));
    }

    value = get_env(ENV_POINTER_INTERVAL);
    if (value)
        parse_interval(ENV_POINTER_INTERVAL, value, m_pointer_interval);

    value = get_env(ENV_BROWSER_INTERVAL);
    if (value)
        parse_interval(ENV_BROWSER_INTERVAL, value, m_browser_interval);
}

bool Config::parse_interval(const char* name, const char* value,
                            std::chrono::milliseconds& interval_out)
{
    int ms;
    if (!to_int(strip(value), ms) || ms <= 0)
    {
        LOG_WARNING << name << ": expected a positive number of milliseconds, got "
                    << repr(std::string(value)) << ", keeping "
                    << interval_out.count() << "ms";
        return false;
    }
    interval_out = std::chrono::milliseconds(ms);
    return true;
}

std::string Config::get_output_dir() const
{
    if (!m_output_dir.empty())
        return m_output_dir;

    fs::path dir = get_executable_dir();
    if (dir.empty())
    {
        std::error_code ec;
        dir = fs::current_path(ec);
    }
    return (dir / OUTPUT_SUBDIR).string();
}

const std::array<KnownBrowser, 3>& Config::get_known_browsers()
{
    static const std::array<KnownBrowser, 3> browsers = {{
        {"google-chrome", " - Google Chrome", "chrome"},
        {"chromium", " - Chromium", "chromium"},
        {"firefox", " — Mozilla Firefox", "firefox"},
    }};
    return browsers;
}
