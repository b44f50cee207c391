#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "tools/loggerdecls.h"

#include "uirecorderglobals.h"


// Browser whose active tab URL may be read from its window title.
struct KnownBrowser
{
    const char* wm_class;       // prefix of WM_CLASS, case-insensitive
    const char* title_suffix;   // appended to the page title by the browser
    const char* process_name;   // reported in BrowserUrlEvent
};


// Recorder settings. Compiled-in defaults, optionally overridden
// by environment variables at startup.
class Config : public ContextBase
{
    public:
        using GetEnvFunc = std::function<const char*(const char*)>;

        static constexpr const char* ENV_LOG_LEVEL = "UIRECORDER_LOG_LEVEL";
        static constexpr const char* ENV_OUTPUT_DIR = "UIRECORDER_OUTPUT_DIR";
        static constexpr const char* ENV_MERGE_UIA_LOG = "UIRECORDER_MERGE_UIA_LOG";
        static constexpr const char* ENV_POINTER_INTERVAL = "UIRECORDER_POINTER_INTERVAL_MS";
        static constexpr const char* ENV_BROWSER_INTERVAL = "UIRECORDER_BROWSER_INTERVAL_MS";

        static constexpr const char* OUTPUT_SUBDIR = "resources/output_logs";
        static constexpr const char* UIA_LOG_FILENAME = "uia_log.json";
        static constexpr const char* POINTER_CLICKS_FILENAME = "mouse_clicks.json";
        static constexpr const char* BROWSER_URLS_FILENAME = "browser_urls.json";

        static constexpr size_t MAX_ANCESTOR_DEPTH = 10;

        static constexpr int DEFAULT_POINTER_INTERVAL_MS = 50;
        static constexpr int DEFAULT_BROWSER_INTERVAL_MS = 1000;

    public:
        Config(const ContextBase& context);

        static std::unique_ptr<Config> make(const ContextBase& context);

        // Apply overrides from the process environment.
        // Malformed values are logged and ignored.
        void load_environment();
        void load_environment(const GetEnvFunc& get_env);

        LogLevel get_log_level() const {return m_log_level;}
        void set_log_level(LogLevel level) {m_log_level = level;}

        // Explicit override, or <executable dir>/resources/output_logs.
        std::string get_output_dir() const;
        void set_output_dir(const std::string& dir) {m_output_dir = dir;}

        bool get_merge_uia_log() const {return m_merge_uia_log;}
        void set_merge_uia_log(bool merge) {m_merge_uia_log = merge;}

        std::chrono::milliseconds get_pointer_interval() const {return m_pointer_interval;}
        void set_pointer_interval(std::chrono::milliseconds interval) {m_pointer_interval = interval;}

        std::chrono::milliseconds get_browser_interval() const {return m_browser_interval;}
        void set_browser_interval(std::chrono::milliseconds interval) {m_browser_interval = interval;}

        size_t get_max_ancestor_depth() const {return MAX_ANCESTOR_DEPTH;}

        static const std::array<KnownBrowser, 3>& get_known_browsers();

    private:
        bool parse_interval(const char* name, const char* value,
                            std::chrono::milliseconds& interval_out);

    private:
        LogLevel m_log_level{LogLevel::INFO};
        std::string m_output_dir;
        bool m_merge_uia_log{false};
        std::chrono::milliseconds m_pointer_interval{DEFAULT_POINTER_INTERVAL_MS};
        std::chrono::milliseconds m_browser_interval{DEFAULT_BROWSER_INTERVAL_MS};
};

#endif // CONFIGURATION_H
