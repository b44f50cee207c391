#ifndef EVENTLOGWRITER_H
#define EVENTLOGWRITER_H

#include <mutex>
#include <string>
#include <vector>

#include "uievents.h"
#include "uirecorderglobals.h"


enum class UIALogMode
{
    OVERWRITE,  // replace uia_log.json with this session's events
    MERGE,      // append this session's events to uia_log.json
};

std::string to_string(UIALogMode mode);


// Persists the session logs as JSON files in the output directory.
// Safe to run more than once per session, e.g. from the regular
// shutdown path and again from the exit hook.
class EventLogWriter : public ContextBase
{
    public:
        EventLogWriter(const ContextBase& context);

        // Snapshot and write all three logs. Failures are logged,
        // the remaining files are still attempted.
        // Returns true if all files were written.
        bool write_all();

        // throws PersistenceException
        void write_ui_events(const std::vector<UIEvent>& session_events, UIALogMode mode);
        void write_pointer_clicks(const std::vector<PointerClickEvent>& events);
        void write_browser_urls(const std::vector<BrowserUrlEvent>& events);

        std::string get_file_path(const std::string& filename) const;

        // Mode for uia_log.json from the configuration.
        UIALogMode get_uia_log_mode();

        // Number of session UIA events already merged into the log file.
        size_t get_merged_count() const;

    private:
        void write_ui_events_merged(const std::vector<UIEvent>& session_events);
        void ensure_output_dir() const;
        void write_file(const std::string& filename, const std::string& contents) const;

    private:
        mutable std::mutex m_mutex;
        size_t m_merged_count{0};
};

#endif // EVENTLOGWRITER_H
