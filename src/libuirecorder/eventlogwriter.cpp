#include <algorithm>
#include <exception>
#include <experimental/filesystem>
#include <system_error>

#include "tools/file_helpers.h"
#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "configuration.h"
#include "eventaggregator.h"
#include "eventjson.h"
#include "eventlogwriter.h"
#include "exception.h"

namespace fs = std::experimental::filesystem;


std::string to_string(UIALogMode mode)
{
    switch (mode)
    {
        case UIALogMode::OVERWRITE: return "overwrite";
        case UIALogMode::MERGE: return "merge";
    }
    return {};
}

EventLogWriter::EventLogWriter(const ContextBase& context) :
    ContextBase(context)
{}

UIALogMode EventLogWriter::get_uia_log_mode()
{
    return config()->get_merge_uia_log() ?
           UIALogMode::MERGE : UIALogMode::OVERWRITE;
}

bool EventLogWriter::write_all()
{
    auto aggregator = get_event_aggregator();
    UIALogMode mode = get_uia_log_mode();
    bool ok = true;

    auto ui_events = aggregator->get_ui_events().snapshot();
    try
    {
        write_ui_events(ui_events, mode);
        LOG_INFO << "Saved UIA log to: " << get_file_path(Config::UIA_LOG_FILENAME);
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "[SaveLog][ERR] " << ex.what()
                  << ", " << ui_events.size() << " UIA events of this session are lost";
        ok = false;
    }

    auto clicks = aggregator->get_pointer_clicks().snapshot();
    try
    {
        write_pointer_clicks(clicks);
        LOG_INFO << "Saved mouse clicks to: " << get_file_path(Config::POINTER_CLICKS_FILENAME);
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "[SaveLog][ERR] " << ex.what()
                  << ", " << clicks.size() << " mouse clicks of this session are lost";
        ok = false;
    }

    auto urls = aggregator->get_browser_urls().snapshot();
    try
    {
        write_browser_urls(urls);
        LOG_INFO << "Saved browser URLs to: " << get_file_path(Config::BROWSER_URLS_FILENAME);
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "[SaveLog][ERR] " << ex.what()
                  << ", " << urls.size() << " browser URLs of this session are lost";
        ok = false;
    }

    return ok;
}

void EventLogWriter::write_ui_events(const std::vector<UIEvent>& session_events, UIALogMode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (mode == UIALogMode::MERGE)
    {
        write_ui_events_merged(session_events);
    }
    else
    {
        write_file(Config::UIA_LOG_FILENAME, serialize_events(session_events));
        m_merged_count = session_events.size();
    }
}

void EventLogWriter::write_pointer_clicks(const std::vector<PointerClickEvent>& events)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    write_file(Config::POINTER_CLICKS_FILENAME, serialize_events(events));
}

void EventLogWriter::write_browser_urls(const std::vector<BrowserUrlEvent>& events)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    write_file(Config::BROWSER_URLS_FILENAME, serialize_events(events));
}

// Re-reads the file on every call, so a second call in the same
// session appends only the events captured since the first one.
void EventLogWriter::write_ui_events_merged(const std::vector<UIEvent>& session_events)
{
    std::string path = get_file_path(Config::UIA_LOG_FILENAME);

    std::vector<UIEvent> events;
    if (is_file(path))
    {
        std::string text;
        std::string error;
        if (!read_file(text, path, 0, error))
            throw PersistenceException(sstr() << "failed to read "
                                       << repr(path) << ": " << error);
        std::vector<std::string> bad_records;
        try
        {
            events = parse_ui_events(text, &bad_records);
        }
        catch (const ValueException& ex)
        {
            LOG_ERROR << "[SaveLog][ERR] existing " << repr(path)
                      << " is malformed, replacing it: " << ex.what();
        }
        for (auto& error : bad_records)
            LOG_WARNING << "[SaveLog] dropping unreadable record of "
                        << repr(path) << ": " << error;
    }
    size_t num_existing = events.size();

    size_t first_new = std::min(m_merged_count, session_events.size());
    events.insert(events.end(), session_events.begin() + static_cast<long>(first_new),
                  session_events.end());

    write_file(Config::UIA_LOG_FILENAME, serialize_events(events));
    m_merged_count = session_events.size();

    LOG_INFO << "merged " << num_existing << " existing and "
             << session_events.size() - first_new << " new UIA events";
}

std::string EventLogWriter::get_file_path(const std::string& filename) const
{
    return (fs::path(config()->get_output_dir()) / filename).string();
}

size_t EventLogWriter::get_merged_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_merged_count;
}

void EventLogWriter::ensure_output_dir() const
{
    std::string dir = config()->get_output_dir();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw PersistenceException(sstr() << "failed to create "
                                   << repr(dir) << ": " << ec.message());
}

void EventLogWriter::write_file(const std::string& filename, const std::string& contents) const
{
    ensure_output_dir();

    std::string path = get_file_path(filename);
    std::string error;
    if (!replace_file_contents(path, contents, error))
        throw PersistenceException(sstr() << "failed to write "
                                   << repr(path) << ": " << error);
}
