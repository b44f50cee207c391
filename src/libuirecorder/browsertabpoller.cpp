#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "browsertabpoller.h"
#include "desktopprobe.h"
#include "eventaggregator.h"
#include "exception.h"


BrowserTabPoller::BrowserTabPoller(const ContextBase& context) :
    ContextBase(context)
{}

Noneable<BrowserUrlEvent> BrowserTabPoller::poll()
{
    auto probe = get_desktop_probe();
    if (!probe)
        throw X11Exception("no X display");

    for (auto& window : probe->get_top_level_windows())
    {
        auto browser = find_browser(window.wm_instance, window.wm_class);
        if (!browser)
            continue;

        // only the top-most browser window has the user's attention
        std::string url = extract_url(window.title, browser->title_suffix);
        if (url.empty())
        {
            LOG_TRACE << browser->process_name << ": no URL in title "
                      << repr(window.title);
            return {};
        }

        BrowserUrlEvent e;
        e.timestamp = now_utc();
        e.process_name = browser->process_name;
        e.url = url;
        if (!get_event_aggregator()->append_browser_url_if_changed(e))
            return {};

        LOG_INFO << "[Browser] " << e.process_name << " URL: " << e.url;
        return e;
    }
    return {};
}

std::string BrowserTabPoller::extract_url(const std::string& title,
                                          const std::string& title_suffix)
{
    if (title_suffix.empty() || !endswith(title, title_suffix))
        return {};

    std::string url = strip(title.substr(0, title.size() - title_suffix.size()));
    if (!startswith(url, "http://") &&
        !startswith(url, "https://"))
        return {};
    return url;
}

const KnownBrowser* BrowserTabPoller::find_browser(const std::string& wm_instance,
                                                   const std::string& wm_class)
{
    std::string instance = lower(wm_instance);
    std::string class_ = lower(wm_class);
    for (auto& browser : Config::get_known_browsers())
    {
        if (startswith(instance, browser.wm_class) ||
            startswith(class_, browser.wm_class))
            return &browser;
    }
    return nullptr;
}
