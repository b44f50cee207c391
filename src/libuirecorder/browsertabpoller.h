#ifndef BROWSERTABPOLLER_H
#define BROWSERTABPOLLER_H

#include <string>

#include "tools/noneable.h"

#include "configuration.h"
#include "uievents.h"
#include "uirecorderglobals.h"


// Reads the active tab's URL from the title of the top-most browser
// window and records it when it changed.
class BrowserTabPoller : public ContextBase
{
    public:
        BrowserTabPoller(const ContextBase& context);

        // One sample. Returns the recorded event, None if there was
        // no browser window, no URL in its title, or the URL is
        // unchanged.
        // throws X11Exception
        Noneable<BrowserUrlEvent> poll();

        // URL embedded in a browser window title, empty if the title
        // doesn't end in title_suffix or isn't an http(s) URL.
        static std::string extract_url(const std::string& title,
                                       const std::string& title_suffix);

        // Known browser a window with this WM_CLASS belongs to, or nullptr.
        static const KnownBrowser* find_browser(const std::string& wm_instance,
                                                const std::string& wm_class);
};

#endif // BROWSERTABPOLLER_H
