#ifndef FAKEDESKTOPPROBE_H
#define FAKEDESKTOPPROBE_H

#include <cctype>
#include <string>
#include <vector>

#include "../desktopprobe.h"
#include "../exception.h"


// Desktop with scripted foreground process, pointer and windows.
class FakeDesktopProbe : public DesktopProbe
{
    public:
        FakeDesktopProbe(const ContextBase& context) :
            DesktopProbe(context)
        {}

        virtual Noneable<int32_t> get_foreground_pid() override
        {
            if (fail)
                throw X11Exception("BadWindow");
            return foreground_pid;
        }

        virtual PointerState query_pointer() override
        {
            if (fail)
                throw X11Exception("XQueryPointer failed");
            return pointer;
        }

        virtual std::vector<TopLevelWindow> get_top_level_windows() override
        {
            if (fail)
                throw X11Exception("BadWindow");
            return windows;
        }

        void set_browser_title(const std::string& wm_class, const std::string& title)
        {
            windows = {{lower_instance(wm_class), wm_class, title, 4242}};
        }

    private:
        static std::string lower_instance(const std::string& wm_class)
        {
            std::string s = wm_class;
            for (auto& c : s)
                c = static_cast<char>(tolower(c));
            return s;
        }

    public:
        bool fail{false};
        Noneable<int32_t> foreground_pid;
        PointerState pointer;
        std::vector<TopLevelWindow> windows;
};

#endif // FAKEDESKTOPPROBE_H
