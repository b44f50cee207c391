#ifndef DESKTOPPROBE_H
#define DESKTOPPROBE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tools/noneable.h"

#include "uirecorderglobals.h"


struct PointerState
{
    int x{};
    int y{};
    bool left_pressed{false};
    bool right_pressed{false};
};

struct TopLevelWindow
{
    std::string wm_instance;    // WM_CLASS res_name
    std::string wm_class;       // WM_CLASS res_class
    std::string title;
    int32_t pid{-1};
};


// Windowing system state the pollers and the process filter sample.
// All calls may come from different threads.
class DesktopProbe : public ContextBase
{
    public:
        using Super = ContextBase;
        DesktopProbe(const ContextBase& context) :
            Super(context)
        {}
        virtual ~DesktopProbe() = default;

        // Process owning the active window, None if there is no
        // active window or it doesn't tell its pid.
        // throws X11Exception
        virtual Noneable<int32_t> get_foreground_pid() = 0;

        // Cursor position in screen coordinates and held buttons.
        // throws X11Exception
        virtual PointerState query_pointer() = 0;

        // Managed top-level windows, top-most first.
        // throws X11Exception
        virtual std::vector<TopLevelWindow> get_top_level_windows() = 0;

    public:
        // throws X11Exception if the display can't be opened
        static std::unique_ptr<DesktopProbe> make_x11(const ContextBase& context);
};

#endif // DESKTOPPROBE_H
