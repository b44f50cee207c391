#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>

#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "../desktopprobe.h"
#include "../exception.h"


// Keeps Xlib's default handler from terminating the process when
// a window disappears between listing and querying it.
// The handler is process wide, callers must hold the probe's mutex.
class TrapError
{
    public:
        TrapError(Display* display) :
            m_display(display)
        {
            XSync(m_display, False);
            m_error_display = nullptr;
            std::memset(&m_error, 0, sizeof(m_error));
        }

        static int error_handler(Display* display, XErrorEvent* error)
        {
            if (!m_error_display)
            {
                m_error_display = display;
                m_error = *error;
            }
            return 0;
        }

        // First error since construction, 0 for none.
        unsigned char get_error()
        {
            XSync(m_display, False);
            if (m_error_display == m_display)
                return m_error.error_code;
            return 0;
        }

        static Display* m_error_display;
        static XErrorEvent m_error;

        Display* m_display{};
};

Display* TrapError::m_error_display{};
XErrorEvent TrapError::m_error{};


typedef std::unique_ptr<unsigned char, decltype(&XFree)> XPropertyPtr;


class DesktopProbeX11 : public DesktopProbe
{
    public:
        using Super = DesktopProbe;

        DesktopProbeX11(const ContextBase& context);
        virtual ~DesktopProbeX11();

        virtual Noneable<int32_t> get_foreground_pid() override;
        virtual PointerState query_pointer() override;
        virtual std::vector<TopLevelWindow> get_top_level_windows() override;

    private:
        // Raw 32 bit property values, empty if the property isn't set.
        std::vector<unsigned long> get_property32(Window window, Atom property, Atom type);
        std::string get_window_title(Window window);
        Noneable<int32_t> get_window_pid(Window window);
        void get_window_class(Window window, std::string& instance, std::string& class_);

    private:
        Display* m_display{};
        Window m_root{};
        std::mutex m_mutex;
        int (*m_old_error_handler) (Display *, XErrorEvent *){};

        Atom m_atom_net_active_window{};
        Atom m_atom_net_client_list{};
        Atom m_atom_net_client_list_stacking{};
        Atom m_atom_net_wm_name{};
        Atom m_atom_net_wm_pid{};
        Atom m_atom_utf8_string{};
};

std::unique_ptr<DesktopProbe> DesktopProbe::make_x11(const ContextBase& context)
{
    return std::make_unique<DesktopProbeX11>(context);
}

DesktopProbeX11::DesktopProbeX11(const ContextBase& context) :
    Super(context)
{
    // pollers and the control thread share the display
    XInitThreads();

    m_display = XOpenDisplay(nullptr);
    if (!m_display)
        throw X11Exception(sstr() << "can't open X display "
                           << repr(safe_assign(XDisplayName(nullptr))));

    m_old_error_handler = XSetErrorHandler(TrapError::error_handler);
    m_root = DefaultRootWindow(m_display);

    m_atom_net_active_window = XInternAtom(m_display, "_NET_ACTIVE_WINDOW", False);
    m_atom_net_client_list = XInternAtom(m_display, "_NET_CLIENT_LIST", False);
    m_atom_net_client_list_stacking = XInternAtom(m_display, "_NET_CLIENT_LIST_STACKING", False);
    m_atom_net_wm_name = XInternAtom(m_display, "_NET_WM_NAME", False);
    m_atom_net_wm_pid = XInternAtom(m_display, "_NET_WM_PID", False);
    m_atom_utf8_string = XInternAtom(m_display, "UTF8_STRING", False);

    LOG_DEBUG << "opened X display " << DisplayString(m_display);
}

DesktopProbeX11::~DesktopProbeX11()
{
    if (m_display)
    {
        XSetErrorHandler(m_old_error_handler);
        XCloseDisplay(m_display);
    }
}

Noneable<int32_t> DesktopProbeX11::get_foreground_pid()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto windows = get_property32(m_root, m_atom_net_active_window, XA_WINDOW);
    if (windows.empty())
    {
        LOG_DEBUG << "no _NET_ACTIVE_WINDOW, is a window manager running?";
        return {};
    }
    Window window = static_cast<Window>(windows[0]);
    if (window == None)
        return {};

    return get_window_pid(window);
}

PointerState DesktopProbeX11::query_pointer()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    Window root_return, child_return;
    int root_x, root_y;
    int win_x, win_y;
    unsigned int mask;

    TrapError trap(m_display);
    XQueryPointer(m_display, m_root, &root_return, &child_return,
                  &root_x, &root_y, &win_x, &win_y, &mask);
    if (auto error = trap.get_error())
        throw X11Exception(sstr() << "XQueryPointer failed, X error "
                           << static_cast<int>(error));

    PointerState state;
    state.x = root_x;
    state.y = root_y;
    state.left_pressed = (mask & Button1Mask) != 0;
    state.right_pressed = (mask & Button3Mask) != 0;
    return state;
}

std::vector<TopLevelWindow> DesktopProbeX11::get_top_level_windows()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // bottom-to-top stacking order, if the window manager provides it
    auto ids = get_property32(m_root, m_atom_net_client_list_stacking, XA_WINDOW);
    if (ids.empty())
        ids = get_property32(m_root, m_atom_net_client_list, XA_WINDOW);
    std::reverse(ids.begin(), ids.end());

    std::vector<TopLevelWindow> windows;
    for (auto id : ids)
    {
        Window window = static_cast<Window>(id);
        TopLevelWindow w;
        get_window_class(window, w.wm_instance, w.wm_class);
        w.title = get_window_title(window);
        w.pid = get_window_pid(window).get_or(-1);
        windows.emplace_back(w);
    }
    return windows;
}

std::vector<unsigned long> DesktopProbeX11::get_property32(Window window, Atom property, Atom type)
{
    Atom actual_type;
    int actual_format;
    unsigned long nitems, bytes_after;
    unsigned char* data = nullptr;

    TrapError trap(m_display);
    int status = XGetWindowProperty(m_display, window, property,
                                    0, 1024, False, type,
                                    &actual_type, &actual_format,
                                    &nitems, &bytes_after, &data);
    XPropertyPtr p{data, XFree};
    if (status != Success || trap.get_error())
    {
        LOG_DEBUG << "XGetWindowProperty(" << window << ") failed";
        return {};
    }

    std::vector<unsigned long> values;
    if (p && actual_type == type && actual_format == 32)
    {
        // format 32 properties are returned as longs
        auto longs = reinterpret_cast<unsigned long*>(p.get());
        values.assign(longs, longs + nitems);
    }
    return values;
}

std::string DesktopProbeX11::get_window_title(Window window)
{
    Atom actual_type;
    int actual_format;
    unsigned long nitems, bytes_after;
    unsigned char* data = nullptr;

    {
        TrapError trap(m_display);
        int status = XGetWindowProperty(m_display, window, m_atom_net_wm_name,
                                        0, 4096, False, m_atom_utf8_string,
                                        &actual_type, &actual_format,
                                        &nitems, &bytes_after, &data);
        XPropertyPtr p{data, XFree};
        if (status == Success && !trap.get_error() &&
            p && actual_type == m_atom_utf8_string && actual_format == 8)
        {
            return std::string(reinterpret_cast<char*>(p.get()), nitems);
        }
    }

    // legacy WM_NAME
    char* name = nullptr;
    TrapError trap(m_display);
    XFetchName(m_display, window, &name);
    XPropertyPtr p{reinterpret_cast<unsigned char*>(name), XFree};
    if (trap.get_error())
        return {};
    return safe_assign(name);
}

Noneable<int32_t> DesktopProbeX11::get_window_pid(Window window)
{
    auto values = get_property32(window, m_atom_net_wm_pid, XA_CARDINAL);
    if (values.empty() || values[0] == 0)
        return {};
    return static_cast<int32_t>(values[0]);
}

void DesktopProbeX11::get_window_class(Window window, std::string& instance, std::string& class_)
{
    XClassHint hint{};
    TrapError trap(m_display);
    Status status = XGetClassHint(m_display, window, &hint);
    XPropertyPtr name{reinterpret_cast<unsigned char*>(hint.res_name), XFree};
    XPropertyPtr cls{reinterpret_cast<unsigned char*>(hint.res_class), XFree};
    if (!status || trap.get_error())
        return;
    instance = safe_assign(hint.res_name);
    class_ = safe_assign(hint.res_class);
}
