#include "tools/logger.h"

#include "desktopprobe.h"
#include "eventaggregator.h"
#include "exception.h"
#include "pointerpoller.h"


PointerPoller::PointerPoller(const ContextBase& context) :
    ContextBase(context)
{}

Noneable<PointerClickEvent> PointerPoller::poll()
{
    auto probe = get_desktop_probe();
    if (!probe)
        throw X11Exception("no X display");

    PointerState state = probe->query_pointer();
    if (!state.left_pressed && !state.right_pressed)
        return {};

    PointerClickEvent e;
    e.timestamp = now_utc();
    e.x = state.x;
    e.y = state.y;
    e.button = state.left_pressed ? PointerButton::LEFT : PointerButton::RIGHT;

    get_event_aggregator()->get_pointer_clicks().append(e);
    LOG_INFO << "[Mouse] " << to_string(e.button) << " click at ("
             << e.x << ", " << e.y << ")";
    return e;
}
