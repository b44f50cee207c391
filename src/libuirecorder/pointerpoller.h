#ifndef POINTERPOLLER_H
#define POINTERPOLLER_H

#include "tools/noneable.h"

#include "uievents.h"
#include "uirecorderglobals.h"


// Samples the pointer and records a click for every sample with
// the left or right button held.
class PointerPoller : public ContextBase
{
    public:
        PointerPoller(const ContextBase& context);

        // One sample. Returns the recorded event, None if no button
        // was held.
        // throws X11Exception
        Noneable<PointerClickEvent> poll();
};

#endif // POINTERPOLLER_H
