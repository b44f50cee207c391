#ifndef UIEVENTRECORDER_H
#define UIEVENTRECORDER_H

#include "tools/noneable.h"

#include "accessibilityeventsource.h"
#include "ancestorpath.h"
#include "uievents.h"
#include "uirecorderglobals.h"


// Turns accessibility events into UIEvent records.
class UIEventRecorder : public ContextBase, public AccessibilityEventSink
{
    public:
        UIEventRecorder(const ContextBase& context);

        // AccessibilityEventSink, never throws
        virtual void on_accessibility_event(const AccessibilityEvent& event) override;

        // Returns the appended record, None if the event was dropped.
        Noneable<UIEvent> record(const AccessibilityEvent& event);

    private:
        UIEvent make_ui_event(const AccessibilityEvent& event) const;
        void echo(const UIEvent& e) const;

        template <class T>
        T read(const PropertyResult<T>& result, const T& default_value,
               const char* what, const AccessibilityEvent& event) const;

    private:
        AncestorPathResolver m_ancestor_path_resolver;
};

#endif // UIEVENTRECORDER_H
