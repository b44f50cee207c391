#ifndef FAKEACCESSIBILITYEVENTSOURCE_H
#define FAKEACCESSIBILITYEVENTSOURCE_H

#include "../accessibilityeventsource.h"
#include "../exception.h"


// Event source the test drives by injecting synthetic events.
class FakeAccessibilityEventSource : public AccessibilityEventSource
{
    public:
        FakeAccessibilityEventSource(const ContextBase& context) :
            AccessibilityEventSource(context)
        {}

        virtual void subscribe(AccessibilityEventSink* sink) override
        {
            if (fail_subscribe)
                throw AtspiException("atspi_event_listener_register failed");
            m_sink = sink;
            subscribe_count++;
        }

        virtual void unsubscribe() override
        {
            if (m_sink)
                unsubscribe_count++;
            m_sink = nullptr;
        }

        virtual bool is_subscribed() const override
        {
            return m_sink != nullptr;
        }

        // Deliver like the runtime would. Returns false if nobody listens.
        bool emit(const AccessibilityEvent& event)
        {
            if (!m_sink)
                return false;
            m_sink->on_accessibility_event(event);
            return true;
        }

        bool emit(AccessibilityEventCategory category, const UIElementPtr& element)
        {
            AccessibilityEvent event;
            event.category = category;
            event.element = element;
            return emit(event);
        }

    public:
        bool fail_subscribe{false};
        int subscribe_count{0};
        int unsubscribe_count{0};

    private:
        AccessibilityEventSink* m_sink{};
};

#endif // FAKEACCESSIBILITYEVENTSOURCE_H
