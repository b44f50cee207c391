#ifndef ACCESSIBILITYEVENTSOURCE_H
#define ACCESSIBILITYEVENTSOURCE_H

#include <memory>
#include <string>

#include "uielement.h"
#include "uievents.h"
#include "uirecorderglobals.h"

enum class AccessibilityEventCategory
{
    FOCUS_CHANGED,
    ELEMENT_INVOKED,
    STRUCTURE_CHANGED,
    PROPERTY_CHANGED,
};

std::string to_string(AccessibilityEventCategory category);

// Event pushed by the accessibility runtime, already reduced to
// what the recorder needs.
struct AccessibilityEvent
{
    AccessibilityEventCategory category{AccessibilityEventCategory::FOCUS_CHANGED};
    UIElementPtr element;

    // PROPERTY_CHANGED only
    std::string property_name;
    PropertyValue new_value{nullptr};

    // STRUCTURE_CHANGED only
    std::string structure_change_kind;
};

class AccessibilityEventSink
{
    public:
        virtual ~AccessibilityEventSink() = default;

        // Called from threads owned by the accessibility runtime.
        virtual void on_accessibility_event(const AccessibilityEvent& event) = 0;
};


// Push source of accessibility events for the whole desktop.
class AccessibilityEventSource : public ContextBase
{
    public:
        using Super = ContextBase;
        AccessibilityEventSource(const ContextBase& context) :
            Super(context)
        {}
        virtual ~AccessibilityEventSource() = default;

        // Register all event categories and start delivering to sink.
        // throws AtspiException if any registration fails
        virtual void subscribe(AccessibilityEventSink* sink) = 0;

        // Stop delivering events. Safe to call repeatedly.
        virtual void unsubscribe() = 0;

        virtual bool is_subscribed() const = 0;

    public:
        static std::unique_ptr<AccessibilityEventSource>
            make_atspi(const ContextBase& context);
};

#endif // ACCESSIBILITYEVENTSOURCE_H
