#include <exception>

#include "tools/logger.h"
#include "tools/process_helpers.h"
#include "tools/string_helpers.h"

#include "configuration.h"
#include "eventaggregator.h"
#include "exception.h"
#include "processfilter.h"
#include "uieventrecorder.h"


static UIEventType to_ui_event_type(AccessibilityEventCategory category)
{
    switch (category)
    {
        case AccessibilityEventCategory::FOCUS_CHANGED: return UIEventType::FOCUS;
        case AccessibilityEventCategory::ELEMENT_INVOKED: return UIEventType::INVOKE;
        case AccessibilityEventCategory::STRUCTURE_CHANGED: return UIEventType::STRUCTURE_CHANGED;
        case AccessibilityEventCategory::PROPERTY_CHANGED: return UIEventType::PROPERTY_CHANGED;
    }
    return UIEventType::FOCUS;
}

UIEventRecorder::UIEventRecorder(const ContextBase& context) :
    ContextBase(context),
    m_ancestor_path_resolver(context, config()->get_max_ancestor_depth())
{}

void UIEventRecorder::on_accessibility_event(const AccessibilityEvent& event)
{
    try
    {
        record(event);
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << "[" << to_string(event.category) << "][ERR] " << ex.what();
    }
}

Noneable<UIEvent> UIEventRecorder::record(const AccessibilityEvent& event)
{
    if (!event.element)
    {
        LOG_ATSPI << "[" << to_string(event.category) << "] event without element";
        return {};
    }

    auto pid = event.element->get_process_id();
    if (!get_process_filter()->passes(pid))
    {
        LOG_TRACE << "[" << to_string(event.category) << "] filtered out pid " << pid;
        return {};
    }

    UIEvent e = make_ui_event(event);
    get_event_aggregator()->get_ui_events().append(e);
    echo(e);
    return e;
}

template <class T>
T UIEventRecorder::read(const PropertyResult<T>& result, const T& default_value,
                        const char* what, const AccessibilityEvent& event) const
{
    if (result)
        return result.value();
    LOG_ATSPI << "[" << to_string(event.category) << "] " << what
              << " unreadable: " << result.error();
    return default_value;
}

UIEvent UIEventRecorder::make_ui_event(const AccessibilityEvent& event) const
{
    const UIElementPtr& element = event.element;

    UIEvent e;
    e.event_type = to_ui_event_type(event.category);
    e.timestamp = now_utc();
    e.name = read(element->get_name(), std::string(), "name", event);
    e.control_type = read(element->get_control_type(),
                          std::string(CONTROL_TYPE_UNKNOWN), "control type", event);
    e.class_name = read(element->get_class_name(), std::string(), "class name", event);
    e.process_id = read(element->get_process_id(), -1, "process id", event);

    if (e.process_id > 0)
    {
        try
        {
            e.process_name = Process::get_process_name(e.process_id);
        }
        catch (const ProcessException& ex)
        {
            LOG_ATSPI << "[" << to_string(event.category) << "] " << ex.what();
        }
    }

    e.ancestor_path = m_ancestor_path_resolver.resolve(element);

    auto bbox = element->get_bounding_box();
    if (bbox && !bbox.value().empty())
        e.coordinates = ElementCoordinates::from_bbox(bbox.value());

    switch (e.event_type)
    {
        case UIEventType::PROPERTY_CHANGED:
            e.property_name = event.property_name;
            e.new_value = event.new_value;
            break;
        case UIEventType::STRUCTURE_CHANGED:
            e.structure_change_kind = event.structure_change_kind;
            break;
        default:
            break;
    }

    return e;
}

void UIEventRecorder::echo(const UIEvent& e) const
{
    switch (e.event_type)
    {
        case UIEventType::FOCUS:
            LOG_INFO << "[Focus] " << e.control_type
                     << "  Name=" << repr(e.name)
                     << "  Class=" << repr(e.class_name)
                     << "  Process=" << repr(e.process_name)
                     << "  PID=" << e.process_id;
            break;
        case UIEventType::INVOKE:
            LOG_INFO << "[Invoke] " << e.control_type
                     << "  Name=" << repr(e.name)
                     << "  Process=" << repr(e.process_name)
                     << "  PID=" << e.process_id;
            break;
        case UIEventType::STRUCTURE_CHANGED:
            LOG_INFO << "[Structure] " << e.structure_change_kind
                     << "  On " << repr(e.name)
                     << "  Process=" << repr(e.process_name)
                     << "  PID=" << e.process_id;
            break;
        case UIEventType::PROPERTY_CHANGED:
            LOG_INFO << "[PropertyChanged] " << e.property_name
                     << " -> " << to_string(e.new_value.get_or(nullptr))
                     << "  (Name=" << repr(e.name)
                     << " Process=" << repr(e.process_name)
                     << " PID=" << e.process_id << ")";
            break;
    }
}
