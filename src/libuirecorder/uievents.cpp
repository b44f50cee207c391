#include <array>
#include <cstdio>

#include "tools/container_helpers.h"
#include "tools/string_helpers.h"
#include "tools/time_helpers.h"

#include "uievents.h"


TimePoint now_utc()
{
    using namespace std::chrono;
    return time_point_cast<microseconds>(system_clock::now());
}

static const std::array<std::pair<UIEventType, const char*>, 4> event_type_names = {{
    {UIEventType::FOCUS, "Focus"},
    {UIEventType::INVOKE, "Invoke"},
    {UIEventType::STRUCTURE_CHANGED, "StructureChanged"},
    {UIEventType::PROPERTY_CHANGED, "PropertyChanged"},
}};

std::string to_string(UIEventType type)
{
    return lookup(event_type_names, type, "");
}

bool parse_ui_event_type(const std::string& s, UIEventType& type_out)
{
    for (auto& e : event_type_names)
    {
        if (s == e.second)
        {
            type_out = e.first;
            return true;
        }
    }
    return false;
}

std::string to_string(const PropertyValue& value)
{
    if (std::holds_alternative<std::nullptr_t>(value))
        return "null";
    if (auto v = std::get_if<bool>(&value))
        return *v ? "true" : "false";
    if (auto v = std::get_if<int64_t>(&value))
        return std::to_string(*v);
    if (auto v = std::get_if<double>(&value))
        return sstr() << *v;
    return std::get<std::string>(value);
}

bool UIEvent::is_well_formed() const
{
    bool property_changed = event_type == UIEventType::PROPERTY_CHANGED;
    bool structure_changed = event_type == UIEventType::STRUCTURE_CHANGED;
    return property_name.is_none() != property_changed &&
           new_value.is_none() != property_changed &&
           structure_change_kind.is_none() != structure_changed;
}

bool UIEvent::operator==(const UIEvent& other) const
{
    return event_type == other.event_type &&
           timestamp == other.timestamp &&
           control_type == other.control_type &&
           name == other.name &&
           class_name == other.class_name &&
           process_id == other.process_id &&
           process_name == other.process_name &&
           ancestor_path == other.ancestor_path &&
           coordinates == other.coordinates &&
           property_name == other.property_name &&
           new_value == other.new_value &&
           structure_change_kind == other.structure_change_kind;
}

std::ostream& operator<<(std::ostream& s, const UIEvent& e)
{
    s << "UIEvent(" << to_string(e.event_type)
      << " " << format_utc_iso8601(e.timestamp)
      << " " << e.control_type
      << " name=" << repr(e.name)
      << " class=" << repr(e.class_name)
      << " pid=" << e.process_id
      << " process=" << repr(e.process_name);
    if (!e.property_name.is_none())
        s << " property=" << e.property_name.value
          << " value=" << to_string(e.new_value.get_or(nullptr));
    if (!e.structure_change_kind.is_none())
        s << " change=" << e.structure_change_kind.value;
    s << ")";
    return s;
}

static const std::array<std::pair<PointerButton, const char*>, 2> pointer_button_names = {{
    {PointerButton::LEFT, "left"},
    {PointerButton::RIGHT, "right"},
}};

std::string to_string(PointerButton button)
{
    return lookup(pointer_button_names, button, "");
}

bool parse_pointer_button(const std::string& s, PointerButton& button_out)
{
    for (auto& e : pointer_button_names)
    {
        if (s == e.second)
        {
            button_out = e.first;
            return true;
        }
    }
    return false;
}

std::ostream& operator<<(std::ostream& s, const PointerClickEvent& e)
{
    s << "PointerClickEvent(" << format_utc_iso8601(e.timestamp)
      << " " << e.x << "," << e.y
      << " " << to_string(e.button) << ")";
    return s;
}

std::ostream& operator<<(std::ostream& s, const BrowserUrlEvent& e)
{
    s << "BrowserUrlEvent(" << format_utc_iso8601(e.timestamp)
      << " " << e.process_name
      << " " << e.url << ")";
    return s;
}
