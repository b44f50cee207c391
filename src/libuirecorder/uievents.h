#ifndef UIEVENTS_H
#define UIEVENTS_H

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "tools/noneable.h"


using TimePoint = std::chrono::system_clock::time_point;

// Current UTC time, at the microsecond resolution the logs store.
TimePoint now_utc();


enum class UIEventType
{
    FOCUS,
    INVOKE,
    STRUCTURE_CHANGED,
    PROPERTY_CHANGED,
};

std::string to_string(UIEventType type);
bool parse_ui_event_type(const std::string& s, UIEventType& type_out);


struct ScreenPoint
{
    int x{};
    int y{};

    bool operator==(const ScreenPoint& other) const
    { return x == other.x && y == other.y; }
};

struct BoundingBox
{
    int left{};
    int top{};
    int right{};
    int bottom{};

    bool empty() const
    { return right <= left || bottom <= top; }

    ScreenPoint top_left() const
    { return {left, top}; }

    bool operator==(const BoundingBox& other) const
    {
        return left == other.left && top == other.top &&
               right == other.right && bottom == other.bottom;
    }
};

struct ElementCoordinates
{
    ScreenPoint coords;     // top-left corner of bbox
    BoundingBox bbox;

    static ElementCoordinates from_bbox(const BoundingBox& bbox)
    { return {bbox.top_left(), bbox}; }

    bool operator==(const ElementCoordinates& other) const
    { return coords == other.coords && bbox == other.bbox; }
};

// Vocabulary shared with the replay engine.
constexpr const char* CONTROL_TYPE_UNKNOWN = "ControlType.Unknown";
constexpr const char* CONTROL_TYPE_CUSTOM = "ControlType.Custom";

constexpr const char* NAME_PROPERTY = "AutomationElementIdentifiers.NameProperty";
constexpr const char* IS_OFFSCREEN_PROPERTY = "AutomationElementIdentifiers.IsOffscreenProperty";

constexpr const char* STRUCTURE_CHILD_ADDED = "ChildAdded";
constexpr const char* STRUCTURE_CHILD_REMOVED = "ChildRemoved";
constexpr const char* STRUCTURE_CHILDREN_INVALIDATED = "ChildrenInvalidated";

// Scalar value of a changed property. nullptr for null.
using PropertyValue = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

std::string to_string(const PropertyValue& value);


// One observed accessibility event.
// property_name and new_value are set only for PROPERTY_CHANGED,
// structure_change_kind only for STRUCTURE_CHANGED.
struct UIEvent
{
    UIEventType event_type{UIEventType::FOCUS};
    TimePoint timestamp;
    std::string control_type;
    std::string name;
    std::string class_name;
    int32_t process_id{-1};
    std::string process_name;
    std::vector<std::string> ancestor_path;     // root-most first
    Noneable<ElementCoordinates> coordinates;
    Noneable<std::string> property_name;
    Noneable<PropertyValue> new_value;
    Noneable<std::string> structure_change_kind;

    // Do the optional fields agree with event_type?
    bool is_well_formed() const;

    bool operator==(const UIEvent& other) const;
    bool operator!=(const UIEvent& other) const
    { return !operator==(other); }
};

std::ostream& operator<<(std::ostream& s, const UIEvent& e);


enum class PointerButton
{
    LEFT,
    RIGHT,
};

std::string to_string(PointerButton button);
bool parse_pointer_button(const std::string& s, PointerButton& button_out);

struct PointerClickEvent
{
    TimePoint timestamp;
    int x{};
    int y{};
    PointerButton button{PointerButton::LEFT};

    bool operator==(const PointerClickEvent& other) const
    {
        return timestamp == other.timestamp &&
               x == other.x && y == other.y &&
               button == other.button;
    }
};

std::ostream& operator<<(std::ostream& s, const PointerClickEvent& e);


struct BrowserUrlEvent
{
    TimePoint timestamp;
    std::string process_name;
    std::string url;

    bool operator==(const BrowserUrlEvent& other) const
    {
        return timestamp == other.timestamp &&
               process_name == other.process_name &&
               url == other.url;
    }
};

std::ostream& operator<<(std::ostream& s, const BrowserUrlEvent& e);

#endif // UIEVENTS_H
