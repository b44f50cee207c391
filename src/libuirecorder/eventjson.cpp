#include "tools/string_helpers.h"
#include "tools/time_helpers.h"

#include "eventjson.h"
#include "exception.h"

using json = nlohmann::json;


namespace {

bool has_field(const json& j, const char* key)
{
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

// Missing and null strings read as empty.
std::string get_string(const json& j, const char* key)
{
    if (!has_field(j, key))
        return {};
    const json& v = j.at(key);
    if (!v.is_string())
        throw ValueException(sstr() << key << ": expected string, got " << v.type_name());
    return v.get<std::string>();
}

TimePoint get_timestamp(const json& j, const char* key)
{
    if (!has_field(j, key))
        throw ValueException(sstr() << "missing " << key);
    const json& v = j.at(key);
    TimePoint tp;
    if (!v.is_string() || !parse_utc_iso8601(v.get<std::string>(), tp))
        throw ValueException(sstr() << key << ": invalid timestamp " << v.dump());
    return tp;
}

int get_int(const json& j, const char* key, int default_value)
{
    if (!has_field(j, key))
        return default_value;
    const json& v = j.at(key);
    if (!v.is_number_integer())
        throw ValueException(sstr() << key << ": expected integer, got " << v.type_name());
    return v.get<int>();
}

json property_value_to_json(const PropertyValue& value)
{
    if (auto v = std::get_if<bool>(&value))
        return *v;
    if (auto v = std::get_if<int64_t>(&value))
        return *v;
    if (auto v = std::get_if<double>(&value))
        return *v;
    if (auto v = std::get_if<std::string>(&value))
        return *v;
    return nullptr;
}

PropertyValue property_value_from_json(const json& j)
{
    switch (j.type())
    {
        case json::value_t::null: return nullptr;
        case json::value_t::boolean: return j.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return j.get<int64_t>();
        case json::value_t::number_float: return j.get<double>();
        case json::value_t::string: return j.get<std::string>();
        default:
            throw ValueException(sstr() << "NewValue: expected scalar, got " << j.type_name());
    }
}

template <class T>
std::vector<T> parse_events(const std::string& text,
                            std::vector<std::string>* bad_records)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded())
        throw ValueException("invalid JSON");
    if (!j.is_array())
        throw ValueException(sstr() << "expected array, got " << j.type_name());

    std::vector<T> events;
    events.reserve(j.size());
    for (size_t i = 0; i < j.size(); i++)
    {
        const json& item = j[i];
        std::string error;
        try
        {
            if (!item.is_object())
                throw ValueException(sstr() << "expected object, got " << item.type_name());
            events.emplace_back(item.get<T>());
            continue;
        }
        catch (const ValueException& ex)
        {
            error = ex.what();
        }
        catch (const json::exception& ex)
        {
            error = ex.what();
        }

        std::string msg = sstr() << "record " << i << ": " << error;
        if (!bad_records)
            throw ValueException(msg);
        bad_records->emplace_back(msg);
    }
    return events;
}

}  // namespace


void to_json(json& j, const ScreenPoint& p)
{
    j = json{{"X", p.x}, {"Y", p.y}};
}

void from_json(const json& j, ScreenPoint& p)
{
    p.x = get_int(j, "X", 0);
    p.y = get_int(j, "Y", 0);
}

void to_json(json& j, const BoundingBox& b)
{
    j = json{{"Left", b.left}, {"Top", b.top}, {"Right", b.right}, {"Bottom", b.bottom}};
}

void from_json(const json& j, BoundingBox& b)
{
    b.left = get_int(j, "Left", 0);
    b.top = get_int(j, "Top", 0);
    b.right = get_int(j, "Right", 0);
    b.bottom = get_int(j, "Bottom", 0);
}

void to_json(json& j, const ElementCoordinates& c)
{
    j = json{{"Coords", c.coords}, {"Bbox", c.bbox}};
}

void from_json(const json& j, ElementCoordinates& c)
{
    if (has_field(j, "Coords"))
        c.coords = j.at("Coords").get<ScreenPoint>();
    if (has_field(j, "Bbox"))
        c.bbox = j.at("Bbox").get<BoundingBox>();
}

void to_json(json& j, const UIEvent& e)
{
    j = json{
        {"EventType", to_string(e.event_type)},
        {"TimestampUtc", format_utc_iso8601(e.timestamp)},
        {"ControlType", e.control_type},
        {"Name", e.name},
        {"ClassName", e.class_name},
        {"ProcessId", e.process_id},
        {"ProcessName", e.process_name},
        {"AncestorPath", e.ancestor_path},
    };
    if (!e.coordinates.is_none())
        j["Coordinates"] = e.coordinates.value;
    if (!e.property_name.is_none())
        j["PropertyName"] = e.property_name.value;
    if (!e.new_value.is_none())
        j["NewValue"] = property_value_to_json(e.new_value.value);
    if (!e.structure_change_kind.is_none())
        j["StructureChangeType"] = e.structure_change_kind.value;
}

void from_json(const json& j, UIEvent& e)
{
    std::string type = get_string(j, "EventType");
    if (!parse_ui_event_type(type, e.event_type))
        throw ValueException(sstr() << "EventType: unknown type " << repr(type));

    e.timestamp = get_timestamp(j, "TimestampUtc");
    e.control_type = get_string(j, "ControlType");
    e.name = get_string(j, "Name");
    e.class_name = get_string(j, "ClassName");
    e.process_id = get_int(j, "ProcessId", -1);
    e.process_name = get_string(j, "ProcessName");

    e.ancestor_path.clear();
    if (has_field(j, "AncestorPath"))
        e.ancestor_path = j.at("AncestorPath").get<std::vector<std::string>>();

    e.coordinates.set_none();
    if (has_field(j, "Coordinates"))
        e.coordinates = j.at("Coordinates").get<ElementCoordinates>();

    e.property_name.set_none();
    e.new_value.set_none();
    e.structure_change_kind.set_none();
    if (e.event_type == UIEventType::PROPERTY_CHANGED)
    {
        e.property_name = get_string(j, "PropertyName");
        auto it = j.find("NewValue");
        e.new_value = it == j.end() ? PropertyValue(nullptr) : property_value_from_json(*it);
    }
    else if (e.event_type == UIEventType::STRUCTURE_CHANGED)
    {
        e.structure_change_kind = get_string(j, "StructureChangeType");
    }
}

void to_json(json& j, const PointerClickEvent& e)
{
    j = json{
        {"TimestampUtc", format_utc_iso8601(e.timestamp)},
        {"X", e.x},
        {"Y", e.y},
        {"Button", to_string(e.button)},
    };
}

void from_json(const json& j, PointerClickEvent& e)
{
    e.timestamp = get_timestamp(j, "TimestampUtc");
    e.x = get_int(j, "X", 0);
    e.y = get_int(j, "Y", 0);
    std::string button = get_string(j, "Button");
    if (!parse_pointer_button(button, e.button))
        throw ValueException(sstr() << "Button: unknown button " << repr(button));
}

void to_json(json& j, const BrowserUrlEvent& e)
{
    j = json{
        {"TimestampUtc", format_utc_iso8601(e.timestamp)},
        {"ProcessName", e.process_name},
        {"Url", e.url},
    };
}

void from_json(const json& j, BrowserUrlEvent& e)
{
    e.timestamp = get_timestamp(j, "TimestampUtc");
    e.process_name = get_string(j, "ProcessName");
    e.url = get_string(j, "Url");
}

std::vector<UIEvent> parse_ui_events(const std::string& text,
                                 std::vector<std::string>* bad_records)
{
    return parse_events<UIEvent>(text, bad_records);
}

std::vector<PointerClickEvent> parse_pointer_click_events(const std::string& text,
                                 std::vector<std::string>* bad_records)
{
    return parse_events<PointerClickEvent>(text, bad_records);
}

std::vector<BrowserUrlEvent> parse_browser_url_events(const std::string& text,
                                 std::vector<std::string>* bad_records)
{
    return parse_events<BrowserUrlEvent>(text, bad_records);
}
