#include <chrono>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "eventjson.h"
#include "exception.h"

using json = nlohmann::json;
using namespace std::chrono;


namespace {

TimePoint make_time(int64_t epoch_seconds, int64_t us=0)
{
    return system_clock::from_time_t(static_cast<time_t>(epoch_seconds)) + microseconds(us);
}

UIEvent make_focus_event()
{
    UIEvent e;
    e.event_type = UIEventType::FOCUS;
    e.timestamp = make_time(1714558272, 123456);
    e.control_type = "ControlType.Button";
    e.name = "OK";
    e.class_name = "GtkButton";
    e.process_id = 4242;
    e.process_name = "gedit";
    e.ancestor_path = {"gedit", "Save As", "ControlType.Panel"};
    e.coordinates = ElementCoordinates::from_bbox({100, 200, 180, 230});
    return e;
}

}  // namespace


TEST(EventJsonTest, UIEventFieldNames)
{
    json j = make_focus_event();
    EXPECT_EQ("Focus", j["EventType"]);
    EXPECT_EQ("2024-05-01T10:11:12.123456Z", j["TimestampUtc"]);
    EXPECT_EQ("ControlType.Button", j["ControlType"]);
    EXPECT_EQ("OK", j["Name"]);
    EXPECT_EQ("GtkButton", j["ClassName"]);
    EXPECT_EQ(4242, j["ProcessId"]);
    EXPECT_EQ("gedit", j["ProcessName"]);
    EXPECT_EQ(3u, j["AncestorPath"].size());
    EXPECT_EQ(100, j["Coordinates"]["Coords"]["X"]);
    EXPECT_EQ(200, j["Coordinates"]["Coords"]["Y"]);
    EXPECT_EQ(180, j["Coordinates"]["Bbox"]["Right"]);

    // absent optionals are omitted
    EXPECT_EQ(0u, j.count("PropertyName"));
    EXPECT_EQ(0u, j.count("NewValue"));
    EXPECT_EQ(0u, j.count("StructureChangeType"));
}

TEST(EventJsonTest, UIEventWithoutCoordinates)
{
    auto e = make_focus_event();
    e.coordinates.set_none();
    json j = e;
    EXPECT_EQ(0u, j.count("Coordinates"));

    auto events = parse_ui_events(serialize_events(std::vector<UIEvent>{e}));
    ASSERT_EQ(1u, events.size());
    EXPECT_TRUE(events[0].coordinates.is_none());
    EXPECT_EQ(e, events[0]);
}

TEST(EventJsonTest, PropertyAndStructureEvents)
{
    UIEvent property = make_focus_event();
    property.event_type = UIEventType::PROPERTY_CHANGED;
    property.property_name = std::string(NAME_PROPERTY);
    property.new_value = PropertyValue(std::string("Saved"));

    UIEvent offscreen = property;
    offscreen.property_name = std::string(IS_OFFSCREEN_PROPERTY);
    offscreen.new_value = PropertyValue(true);

    UIEvent structure = make_focus_event();
    structure.event_type = UIEventType::STRUCTURE_CHANGED;
    structure.structure_change_kind = std::string(STRUCTURE_CHILD_ADDED);

    std::vector<UIEvent> events{property, offscreen, structure};
    auto text = serialize_events(events);

    json j = json::parse(text);
    EXPECT_EQ("AutomationElementIdentifiers.NameProperty", j[0]["PropertyName"]);
    EXPECT_EQ("Saved", j[0]["NewValue"]);
    EXPECT_EQ(true, j[1]["NewValue"]);
    EXPECT_EQ("ChildAdded", j[2]["StructureChangeType"]);

    EXPECT_EQ(events, parse_ui_events(text));
}

TEST(EventJsonTest, NullOptionalsReadAsAbsent)
{
    auto text = R"([{
        "EventType": "Invoke",
        "TimestampUtc": "2024-05-01T10:11:12.1234567Z",
        "ControlType": "ControlType.MenuItem",
        "Name": "Open",
        "ClassName": null,
        "ProcessId": 17,
        "ProcessName": "gedit",
        "AncestorPath": null,
        "Coordinates": null,
        "PropertyName": null,
        "NewValue": null,
        "StructureChangeType": null
    }])";

    auto events = parse_ui_events(text);
    ASSERT_EQ(1u, events.size());
    auto& e = events[0];
    EXPECT_EQ(UIEventType::INVOKE, e.event_type);
    EXPECT_EQ(make_time(1714558272, 123456), e.timestamp);
    EXPECT_EQ("", e.class_name);
    EXPECT_TRUE(e.ancestor_path.empty());
    EXPECT_TRUE(e.coordinates.is_none());
    EXPECT_TRUE(e.property_name.is_none());
    EXPECT_TRUE(e.new_value.is_none());
    EXPECT_TRUE(e.structure_change_kind.is_none());
    EXPECT_TRUE(e.is_well_formed());
}

TEST(EventJsonTest, PointerClicksAndBrowserUrls)
{
    PointerClickEvent click{make_time(1714558272), 640, 480, PointerButton::RIGHT};
    json jc = click;
    EXPECT_EQ("2024-05-01T10:11:12.000000Z", jc["TimestampUtc"]);
    EXPECT_EQ(640, jc["X"]);
    EXPECT_EQ(480, jc["Y"]);
    EXPECT_EQ("right", jc["Button"]);

    BrowserUrlEvent url{make_time(1714558272), "chrome", "https://example.com/a"};
    json ju = url;
    EXPECT_EQ("chrome", ju["ProcessName"]);
    EXPECT_EQ("https://example.com/a", ju["Url"]);

    auto clicks = parse_pointer_click_events(serialize_events(std::vector<PointerClickEvent>{click}));
    ASSERT_EQ(1u, clicks.size());
    EXPECT_EQ(click, clicks[0]);

    auto urls = parse_browser_url_events(serialize_events(std::vector<BrowserUrlEvent>{url}));
    ASSERT_EQ(1u, urls.size());
    EXPECT_EQ(url, urls[0]);
}

TEST(EventJsonTest, EmptyLogIsEmptyArray)
{
    auto text = serialize_events(std::vector<UIEvent>{});
    EXPECT_EQ("[]", text);
    EXPECT_TRUE(parse_ui_events(text).empty());
}

TEST(EventJsonTest, MalformedInputThrows)
{
    EXPECT_THROW(parse_ui_events(""), ValueException);
    EXPECT_THROW(parse_ui_events("[{"), ValueException);
    EXPECT_THROW(parse_ui_events(R"({"EventType": "Focus"})"), ValueException);
    EXPECT_THROW(parse_ui_events("[1, 2]"), ValueException);
    EXPECT_THROW(parse_ui_events(R"([{"EventType": "Hover", "TimestampUtc": "2024-05-01T10:11:12Z"}])"),
                 ValueException);
    EXPECT_THROW(parse_ui_events(R"([{"EventType": "Focus", "TimestampUtc": "noon"}])"),
                 ValueException);
    EXPECT_THROW(parse_ui_events(R"([{"EventType": "Focus"}])"), ValueException);
    EXPECT_THROW(parse_pointer_click_events(
                     R"([{"TimestampUtc": "2024-05-01T10:11:12Z", "Button": "middle"}])"),
                 ValueException);
}

TEST(EventJsonTest, BadRecordsSkippedWhenCollected)
{
    std::string text = R"([
        {"EventType": "Focus", "TimestampUtc": "2024-05-01T10:11:12Z", "Name": "first"},
        {"EventType": "Focus", "Name": "no timestamp"},
        {"EventType": "PropertyChanged", "TimestampUtc": "2024-05-01T10:11:13Z",
         "PropertyName": "AutomationElementIdentifiers.NameProperty", "NewValue": [1, 2]},
        {"EventType": "Invoke", "TimestampUtc": "2024-05-01T10:11:14Z", "Name": "last"}
    ])";

    EXPECT_THROW(parse_ui_events(text), ValueException);

    std::vector<std::string> bad_records;
    auto events = parse_ui_events(text, &bad_records);
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ("first", events[0].name);
    EXPECT_EQ("last", events[1].name);
    ASSERT_EQ(2u, bad_records.size());
    EXPECT_EQ(0u, bad_records[0].find("record 1: "));
    EXPECT_EQ(0u, bad_records[1].find("record 2: "));

    // a broken document still fails as a whole
    EXPECT_THROW(parse_ui_events("[{", &bad_records), ValueException);
}
