#include <sstream>

#include <gtest/gtest.h>

#include "uievents.h"


TEST(UIEventsTest, EventTypeNames)
{
    EXPECT_EQ("Focus", to_string(UIEventType::FOCUS));
    EXPECT_EQ("Invoke", to_string(UIEventType::INVOKE));
    EXPECT_EQ("StructureChanged", to_string(UIEventType::STRUCTURE_CHANGED));
    EXPECT_EQ("PropertyChanged", to_string(UIEventType::PROPERTY_CHANGED));

    UIEventType type;
    ASSERT_TRUE(parse_ui_event_type("PropertyChanged", type));
    EXPECT_EQ(UIEventType::PROPERTY_CHANGED, type);
    EXPECT_FALSE(parse_ui_event_type("focus", type));
}

TEST(UIEventsTest, CoordsAreTopLeftOfBoundingBox)
{
    BoundingBox bbox{10, 20, 110, 45};
    EXPECT_FALSE(bbox.empty());
    EXPECT_EQ((ScreenPoint{10, 20}), bbox.top_left());

    auto coords = ElementCoordinates::from_bbox(bbox);
    EXPECT_EQ((ScreenPoint{10, 20}), coords.coords);
    EXPECT_EQ(bbox, coords.bbox);

    EXPECT_TRUE((BoundingBox{10, 20, 10, 60}).empty());
    EXPECT_TRUE((BoundingBox{}).empty());
}

TEST(UIEventsTest, WellFormedOptionals)
{
    UIEvent focus;
    focus.event_type = UIEventType::FOCUS;
    EXPECT_TRUE(focus.is_well_formed());

    focus.structure_change_kind = std::string(STRUCTURE_CHILD_ADDED);
    EXPECT_FALSE(focus.is_well_formed());

    UIEvent property;
    property.event_type = UIEventType::PROPERTY_CHANGED;
    EXPECT_FALSE(property.is_well_formed());
    property.property_name = std::string(NAME_PROPERTY);
    property.new_value = PropertyValue(std::string("OK"));
    EXPECT_TRUE(property.is_well_formed());

    UIEvent structure;
    structure.event_type = UIEventType::STRUCTURE_CHANGED;
    structure.structure_change_kind = std::string(STRUCTURE_CHILD_REMOVED);
    EXPECT_TRUE(structure.is_well_formed());
}

TEST(UIEventsTest, PropertyValueToString)
{
    EXPECT_EQ("null", to_string(PropertyValue(nullptr)));
    EXPECT_EQ("true", to_string(PropertyValue(true)));
    EXPECT_EQ("42", to_string(PropertyValue(int64_t{42})));
    EXPECT_EQ("0.5", to_string(PropertyValue(0.5)));
    EXPECT_EQ("Save", to_string(PropertyValue(std::string("Save"))));
}

TEST(UIEventsTest, PointerButtonNames)
{
    EXPECT_EQ("left", to_string(PointerButton::LEFT));
    EXPECT_EQ("right", to_string(PointerButton::RIGHT));

    PointerButton button;
    ASSERT_TRUE(parse_pointer_button("right", button));
    EXPECT_EQ(PointerButton::RIGHT, button);
    EXPECT_FALSE(parse_pointer_button("middle", button));
}

TEST(UIEventsTest, NowIsMicrosecondResolution)
{
    using namespace std::chrono;
    auto tp = now_utc();
    EXPECT_EQ(tp, time_point_cast<microseconds>(tp));
}
