#include <unistd.h>

#include <gtest/gtest.h>

#include "eventaggregator.h"
#include "processfilter.h"
#include "testing/fakeelement.h"
#include "testing/testcontext.h"
#include "uieventrecorder.h"


class UIEventRecorderTest : public ::testing::Test
{
    protected:
        AccessibilityEvent make_event(AccessibilityEventCategory category,
                                      const UIElementPtr& element)
        {
            AccessibilityEvent event;
            event.category = category;
            event.element = element;
            return event;
        }

        std::vector<UIEvent> ui_events()
        {
            return m_context.get_event_aggregator()->get_ui_events().snapshot();
        }

    protected:
        TestContext m_context{LogLevel::NONE};
        UIEventRecorder m_recorder{m_context};
        int32_t m_own_pid{static_cast<int32_t>(getpid())};
};

TEST_F(UIEventRecorderTest, FocusRecordsElementProperties)
{
    auto window = FakeElement::make(m_context, "Untitled Document 1 - gedit",
                                    "ControlType.Window", m_own_pid);
    auto button = FakeElement::make(m_context, "Save", "ControlType.Button",
                                    m_own_pid, window);
    button->class_name = std::string("GtkButton");
    button->bounding_box = BoundingBox{100, 200, 180, 230};

    auto e = m_recorder.record(make_event(AccessibilityEventCategory::FOCUS_CHANGED, button));
    ASSERT_FALSE(e.is_none());
    EXPECT_EQ(UIEventType::FOCUS, e.value.event_type);
    EXPECT_EQ("Save", e.value.name);
    EXPECT_EQ("ControlType.Button", e.value.control_type);
    EXPECT_EQ("GtkButton", e.value.class_name);
    EXPECT_EQ(m_own_pid, e.value.process_id);
    EXPECT_EQ("uirecorder_unittests", e.value.process_name);
    EXPECT_EQ((std::vector<std::string>{"Untitled Document 1 - gedit"}), e.value.ancestor_path);
    ASSERT_FALSE(e.value.coordinates.is_none());
    EXPECT_EQ((ScreenPoint{100, 200}), e.value.coordinates.value.coords);
    EXPECT_TRUE(e.value.is_well_formed());

    auto events = ui_events();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(e.value, events[0]);
}

TEST_F(UIEventRecorderTest, UnreadablePropertiesFallBackToDefaults)
{
    auto element = FakeElement::make(m_context, "");
    element->name = PropertyError::STALE_ELEMENT;
    element->control_type = PropertyError::PROPERTY_UNAVAILABLE;
    element->class_name = PropertyError::ACCESS_DENIED;
    element->process_id = PropertyError::STALE_ELEMENT;
    element->bounding_box = PropertyError::STALE_ELEMENT;
    element->parent = PropertyError::STALE_ELEMENT;

    auto e = m_recorder.record(make_event(AccessibilityEventCategory::ELEMENT_INVOKED, element));
    ASSERT_FALSE(e.is_none());
    EXPECT_EQ(UIEventType::INVOKE, e.value.event_type);
    EXPECT_EQ("", e.value.name);
    EXPECT_EQ("ControlType.Unknown", e.value.control_type);
    EXPECT_EQ("", e.value.class_name);
    EXPECT_EQ(-1, e.value.process_id);
    EXPECT_EQ("", e.value.process_name);
    EXPECT_TRUE(e.value.ancestor_path.empty());
    EXPECT_TRUE(e.value.coordinates.is_none());
    EXPECT_TRUE(e.value.is_well_formed());
}

TEST_F(UIEventRecorderTest, EmptyBoundingBoxHasNoCoordinates)
{
    auto element = FakeElement::make(m_context, "hidden");
    element->bounding_box = BoundingBox{0, 0, 0, 0};
    auto e = m_recorder.record(make_event(AccessibilityEventCategory::FOCUS_CHANGED, element));
    ASSERT_FALSE(e.is_none());
    EXPECT_TRUE(e.value.coordinates.is_none());
}

TEST_F(UIEventRecorderTest, PropertyChangeCarriesNameAndValue)
{
    auto element = FakeElement::make(m_context, "Status", "ControlType.Text", m_own_pid);
    auto event = make_event(AccessibilityEventCategory::PROPERTY_CHANGED, element);
    event.property_name = NAME_PROPERTY;
    event.new_value = std::string("Saved");

    auto e = m_recorder.record(event);
    ASSERT_FALSE(e.is_none());
    EXPECT_EQ(UIEventType::PROPERTY_CHANGED, e.value.event_type);
    EXPECT_EQ(e.value.property_name, std::string(NAME_PROPERTY));
    EXPECT_TRUE(e.value.new_value == PropertyValue(std::string("Saved")));
    EXPECT_TRUE(e.value.structure_change_kind.is_none());
    EXPECT_TRUE(e.value.is_well_formed());
}

TEST_F(UIEventRecorderTest, StructureChangeCarriesKind)
{
    auto element = FakeElement::make(m_context, "Files", "ControlType.List", m_own_pid);
    auto event = make_event(AccessibilityEventCategory::STRUCTURE_CHANGED, element);
    event.structure_change_kind = STRUCTURE_CHILD_REMOVED;

    auto e = m_recorder.record(event);
    ASSERT_FALSE(e.is_none());
    EXPECT_EQ(e.value.structure_change_kind, std::string(STRUCTURE_CHILD_REMOVED));
    EXPECT_TRUE(e.value.property_name.is_none());
    EXPECT_TRUE(e.value.new_value.is_none());
    EXPECT_TRUE(e.value.is_well_formed());
}

TEST_F(UIEventRecorderTest, ForegroundFilterDropsOtherProcesses)
{
    m_context.get_process_filter()->set_pid(m_own_pid);

    auto own = FakeElement::make(m_context, "mine", "ControlType.Button", m_own_pid);
    auto other = FakeElement::make(m_context, "theirs", "ControlType.Button", m_own_pid + 1);
    auto unknown = FakeElement::make(m_context, "unknown");
    unknown->process_id = PropertyError::ACCESS_DENIED;

    EXPECT_FALSE(m_recorder.record(make_event(AccessibilityEventCategory::FOCUS_CHANGED, own)).is_none());
    EXPECT_TRUE(m_recorder.record(make_event(AccessibilityEventCategory::FOCUS_CHANGED, other)).is_none());
    EXPECT_TRUE(m_recorder.record(make_event(AccessibilityEventCategory::FOCUS_CHANGED, unknown)).is_none());

    auto events = ui_events();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("mine", events[0].name);
}

TEST_F(UIEventRecorderTest, EventWithoutElementIsDropped)
{
    m_recorder.on_accessibility_event(make_event(AccessibilityEventCategory::FOCUS_CHANGED, nullptr));
    EXPECT_TRUE(ui_events().empty());
}
