#include <atspi/atspi.h>
#include <gtest/gtest.h>

#include "atspieventsource.h"
#include "uievents.h"


TEST(AtspiEventSourceTest, ControlTypes)
{
    EXPECT_EQ("ControlType.Button", to_control_type(ATSPI_ROLE_PUSH_BUTTON));
    EXPECT_EQ("ControlType.Button", to_control_type(ATSPI_ROLE_TOGGLE_BUTTON));
    EXPECT_EQ("ControlType.Edit", to_control_type(ATSPI_ROLE_ENTRY));
    EXPECT_EQ("ControlType.Window", to_control_type(ATSPI_ROLE_FRAME));
    EXPECT_EQ("ControlType.MenuItem", to_control_type(ATSPI_ROLE_MENU_ITEM));
    EXPECT_EQ("ControlType.Document", to_control_type(ATSPI_ROLE_DOCUMENT_WEB));
    EXPECT_EQ(CONTROL_TYPE_CUSTOM, to_control_type(ATSPI_ROLE_CANVAS));
    EXPECT_EQ(CONTROL_TYPE_CUSTOM, to_control_type(ATSPI_ROLE_INVALID));
}

TEST(AtspiEventSourceTest, StructureChangeKinds)
{
    EXPECT_EQ(STRUCTURE_CHILD_ADDED, to_structure_change_kind("object:children-changed:add"));
    EXPECT_EQ(STRUCTURE_CHILD_ADDED, to_structure_change_kind("object:children-changed:add:system"));
    EXPECT_EQ(STRUCTURE_CHILD_REMOVED, to_structure_change_kind("object:children-changed:remove"));
    EXPECT_EQ(STRUCTURE_CHILDREN_INVALIDATED, to_structure_change_kind("object:children-changed"));
    EXPECT_EQ(STRUCTURE_CHILDREN_INVALIDATED, to_structure_change_kind(""));
}

TEST(AtspiEventSourceTest, PropertyErrors)
{
    EXPECT_EQ(PropertyError::NONE, to_property_error(nullptr));

    auto check = [](const char* message)
    {
        GError* error = g_error_new_literal(g_quark_from_static_string("test"), 1, message);
        PropertyError e = to_property_error(error);
        g_error_free(error);
        return e;
    };

    EXPECT_EQ(PropertyError::ACCESS_DENIED,
              check("GDBus.Error:org.freedesktop.DBus.Error.AccessDenied: denied"));
    EXPECT_EQ(PropertyError::STALE_ELEMENT,
              check("The application no longer exists"));
    EXPECT_EQ(PropertyError::STALE_ELEMENT,
              check("GDBus.Error:org.freedesktop.DBus.Error.UnknownObject: No such object"));
    EXPECT_EQ(PropertyError::STALE_ELEMENT,
              check("GDBus.Error:org.freedesktop.DBus.Error.ServiceUnknown: gone"));
    EXPECT_EQ(PropertyError::PROPERTY_UNAVAILABLE,
              check("GDBus.Error:org.freedesktop.DBus.Error.NoReply: timeout"));
}
