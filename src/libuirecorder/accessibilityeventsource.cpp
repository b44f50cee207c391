#include <array>

#include "tools/container_helpers.h"

#include "accessibilityeventsource.h"


std::string to_string(AccessibilityEventCategory category)
{
    static const std::array<std::pair<AccessibilityEventCategory, const char*>, 4> a = {{
        {AccessibilityEventCategory::FOCUS_CHANGED, "Focus"},
        {AccessibilityEventCategory::ELEMENT_INVOKED, "Invoke"},
        {AccessibilityEventCategory::STRUCTURE_CHANGED, "StructureChanged"},
        {AccessibilityEventCategory::PROPERTY_CHANGED, "PropertyChanged"},
    }};
    return lookup(a, category, "");
}
