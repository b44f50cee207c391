#ifndef ATSPIEVENTSOURCE_H
#define ATSPIEVENTSOURCE_H

#include <string>

#include <atspi/atspi.h>

#include "tools/propertyresult.h"

std::string to_string(AtspiRole role);

// Closest "ControlType.<Name>" for an AT-SPI role,
// ControlType.Custom for roles without counterpart.
std::string to_control_type(AtspiRole role);

// Classify a failed AT-SPI call.
PropertyError to_property_error(const GError* error);

// "object:children-changed:add:system" -> ChildAdded, etc.
std::string to_structure_change_kind(const std::string& event_type);

#endif // ATSPIEVENTSOURCE_H
