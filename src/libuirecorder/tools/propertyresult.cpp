#include "propertyresult.h"

std::string to_string(PropertyError e)
{
    switch (e)
    {
        case PropertyError::NONE: return "None";
        case PropertyError::PROPERTY_UNAVAILABLE: return "PropertyUnavailable";
        case PropertyError::STALE_ELEMENT: return "StaleElement";
        case PropertyError::ACCESS_DENIED: return "AccessDenied";
    }
    return {};
}
