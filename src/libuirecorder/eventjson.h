#ifndef EVENTJSON_H
#define EVENTJSON_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "uievents.h"

// JSON shapes of the three logs. Field names are PascalCase,
// absent optional fields are omitted and read back from either
// an omitted or a null field.

void to_json(nlohmann::json& j, const ScreenPoint& p);
void from_json(const nlohmann::json& j, ScreenPoint& p);

void to_json(nlohmann::json& j, const BoundingBox& b);
void from_json(const nlohmann::json& j, BoundingBox& b);

void to_json(nlohmann::json& j, const ElementCoordinates& c);
void from_json(const nlohmann::json& j, ElementCoordinates& c);

void to_json(nlohmann::json& j, const UIEvent& e);
void from_json(const nlohmann::json& j, UIEvent& e);

void to_json(nlohmann::json& j, const PointerClickEvent& e);
void from_json(const nlohmann::json& j, PointerClickEvent& e);

void to_json(nlohmann::json& j, const BrowserUrlEvent& e);
void from_json(const nlohmann::json& j, BrowserUrlEvent& e);


// Serialize a whole log, a JSON array, indented for humans.
template <class T>
std::string serialize_events(const std::vector<T>& events)
{
    nlohmann::json j = nlohmann::json::array();
    for (auto& e : events)
        j.push_back(e);
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Parse a whole log. With bad_records given, malformed records are
// skipped and described there instead of failing the whole log.
// throws ValueException on malformed JSON, or records if bad_records is null
std::vector<UIEvent> parse_ui_events(const std::string& text,
                                     std::vector<std::string>* bad_records=nullptr);
std::vector<PointerClickEvent> parse_pointer_click_events(const std::string& text,
                                     std::vector<std::string>* bad_records=nullptr);
std::vector<BrowserUrlEvent> parse_browser_url_events(const std::string& text,
                                     std::vector<std::string>* bad_records=nullptr);

#endif // EVENTJSON_H
