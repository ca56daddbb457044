/**
 * @file session_capabilities.cpp
 * @brief Session capability serialization
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/session_capabilities.hpp"
#include "devstore/utilities.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace devstore {

namespace {

constexpr const char* KEY_ANDROID_TARGET = "androidTarget";
constexpr const char* KEY_SCREEN_SIZE = "screenSize";
constexpr const char* KEY_AUT = "aut";
constexpr const char* KEY_LOCALE = "locale";

// Non-string values are treated as absent
std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

std::string SessionCapabilities::to_json() const {
    json j;
    j[KEY_ANDROID_TARGET] = android_target;
    j[KEY_SCREEN_SIZE] = screen_size;
    if (!app_id.empty()) {
        j[KEY_AUT] = app_id;
    }
    if (!locale.empty()) {
        j[KEY_LOCALE] = locale;
    }
    return j.dump();
}

std::optional<SessionCapabilities> SessionCapabilities::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            utilities::log_warn("SessionCapabilities: Expected a JSON object");
            return std::nullopt;
        }

        SessionCapabilities caps;
        caps.android_target = string_field(j, KEY_ANDROID_TARGET);
        caps.screen_size = string_field(j, KEY_SCREEN_SIZE);
        caps.app_id = string_field(j, KEY_AUT);
        caps.locale = string_field(j, KEY_LOCALE);
        return caps;

    } catch (const json::exception& e) {
        utilities::log_warn("SessionCapabilities: Invalid JSON: " + std::string(e.what()));
        return std::nullopt;
    }
}

} // namespace devstore
