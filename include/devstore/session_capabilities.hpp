/**
 * @file session_capabilities.hpp
 * @brief Capabilities a test session asks the device store for
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <string>
#include <optional>

namespace devstore {

/**
 * @brief Desired capabilities of a test session
 *
 * Only android_target and screen_size take part in device matching; the
 * remaining fields are carried for the session manager.
 */
struct SessionCapabilities {
    std::string android_target;     ///< Target platform name, e.g. "ANDROID16" (required)
    std::string screen_size;        ///< Screen size, empty or "*" for any
    std::string app_id;             ///< Application under test ("aut")
    std::string locale;             ///< Requested device locale

    /**
     * @brief Serialize capabilities to JSON
     * @return JSON object string using the desired-capabilities key names
     */
    std::string to_json() const;

    /**
     * @brief Deserialize capabilities from a desired-capabilities JSON object
     *
     * Keys: "androidTarget", "screenSize", "aut", "locale". Missing keys are
     * left empty; validation of the target happens at allocation time.
     *
     * @param json JSON string
     * @return SessionCapabilities or std::nullopt if not a JSON object
     */
    static std::optional<SessionCapabilities> from_json(const std::string& json);
};

} // namespace devstore
