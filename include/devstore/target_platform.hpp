/**
 * @file target_platform.hpp
 * @brief Android target platforms a device can run
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace devstore {

/**
 * @brief Target platform (OS variant + API level)
 */
enum class TargetPlatform {
    ANDROID10,      ///< 2.3.3, API 10
    ANDROID11,      ///< 3.0, API 11
    ANDROID12,      ///< 3.1, API 12
    ANDROID13,      ///< 3.2, API 13
    ANDROID14,      ///< 4.0, API 14
    ANDROID15,      ///< 4.0.3, API 15
    ANDROID16,      ///< 4.1, API 16
    ANDROID17,      ///< 4.2, API 17
    ANDROID18,      ///< 4.3, API 18
    ANDROID19,      ///< 4.4, API 19
    ANDROID21,      ///< 5.0, API 21
    ANDROID22,      ///< 5.1, API 22
    ANDROID23       ///< 6.0, API 23
};

/**
 * @brief Helpers for converting target platforms
 */
class TargetPlatforms {
public:
    /**
     * @brief Canonical name ("ANDROID16")
     */
    static std::string to_string(TargetPlatform platform);

    /**
     * @brief Parse canonical name (exact, case-sensitive)
     * @return Platform or std::nullopt if the name is not a known platform
     */
    static std::optional<TargetPlatform> from_string(const std::string& name);

    /**
     * @brief Android API level (e.g. 16 for ANDROID16)
     */
    static int api_level(TargetPlatform platform);

    /**
     * @brief Marketing version string (e.g. "4.1")
     */
    static std::string version_name(TargetPlatform platform);

    /**
     * @brief All platforms in ascending API order
     */
    static const std::vector<TargetPlatform>& all();
};

} // namespace devstore
