/**
 * @file target_platform.cpp
 * @brief Target platform conversions
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/target_platform.hpp"

namespace devstore {

std::string TargetPlatforms::to_string(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::ANDROID10: return "ANDROID10";
        case TargetPlatform::ANDROID11: return "ANDROID11";
        case TargetPlatform::ANDROID12: return "ANDROID12";
        case TargetPlatform::ANDROID13: return "ANDROID13";
        case TargetPlatform::ANDROID14: return "ANDROID14";
        case TargetPlatform::ANDROID15: return "ANDROID15";
        case TargetPlatform::ANDROID16: return "ANDROID16";
        case TargetPlatform::ANDROID17: return "ANDROID17";
        case TargetPlatform::ANDROID18: return "ANDROID18";
        case TargetPlatform::ANDROID19: return "ANDROID19";
        case TargetPlatform::ANDROID21: return "ANDROID21";
        case TargetPlatform::ANDROID22: return "ANDROID22";
        case TargetPlatform::ANDROID23: return "ANDROID23";
        default: return "UNKNOWN";
    }
}

std::optional<TargetPlatform> TargetPlatforms::from_string(const std::string& name) {
    if (name == "ANDROID10") return TargetPlatform::ANDROID10;
    if (name == "ANDROID11") return TargetPlatform::ANDROID11;
    if (name == "ANDROID12") return TargetPlatform::ANDROID12;
    if (name == "ANDROID13") return TargetPlatform::ANDROID13;
    if (name == "ANDROID14") return TargetPlatform::ANDROID14;
    if (name == "ANDROID15") return TargetPlatform::ANDROID15;
    if (name == "ANDROID16") return TargetPlatform::ANDROID16;
    if (name == "ANDROID17") return TargetPlatform::ANDROID17;
    if (name == "ANDROID18") return TargetPlatform::ANDROID18;
    if (name == "ANDROID19") return TargetPlatform::ANDROID19;
    if (name == "ANDROID21") return TargetPlatform::ANDROID21;
    if (name == "ANDROID22") return TargetPlatform::ANDROID22;
    if (name == "ANDROID23") return TargetPlatform::ANDROID23;
    return std::nullopt;
}

int TargetPlatforms::api_level(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::ANDROID10: return 10;
        case TargetPlatform::ANDROID11: return 11;
        case TargetPlatform::ANDROID12: return 12;
        case TargetPlatform::ANDROID13: return 13;
        case TargetPlatform::ANDROID14: return 14;
        case TargetPlatform::ANDROID15: return 15;
        case TargetPlatform::ANDROID16: return 16;
        case TargetPlatform::ANDROID17: return 17;
        case TargetPlatform::ANDROID18: return 18;
        case TargetPlatform::ANDROID19: return 19;
        case TargetPlatform::ANDROID21: return 21;
        case TargetPlatform::ANDROID22: return 22;
        case TargetPlatform::ANDROID23: return 23;
        default: return 0;
    }
}

std::string TargetPlatforms::version_name(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::ANDROID10: return "2.3.3";
        case TargetPlatform::ANDROID11: return "3.0";
        case TargetPlatform::ANDROID12: return "3.1";
        case TargetPlatform::ANDROID13: return "3.2";
        case TargetPlatform::ANDROID14: return "4.0";
        case TargetPlatform::ANDROID15: return "4.0.3";
        case TargetPlatform::ANDROID16: return "4.1";
        case TargetPlatform::ANDROID17: return "4.2";
        case TargetPlatform::ANDROID18: return "4.3";
        case TargetPlatform::ANDROID19: return "4.4";
        case TargetPlatform::ANDROID21: return "5.0";
        case TargetPlatform::ANDROID22: return "5.1";
        case TargetPlatform::ANDROID23: return "6.0";
        default: return "";
    }
}

const std::vector<TargetPlatform>& TargetPlatforms::all() {
    static const std::vector<TargetPlatform> platforms = {
        TargetPlatform::ANDROID10, TargetPlatform::ANDROID11, TargetPlatform::ANDROID12,
        TargetPlatform::ANDROID13, TargetPlatform::ANDROID14, TargetPlatform::ANDROID15,
        TargetPlatform::ANDROID16, TargetPlatform::ANDROID17, TargetPlatform::ANDROID18,
        TargetPlatform::ANDROID19, TargetPlatform::ANDROID21, TargetPlatform::ANDROID22,
        TargetPlatform::ANDROID23
    };
    return platforms;
}

} // namespace devstore
