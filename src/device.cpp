/**
 * @file device.cpp
 * @brief Common device behaviour and physical devices
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/device.hpp"
#include "devstore/utilities.hpp"

#include <utility>

namespace devstore {

bool Device::screen_size_matches(const std::string& requested) const {
    std::string wanted = utilities::trim_string(requested);
    if (wanted.empty() || wanted == "*") {
        return true;
    }
    return wanted == screen_size();
}

// ============================================================================
// PhysicalDevice
// ============================================================================

PhysicalDevice::PhysicalDevice(
    std::string serial,
    TargetPlatform platform,
    std::string screen_size,
    bool ready
)
    : serial_(std::move(serial))
    , platform_(platform)
    , screen_size_(std::move(screen_size))
    , ready_(ready)
{
}

std::string PhysicalDevice::describe() const {
    return "device " + serial_ + " [" + TargetPlatforms::to_string(platform_) +
           ", " + screen_size_ + "]";
}

} // namespace devstore
