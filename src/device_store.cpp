/**
 * @file device_store.cpp
 * @brief Implementation of the device lease registry
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/device_store.hpp"
#include "devstore/utilities.hpp"

#include <algorithm>
#include <utility>

namespace devstore {

using namespace devstore::utilities;

std::string device_store_error_to_string(DeviceStoreError error) {
    switch (error) {
        case DeviceStoreError::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case DeviceStoreError::EMPTY_STORE: return "EMPTY_STORE";
        case DeviceStoreError::MISSING_FIELD: return "MISSING_FIELD";
        case DeviceStoreError::UNKNOWN_PLATFORM: return "UNKNOWN_PLATFORM";
        case DeviceStoreError::NO_MATCHING_PLATFORM: return "NO_MATCHING_PLATFORM";
        case DeviceStoreError::NO_DEVICE_AVAILABLE: return "NO_DEVICE_AVAILABLE";
        case DeviceStoreError::NO_DEVICES_AVAILABLE: return "NO_DEVICES_AVAILABLE";
        case DeviceStoreError::EXHAUSTED_POOL: return "EXHAUSTED_POOL";
        case DeviceStoreError::DEVICE_OPERATION_FAILED: return "DEVICE_OPERATION_FAILED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Constructors
// ============================================================================

DeviceStore::DeviceStore(uint16_t port_min, uint16_t port_max, uint16_t port_step)
    : port_allocator_(std::make_shared<PortAllocator>(port_min, port_max, port_step))
{
}

DeviceStore::DeviceStore(std::shared_ptr<PortAllocator> port_allocator)
    : port_allocator_(std::move(port_allocator))
{
    if (!port_allocator_) {
        throw std::invalid_argument("DeviceStore: port allocator cannot be null");
    }
}

// ============================================================================
// Registration
// ============================================================================

void DeviceStore::add_devices(const std::vector<DevicePtr>& devices) {
    if (devices.empty()) {
        log_info("DeviceStore: No Android devices were found");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& device : devices) {
        if (!device) {
            continue;
        }
        if (!device->is_ready()) {
            log_debug("DeviceStore: Skipping " + device->describe() + ", not ready");
            continue;
        }

        // A running emulator keeps its port out of the pool
        if (is_emulator_started(*device)) {
            uint16_t port = device->as_emulator()->port();
            if (port != 0 && !port_allocator_->allocate_specific(port)) {
                log_warn("DeviceStore: Port " + std::to_string(port) + " of " + device->describe() +
                         " is outside the pool or already reserved");
            }
        }

        add_device_locked(device);
    }
}

void DeviceStore::add_emulators(const std::vector<EmulatorPtr>& emulators) {
    if (emulators.empty()) {
        DeviceStoreException e(DeviceStoreError::NO_DEVICES_AVAILABLE,
            "No android virtual devices were found. "
            "Please start the android tool and create emulators.");
        log_critical("DeviceStore: " + std::string(e.what()));
        throw e;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    size_t admitted = 0;
    for (const auto& emulator : emulators) {
        if (!emulator) {
            continue;
        }
        if (is_emulator_started(*emulator)) {
            log_info("DeviceStore: Skipping emulator because it is already in use: " + emulator->describe());
            uint16_t port = emulator->port();
            if (port != 0 && !port_allocator_->allocate_specific(port)) {
                log_warn("DeviceStore: Port " + std::to_string(port) + " of " + emulator->describe() +
                         " is outside the pool or already reserved");
            }
            continue;
        }

        log_info("DeviceStore: Adding " + emulator->describe());
        add_device_locked(emulator);
        ++admitted;
    }

    if (admitted == 0) {
        throw DeviceStoreException(DeviceStoreError::NO_DEVICES_AVAILABLE,
            "No Android virtual devices that can be used were found. "
            "Please note that only switched off emulators can be used.");
    }
}

void DeviceStore::add_device_locked(const DevicePtr& device) {
    devices_[device->target_platform()].push_back(device);
}

// ============================================================================
// Allocation
// ============================================================================

DeviceStore::DevicePtr DeviceStore::find_device(const std::shared_ptr<const SessionCapabilities>& caps) {
    if (!caps) {
        throw DeviceStoreException(DeviceStoreError::INVALID_ARGUMENT, "Capabilities are null");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (devices_.empty()) {
        throw DeviceStoreException(DeviceStoreError::EMPTY_STORE,
            "Device store does not contain any Android device");
    }

    const std::string& android_target = caps->android_target;
    if (android_target.empty()) {
        throw DeviceStoreException(DeviceStoreError::MISSING_FIELD,
            "'androidTarget' is missing in desired capabilities");
    }

    auto platform = TargetPlatforms::from_string(android_target);
    if (!platform) {
        throw DeviceStoreException(DeviceStoreError::UNKNOWN_PLATFORM,
            "Unknown target platform requested: " + android_target);
    }

    auto platform_it = devices_.find(*platform);
    if (platform_it == devices_.end() || platform_it->second.empty()) {
        throw DeviceStoreException(DeviceStoreError::NO_MATCHING_PLATFORM,
            "Device store does not contain a device of requested platform: " + android_target);
    }

    for (const auto& device : platform_it->second) {
        if (is_emulator_started(*device)) {
            continue;
        }
        if (!device->screen_size_matches(caps->screen_size)) {
            continue;
        }
        if (find_in_use_locked(device) != devices_in_use_.end()) {
            continue;
        }

        devices_in_use_.push_back(device);
        log_info("DeviceStore: Leased " + device->describe());
        return device;
    }

    throw DeviceStoreException(DeviceStoreError::NO_DEVICE_AVAILABLE,
        "No devices are found. This can happen if the devices are in use "
        "or no device screen matches the required capabilities.");
}

void DeviceStore::release(const DevicePtr& device) {
    if (!device) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_in_use_locked(device);
    if (it == devices_in_use_.end()) {
        return;
    }

    if (EmulatorDevice* emulator = device->as_emulator()) {
        uint16_t port = emulator->port();
        try {
            emulator->stop();
        } catch (const DeviceOperationException& e) {
            log_error("DeviceStore: Failed to stop " + device->describe() + ": " + e.what());
            throw DeviceStoreException(DeviceStoreError::DEVICE_OPERATION_FAILED,
                "Failed to stop emulator: " + std::string(e.what()));
        }
        if (port != 0 && !port_allocator_->release(port)) {
            log_warn("DeviceStore: Port " + std::to_string(port) + " was not issued by the pool");
        }
    }

    devices_in_use_.erase(it);
    log_info("DeviceStore: Released " + device->describe());
}

bool DeviceStore::force_release(const DevicePtr& device) {
    if (!device) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_in_use_locked(device);
    if (it == devices_in_use_.end()) {
        return false;
    }

    devices_in_use_.erase(it);
    log_warn("DeviceStore: Lease of " + device->describe() + " dropped without stopping the device");
    return true;
}

uint16_t DeviceStore::next_emulator_port() {
    auto port = port_allocator_->allocate();
    if (!port) {
        throw DeviceStoreException(DeviceStoreError::EXHAUSTED_POOL,
            "No free emulator port between " + std::to_string(port_allocator_->start_port()) +
            " and " + std::to_string(port_allocator_->end_port()));
    }
    return *port;
}

void DeviceStore::release_emulator_port(uint16_t port) {
    if (!port_allocator_->release(port)) {
        log_warn("DeviceStore: Ignoring release of port " + std::to_string(port) + ", not issued");
    }
}

uint16_t DeviceStore::start_emulator(const DevicePtr& device) {
    EmulatorDevice* emulator = device ? device->as_emulator() : nullptr;
    if (!emulator) {
        throw DeviceStoreException(DeviceStoreError::INVALID_ARGUMENT, "Device is not an emulator");
    }
    if (!is_in_use(device)) {
        throw DeviceStoreException(DeviceStoreError::INVALID_ARGUMENT,
            "Emulator is not leased: " + device->describe());
    }

    uint16_t port;
    try {
        port = next_emulator_port();
    } catch (const DeviceStoreException& e) {
        log_error("DeviceStore: Cannot start " + device->describe() + ": " + e.what());
        release(device);
        throw;
    }

    try {
        emulator->start(port);
    } catch (const DeviceOperationException& e) {
        log_error("DeviceStore: Failed to start " + device->describe() + ": " + e.what());
        release_emulator_port(port);
        release(device);
        throw DeviceStoreException(DeviceStoreError::DEVICE_OPERATION_FAILED,
            "Failed to start emulator: " + std::string(e.what()));
    }

    return port;
}

// ============================================================================
// Inspection
// ============================================================================

std::vector<DeviceStore::DevicePtr> DeviceStore::get_devices_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_in_use_;
}

DeviceStore::DeviceMap DeviceStore::get_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

bool DeviceStore::is_in_use(const DevicePtr& device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(devices_in_use_.begin(), devices_in_use_.end(), device) != devices_in_use_.end();
}

DeviceStoreStats DeviceStore::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DeviceStoreStats stats{};
    for (const auto& [platform, devices] : devices_) {
        stats.known_devices += devices.size();
        if (!devices.empty()) {
            stats.platforms++;
        }
    }
    stats.devices_in_use = devices_in_use_.size();
    stats.allocated_ports = port_allocator_->get_allocated_count();
    stats.available_ports = port_allocator_->get_available_count();
    return stats;
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::vector<DeviceStore::DevicePtr>::iterator DeviceStore::find_in_use_locked(const DevicePtr& device) {
    return std::find(devices_in_use_.begin(), devices_in_use_.end(), device);
}

bool DeviceStore::is_emulator_started(const Device& device) {
    const EmulatorDevice* emulator = device.as_emulator();
    if (!emulator) {
        return false;
    }
    try {
        return emulator->is_started();
    } catch (const DeviceOperationException& e) {
        throw DeviceStoreException(DeviceStoreError::DEVICE_OPERATION_FAILED,
            "Cannot determine state of " + device.describe() + ": " + e.what());
    }
}

} // namespace devstore
