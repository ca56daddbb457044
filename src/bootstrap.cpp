/**
 * @file bootstrap.cpp
 * @brief Device store bootstrap from configuration
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/bootstrap.hpp"
#include "devstore/utilities.hpp"

namespace devstore {

using namespace devstore::utilities;

EmulatorLaunchSettings make_launch_settings(const StoreConfig& cfg) {
    EmulatorLaunchSettings settings;
    settings.binary = cfg.emulator_binary;
    settings.extra_args = cfg.emulator_args;
    settings.console_auth_token = cfg.console_auth_token;
    return settings;
}

std::vector<std::shared_ptr<Device>> make_physical_devices(const StoreConfig& cfg) {
    std::vector<std::shared_ptr<Device>> devices;
    devices.reserve(cfg.devices.size());

    for (const auto& entry : cfg.devices) {
        auto platform = TargetPlatforms::from_string(entry.target);
        if (!platform) {
            log_warn("Bootstrap: Skipping device " + entry.serial + ", unknown target " + entry.target);
            continue;
        }
        devices.push_back(std::make_shared<PhysicalDevice>(
            entry.serial, *platform, entry.screen_size, entry.ready));
    }

    return devices;
}

std::vector<std::shared_ptr<EmulatorDevice>> make_emulators(const StoreConfig& cfg) {
    EmulatorLaunchSettings settings = make_launch_settings(cfg);

    std::vector<std::shared_ptr<EmulatorDevice>> emulators;
    emulators.reserve(cfg.emulators.size());

    for (const auto& entry : cfg.emulators) {
        auto platform = TargetPlatforms::from_string(entry.target);
        if (!platform) {
            log_warn("Bootstrap: Skipping emulator " + entry.avd + ", unknown target " + entry.target);
            continue;
        }

        auto emulator = std::make_shared<AndroidEmulator>(
            entry.avd, *platform, entry.screen_size, settings);
        if (entry.running) {
            if (entry.port == 0) {
                log_warn("Bootstrap: Emulator " + entry.avd + " marked running without a port");
            }
            emulator->attach_running(entry.port);
        }
        emulators.push_back(emulator);
    }

    return emulators;
}

std::unique_ptr<DeviceStore> bootstrap_device_store(const StoreConfig& cfg) {
    log_info("Bootstrap: Creating device store (ports " + std::to_string(cfg.port_min) + "-" +
             std::to_string(cfg.port_max) + ", step " + std::to_string(cfg.port_step) + ")");

    auto store = std::make_unique<DeviceStore>(cfg.port_min, cfg.port_max, cfg.port_step);

    store->add_devices(make_physical_devices(cfg));

    if (!cfg.emulators.empty()) {
        try {
            store->add_emulators(make_emulators(cfg));
        } catch (const DeviceStoreException& e) {
            // Busy emulators are fatal only when nothing else was registered
            if (e.error() != DeviceStoreError::NO_DEVICES_AVAILABLE ||
                store->get_stats().known_devices == 0) {
                throw;
            }
            log_warn("Bootstrap: " + std::string(e.what()) + " Continuing with physical devices.");
        }
    }

    DeviceStoreStats stats = store->get_stats();
    log_info("Bootstrap: " + std::to_string(stats.known_devices) + " devices on " +
             std::to_string(stats.platforms) + " platforms available");

    return store;
}

} // namespace devstore
