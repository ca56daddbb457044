/**
 * @file device_store_example.cpp
 * @brief Device store example - lease a device for a test session
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates the session lifecycle against a configured inventory:
 * - Load configuration and bootstrap the store
 * - Lease a device for desired capabilities
 * - Start the emulator if the device is one
 * - Release the device
 */

#include "devstore/bootstrap.hpp"
#include "devstore/session_capabilities.hpp"
#include "devstore/utilities.hpp"

#include <iostream>
#include <memory>

using namespace devstore;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <capabilities-json> [config.json]\n";
        std::cerr << "Example: " << argv[0] << " '{\"androidTarget\":\"ANDROID16\",\"screenSize\":\"320x480\"}'\n";
        return 1;
    }

    std::string caps_json = argv[1];
    std::string config_path = argc >= 3 ? argv[2] : "";

    try {
        auto cfg = load_store_config(config_path);
        if (!cfg) {
            std::cerr << "Error: could not load configuration\n";
            return 1;
        }

        auto level = utilities::parse_log_level(cfg->log_level);
        utilities::initialize_logging(cfg->log_file, level.value_or(utilities::LogLevel::INFO));

        auto parsed = SessionCapabilities::from_json(caps_json);
        if (!parsed) {
            std::cerr << "Error: capabilities must be a JSON object\n";
            return 1;
        }
        auto caps = std::make_shared<const SessionCapabilities>(*parsed);

        auto store = bootstrap_device_store(*cfg);

        std::cout << "\n=== DevStore Example ===\n\n";
        for (const auto& [platform, devices] : store->get_devices()) {
            std::cout << TargetPlatforms::to_string(platform) << " (API "
                      << TargetPlatforms::api_level(platform) << "):\n";
            for (const auto& device : devices) {
                std::cout << "  - " << device->describe() << "\n";
            }
        }

        auto device = store->find_device(caps);
        std::cout << "\nLeased: " << device->describe() << "\n";

        if (device->as_emulator()) {
            // Releases the lease itself if no port is left or the start fails
            uint16_t port = store->start_emulator(device);
            std::cout << "Started on console port " << port << "\n";
        }

        DeviceStoreStats stats = store->get_stats();
        std::cout << "In use: " << stats.devices_in_use << "/" << stats.known_devices
                  << ", free ports: " << stats.available_ports << "\n";

        store->release(device);
        std::cout << "Released.\n";

        return 0;

    } catch (const DeviceStoreException& e) {
        std::cerr << "Error [" << device_store_error_to_string(e.error()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
