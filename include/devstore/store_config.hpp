/**
 * @file store_config.hpp
 * @brief Device store defaults and configuration file loading
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Compile-time defaults plus the JSON configuration describing the
 * device inventory, emulator settings and logging.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <optional>

namespace devstore {
namespace config {

// ============================================================================
// Emulator Port Pool
// ============================================================================

/// First emulator console port
constexpr uint16_t EMULATOR_PORT_MIN = 5554;

/// Last emulator console port
constexpr uint16_t EMULATOR_PORT_MAX = 5584;

/// Console ports are even; port + 1 is taken by adb
constexpr uint16_t EMULATOR_PORT_STEP = 2;

// ============================================================================
// Emulator Control
// ============================================================================

/// Emulator executable used when none is configured
constexpr const char* DEFAULT_EMULATOR_BINARY = "emulator";

/// Emulator console host
constexpr const char* EMULATOR_CONSOLE_HOST = "127.0.0.1";

/// Time allowed for the emulator process to exit after a console kill
constexpr auto EMULATOR_STOP_TIMEOUT = std::chrono::seconds(10);

/// Grace period after SIGKILL before giving up on reaping
constexpr auto EMULATOR_KILL_GRACE = std::chrono::milliseconds(500);

// ============================================================================
// Environment
// ============================================================================

/// Path of the configuration file
constexpr const char* ENV_CONFIG_PATH = "DEVSTORE_CONFIG";

/// Overrides emulator.binary
constexpr const char* ENV_EMULATOR_BINARY = "DEVSTORE_EMULATOR";

/// Overrides logging.level
constexpr const char* ENV_LOG_LEVEL = "DEVSTORE_LOG_LEVEL";

/// Configuration file used when DEVSTORE_CONFIG is not set
constexpr const char* DEFAULT_CONFIG_PATH = "devstore.json";

} // namespace config

/**
 * @brief Physical device entry from the inventory
 */
struct PhysicalDeviceEntry {
    std::string serial;             ///< adb serial number
    std::string target;             ///< Target platform name (e.g. "ANDROID16")
    std::string screen_size;        ///< Screen size descriptor (e.g. "320x480")
    bool ready = true;              ///< Whether the device finished booting
};

/**
 * @brief Emulator (AVD) entry from the inventory
 */
struct EmulatorEntry {
    std::string avd;                ///< AVD name
    std::string target;             ///< Target platform name
    std::string screen_size;        ///< Skin / screen size descriptor
    bool running = false;           ///< Already started outside this process
    uint16_t port = 0;              ///< Console port when running
};

/**
 * @brief Full device store configuration
 */
struct StoreConfig {
    uint16_t port_min = config::EMULATOR_PORT_MIN;
    uint16_t port_max = config::EMULATOR_PORT_MAX;
    uint16_t port_step = config::EMULATOR_PORT_STEP;

    std::string emulator_binary = config::DEFAULT_EMULATOR_BINARY;
    std::string console_auth_token;             ///< Sent as "auth <token>" before console commands
    std::vector<std::string> emulator_args;     ///< Extra arguments for every emulator launch

    std::string log_file;                       ///< Empty for console only
    std::string log_level = "info";

    std::vector<PhysicalDeviceEntry> devices;
    std::vector<EmulatorEntry> emulators;

    /**
     * @brief Parse configuration from JSON text
     *
     * Missing sections keep their defaults. Entries with an unknown target
     * platform are logged and dropped.
     *
     * @param json JSON document
     * @return StoreConfig or std::nullopt if the document is invalid
     */
    static std::optional<StoreConfig> from_json(const std::string& json);
};

/**
 * @brief Load configuration from file and apply environment overrides
 * @param path Path to JSON file (empty uses DEVSTORE_CONFIG, then devstore.json)
 * @return StoreConfig or std::nullopt if the file cannot be read or parsed
 */
std::optional<StoreConfig> load_store_config(const std::string& path = "");

/**
 * @brief Apply DEVSTORE_EMULATOR and DEVSTORE_LOG_LEVEL overrides
 * @param cfg Configuration to update in place
 */
void apply_environment_overrides(StoreConfig& cfg);

} // namespace devstore
