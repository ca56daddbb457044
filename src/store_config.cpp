/**
 * @file store_config.cpp
 * @brief Configuration file parsing and environment overrides
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/store_config.hpp"
#include "devstore/target_platform.hpp"
#include "devstore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <limits>

using json = nlohmann::json;

namespace devstore {

using namespace devstore::utilities;

namespace {

std::optional<uint16_t> parse_port(const json& value, const std::string& name) {
    if (!value.is_number_integer()) {
        log_error("StoreConfig: " + name + " must be an integer");
        return std::nullopt;
    }
    auto number = value.get<int64_t>();
    if (number < 0 || number > std::numeric_limits<uint16_t>::max()) {
        log_error("StoreConfig: " + name + " out of range: " + std::to_string(number));
        return std::nullopt;
    }
    return static_cast<uint16_t>(number);
}

bool read_port(const json& section, const char* key, uint16_t& out) {
    if (!section.contains(key)) {
        return true;
    }
    auto port = parse_port(section.at(key), "ports." + std::string(key));
    if (!port) {
        return false;
    }
    out = *port;
    return true;
}

bool known_target(const std::string& target, const std::string& entry_name) {
    if (TargetPlatforms::from_string(target).has_value()) {
        return true;
    }
    log_warn("StoreConfig: Skipping " + entry_name + ", unknown target platform '" + target + "'");
    return false;
}

} // namespace

// ============================================================================
// JSON Parsing
// ============================================================================

std::optional<StoreConfig> StoreConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            log_error("StoreConfig: Configuration must be a JSON object");
            return std::nullopt;
        }

        StoreConfig cfg;

        // Port pool
        if (j.contains("ports")) {
            const json& ports = j.at("ports");
            if (!read_port(ports, "min", cfg.port_min) ||
                !read_port(ports, "max", cfg.port_max) ||
                !read_port(ports, "step", cfg.port_step)) {
                return std::nullopt;
            }
        }
        if (cfg.port_min > cfg.port_max || cfg.port_step == 0) {
            log_error("StoreConfig: Invalid port range " + std::to_string(cfg.port_min) + "-" +
                      std::to_string(cfg.port_max) + " step " + std::to_string(cfg.port_step));
            return std::nullopt;
        }

        // Emulator control
        if (j.contains("emulator")) {
            const json& emulator = j.at("emulator");
            cfg.emulator_binary = emulator.value("binary", cfg.emulator_binary);
            cfg.console_auth_token = emulator.value("console_auth_token", "");
            if (emulator.contains("extra_args")) {
                cfg.emulator_args = emulator.at("extra_args").get<std::vector<std::string>>();
            }
        }

        // Logging
        if (j.contains("logging")) {
            const json& logging = j.at("logging");
            cfg.log_file = logging.value("file", "");
            std::string level = logging.value("level", cfg.log_level);
            if (parse_log_level(level).has_value()) {
                cfg.log_level = level;
            } else {
                log_warn("StoreConfig: Unknown log level '" + level + "', using " + cfg.log_level);
            }
        }

        // Physical devices
        if (j.contains("devices")) {
            for (const auto& entry : j.at("devices")) {
                PhysicalDeviceEntry device;
                device.serial = entry.value("serial", "");
                device.target = entry.value("target", "");
                device.screen_size = entry.value("screen_size", "");
                device.ready = entry.value("ready", true);

                if (device.serial.empty()) {
                    log_warn("StoreConfig: Skipping device without serial");
                    continue;
                }
                if (!known_target(device.target, "device " + device.serial)) {
                    continue;
                }
                cfg.devices.push_back(device);
            }
        }

        // Emulators
        if (j.contains("emulators")) {
            for (const auto& entry : j.at("emulators")) {
                EmulatorEntry emulator;
                emulator.avd = entry.value("avd", "");
                emulator.target = entry.value("target", "");
                emulator.screen_size = entry.value("screen_size", "");
                emulator.running = entry.value("running", false);

                if (emulator.avd.empty()) {
                    log_warn("StoreConfig: Skipping emulator without avd name");
                    continue;
                }
                if (entry.contains("port")) {
                    auto port = parse_port(entry.at("port"), "port of emulator " + emulator.avd);
                    if (!port) {
                        log_warn("StoreConfig: Skipping emulator " + emulator.avd + ", invalid port");
                        continue;
                    }
                    emulator.port = *port;
                }
                if (!known_target(emulator.target, "emulator " + emulator.avd)) {
                    continue;
                }
                cfg.emulators.push_back(emulator);
            }
        }

        return cfg;

    } catch (const json::exception& e) {
        log_error("StoreConfig: Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// File Loading
// ============================================================================

std::optional<StoreConfig> load_store_config(const std::string& path) {
    std::string config_path = path;
    if (config_path.empty()) {
        config_path = get_env(config::ENV_CONFIG_PATH, config::DEFAULT_CONFIG_PATH);
    }

    auto content = read_file(config_path);
    if (!content) {
        return std::nullopt;
    }

    auto cfg = StoreConfig::from_json(*content);
    if (!cfg) {
        log_error("StoreConfig: Invalid configuration in " + config_path);
        return std::nullopt;
    }

    apply_environment_overrides(*cfg);

    log_info("StoreConfig: Loaded " + config_path + " (" + std::to_string(cfg->devices.size()) +
             " devices, " + std::to_string(cfg->emulators.size()) + " emulators)");
    return cfg;
}

void apply_environment_overrides(StoreConfig& cfg) {
    std::string binary = get_env(config::ENV_EMULATOR_BINARY);
    if (!binary.empty()) {
        cfg.emulator_binary = binary;
    }

    std::string level = get_env(config::ENV_LOG_LEVEL);
    if (!level.empty()) {
        if (parse_log_level(level).has_value()) {
            cfg.log_level = level;
        } else {
            log_warn("StoreConfig: Ignoring unknown " + std::string(config::ENV_LOG_LEVEL) + " '" + level + "'");
        }
    }
}

} // namespace devstore
