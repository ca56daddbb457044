/**
 * @file bootstrap.hpp
 * @brief Builds a device store from the configured inventory
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "devstore/android_emulator.hpp"
#include "devstore/device_store.hpp"
#include "devstore/store_config.hpp"

#include <memory>
#include <vector>

namespace devstore {

/**
 * @brief Launch settings for emulators described by the configuration
 */
EmulatorLaunchSettings make_launch_settings(const StoreConfig& cfg);

/**
 * @brief Create physical devices from inventory entries
 */
std::vector<std::shared_ptr<Device>> make_physical_devices(const StoreConfig& cfg);

/**
 * @brief Create emulators from inventory entries
 *
 * Entries marked running are attached on their configured port.
 */
std::vector<std::shared_ptr<EmulatorDevice>> make_emulators(const StoreConfig& cfg);

/**
 * @brief Create and populate a device store
 *
 * Physical devices are registered first, then emulators (only if any are
 * configured). Configured emulators that are all busy only fail the
 * bootstrap when no physical device was registered either.
 *
 * @param cfg Store configuration
 * @return Device store ready for allocation
 * @throws DeviceStoreException NO_DEVICES_AVAILABLE if emulators are
 *         configured, none is usable and the store is otherwise empty
 */
std::unique_ptr<DeviceStore> bootstrap_device_store(const StoreConfig& cfg);

} // namespace devstore
