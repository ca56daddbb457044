/**
 * @file device.hpp
 * @brief Test execution devices (physical and emulated)
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Device is the entity the store leases to test sessions. Emulator-specific
 * control (start/stop/port) is exposed through as_emulator() so callers never
 * need to inspect the concrete type.
 */

#pragma once

#include "devstore/target_platform.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace devstore {

class EmulatorDevice;

/**
 * @brief Raised when controlling a device or emulator process fails
 */
class DeviceOperationException : public std::runtime_error {
public:
    explicit DeviceOperationException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Device - a leasable test execution device
 *
 * Devices are identified by address; two devices with equal attributes are
 * still distinct devices.
 */
class Device {
public:
    virtual ~Device() = default;

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    /**
     * @brief Platform the device runs
     */
    virtual TargetPlatform target_platform() const = 0;

    /**
     * @brief Screen size descriptor (e.g. "320x480")
     */
    virtual std::string screen_size() const = 0;

    /**
     * @brief Whether the device can accept sessions
     */
    virtual bool is_ready() const = 0;

    /**
     * @brief Human-readable identification for logs
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Emulator control capability
     * @return This device as an emulator, or nullptr for physical devices
     */
    virtual EmulatorDevice* as_emulator() { return nullptr; }
    virtual const EmulatorDevice* as_emulator() const { return nullptr; }

    /**
     * @brief Check requested screen size against this device
     *
     * An empty request or "*" matches any device.
     *
     * @param requested Requested screen size descriptor
     * @return true if the device satisfies the request
     */
    bool screen_size_matches(const std::string& requested) const;

protected:
    Device() = default;
};

/**
 * @brief EmulatorDevice - a device backed by an emulator process
 */
class EmulatorDevice : public Device {
public:
    EmulatorDevice* as_emulator() override { return this; }
    const EmulatorDevice* as_emulator() const override { return this; }

    /**
     * @brief Whether the emulator process is running
     * @throws DeviceOperationException if the state cannot be determined
     */
    virtual bool is_started() const = 0;

    /**
     * @brief Launch the emulator on the given console port
     * @throws DeviceOperationException if the process cannot be started
     */
    virtual void start(uint16_t port) = 0;

    /**
     * @brief Signal the emulator to shut down and wait for it
     * @throws DeviceOperationException if the emulator could not be stopped
     */
    virtual void stop() = 0;

    /**
     * @brief Console port, 0 when not started
     */
    virtual uint16_t port() const = 0;
};

/**
 * @brief PhysicalDevice - a hardware device attached over adb
 */
class PhysicalDevice : public Device {
public:
    PhysicalDevice(
        std::string serial,
        TargetPlatform platform,
        std::string screen_size,
        bool ready = true
    );

    TargetPlatform target_platform() const override { return platform_; }
    std::string screen_size() const override { return screen_size_; }
    bool is_ready() const override { return ready_; }
    std::string describe() const override;

    const std::string& serial() const { return serial_; }

private:
    std::string serial_;
    TargetPlatform platform_;
    std::string screen_size_;
    bool ready_;
};

} // namespace devstore
