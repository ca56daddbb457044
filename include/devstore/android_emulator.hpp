/**
 * @file android_emulator.hpp
 * @brief Android virtual device controlled through the emulator console
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Launches the emulator binary for an AVD on a given console port
 * - Stops it with the console "kill" command
 * - Reaps the child process, escalating to SIGKILL on timeout
 */

#pragma once

#include "devstore/device.hpp"
#include "devstore/store_config.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace devstore {

/**
 * @brief Settings shared by all emulators launched from one store
 */
struct EmulatorLaunchSettings {
    std::string binary = config::DEFAULT_EMULATOR_BINARY;   ///< Emulator executable (PATH lookup)
    std::vector<std::string> extra_args;                     ///< Appended to every launch
    std::string console_auth_token;                          ///< Empty if the console needs no auth
    std::string console_host = config::EMULATOR_CONSOLE_HOST;
    std::chrono::milliseconds stop_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config::EMULATOR_STOP_TIMEOUT);
};

/**
 * @brief AndroidEmulator - EmulatorDevice backed by the SDK emulator
 *
 * Thread-safe: state queries may run while another thread starts or stops
 * the emulator.
 */
class AndroidEmulator : public EmulatorDevice {
public:
    /**
     * @brief Construct a stopped emulator for an AVD
     * @param avd_name AVD name passed to "-avd"
     * @param platform Platform of the AVD system image
     * @param screen_size Skin size descriptor (e.g. "480x800")
     * @param settings Launch and console settings
     */
    AndroidEmulator(
        std::string avd_name,
        TargetPlatform platform,
        std::string screen_size,
        EmulatorLaunchSettings settings = EmulatorLaunchSettings()
    );

    /**
     * @brief Destructor - stops an emulator this object launched
     */
    ~AndroidEmulator() override;

    TargetPlatform target_platform() const override { return platform_; }
    std::string screen_size() const override { return screen_size_; }
    bool is_ready() const override { return true; }
    std::string describe() const override;

    bool is_started() const override;
    void start(uint16_t port) override;
    void stop() override;
    uint16_t port() const override;

    /**
     * @brief Record an emulator already running outside this process
     *
     * The emulator is marked started on the given console port; stop() will
     * shut it down through the console but has no child process to reap.
     *
     * @param port Console port of the running instance
     */
    void attach_running(uint16_t port);

    const std::string& avd_name() const { return avd_name_; }

    /**
     * @brief adb serial of the running instance ("emulator-5554")
     */
    std::string serial() const;

private:
    std::string avd_name_;
    TargetPlatform platform_;
    std::string screen_size_;
    EmulatorLaunchSettings settings_;

    /// Console port, 0 when stopped
    uint16_t port_;

    /// Whether the emulator is running
    bool started_;

    /// Child process id when launched by this object, -1 otherwise
    pid_t pid_;

    /// Guards port_, started_ and pid_
    mutable std::mutex mutex_;

    /**
     * @brief Fork and exec the emulator binary (called under lock)
     * @throws DeviceOperationException if fork or exec fails
     */
    pid_t spawn(uint16_t port);

    /**
     * @brief Send console commands to the running emulator (called under lock)
     * @throws DeviceOperationException on connection or write failure
     */
    void send_console_commands(const std::vector<std::string>& commands);

    /**
     * @brief Wait for the launched child to exit (called under lock)
     * @return true if the child was reaped within timeout
     */
    bool wait_for_exit(std::chrono::milliseconds timeout);
};

} // namespace devstore
