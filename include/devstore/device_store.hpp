/**
 * @file device_store.hpp
 * @brief Registry that leases test devices to sessions
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Tracks the known device fleet grouped by target platform and the subset
 * currently leased to test sessions:
 * - Registration of physical devices and emulators at startup
 * - First-fit allocation by target platform and screen size
 * - Release with emulator shutdown and console port reclamation
 * - Thread-safe allocation and release
 */

#pragma once

#include "devstore/device.hpp"
#include "devstore/port_allocator.hpp"
#include "devstore/session_capabilities.hpp"
#include "devstore/target_platform.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace devstore {

/**
 * @brief Reasons a device store operation fails
 */
enum class DeviceStoreError {
    INVALID_ARGUMENT,           ///< Capability request absent or malformed
    EMPTY_STORE,                ///< No devices registered at all
    MISSING_FIELD,              ///< Target platform missing from request
    UNKNOWN_PLATFORM,           ///< Target platform not recognised
    NO_MATCHING_PLATFORM,       ///< No device registered for the platform
    NO_DEVICE_AVAILABLE,        ///< All matching devices busy or no screen size match
    NO_DEVICES_AVAILABLE,       ///< Registration admitted no usable emulator
    EXHAUSTED_POOL,             ///< No emulator port left
    DEVICE_OPERATION_FAILED     ///< Device or emulator control failed
};

/**
 * @brief Name of an error code ("NO_DEVICE_AVAILABLE")
 */
std::string device_store_error_to_string(DeviceStoreError error);

/**
 * @brief Exception raised by DeviceStore operations
 */
class DeviceStoreException : public std::runtime_error {
public:
    DeviceStoreException(DeviceStoreError error, const std::string& message)
        : std::runtime_error(message)
        , error_(error) {}

    DeviceStoreError error() const noexcept { return error_; }

    /**
     * @brief Whether retrying later (or with other requirements) may succeed
     */
    bool is_transient() const noexcept {
        return error_ == DeviceStoreError::EMPTY_STORE ||
               error_ == DeviceStoreError::NO_MATCHING_PLATFORM ||
               error_ == DeviceStoreError::NO_DEVICE_AVAILABLE ||
               error_ == DeviceStoreError::EXHAUSTED_POOL;
    }

private:
    DeviceStoreError error_;
};

/**
 * @brief Snapshot of store occupancy
 */
struct DeviceStoreStats {
    size_t known_devices;           ///< Devices registered across all platforms
    size_t platforms;               ///< Platforms with at least one device
    size_t devices_in_use;          ///< Devices currently leased
    size_t allocated_ports;         ///< Emulator ports issued
    size_t available_ports;         ///< Emulator ports left in the pool
};

/**
 * @brief DeviceStore - leases devices to test sessions
 *
 * A single mutex covers the known-device map and the leased set, so the
 * scan-and-claim in find_device() and the removal in release() are atomic
 * with respect to each other. Registration also takes the lock but is
 * expected to happen once at startup.
 *
 * Lock order: DeviceStore mutex, then the PortAllocator mutex.
 */
class DeviceStore {
public:
    using DevicePtr = std::shared_ptr<Device>;
    using EmulatorPtr = std::shared_ptr<EmulatorDevice>;
    using DeviceMap = std::map<TargetPlatform, std::vector<DevicePtr>>;

    /**
     * @brief Construct store with its own emulator port pool
     * @param port_min First emulator console port
     * @param port_max Last emulator console port
     * @param port_step Distance between console ports
     */
    explicit DeviceStore(
        uint16_t port_min = config::EMULATOR_PORT_MIN,
        uint16_t port_max = config::EMULATOR_PORT_MAX,
        uint16_t port_step = config::EMULATOR_PORT_STEP
    );

    /**
     * @brief Construct store sharing an existing port pool
     * @param port_allocator Port pool (must not be null)
     * @throws std::invalid_argument if port_allocator is null
     */
    explicit DeviceStore(std::shared_ptr<PortAllocator> port_allocator);

    ~DeviceStore() = default;

    // Disable copy and move
    DeviceStore(const DeviceStore&) = delete;
    DeviceStore& operator=(const DeviceStore&) = delete;
    DeviceStore(DeviceStore&&) = delete;
    DeviceStore& operator=(DeviceStore&&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Register devices that are ready to accept sessions
     *
     * Devices whose readiness flag is false are skipped. A running emulator
     * has its console port reserved so the pool never hands it out.
     * Registering the same device twice is not supported.
     *
     * @param devices Discovered devices
     */
    void add_devices(const std::vector<DevicePtr>& devices);

    /**
     * @brief Register emulators that are switched off
     *
     * Emulators that are already running belong to someone else and are
     * skipped; their console port is still reserved in the pool.
     *
     * @param emulators Discovered emulators
     * @throws DeviceStoreException NO_DEVICES_AVAILABLE if the list is empty or
     *         none of the emulators could be admitted
     * @throws DeviceStoreException DEVICE_OPERATION_FAILED if an emulator state
     *         query fails
     */
    void add_emulators(const std::vector<EmulatorPtr>& emulators);

    // ========================================================================
    // Allocation
    // ========================================================================

    /**
     * @brief Lease a device matching the requested capabilities
     *
     * The first device in registration order for the requested platform that
     * is not a running emulator, matches the screen size and is not leased
     * wins. The caller must call release() exactly once when the session ends.
     *
     * @param caps Desired session capabilities
     * @return Leased device
     * @throws DeviceStoreException INVALID_ARGUMENT, EMPTY_STORE, MISSING_FIELD,
     *         UNKNOWN_PLATFORM, NO_MATCHING_PLATFORM, NO_DEVICE_AVAILABLE or
     *         DEVICE_OPERATION_FAILED
     */
    DevicePtr find_device(const std::shared_ptr<const SessionCapabilities>& caps);

    /**
     * @brief Return a leased device
     *
     * Emulators are stopped and their console port goes back to the pool
     * before the lease is dropped. Releasing a device that is not leased does
     * nothing.
     *
     * @param device Device returned by find_device()
     * @throws DeviceStoreException DEVICE_OPERATION_FAILED if the emulator could
     *         not be stopped; the device then stays leased and release() may be
     *         retried
     */
    void release(const DevicePtr& device);

    /**
     * @brief Drop a lease without stopping the device
     *
     * For emulators whose stop keeps failing. The console port stays reserved
     * because the process may still be listening on it.
     *
     * @param device Leased device
     * @return true if a lease was dropped
     */
    bool force_release(const DevicePtr& device);

    /**
     * @brief Issue a console port for an emulator about to be started
     * @return Port from the pool
     * @throws DeviceStoreException EXHAUSTED_POOL if no port is left
     */
    uint16_t next_emulator_port();

    /**
     * @brief Return a port from next_emulator_port() that was never used
     *
     * For callers whose emulator failed to start. Ports of started emulators
     * are reclaimed by release().
     *
     * @param port Port to return
     */
    void release_emulator_port(uint16_t port);

    /**
     * @brief Start a leased emulator on a port from the pool
     *
     * If no port is left or the emulator fails to start, the port is
     * returned and the lease is released before the error propagates.
     *
     * @param device Device returned by find_device()
     * @return Console port the emulator was started on
     * @throws DeviceStoreException INVALID_ARGUMENT if the device is not a
     *         leased emulator
     * @throws DeviceStoreException EXHAUSTED_POOL if no port is left
     * @throws DeviceStoreException DEVICE_OPERATION_FAILED if the start fails
     */
    uint16_t start_emulator(const DevicePtr& device);

    // ========================================================================
    // Inspection
    // ========================================================================

    /**
     * @brief Devices currently leased, in lease order
     */
    std::vector<DevicePtr> get_devices_in_use() const;

    /**
     * @brief All registered devices by platform
     */
    DeviceMap get_devices() const;

    /**
     * @brief Whether the device is currently leased
     */
    bool is_in_use(const DevicePtr& device) const;

    /**
     * @brief Occupancy counts
     */
    DeviceStoreStats get_stats() const;

private:
    /// Registered devices by platform, in registration order
    DeviceMap devices_;

    /// Devices leased to sessions
    std::vector<DevicePtr> devices_in_use_;

    /// Emulator console port pool
    std::shared_ptr<PortAllocator> port_allocator_;

    /// Guards devices_ and devices_in_use_
    mutable std::mutex mutex_;

    /**
     * @brief Insert device under its platform (called under lock)
     */
    void add_device_locked(const DevicePtr& device);

    /**
     * @brief Leased-set lookup (called under lock)
     */
    std::vector<DevicePtr>::iterator find_in_use_locked(const DevicePtr& device);

    /**
     * @brief Whether the device is an emulator that is already running
     * @throws DeviceStoreException DEVICE_OPERATION_FAILED if the state query fails
     */
    static bool is_emulator_started(const Device& device);
};

} // namespace devstore
