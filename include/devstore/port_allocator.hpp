/**
 * @file port_allocator.hpp
 * @brief Thread-safe emulator console port allocation
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Allocates unique console ports for emulator instances from a stepped range.
 * - Thread-safe allocation
 * - Round-robin reuse of released ports
 * - Reservation of ports held by externally started emulators
 */

#pragma once

#include "devstore/store_config.hpp"

#include <cstdint>
#include <set>
#include <mutex>
#include <optional>

namespace devstore {

/**
 * @brief PortAllocator - Thread-safe emulator port allocation
 *
 * Manages the pool of console ports handed to emulators. Only ports of the
 * form start_port + k * step are part of the pool; an Android emulator
 * occupies its console port and the adb port directly above it, hence the
 * default step of 2.
 *
 * Default range: 5554-5584, step 2 (16 ports available)
 */
class PortAllocator {
public:
    /**
     * @brief Construct port allocator with configurable range
     * @param start_port First port in allocation range (default: 5554)
     * @param end_port Last port in allocation range (default: 5584)
     * @param step Distance between consecutive pool ports (default: 2)
     * @throws std::invalid_argument if the range is empty or step is zero
     */
    explicit PortAllocator(
        uint16_t start_port = config::EMULATOR_PORT_MIN,
        uint16_t end_port = config::EMULATOR_PORT_MAX,
        uint16_t step = config::EMULATOR_PORT_STEP
    );

    ~PortAllocator() = default;

    // Disable copy and move
    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;
    PortAllocator(PortAllocator&&) = delete;
    PortAllocator& operator=(PortAllocator&&) = delete;

    /**
     * @brief Allocate next available port
     * @return Port number if successful, std::nullopt if the pool is exhausted
     */
    std::optional<uint16_t> allocate();

    /**
     * @brief Allocate specific port if available
     * @param port Desired port number
     * @return true if port was allocated, false if already in use or not in the pool
     */
    bool allocate_specific(uint16_t port);

    /**
     * @brief Release allocated port back to pool
     * @param port Port number to release
     * @return true if port was released, false if port was not allocated
     */
    bool release(uint16_t port);

    /**
     * @brief Check if port is allocated
     * @param port Port number to check
     * @return true if port is allocated, false otherwise
     */
    bool is_allocated(uint16_t port) const;

    /**
     * @brief Get number of allocated ports
     */
    size_t get_allocated_count() const;

    /**
     * @brief Get number of available ports
     */
    size_t get_available_count() const;

    /**
     * @brief Get total number of ports in the pool
     */
    size_t get_total_count() const;

    /**
     * @brief Check if any ports are available
     */
    bool has_available_ports() const;

    /**
     * @brief Reset allocator (release all ports)
     */
    void reset();

    uint16_t start_port() const { return start_port_; }
    uint16_t end_port() const { return end_port_; }
    uint16_t step() const { return step_; }

private:
    /// Start of port allocation range
    uint16_t start_port_;

    /// End of port allocation range (inclusive)
    uint16_t end_port_;

    /// Distance between pool ports
    uint16_t step_;

    /// Next port to try for allocation (round-robin)
    uint16_t next_port_;

    /// Set of currently allocated ports
    std::set<uint16_t> allocated_ports_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;

    /**
     * @brief Check if port belongs to the pool (in range and on a step boundary)
     */
    bool is_pool_port(uint16_t port) const;

    /**
     * @brief Advance next_port_ by one step, wrapping to start_port_
     */
    void advance();
};

} // namespace devstore
