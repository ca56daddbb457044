/**
 * @file port_allocator.cpp
 * @brief Implementation of thread-safe emulator port allocation
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/port_allocator.hpp"

#include <stdexcept>

namespace devstore {

// ============================================================================
// Constructor
// ============================================================================

PortAllocator::PortAllocator(uint16_t start_port, uint16_t end_port, uint16_t step)
    : start_port_(start_port)
    , end_port_(end_port)
    , step_(step)
    , next_port_(start_port)
{
    if (start_port_ > end_port_) {
        throw std::invalid_argument("start_port must not exceed end_port");
    }
    if (step_ == 0) {
        throw std::invalid_argument("port step must be greater than zero");
    }
}

// ============================================================================
// Port Allocation
// ============================================================================

std::optional<uint16_t> PortAllocator::allocate() {
    std::lock_guard<std::mutex> lock(mutex_);

    const size_t total = get_total_count();
    if (allocated_ports_.size() >= total) {
        return std::nullopt;
    }

    for (size_t attempts = 0; attempts < total; ++attempts) {
        uint16_t candidate = next_port_;
        advance();

        if (allocated_ports_.find(candidate) == allocated_ports_.end()) {
            allocated_ports_.insert(candidate);
            return candidate;
        }
    }

    return std::nullopt;
}

bool PortAllocator::allocate_specific(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_pool_port(port)) {
        return false;
    }

    return allocated_ports_.insert(port).second;
}

// ============================================================================
// Port Release
// ============================================================================

bool PortAllocator::release(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = allocated_ports_.find(port);
    if (it == allocated_ports_.end()) {
        return false;
    }

    allocated_ports_.erase(it);
    return true;
}

// ============================================================================
// Query Functions
// ============================================================================

bool PortAllocator::is_allocated(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_ports_.find(port) != allocated_ports_.end();
}

size_t PortAllocator::get_allocated_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_ports_.size();
}

size_t PortAllocator::get_available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_total_count() - allocated_ports_.size();
}

size_t PortAllocator::get_total_count() const {
    return static_cast<size_t>(end_port_ - start_port_) / step_ + 1;
}

bool PortAllocator::has_available_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_ports_.size() < get_total_count();
}

// ============================================================================
// Management Functions
// ============================================================================

void PortAllocator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    allocated_ports_.clear();
    next_port_ = start_port_;
}

// ============================================================================
// Private Helper Functions
// ============================================================================

bool PortAllocator::is_pool_port(uint16_t port) const {
    if (port < start_port_ || port > end_port_) {
        return false;
    }
    return (port - start_port_) % step_ == 0;
}

void PortAllocator::advance() {
    // Widen before adding so a range ending near 65535 cannot wrap
    uint32_t next = static_cast<uint32_t>(next_port_) + step_;
    if (next > end_port_) {
        next_port_ = start_port_;
    } else {
        next_port_ = static_cast<uint16_t>(next);
    }
}

} // namespace devstore
