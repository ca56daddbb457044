/**
 * @file test_port_allocator.cpp
 * @brief Unit tests for PortAllocator
 *
 * Tests emulator port allocation including:
 * - Port allocation and release
 * - Stepped console port ranges
 * - Port exhaustion handling
 * - Thread safety
 * - Edge cases
 */

#include <gtest/gtest.h>
#include "devstore/port_allocator.hpp"
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace devstore;

// Test fixture for port allocator tests
class PortAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        allocator_ = std::make_unique<PortAllocator>();
    }

    void TearDown() override {
        allocator_.reset();
    }

    std::unique_ptr<PortAllocator> allocator_;
};

// ============================================================================
// Basic Allocation Tests
// ============================================================================

TEST_F(PortAllocatorTest, AllocatePort) {
    auto port = allocator_->allocate();
    ASSERT_TRUE(port.has_value());
    EXPECT_GE(*port, 5554);
    EXPECT_LE(*port, 5584);
}

TEST_F(PortAllocatorTest, AllocatedPortsAreEvenConsolePorts) {
    while (auto port = allocator_->allocate()) {
        EXPECT_EQ(*port % 2, 0) << "port " << *port;
    }
}

TEST_F(PortAllocatorTest, AllocateMultiplePorts) {
    auto port1 = allocator_->allocate();
    auto port2 = allocator_->allocate();
    auto port3 = allocator_->allocate();

    ASSERT_TRUE(port1.has_value());
    ASSERT_TRUE(port2.has_value());
    ASSERT_TRUE(port3.has_value());

    EXPECT_NE(*port1, *port2);
    EXPECT_NE(*port2, *port3);
    EXPECT_NE(*port1, *port3);
}

TEST_F(PortAllocatorTest, IssuedPortNotReissuedUntilReleased) {
    auto first = allocator_->allocate();
    ASSERT_TRUE(first.has_value());

    // Drain the rest of the pool; none of them may be the first port
    while (auto port = allocator_->allocate()) {
        EXPECT_NE(*port, *first);
    }

    ASSERT_TRUE(allocator_->release(*first));
    auto again = allocator_->allocate();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *first);
}

TEST_F(PortAllocatorTest, AllocateSpecificPort) {
    EXPECT_TRUE(allocator_->allocate_specific(5560));
    EXPECT_TRUE(allocator_->is_allocated(5560));
}

TEST_F(PortAllocatorTest, AllocateSpecificPortTwice) {
    EXPECT_TRUE(allocator_->allocate_specific(5560));
    EXPECT_FALSE(allocator_->allocate_specific(5560));
}

TEST_F(PortAllocatorTest, AllocateSpecificOffStep) {
    // adb ports (odd) are never part of the pool
    EXPECT_FALSE(allocator_->allocate_specific(5555));
}

TEST_F(PortAllocatorTest, AllocateSpecificOutOfRange) {
    EXPECT_FALSE(allocator_->allocate_specific(5552));
    EXPECT_FALSE(allocator_->allocate_specific(5586));
}

TEST_F(PortAllocatorTest, AllocateSkipsSpecificallyReservedPort) {
    ASSERT_TRUE(allocator_->allocate_specific(5554));

    auto port = allocator_->allocate();
    ASSERT_TRUE(port.has_value());
    EXPECT_NE(*port, 5554);
}

// ============================================================================
// Release Tests
// ============================================================================

TEST_F(PortAllocatorTest, ReleasePort) {
    auto port = allocator_->allocate();
    ASSERT_TRUE(port.has_value());

    EXPECT_TRUE(allocator_->release(*port));
    EXPECT_FALSE(allocator_->is_allocated(*port));
}

TEST_F(PortAllocatorTest, ReleaseUnallocatedPort) {
    EXPECT_FALSE(allocator_->release(5570));
    EXPECT_EQ(allocator_->get_available_count(), allocator_->get_total_count());
}

TEST_F(PortAllocatorTest, ReleasePortTwice) {
    auto port = allocator_->allocate();
    ASSERT_TRUE(port.has_value());

    size_t available_before = allocator_->get_available_count();

    EXPECT_TRUE(allocator_->release(*port));
    EXPECT_FALSE(allocator_->release(*port));

    // Second release must not count the port as available twice
    EXPECT_EQ(allocator_->get_available_count(), available_before + 1);
}

// ============================================================================
// Query Tests
// ============================================================================

TEST_F(PortAllocatorTest, GetAllocatedCountGrows) {
    EXPECT_EQ(allocator_->get_allocated_count(), 0);

    allocator_->allocate();
    EXPECT_EQ(allocator_->get_allocated_count(), 1);

    allocator_->allocate();
    EXPECT_EQ(allocator_->get_allocated_count(), 2);
}

TEST_F(PortAllocatorTest, GetTotalCount) {
    // 5554, 5556, ..., 5584
    EXPECT_EQ(allocator_->get_total_count(), 16);

    allocator_->allocate();
    EXPECT_EQ(allocator_->get_allocated_count() + allocator_->get_available_count(),
              allocator_->get_total_count());
}

TEST_F(PortAllocatorTest, HasAvailablePorts) {
    EXPECT_TRUE(allocator_->has_available_ports());
}

// ============================================================================
// Range Configuration Tests
// ============================================================================

TEST_F(PortAllocatorTest, UnitStepRange) {
    PortAllocator unit(30000, 30005, 1);

    EXPECT_EQ(unit.get_total_count(), 6);

    std::set<uint16_t> allocated;
    while (auto port = unit.allocate()) {
        allocated.insert(*port);
    }

    EXPECT_EQ(allocated.size(), 6);
    for (uint16_t port = 30000; port <= 30005; port++) {
        EXPECT_EQ(allocated.count(port), 1);
    }
}

TEST_F(PortAllocatorTest, RangeEndNotOnStep) {
    // 5554, 5556, 5558; 5559 is not a console port
    PortAllocator odd_end(5554, 5559, 2);
    EXPECT_EQ(odd_end.get_total_count(), 3);
}

TEST_F(PortAllocatorTest, SinglePortRange) {
    PortAllocator single(40000, 40000, 2);

    EXPECT_EQ(single.get_total_count(), 1);

    auto port = single.allocate();
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 40000);

    EXPECT_FALSE(single.allocate().has_value());
}

TEST_F(PortAllocatorTest, RangeEndingAtMaxPort) {
    PortAllocator top(65530, 65535, 2);

    std::set<uint16_t> allocated;
    while (auto port = top.allocate()) {
        allocated.insert(*port);
    }

    EXPECT_EQ(allocated, (std::set<uint16_t>{65530, 65532, 65534}));
}

TEST_F(PortAllocatorTest, InvalidRangeThrows) {
    EXPECT_THROW(PortAllocator(6000, 5000, 2), std::invalid_argument);
}

TEST_F(PortAllocatorTest, ZeroStepThrows) {
    EXPECT_THROW(PortAllocator(5554, 5584, 0), std::invalid_argument);
}

// ============================================================================
// Exhaustion Tests
// ============================================================================

TEST_F(PortAllocatorTest, ExhaustDefaultPool) {
    std::vector<uint16_t> allocated_ports;
    while (auto port = allocator_->allocate()) {
        allocated_ports.push_back(*port);
    }

    EXPECT_EQ(allocated_ports.size(), 16);
    EXPECT_FALSE(allocator_->has_available_ports());
    EXPECT_FALSE(allocator_->allocate().has_value());

    allocator_->release(allocated_ports[3]);

    auto port = allocator_->allocate();
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, allocated_ports[3]);
}

TEST_F(PortAllocatorTest, RoundRobinAfterRelease) {
    auto first = allocator_->allocate();
    ASSERT_TRUE(first.has_value());
    allocator_->release(*first);

    // Round-robin moves on instead of handing the same port straight back
    auto second = allocator_->allocate();
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*second, *first);
}

// ============================================================================
// Reset Tests
// ============================================================================

TEST_F(PortAllocatorTest, Reset) {
    allocator_->allocate();
    allocator_->allocate();
    allocator_->allocate_specific(5584);

    allocator_->reset();

    EXPECT_EQ(allocator_->get_allocated_count(), 0);
    EXPECT_EQ(allocator_->get_available_count(), allocator_->get_total_count());

    auto port = allocator_->allocate();
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 5554);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(PortAllocatorTest, ConcurrentAllocation) {
    PortAllocator wide(20000, 40000, 2);

    const int num_threads = 10;
    const int allocations_per_thread = 100;
    std::vector<std::thread> threads;
    std::vector<std::vector<uint16_t>> allocated_ports(num_threads);

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&wide, &allocated_ports, t, allocations_per_thread]() {
            for (int i = 0; i < allocations_per_thread; i++) {
                auto port = wide.allocate();
                if (port.has_value()) {
                    allocated_ports[t].push_back(*port);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::set<uint16_t> unique_ports;
    size_t total = 0;
    for (const auto& ports : allocated_ports) {
        total += ports.size();
        unique_ports.insert(ports.begin(), ports.end());
    }

    EXPECT_EQ(total, static_cast<size_t>(num_threads * allocations_per_thread));
    EXPECT_EQ(unique_ports.size(), total);
}

TEST_F(PortAllocatorTest, ConcurrentAllocationSamePort) {
    const int num_threads = 10;
    std::vector<std::thread> threads;
    std::vector<int> results(num_threads, 0);

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, &results, t]() {
            results[t] = allocator_->allocate_specific(5570) ? 1 : 0;
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    int success_count = 0;
    for (int result : results) {
        success_count += result;
    }

    EXPECT_EQ(success_count, 1);
}

TEST_F(PortAllocatorTest, ConcurrentAllocateAndRelease) {
    const int num_threads = 10;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 50; i++) {
                auto port = allocator_->allocate();
                if (port.has_value()) {
                    allocator_->release(*port);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(allocator_->get_allocated_count(), 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
