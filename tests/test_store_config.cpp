/**
 * @file test_store_config.cpp
 * @brief Unit tests for device store configuration
 *
 * Tests configuration handling including:
 * - Compile-time defaults
 * - JSON parsing of every section
 * - Rejection of invalid port pools
 * - File loading and environment overrides
 */

#include <gtest/gtest.h>
#include "devstore/store_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace devstore;
namespace fs = std::filesystem;

// Test fixture for store config tests
class StoreConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "devstore_config_test";
        fs::create_directories(test_dir_);

        unsetenv(config::ENV_CONFIG_PATH);
        unsetenv(config::ENV_EMULATOR_BINARY);
        unsetenv(config::ENV_LOG_LEVEL);
    }

    void TearDown() override {
        unsetenv(config::ENV_CONFIG_PATH);
        unsetenv(config::ENV_EMULATOR_BINARY);
        unsetenv(config::ENV_LOG_LEVEL);

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path write_config(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    fs::path test_dir_;
};

// ============================================================================
// Defaults Tests
// ============================================================================

TEST_F(StoreConfigTest, PortPoolDefaults) {
    EXPECT_EQ(config::EMULATOR_PORT_MIN, 5554);
    EXPECT_EQ(config::EMULATOR_PORT_MAX, 5584);
    EXPECT_EQ(config::EMULATOR_PORT_STEP, 2);
}

TEST_F(StoreConfigTest, EmptyDocumentUsesDefaults) {
    auto cfg = StoreConfig::from_json("{}");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->port_min, config::EMULATOR_PORT_MIN);
    EXPECT_EQ(cfg->port_max, config::EMULATOR_PORT_MAX);
    EXPECT_EQ(cfg->port_step, config::EMULATOR_PORT_STEP);
    EXPECT_EQ(cfg->emulator_binary, "emulator");
    EXPECT_EQ(cfg->log_level, "info");
    EXPECT_TRUE(cfg->devices.empty());
    EXPECT_TRUE(cfg->emulators.empty());
}

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_F(StoreConfigTest, ParsesAllSections) {
    auto cfg = StoreConfig::from_json(R"({
        "ports": {"min": 5560, "max": 5570, "step": 2},
        "emulator": {
            "binary": "/opt/android-sdk/emulator/emulator",
            "console_auth_token": "s3cret",
            "extra_args": ["-no-window", "-no-audio"]
        },
        "logging": {"file": "/tmp/devstore.log", "level": "debug"},
        "devices": [
            {"serial": "0123456789ABCDEF", "target": "ANDROID19", "screen_size": "1080x1920"},
            {"serial": "FEDCBA9876543210", "target": "ANDROID16", "screen_size": "320x480", "ready": false}
        ],
        "emulators": [
            {"avd": "Nexus_S_16", "target": "ANDROID16", "screen_size": "480x800"},
            {"avd": "Nexus_4_18", "target": "ANDROID18", "screen_size": "768x1280", "running": true, "port": 5562}
        ]
    })");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->port_min, 5560);
    EXPECT_EQ(cfg->port_max, 5570);
    EXPECT_EQ(cfg->port_step, 2);

    EXPECT_EQ(cfg->emulator_binary, "/opt/android-sdk/emulator/emulator");
    EXPECT_EQ(cfg->console_auth_token, "s3cret");
    ASSERT_EQ(cfg->emulator_args.size(), 2);
    EXPECT_EQ(cfg->emulator_args[0], "-no-window");

    EXPECT_EQ(cfg->log_file, "/tmp/devstore.log");
    EXPECT_EQ(cfg->log_level, "debug");

    ASSERT_EQ(cfg->devices.size(), 2);
    EXPECT_EQ(cfg->devices[0].serial, "0123456789ABCDEF");
    EXPECT_TRUE(cfg->devices[0].ready);
    EXPECT_FALSE(cfg->devices[1].ready);

    ASSERT_EQ(cfg->emulators.size(), 2);
    EXPECT_EQ(cfg->emulators[0].avd, "Nexus_S_16");
    EXPECT_FALSE(cfg->emulators[0].running);
    EXPECT_TRUE(cfg->emulators[1].running);
    EXPECT_EQ(cfg->emulators[1].port, 5562);
}

TEST_F(StoreConfigTest, UnknownTargetEntriesDropped) {
    auto cfg = StoreConfig::from_json(R"({
        "devices": [
            {"serial": "A", "target": "ANDROID99", "screen_size": "320x480"},
            {"serial": "B", "target": "ANDROID17", "screen_size": "320x480"}
        ],
        "emulators": [
            {"avd": "old", "target": "ANDROID8", "screen_size": "320x480"}
        ]
    })");

    ASSERT_TRUE(cfg.has_value());
    ASSERT_EQ(cfg->devices.size(), 1);
    EXPECT_EQ(cfg->devices[0].serial, "B");
    EXPECT_TRUE(cfg->emulators.empty());
}

TEST_F(StoreConfigTest, EntriesWithoutIdentityDropped) {
    auto cfg = StoreConfig::from_json(R"({
        "devices": [{"target": "ANDROID17", "screen_size": "320x480"}],
        "emulators": [{"target": "ANDROID17", "screen_size": "320x480"}]
    })");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->devices.empty());
    EXPECT_TRUE(cfg->emulators.empty());
}

TEST_F(StoreConfigTest, EmulatorWithInvalidPortDropped) {
    auto cfg = StoreConfig::from_json(R"({
        "emulators": [
            {"avd": "too_high", "target": "ANDROID18", "running": true, "port": 71090},
            {"avd": "negative", "target": "ANDROID18", "running": true, "port": -1},
            {"avd": "text", "target": "ANDROID18", "running": true, "port": "5560"},
            {"avd": "valid", "target": "ANDROID18", "running": true, "port": 5560}
        ]
    })");

    ASSERT_TRUE(cfg.has_value());
    ASSERT_EQ(cfg->emulators.size(), 1);
    EXPECT_EQ(cfg->emulators[0].avd, "valid");
    EXPECT_EQ(cfg->emulators[0].port, 5560);
}

TEST_F(StoreConfigTest, UnknownLogLevelKeepsDefault) {
    auto cfg = StoreConfig::from_json(R"({"logging": {"level": "verbose"}})");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log_level, "info");
}

// ============================================================================
// Invalid Document Tests
// ============================================================================

TEST_F(StoreConfigTest, MalformedJsonRejected) {
    EXPECT_FALSE(StoreConfig::from_json("{\"ports\": ").has_value());
}

TEST_F(StoreConfigTest, NonObjectRejected) {
    EXPECT_FALSE(StoreConfig::from_json("[1, 2, 3]").has_value());
}

TEST_F(StoreConfigTest, InvertedPortRangeRejected) {
    EXPECT_FALSE(StoreConfig::from_json(R"({"ports": {"min": 5584, "max": 5554}})").has_value());
}

TEST_F(StoreConfigTest, ZeroPortStepRejected) {
    EXPECT_FALSE(StoreConfig::from_json(R"({"ports": {"step": 0}})").has_value());
}

TEST_F(StoreConfigTest, PortOutOfRangeRejected) {
    EXPECT_FALSE(StoreConfig::from_json(R"({"ports": {"max": 70000}})").has_value());
    EXPECT_FALSE(StoreConfig::from_json(R"({"ports": {"min": -1}})").has_value());
}

TEST_F(StoreConfigTest, NonIntegerPortRejected) {
    EXPECT_FALSE(StoreConfig::from_json(R"({"ports": {"min": "5554"}})").has_value());
}

TEST_F(StoreConfigTest, WrongSectionTypeRejected) {
    EXPECT_FALSE(StoreConfig::from_json(R"({"emulator": {"extra_args": "-no-window"}})").has_value());
}

// ============================================================================
// File Loading Tests
// ============================================================================

TEST_F(StoreConfigTest, LoadFromExplicitPath) {
    fs::path path = write_config("explicit.json",
        R"({"devices": [{"serial": "X1", "target": "ANDROID21", "screen_size": "720x1280"}]})");

    auto cfg = load_store_config(path.string());

    ASSERT_TRUE(cfg.has_value());
    ASSERT_EQ(cfg->devices.size(), 1);
    EXPECT_EQ(cfg->devices[0].serial, "X1");
}

TEST_F(StoreConfigTest, LoadFromEnvironmentPath) {
    fs::path path = write_config("from_env.json", R"({"ports": {"min": 5600, "max": 5610}})");
    setenv(config::ENV_CONFIG_PATH, path.c_str(), 1);

    auto cfg = load_store_config();

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->port_min, 5600);
    EXPECT_EQ(cfg->port_max, 5610);
}

TEST_F(StoreConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(load_store_config((test_dir_ / "missing.json").string()).has_value());
}

TEST_F(StoreConfigTest, LoadInvalidFileFails) {
    fs::path path = write_config("invalid.json", "not json");
    EXPECT_FALSE(load_store_config(path.string()).has_value());
}

// ============================================================================
// Environment Override Tests
// ============================================================================

TEST_F(StoreConfigTest, EnvironmentOverridesBinaryAndLevel) {
    fs::path path = write_config("override.json",
        R"({"emulator": {"binary": "emulator64-arm"}, "logging": {"level": "info"}})");
    setenv(config::ENV_EMULATOR_BINARY, "/usr/local/bin/emulator", 1);
    setenv(config::ENV_LOG_LEVEL, "error", 1);

    auto cfg = load_store_config(path.string());

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->emulator_binary, "/usr/local/bin/emulator");
    EXPECT_EQ(cfg->log_level, "error");
}

TEST_F(StoreConfigTest, UnknownEnvironmentLogLevelIgnored) {
    StoreConfig cfg;
    cfg.log_level = "warn";
    setenv(config::ENV_LOG_LEVEL, "loud", 1);

    apply_environment_overrides(cfg);

    EXPECT_EQ(cfg.log_level, "warn");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
