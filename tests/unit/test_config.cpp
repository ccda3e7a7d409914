/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace exo_watch;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "exo_watch_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.node.service_port, 52415);
    EXPECT_EQ(config.discovery.port, 52416);
    EXPECT_EQ(config.telemetry.port, 52417);
    EXPECT_EQ(config.discovery.node_ttl_ms, 60000u);
    EXPECT_EQ(config.discovery.sweep_interval_ms, 10000u);
    EXPECT_EQ(config.discovery.announce_interval_ms, 10000u);
    EXPECT_EQ(config.discovery.broadcast_addresses.size(), 5u);
    EXPECT_EQ(config.discovery.broadcast_addresses.front(), "255.255.255.255");
    EXPECT_EQ(config.discovery.scan_prefixes.size(), 4u);
    EXPECT_TRUE(config.discovery.scan_enabled);
    EXPECT_EQ(config.discovery.probe_concurrency, 32u);
    EXPECT_EQ(config.logging.log_level, "info");
    EXPECT_TRUE(config.logging.log_dir.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [node]
        name = "studio-01"
        address = "10.1.2.3"
        service_port = 8000

        [discovery]
        port = 6100
        announce_interval_ms = 2500
        scan_interval_ms = 30000
        node_ttl_ms = 15000
        sweep_interval_ms = 1000
        broadcast_addresses = ["10.1.2.255"]
        scan_prefixes = ["10.1.2", "10.1.3"]
        scan_enabled = false
        probe_timeout_ms = 500
        probe_concurrency = 8

        [telemetry]
        port = 7000
        metrics_interval_ms = 1000
        service_poll_interval_ms = 2000
        exo_log_path = "/tmp/exo.log"
        service_unit_path = "/tmp/exo.service"
        disk_path = "/data"

        [logging]
        log_dir = "/tmp/exo_watch_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.node.name, "studio-01");
    EXPECT_EQ(config.node.address, "10.1.2.3");
    EXPECT_EQ(config.node.service_port, 8000);
    EXPECT_EQ(config.discovery.port, 6100);
    EXPECT_EQ(config.discovery.announce_interval_ms, 2500u);
    EXPECT_EQ(config.discovery.scan_interval_ms, 30000u);
    EXPECT_EQ(config.discovery.node_ttl_ms, 15000u);
    EXPECT_EQ(config.discovery.sweep_interval_ms, 1000u);
    ASSERT_EQ(config.discovery.broadcast_addresses.size(), 1u);
    EXPECT_EQ(config.discovery.broadcast_addresses[0], "10.1.2.255");
    ASSERT_EQ(config.discovery.scan_prefixes.size(), 2u);
    EXPECT_EQ(config.discovery.scan_prefixes[1], "10.1.3");
    EXPECT_FALSE(config.discovery.scan_enabled);
    EXPECT_EQ(config.discovery.probe_timeout_ms, 500u);
    EXPECT_EQ(config.discovery.probe_concurrency, 8u);
    EXPECT_EQ(config.telemetry.port, 7000);
    EXPECT_EQ(config.telemetry.metrics_interval_ms, 1000u);
    EXPECT_EQ(config.telemetry.service_poll_interval_ms, 2000u);
    EXPECT_EQ(config.telemetry.exo_log_path.string(), "/tmp/exo.log");
    EXPECT_EQ(config.telemetry.service_unit_path.string(), "/tmp/exo.service");
    EXPECT_EQ(config.telemetry.disk_path.string(), "/data");
    EXPECT_EQ(config.logging.log_dir.string(), "/tmp/exo_watch_logs");
    EXPECT_EQ(config.logging.log_level, "debug");
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_EQ(config.logging.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [node]
        name = "partial-node"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->node.name, "partial-node");
    // Defaults for everything else
    EXPECT_EQ(result->node.service_port, 52415);
    EXPECT_EQ(result->discovery.port, 52416);
    EXPECT_EQ(result->discovery.scan_prefixes.size(), 4u);
}

TEST_F(ConfigTest, OutOfRangeValuesKeepDefaults) {
    auto path = write_toml(R"(
        [discovery]
        port = 70000
        node_ttl_ms = -5
        probe_concurrency = 0

        [telemetry]
        port = "not a number"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->discovery.port, 52416);
    EXPECT_EQ(result->discovery.node_ttl_ms, 60000u);
    EXPECT_EQ(result->discovery.probe_concurrency, 32u);
    EXPECT_EQ(result->telemetry.port, 52417);
}

TEST_F(ConfigTest, UnknownKeysIgnored) {
    auto path = write_toml(R"(
        [discovery]
        port = 6200
        flavour = "strawberry"

        [extra]
        anything = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->discovery.port, 6200);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}
