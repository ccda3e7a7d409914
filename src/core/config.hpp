/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace exo_watch {

struct NodeConfig {
    std::string name;                   ///< Empty = hostname
    std::string address;                ///< Empty = autodetect
    uint16_t service_port = DEFAULT_SERVICE_PORT;
};

struct DiscoveryConfig {
    uint16_t port = DEFAULT_DISCOVERY_PORT;
    uint32_t announce_interval_ms = 10000;
    uint32_t scan_interval_ms = 10000;
    uint32_t node_ttl_ms = 60000;
    uint32_t sweep_interval_ms = 10000;
    std::vector<std::string> broadcast_addresses = {
        "255.255.255.255",
        "192.168.1.255",
        "192.168.0.255",
        "10.0.0.255",
        "172.16.0.255",
    };
    std::vector<std::string> scan_prefixes = {
        "192.168.1",
        "192.168.0",
        "10.0.0",
        "172.16.0",
    };
    bool scan_enabled = true;
    uint32_t probe_timeout_ms = 2000;
    uint32_t probe_concurrency = 32;
};

struct TelemetryConfig {
    uint16_t port = DEFAULT_TELEMETRY_PORT;
    uint32_t metrics_interval_ms = 2000;
    uint32_t service_poll_interval_ms = 5000;
    std::filesystem::path exo_log_path = "/var/log/exo/exo.log";
    std::filesystem::path service_unit_path = "/etc/systemd/system/exo.service";
    std::filesystem::path disk_path = "/";
};

struct LoggingConfig {
    std::filesystem::path log_dir;      ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    DiscoveryConfig discovery;
    TelemetryConfig telemetry;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing sections and keys keep their defaults; values of the wrong type
 * or out of range are ignored in favour of the default.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace exo_watch
