/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <limits>

#include <toml++/toml.hpp>

namespace exo_watch {

namespace {

void read_port(toml::node_view<toml::node> node, uint16_t& out) {
    if (auto v = node.value<int64_t>(); v && *v >= 0 && *v <= 65535) {
        out = static_cast<uint16_t>(*v);
    }
}

void read_u32(toml::node_view<toml::node> node, uint32_t& out, uint32_t min_value = 0) {
    if (auto v = node.value<int64_t>();
        v && *v >= static_cast<int64_t>(min_value)
          && *v <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        out = static_cast<uint32_t>(*v);
    }
}

void read_string_array(toml::node_view<toml::node> node, std::vector<std::string>& out) {
    auto* arr = node.as_array();
    if (!arr) return;

    std::vector<std::string> values;
    for (const auto& element : *arr) {
        if (auto s = element.value<std::string>()) {
            values.push_back(*s);
        }
    }
    out = std::move(values);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.name = node["name"].value_or(config.node.name);
            config.node.address = node["address"].value_or(config.node.address);
            read_port(node["service_port"], config.node.service_port);
        }

        // [discovery]
        if (auto discovery = tbl["discovery"]; discovery.is_table()) {
            auto& d = config.discovery;
            read_port(discovery["port"], d.port);
            read_u32(discovery["announce_interval_ms"], d.announce_interval_ms, 1);
            read_u32(discovery["scan_interval_ms"], d.scan_interval_ms, 1);
            read_u32(discovery["node_ttl_ms"], d.node_ttl_ms, 1);
            read_u32(discovery["sweep_interval_ms"], d.sweep_interval_ms, 1);
            read_string_array(discovery["broadcast_addresses"], d.broadcast_addresses);
            read_string_array(discovery["scan_prefixes"], d.scan_prefixes);
            d.scan_enabled = discovery["scan_enabled"].value_or(d.scan_enabled);
            read_u32(discovery["probe_timeout_ms"], d.probe_timeout_ms, 1);
            read_u32(discovery["probe_concurrency"], d.probe_concurrency, 1);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            read_port(telemetry["port"], t.port);
            read_u32(telemetry["metrics_interval_ms"], t.metrics_interval_ms, 1);
            read_u32(telemetry["service_poll_interval_ms"], t.service_poll_interval_ms, 1);
            if (auto p = telemetry["exo_log_path"].value<std::string>()) t.exo_log_path = *p;
            if (auto p = telemetry["service_unit_path"].value<std::string>()) t.service_unit_path = *p;
            if (auto p = telemetry["disk_path"].value<std::string>()) t.disk_path = *p;
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            auto& l = config.logging;
            if (auto p = logging["log_dir"].value<std::string>()) l.log_dir = *p;
            l.log_level = logging["log_level"].value_or(l.log_level);
            read_u32(logging["max_file_size_mb"], l.max_file_size_mb, 1);
            read_u32(logging["rotate_count"], l.rotate_count);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace exo_watch
