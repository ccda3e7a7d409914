/**
 * @file telemetry_hub.cpp
 * @brief TelemetryHub implementation and payload assembly.
 */

#include "telemetry/telemetry_hub.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "telemetry.hub";

std::string bool_string(bool value) {
    return value ? "true" : "false";
}

std::string join_capabilities(const std::set<std::string>& caps) {
    std::string out;
    for (const auto& cap : caps) {
        if (!out.empty()) out.push_back(',');
        out += cap;
    }
    return out;
}

Timestamp now() {
    return std::chrono::system_clock::now();
}

}  // anonymous namespace

std::string format_percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

// ─────────────────────────────────────────────
// Event builders
// ─────────────────────────────────────────────

TelemetryEvent make_node_event(const NodeChange& change, Timestamp ts, bool is_discovering) {
    const auto& node = change.node;
    return TelemetryEvent{
        EventType::NetworkDiscovery,
        ts,
        {
            {"change", std::string(to_string(change.kind))},
            {"discovered_nodes_count", std::to_string(change.total_nodes)},
            {"is_discovering", bool_string(is_discovering)},
            {"node_id", node.id},
            {"name", node.name},
            {"address", node.address},
            {"port", std::to_string(node.port)},
            {"capabilities", join_capabilities(node.capabilities)},
            {"memory", std::to_string(node.memory_bytes)},
            {"gpu", node.gpu.value_or("")},
            {"online", bool_string(node.online)},
            {"source", std::string(to_string(node.source))},
        }
    };
}

TelemetryEvent make_metrics_event(const MetricsSample& sample) {
    return TelemetryEvent{
        EventType::PerformanceMetrics,
        sample.timestamp == Timestamp{} ? now() : sample.timestamp,
        {
            {"cpu", format_percent(sample.cpu_percent)},
            {"memory", format_percent(sample.memory_percent)},
            {"disk", format_percent(sample.disk_percent)},
            {"gpu", format_percent(sample.gpu_percent)},
        }
    };
}

TelemetryEvent make_service_event(const ServiceStatus& status, Timestamp ts) {
    return TelemetryEvent{
        EventType::ServiceStatus,
        ts,
        {
            {"is_running", bool_string(status.is_running)},
            {"is_installed", bool_string(status.is_installed)},
            {"api_accessible", bool_string(status.api_accessible)},
        }
    };
}

TelemetryEvent make_log_event(const LogEntry& entry, Timestamp ts) {
    return TelemetryEvent{
        EventType::LogEntry,
        ts,
        {
            {"level", entry.level},
            {"message", entry.message},
            {"isError", bool_string(entry.is_error)},
            {"logged_at", format_iso8601(entry.timestamp)},
        }
    };
}

TelemetryEvent make_debug_event(std::string_view source, std::string_view message, Timestamp ts) {
    return TelemetryEvent{
        EventType::DebugMessage,
        ts,
        {
            {"level", "DEBUG"},
            {"message", std::string(message)},
            {"source", std::string(source)},
        }
    };
}

TelemetryEvent make_server_status_event(std::string_view status, uint16_t port, Timestamp ts) {
    return TelemetryEvent{
        EventType::ServerStatus,
        ts,
        {
            {"status", std::string(status)},
            {"port", std::to_string(port)},
        }
    };
}

// ─────────────────────────────────────────────
// TelemetryHub
// ─────────────────────────────────────────────

TelemetryHub::TelemetryHub(ITelemetrySink& sink, std::shared_ptr<Logger> logger)
    : sink_(sink), logger_(std::move(logger)) {}

void TelemetryHub::on_node_change(const NodeChange& change) {
    forward(make_node_event(change, now(), discovering_.load()));
}

void TelemetryHub::on_metrics(const MetricsSample& sample) {
    forward(make_metrics_event(sample));
}

void TelemetryHub::on_service_status(const ServiceStatus& status) {
    if (logger_) {
        logger_->info(COMPONENT, std::string("Service status: running=")
                      + bool_string(status.is_running)
                      + " installed=" + bool_string(status.is_installed));
    }
    forward(make_service_event(status, now()));
}

void TelemetryHub::on_log_entry(const LogEntry& entry) {
    forward(make_log_event(entry, now()));
}

void TelemetryHub::publish_debug(std::string_view source, std::string_view message) {
    forward(make_debug_event(source, message, now()));
}

void TelemetryHub::forward(const TelemetryEvent& event) {
    sink_.publish(event);
    ++published_;
}

}  // namespace exo_watch
