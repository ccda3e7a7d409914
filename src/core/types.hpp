/**
 * @file types.hpp
 * @brief Fundamental types used throughout ExoWatch.
 *
 * Defines Node, NodeChange, MetricsSample and the other vocabulary types
 * shared by discovery, the registry and the telemetry pipeline.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace exo_watch {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Well-known Ports
// ─────────────────────────────────────────────

inline constexpr uint16_t DEFAULT_SERVICE_PORT = 52415;    ///< Cluster node HTTP API
inline constexpr uint16_t DEFAULT_DISCOVERY_PORT = 52416;  ///< UDP announcements
inline constexpr uint16_t DEFAULT_TELEMETRY_PORT = 52417;  ///< TCP telemetry stream

// ─────────────────────────────────────────────
// Node
// ─────────────────────────────────────────────

/**
 * @brief How a node was last sighted.
 */
enum class SightingSource : uint8_t {
    Announcement,   ///< UDP self-announcement
    Scan            ///< Positive HTTP probe
};

[[nodiscard]] constexpr std::string_view to_string(SightingSource source) noexcept {
    switch (source) {
        case SightingSource::Announcement: return "announcement";
        case SightingSource::Scan:         return "scan";
    }
    return "unknown";
}

/**
 * @brief A discovered cluster participant.
 *
 * Keyed by `address` in the NodeRegistry. `id` is assigned by the registry
 * on first insert and never changes while the entry lives.
 */
struct Node {
    NodeId id;
    std::string name;
    std::string address;
    uint16_t port{DEFAULT_SERVICE_PORT};
    std::set<std::string> capabilities;
    int64_t memory_bytes{0};
    std::optional<std::string> gpu;
    Timestamp last_seen{};
    bool online{false};
    SightingSource source{SightingSource::Announcement};

    [[nodiscard]] const std::string& display_name() const noexcept {
        return name.empty() ? address : name;
    }
};

// ─────────────────────────────────────────────
// Registry Change Notifications
// ─────────────────────────────────────────────

enum class ChangeKind : uint8_t {
    Added,
    Updated,
    Removed
};

[[nodiscard]] constexpr std::string_view to_string(ChangeKind kind) noexcept {
    switch (kind) {
        case ChangeKind::Added:   return "added";
        case ChangeKind::Updated: return "updated";
        case ChangeKind::Removed: return "removed";
    }
    return "unknown";
}

struct NodeChange {
    ChangeKind kind;
    Node node;
    size_t total_nodes{0};      ///< Registry size right after the change
};

/**
 * @brief Aggregate view over every node in the registry.
 */
struct ClusterInfo {
    size_t total_nodes{0};
    size_t online_nodes{0};
    int64_t total_memory_bytes{0};
    std::set<std::string> capabilities;

    [[nodiscard]] double total_memory_gb() const noexcept {
        return static_cast<double>(total_memory_bytes) / (1024.0 * 1024.0 * 1024.0);
    }
};

// ─────────────────────────────────────────────
// External Collaborator Samples
// ─────────────────────────────────────────────

/**
 * @brief Host utilisation percentages, each in [0.0, 100.0].
 */
struct MetricsSample {
    Timestamp timestamp;
    double cpu_percent{0.0};
    double memory_percent{0.0};
    double disk_percent{0.0};
    double gpu_percent{0.0};
};

struct ServiceStatus {
    bool is_installed{false};
    bool is_running{false};
    bool api_accessible{false};

    bool operator==(const ServiceStatus&) const = default;
};

struct LogEntry {
    Timestamp timestamp;
    std::string level;
    std::string message;
    bool is_error{false};
};

}  // namespace exo_watch
