/**
 * @file telemetry_event.hpp
 * @brief Typed, timestamped telemetry messages and their NDJSON encoding.
 *
 * Wire format: one JSON object per line,
 *
 *   {"type":"<type>","timestamp":"2024-01-01T12:00:00Z","data":{"k":"v",...}}\n
 *
 * All payload values are strings. The trailing newline is the frame
 * delimiter; JSON string escaping guarantees no raw newline appears inside
 * a frame.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace exo_watch {

enum class EventType : uint8_t {
    LogEntry,
    PerformanceMetrics,
    ServiceStatus,
    NetworkDiscovery,
    DebugMessage,
    ServerStatus
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::LogEntry:           return "log_entry";
        case EventType::PerformanceMetrics: return "performance_metrics";
        case EventType::ServiceStatus:      return "service_status";
        case EventType::NetworkDiscovery:   return "network_discovery";
        case EventType::DebugMessage:       return "debug_message";
        case EventType::ServerStatus:       return "server_status";
    }
    return "unknown";
}

[[nodiscard]] std::optional<EventType> parse_event_type(std::string_view text) noexcept;

using EventPayload = std::map<std::string, std::string>;

struct TelemetryEvent {
    EventType type;
    Timestamp timestamp;
    EventPayload data;
};

/// "2024-01-01T12:00:00Z" (UTC, second precision).
[[nodiscard]] std::string format_iso8601(Timestamp ts);

/**
 * @brief Encode an event as one newline-terminated JSON frame.
 *
 * Fails with ErrorKind::Serialization when any key or value is not valid
 * UTF-8.
 */
[[nodiscard]] Result<std::string> encode_event(const TelemetryEvent& event);

}  // namespace exo_watch
