/**
 * @file telemetry_event.cpp
 * @brief TelemetryEvent encoding.
 */

#include "telemetry/telemetry_event.hpp"
#include "core/json.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace exo_watch {

std::optional<EventType> parse_event_type(std::string_view text) noexcept {
    for (auto type : {EventType::LogEntry, EventType::PerformanceMetrics,
                      EventType::ServiceStatus, EventType::NetworkDiscovery,
                      EventType::DebugMessage, EventType::ServerStatus}) {
        if (to_string(type) == text) return type;
    }
    return std::nullopt;
}

std::string format_iso8601(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    std::tm utc{};
    ::gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%TZ");
    return oss.str();
}

Result<std::string> encode_event(const TelemetryEvent& event) {
    std::string out;
    out.reserve(64 + event.data.size() * 32);

    out += R"({"type":)";
    json::append_string(out, to_string(event.type));
    out += R"(,"timestamp":)";
    json::append_string(out, format_iso8601(event.timestamp));
    out += R"(,"data":{)";

    bool first = true;
    for (const auto& [key, value] : event.data) {
        if (!json::is_valid_utf8(key) || !json::is_valid_utf8(value)) {
            return Error{ErrorKind::Serialization,
                         "invalid UTF-8 in " + std::string(to_string(event.type))
                         + " payload field"};
        }
        if (!first) out.push_back(',');
        first = false;
        json::append_string(out, key);
        out.push_back(':');
        json::append_string(out, value);
    }

    out += "}}\n";
    return out;
}

}  // namespace exo_watch
