/**
 * @file telemetry_hub.hpp
 * @brief Converts registry changes and collaborator samples into telemetry events.
 *
 * The hub holds no reference to the objects it observes. Collaborators are
 * wired to its on_*() entry points by whoever owns both sides, and every
 * event is handed synchronously to a single ITelemetrySink. There is no
 * queue: with no consumer attached an event is simply not delivered.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/telemetry_event.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace exo_watch {

/**
 * @brief Destination for telemetry events (the broadcast server in production).
 */
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;

    virtual void publish(const TelemetryEvent& event) = 0;
};

// ─────────────────────────────────────────────
// Event builders
// ─────────────────────────────────────────────

/// `is_discovering` reports whether discovery (listener or announcer) is active.
[[nodiscard]] TelemetryEvent make_node_event(const NodeChange& change, Timestamp now,
                                             bool is_discovering = false);
[[nodiscard]] TelemetryEvent make_metrics_event(const MetricsSample& sample);
[[nodiscard]] TelemetryEvent make_service_event(const ServiceStatus& status, Timestamp now);
[[nodiscard]] TelemetryEvent make_log_event(const LogEntry& entry, Timestamp now);
[[nodiscard]] TelemetryEvent make_debug_event(std::string_view source,
                                              std::string_view message,
                                              Timestamp now);
[[nodiscard]] TelemetryEvent make_server_status_event(std::string_view status,
                                                      uint16_t port,
                                                      Timestamp now);

/// One decimal place, "42.5".
[[nodiscard]] std::string format_percent(double value);

// ─────────────────────────────────────────────
// TelemetryHub
// ─────────────────────────────────────────────

class TelemetryHub {
public:
    explicit TelemetryHub(ITelemetrySink& sink, std::shared_ptr<Logger> logger = nullptr);

    // Non-copyable
    TelemetryHub(const TelemetryHub&) = delete;
    TelemetryHub& operator=(const TelemetryHub&) = delete;

    void on_node_change(const NodeChange& change);
    void on_metrics(const MetricsSample& sample);
    void on_service_status(const ServiceStatus& status);
    void on_log_entry(const LogEntry& entry);
    void publish_debug(std::string_view source, std::string_view message);

    /// Discovery state carried by every network_discovery event.
    void set_discovering(bool active) noexcept { discovering_.store(active); }
    [[nodiscard]] bool is_discovering() const noexcept { return discovering_.load(); }

    [[nodiscard]] uint64_t published_count() const noexcept { return published_.load(); }

private:
    void forward(const TelemetryEvent& event);

    ITelemetrySink& sink_;
    std::shared_ptr<Logger> logger_;
    std::atomic<uint64_t> published_{0};
    std::atomic<bool> discovering_{false};
};

}  // namespace exo_watch
