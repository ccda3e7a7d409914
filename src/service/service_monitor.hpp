/**
 * @file service_monitor.hpp
 * @brief Polls the local cluster node service and reports status transitions.
 *
 *   installed      : the service unit file exists
 *   running        : GET / on the service port answers 200 or 302
 *   api_accessible : GET /v1/chat/completions answers 200 or 405
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/discovery_announcer.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace exo_watch {

using ServiceStatusCallback = std::function<void(const ServiceStatus&)>;

class ServiceMonitor {
public:
    static constexpr uint32_t PROBE_TIMEOUT_MS = 2000;

    ServiceMonitor(std::filesystem::path unit_path,
                   uint16_t service_port,
                   uint32_t poll_interval_ms = 5000,
                   std::shared_ptr<Logger> logger = nullptr);
    ~ServiceMonitor();

    // Non-copyable
    ServiceMonitor(const ServiceMonitor&) = delete;
    ServiceMonitor& operator=(const ServiceMonitor&) = delete;

    void start();
    void stop();

    /**
     * @brief Check once and notify if this is the first poll or anything changed.
     * @return The freshly observed status.
     */
    ServiceStatus poll_once();

    void on_change(ServiceStatusCallback callback);

    /// Replace the HTTP probe (tests inject a fake).
    void set_probe_function(ProbeFunction probe);

    [[nodiscard]] std::optional<ServiceStatus> current() const;

private:
    void poll_loop(std::stop_token stop);
    bool probe_matches(const std::string& path, int expected_a, int expected_b);

    std::filesystem::path unit_path_;
    uint16_t service_port_;
    uint32_t interval_ms_;
    std::shared_ptr<Logger> logger_;

    std::mutex probe_mutex_;
    ProbeFunction probe_;

    mutable std::mutex state_mutex_;
    std::optional<ServiceStatus> current_;

    std::mutex callbacks_mutex_;
    std::vector<ServiceStatusCallback> callbacks_;

    std::jthread poll_thread_;
};

}  // namespace exo_watch
