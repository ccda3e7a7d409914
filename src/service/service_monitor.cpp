/**
 * @file service_monitor.cpp
 * @brief ServiceMonitor implementation.
 */

#include "service/service_monitor.hpp"
#include "network/http_probe.hpp"

#include <chrono>
#include <condition_variable>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "service.monitor";
constexpr std::string_view LOOPBACK = "127.0.0.1";

}  // anonymous namespace

ServiceMonitor::ServiceMonitor(std::filesystem::path unit_path,
                               uint16_t service_port,
                               uint32_t poll_interval_ms,
                               std::shared_ptr<Logger> logger)
    : unit_path_(std::move(unit_path))
    , service_port_(service_port)
    , interval_ms_(poll_interval_ms)
    , logger_(std::move(logger))
    , probe_(&probe_http) {}

ServiceMonitor::~ServiceMonitor() {
    stop();
}

void ServiceMonitor::start() {
    if (poll_thread_.joinable()) return;
    poll_thread_ = std::jthread([this](std::stop_token stop) {
        poll_loop(stop);
    });
}

void ServiceMonitor::stop() {
    if (poll_thread_.joinable()) {
        poll_thread_.request_stop();
        poll_thread_.join();
    }
}

void ServiceMonitor::on_change(ServiceStatusCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void ServiceMonitor::set_probe_function(ProbeFunction probe) {
    std::lock_guard lock(probe_mutex_);
    probe_ = std::move(probe);
}

std::optional<ServiceStatus> ServiceMonitor::current() const {
    std::lock_guard lock(state_mutex_);
    return current_;
}

bool ServiceMonitor::probe_matches(const std::string& path, int expected_a, int expected_b) {
    ProbeFunction probe;
    {
        std::lock_guard lock(probe_mutex_);
        probe = probe_;
    }
    auto status = probe(std::string(LOOPBACK), service_port_, path, PROBE_TIMEOUT_MS);
    return status && (*status == expected_a || *status == expected_b);
}

ServiceStatus ServiceMonitor::poll_once() {
    ServiceStatus status;
    std::error_code ec;
    status.is_installed = std::filesystem::exists(unit_path_, ec);
    status.is_running = probe_matches("/", 200, 302);
    status.api_accessible = probe_matches("/v1/chat/completions", 200, 405);

    bool changed = false;
    {
        std::lock_guard lock(state_mutex_);
        changed = !current_ || *current_ != status;
        current_ = status;
    }
    if (!changed) return status;

    if (logger_) {
        logger_->info(COMPONENT, std::string("Service ")
                      + (status.is_running ? "running" : "not running")
                      + (status.is_installed ? ", installed" : ", not installed")
                      + (status.api_accessible ? ", API reachable" : ""));
    }

    std::vector<ServiceStatusCallback> callbacks;
    {
        std::lock_guard lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(status);
    }
    return status;
}

void ServiceMonitor::poll_loop(std::stop_token stop) {
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    while (!stop.stop_requested()) {
        poll_once();
        std::unique_lock lock(wait_mutex);
        wait_cv.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_), [] { return false; });
    }
}

}  // namespace exo_watch
