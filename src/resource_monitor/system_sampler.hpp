/**
 * @file system_sampler.hpp
 * @brief Periodic CPU / memory / disk / GPU utilization sampler.
 *
 * Data sources:
 *   /proc/stat                              : aggregate CPU time deltas
 *   /proc/meminfo                           : MemTotal vs MemAvailable
 *   statvfs(disk_path)                      : filesystem fill level
 *   /sys/class/drm/cardN/device/gpu_busy_percent : GPU busy (0 when absent)
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
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

struct CpuTimes {
    uint64_t user{0}, nice{0}, system{0}, idle{0};
    uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};

    [[nodiscard]] uint64_t total() const noexcept {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }
    [[nodiscard]] uint64_t active() const noexcept {
        return user + nice + system + irq + softirq + steal;
    }
};

/// Parse the aggregate "cpu ..." line of /proc/stat.
[[nodiscard]] Result<CpuTimes> parse_cpu_line(const std::string& line);

/// Busy share between two readings, 0 when no time elapsed.
[[nodiscard]] double cpu_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept;

[[nodiscard]] Result<double> memory_percent(const std::filesystem::path& meminfo);
[[nodiscard]] Result<double> disk_percent(const std::filesystem::path& mount_point);

/// Highest gpu_busy_percent across DRM cards under `drm_root`, 0 when none report it.
[[nodiscard]] double gpu_percent(const std::filesystem::path& drm_root);

struct SamplerPaths {
    std::filesystem::path proc_stat = "/proc/stat";
    std::filesystem::path meminfo = "/proc/meminfo";
    std::filesystem::path disk = "/";
    std::filesystem::path drm_root = "/sys/class/drm";
};

using SampleCallback = std::function<void(const MetricsSample&)>;

class SystemSampler {
public:
    explicit SystemSampler(SamplerPaths paths = {},
                           uint32_t interval_ms = 2000,
                           std::shared_ptr<Logger> logger = nullptr);
    ~SystemSampler();

    // Non-copyable
    SystemSampler(const SystemSampler&) = delete;
    SystemSampler& operator=(const SystemSampler&) = delete;

    void start();
    void stop();

    /// Take one reading now; CPU is measured against the previous reading.
    MetricsSample sample_once();

    void on_sample(SampleCallback callback);

    [[nodiscard]] std::optional<MetricsSample> latest() const;

private:
    void sampling_loop(std::stop_token stop);
    void warn_once(const Error& error);

    SamplerPaths paths_;
    uint32_t interval_ms_;
    std::shared_ptr<Logger> logger_;

    std::mutex sample_mutex_;
    std::optional<CpuTimes> prev_cpu_;
    std::atomic<bool> warned_{false};

    mutable std::mutex latest_mutex_;
    std::optional<MetricsSample> latest_;

    std::mutex callbacks_mutex_;
    std::vector<SampleCallback> callbacks_;

    std::jthread sampling_thread_;
};

}  // namespace exo_watch
