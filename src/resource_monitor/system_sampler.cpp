/**
 * @file system_sampler.cpp
 * @brief SystemSampler: reads utilization figures from /proc, /sys and statvfs.
 */

#include "resource_monitor/system_sampler.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "resource.sampler";

std::string read_first_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Parsers
// ─────────────────────────────────────────────

Result<CpuTimes> parse_cpu_line(const std::string& line) {
    if (!line.starts_with("cpu")) {
        return Error{ErrorKind::Io, "Not a /proc/stat cpu line: " + line};
    }
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle;
    if (!iss) {
        return Error{ErrorKind::Io, "Truncated /proc/stat cpu line"};
    }
    // Older kernels stop after idle
    iss >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

double cpu_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept {
    if (curr.total() <= prev.total()) return 0.0;
    const uint64_t total_delta = curr.total() - prev.total();
    const uint64_t active_delta = curr.active() >= prev.active() ? curr.active() - prev.active() : 0;
    return std::min(100.0, 100.0 * static_cast<double>(active_delta) / static_cast<double>(total_delta));
}

Result<double> memory_percent(const std::filesystem::path& meminfo) {
    std::ifstream ifs(meminfo);
    if (!ifs.is_open()) {
        return Error{ErrorKind::Io, "Cannot open " + meminfo.string()};
    }

    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream(line.substr(9)) >> total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream(line.substr(13)) >> available_kb;
        }
    }
    if (total_kb == 0) {
        return Error{ErrorKind::Io, "MemTotal missing from " + meminfo.string()};
    }
    available_kb = std::min(available_kb, total_kb);
    return 100.0 * static_cast<double>(total_kb - available_kb) / static_cast<double>(total_kb);
}

Result<double> disk_percent(const std::filesystem::path& mount_point) {
    struct statvfs fs{};
    if (::statvfs(mount_point.c_str(), &fs) != 0 || fs.f_blocks == 0) {
        return Error{ErrorKind::Io, "statvfs failed for " + mount_point.string()};
    }
    const auto total = static_cast<double>(fs.f_blocks);
    const auto free = static_cast<double>(fs.f_bfree);
    return 100.0 * (total - free) / total;
}

double gpu_percent(const std::filesystem::path& drm_root) {
    std::error_code ec;
    double busiest = 0.0;
    for (const auto& entry : std::filesystem::directory_iterator(drm_root, ec)) {
        const auto name = entry.path().filename().string();
        if (!name.starts_with("card") || name.find('-') != std::string::npos) continue;

        auto line = read_first_line(entry.path() / "device" / "gpu_busy_percent");
        if (line.empty()) continue;

        double value = 0.0;
        std::istringstream iss(line);
        if (iss >> value) {
            busiest = std::max(busiest, std::clamp(value, 0.0, 100.0));
        }
    }
    return busiest;
}

// ─────────────────────────────────────────────
// SystemSampler
// ─────────────────────────────────────────────

SystemSampler::SystemSampler(SamplerPaths paths, uint32_t interval_ms, std::shared_ptr<Logger> logger)
    : paths_(std::move(paths)), interval_ms_(interval_ms), logger_(std::move(logger)) {}

SystemSampler::~SystemSampler() {
    stop();
}

void SystemSampler::start() {
    if (sampling_thread_.joinable()) return;

    // Prime the CPU baseline so the first published sample is meaningful
    {
        std::lock_guard lock(sample_mutex_);
        auto cpu = parse_cpu_line(read_first_line(paths_.proc_stat));
        if (cpu) prev_cpu_ = *cpu;
    }

    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void SystemSampler::stop() {
    if (sampling_thread_.joinable()) {
        sampling_thread_.request_stop();
        sampling_thread_.join();
    }
}

void SystemSampler::on_sample(SampleCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

std::optional<MetricsSample> SystemSampler::latest() const {
    std::lock_guard lock(latest_mutex_);
    return latest_;
}

MetricsSample SystemSampler::sample_once() {
    MetricsSample sample;
    sample.timestamp = std::chrono::system_clock::now();

    {
        std::lock_guard lock(sample_mutex_);
        auto cpu = parse_cpu_line(read_first_line(paths_.proc_stat));
        if (cpu) {
            if (prev_cpu_) sample.cpu_percent = cpu_percent(*prev_cpu_, *cpu);
            prev_cpu_ = *cpu;
        } else {
            warn_once(cpu.error());
        }
    }

    if (auto mem = memory_percent(paths_.meminfo)) {
        sample.memory_percent = *mem;
    } else {
        warn_once(mem.error());
    }

    if (auto disk = disk_percent(paths_.disk)) {
        sample.disk_percent = *disk;
    } else {
        warn_once(disk.error());
    }

    sample.gpu_percent = gpu_percent(paths_.drm_root);

    {
        std::lock_guard lock(latest_mutex_);
        latest_ = sample;
    }
    return sample;
}

void SystemSampler::sampling_loop(std::stop_token stop) {
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex);
            wait_cv.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_), [] { return false; });
        }
        if (stop.stop_requested()) break;

        auto sample = sample_once();

        std::vector<SampleCallback> callbacks;
        {
            std::lock_guard lock(callbacks_mutex_);
            callbacks = callbacks_;
        }
        for (const auto& cb : callbacks) {
            cb(sample);
        }
    }
}

void SystemSampler::warn_once(const Error& error) {
    // Partial readings are normal on containers; report the first one only
    if (warned_.exchange(true)) return;
    if (logger_) {
        logger_->warn(COMPONENT, error.message);
    }
}

}  // namespace exo_watch
