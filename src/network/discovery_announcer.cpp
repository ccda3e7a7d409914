/**
 * @file discovery_announcer.cpp
 * @brief DiscoveryAnnouncer implementation: UDP broadcast plus bounded HTTP scan.
 */

#include "network/discovery_announcer.hpp"
#include "network/http_probe.hpp"
#include "network/udp_socket.hpp"

#include <chrono>
#include <condition_variable>
#include <unistd.h>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "discovery.announcer";
constexpr int SCAN_FIRST_HOST = 1;
constexpr int SCAN_LAST_HOST = 254;

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

DiscoveryAnnouncer::DiscoveryAnnouncer(NodeRegistry& registry,
                                       HostProfile self,
                                       DiscoveryConfig config,
                                       std::shared_ptr<Logger> logger)
    : registry_(registry)
    , config_(std::move(config))
    , logger_(logger)
    , errors_(std::move(logger), std::string(COMPONENT))
    , self_(std::move(self))
    , probe_(&probe_http) {}

DiscoveryAnnouncer::~DiscoveryAnnouncer() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> DiscoveryAnnouncer::start() {
    if (running_) return Result<void>{};

    Result<void> outcome{};
    auto fd = create_udp_socket(true);
    if (fd) {
        broadcast_fd_ = *fd;
    } else {
        errors_.report(fd.error());
        outcome = fd.error();
    }

    running_ = true;

    if (broadcast_fd_ >= 0) {
        announce_thread_ = std::jthread([this](std::stop_token stop) {
            announce_loop(stop);
        });
    }
    if (config_.scan_enabled && !config_.scan_prefixes.empty()) {
        scan_thread_ = std::jthread([this](std::stop_token stop) {
            scan_loop(stop);
        });
    }

    if (logger_) {
        logger_->info(COMPONENT, "Announcing every "
                      + std::to_string(config_.announce_interval_ms) + "ms to "
                      + std::to_string(config_.broadcast_addresses.size())
                      + " broadcast addresses; scan "
                      + (scan_thread_.joinable()
                            ? "every " + std::to_string(config_.scan_interval_ms) + "ms"
                            : std::string("disabled")));
    }
    return outcome;
}

void DiscoveryAnnouncer::stop() {
    if (announce_thread_.joinable()) announce_thread_.request_stop();
    if (scan_thread_.joinable()) scan_thread_.request_stop();
    if (announce_thread_.joinable()) announce_thread_.join();
    if (scan_thread_.joinable()) scan_thread_.join();

    if (broadcast_fd_ >= 0) {
        ::close(broadcast_fd_);
        broadcast_fd_ = -1;
    }
    running_ = false;
}

// ─────────────────────────────────────────────
// Profile
// ─────────────────────────────────────────────

void DiscoveryAnnouncer::set_probe_function(ProbeFunction probe) {
    std::lock_guard lock(probe_mutex_);
    probe_ = std::move(probe);
}

void DiscoveryAnnouncer::update_profile(HostProfile profile) {
    std::lock_guard lock(profile_mutex_);
    self_ = std::move(profile);
}

HostProfile DiscoveryAnnouncer::profile() const {
    std::lock_guard lock(profile_mutex_);
    return self_;
}

std::string DiscoveryAnnouncer::announcement() const {
    std::lock_guard lock(profile_mutex_);
    return format_announcement(self_);
}

// ─────────────────────────────────────────────
// Broadcast Announce
// ─────────────────────────────────────────────

size_t DiscoveryAnnouncer::announce_once() {
    if (broadcast_fd_ < 0) return 0;

    const auto message = announcement();
    size_t delivered = 0;
    for (const auto& address : config_.broadcast_addresses) {
        auto sent = send_datagram(broadcast_fd_, message, address, config_.port);
        if (sent) {
            ++delivered;
        } else {
            errors_.report(sent.error());
        }
    }
    if (delivered == config_.broadcast_addresses.size()) {
        errors_.clear_streak();
    }
    return delivered;
}

void DiscoveryAnnouncer::announce_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        announce_once();
        sleep_until_stopped(stop, std::chrono::milliseconds(config_.announce_interval_ms));
    }
}

// ─────────────────────────────────────────────
// Active Scan
// ─────────────────────────────────────────────

std::vector<std::string> DiscoveryAnnouncer::scan_targets(
        const std::vector<std::string>& prefixes, const std::string& exclude) {
    std::vector<std::string> targets;
    targets.reserve(prefixes.size() * (SCAN_LAST_HOST - SCAN_FIRST_HOST + 1));
    for (const auto& prefix : prefixes) {
        for (int host = SCAN_FIRST_HOST; host <= SCAN_LAST_HOST; ++host) {
            auto address = prefix + "." + std::to_string(host);
            if (address == exclude) continue;
            targets.push_back(std::move(address));
        }
    }
    return targets;
}

size_t DiscoveryAnnouncer::scan_once(std::stop_token stop) {
    const auto self_address = profile().address;
    const auto targets = scan_targets(config_.scan_prefixes, self_address);
    std::atomic<size_t> hits{0};

    {
        WorkerPool pool(config_.probe_concurrency);
        for (const auto& address : targets) {
            if (stop.stop_requested()) break;
            pool.post([this, address, stop, &hits](std::stop_token worker_stop) {
                if (stop.stop_requested() || worker_stop.stop_requested()) return;
                probe_address(address, stop, hits);
            });
        }
        pool.wait_idle();
    }

    if (logger_) {
        logger_->debug(COMPONENT, "Scan pass over " + std::to_string(targets.size())
                       + " addresses found " + std::to_string(hits.load()) + " peers");
    }
    return hits.load();
}

void DiscoveryAnnouncer::probe_address(const std::string& address,
                                       std::stop_token stop,
                                       std::atomic<size_t>& hits) {
    ProbeFunction probe;
    {
        std::lock_guard lock(probe_mutex_);
        probe = probe_;
    }
    const auto port = profile().port;

    // Failures and timeouts mean "no peer here"
    auto status = probe(address, port, "/", config_.probe_timeout_ms);
    if (!status || !is_peer_status(*status) || stop.stop_requested()) return;

    Node node;
    node.name = std::string(SCAN_NODE_NAME);
    node.address = address;
    node.port = port;
    node.capabilities = {std::string(SCAN_NODE_CAPABILITY)};
    node.memory_bytes = 0;
    node.last_seen = std::chrono::system_clock::now();
    node.source = SightingSource::Scan;
    registry_.upsert(std::move(node));
    ++hits;
}

Result<void> DiscoveryAnnouncer::ping_node(const Node& node) {
    ProbeFunction probe;
    {
        std::lock_guard lock(probe_mutex_);
        probe = probe_;
    }

    auto status = probe(node.address, node.port, "/v1/chat/completions", config_.probe_timeout_ms);
    if (!status) {
        if (logger_) {
            logger_->warn(COMPONENT, "Failed to ping " + node.display_name() + ": " + status.error().message);
        }
        return status.error();
    }

    if (!registry_.touch(node.address, std::chrono::system_clock::now()) && logger_) {
        logger_->debug(COMPONENT, "Pinged " + node.address + " but it is no longer registered");
    }
    return Result<void>{};
}

void DiscoveryAnnouncer::scan_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        scan_once(stop);
        sleep_until_stopped(stop, std::chrono::milliseconds(config_.scan_interval_ms));
    }
}

void DiscoveryAnnouncer::sleep_until_stopped(std::stop_token stop,
                                             std::chrono::milliseconds interval) {
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;
    std::unique_lock lock(wait_mutex);
    wait_cv.wait_for(lock, stop, interval, [] { return false; });
}

}  // namespace exo_watch
