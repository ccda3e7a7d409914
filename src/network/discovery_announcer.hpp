/**
 * @file discovery_announcer.hpp
 * @brief Active side of discovery: periodic broadcast announce plus subnet scan.
 *
 * Two independent loops run on their own threads:
 *
 *   announce : sends our self-descriptor to a fixed list of broadcast
 *              addresses (global broadcast plus common private /24s).
 *   scan     : probes every host 1..254 of a fixed list of private /24
 *              prefixes with an HTTP GET on the service port; any 2xx/3xx
 *              answer is recorded as a peer with minimal metadata.
 *
 * The broadcast list is a heuristic, not a netmask-derived broadcast address,
 * so peers on non-standard subnets are only found by the scan, and the scan
 * reports any unrelated HTTP server on the service port as a peer.
 */

#pragma once

#include "core/config.hpp"
#include "core/error_latch.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/worker_pool.hpp"
#include "network/announcement.hpp"
#include "network/node_registry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace exo_watch {

/// Probe signature: (address, port, path, timeout_ms) -> HTTP status.
using ProbeFunction = std::function<Result<int>(const std::string&, uint16_t,
                                                const std::string&, uint32_t)>;

inline constexpr std::string_view SCAN_NODE_NAME = "Discovered Node";
inline constexpr std::string_view SCAN_NODE_CAPABILITY = "web_interface";

class DiscoveryAnnouncer {
public:
    DiscoveryAnnouncer(NodeRegistry& registry,
                       HostProfile self,
                       DiscoveryConfig config,
                       std::shared_ptr<Logger> logger = nullptr);
    ~DiscoveryAnnouncer();

    // Non-copyable
    DiscoveryAnnouncer(const DiscoveryAnnouncer&) = delete;
    DiscoveryAnnouncer& operator=(const DiscoveryAnnouncer&) = delete;

    /**
     * @brief Open the broadcast socket and launch the announce and scan loops.
     *
     * If the socket cannot be created the error is recorded and returned, but
     * the scan loop still runs.
     */
    Result<void> start();
    void stop();

    /**
     * @brief Send one announcement to every configured broadcast address.
     * @return Number of addresses the datagram was handed to.
     */
    size_t announce_once();

    /**
     * @brief Run one full scan pass and wait for it to finish.
     * @return Number of positive sightings.
     */
    size_t scan_once(std::stop_token stop = {});

    /**
     * @brief Probe a known node's chat endpoint and refresh its last-seen.
     *
     * Any HTTP response counts as alive, whatever the status code.
     */
    Result<void> ping_node(const Node& node);

    /// Replace the HTTP probe (tests inject a fake).
    void set_probe_function(ProbeFunction probe);

    /// Update the advertised descriptor (e.g. after an address change).
    void update_profile(HostProfile profile);

    [[nodiscard]] HostProfile profile() const;
    [[nodiscard]] std::string announcement() const;
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] std::optional<Error> last_error() const { return errors_.last(); }

    /**
     * @brief Every "<prefix>.<1..254>" address, skipping `exclude`.
     */
    [[nodiscard]] static std::vector<std::string> scan_targets(
        const std::vector<std::string>& prefixes, const std::string& exclude = {});

private:
    void announce_loop(std::stop_token stop);
    void scan_loop(std::stop_token stop);
    void probe_address(const std::string& address, std::stop_token stop,
                       std::atomic<size_t>& hits);
    static void sleep_until_stopped(std::stop_token stop, std::chrono::milliseconds interval);

    NodeRegistry& registry_;
    DiscoveryConfig config_;
    std::shared_ptr<Logger> logger_;
    ErrorLatch errors_;

    mutable std::mutex profile_mutex_;
    HostProfile self_;

    std::mutex probe_mutex_;
    ProbeFunction probe_;

    int broadcast_fd_ = -1;

    std::jthread announce_thread_;
    std::jthread scan_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace exo_watch
