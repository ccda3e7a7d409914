/**
 * @file discovery_listener.hpp
 * @brief Passive receiver of peer self-announcements.
 *
 * Binds a UDP socket on the discovery port and feeds every well-formed
 * announcement into the NodeRegistry. The port is shared with arbitrary LAN
 * broadcast traffic, so anything that fails to parse is dropped silently.
 */

#pragma once

#include "core/error_latch.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "network/node_registry.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace exo_watch {

class DiscoveryListener {
public:
    static constexpr size_t MAX_DATAGRAM_SIZE = 2048;

    DiscoveryListener(NodeRegistry& registry,
                      uint16_t port,
                      std::shared_ptr<Logger> logger = nullptr);
    ~DiscoveryListener();

    // Non-copyable
    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    /**
     * @brief Bind the socket and launch the receive thread.
     *
     * A bind failure is returned and also recorded in last_error(); the
     * listener then stays stopped and the rest of the daemon keeps running.
     */
    Result<void> start();
    void stop();

    /**
     * @brief Parse one datagram and upsert it.
     * @return true if the datagram was a valid announcement that reached the registry.
     */
    bool handle_datagram(std::string_view payload);

    /// Announcements advertising this address are ignored (our own broadcasts).
    void set_self_address(std::string address);

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_.load(); }
    [[nodiscard]] uint64_t accepted_count() const noexcept { return accepted_.load(); }
    [[nodiscard]] uint64_t dropped_count() const noexcept { return dropped_.load(); }
    [[nodiscard]] std::optional<Error> last_error() const { return errors_.last(); }

private:
    void listen_loop(std::stop_token stop);

    NodeRegistry& registry_;
    uint16_t port_;
    std::shared_ptr<Logger> logger_;
    ErrorLatch errors_;

    int listen_fd_ = -1;
    std::jthread listen_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    std::mutex self_mutex_;
    std::string self_address_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace exo_watch
