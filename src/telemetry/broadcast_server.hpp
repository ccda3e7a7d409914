/**
 * @file broadcast_server.hpp
 * @brief Push-only TCP server fanning telemetry events out to every connected client.
 *
 * Wire format: one JSON object per line (NDJSON). Clients never receive
 * anything published before they connected. Anything a client sends is read
 * and discarded; reads exist only to notice disconnects.
 */

#pragma once

#include "core/error_latch.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "telemetry/telemetry_hub.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace exo_watch {

/**
 * @brief Per-client lifecycle.
 *
 * Connecting: accepted, not yet confirmed writable; receives no events.
 * Ready: part of the fan-out. Closed: awaiting reap by the serve loop.
 */
enum class ClientState : uint8_t {
    Connecting,
    Ready,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(ClientState state) noexcept {
    switch (state) {
        case ClientState::Connecting: return "connecting";
        case ClientState::Ready:      return "ready";
        case ClientState::Closed:     return "closed";
    }
    return "unknown";
}

class BroadcastServer final : public ITelemetrySink {
public:
    static constexpr int DEFAULT_BACKLOG = 16;
    static constexpr uint32_t SEND_TIMEOUT_MS = 1000;

    explicit BroadcastServer(std::shared_ptr<Logger> logger = nullptr);
    ~BroadcastServer() override;

    // Non-copyable
    BroadcastServer(const BroadcastServer&) = delete;
    BroadcastServer& operator=(const BroadcastServer&) = delete;

    /**
     * @brief Bind, listen and start the accept/disconnect loop.
     * @param port TCP port; 0 lets the OS choose (see bound_port()).
     *
     * Publishes a server_status event once listening.
     */
    Result<void> listen(uint16_t port, int backlog = DEFAULT_BACKLOG);

    /// Close the listener and every client immediately. Pending frames are dropped.
    void stop();

    /// Serialize once and write to every Ready client. Failing clients are closed.
    void publish(const TelemetryEvent& event) override;

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_.load(); }
    [[nodiscard]] size_t connected_clients() const;
    [[nodiscard]] size_t client_count(ClientState state) const;
    [[nodiscard]] uint64_t published_count() const noexcept { return published_.load(); }
    [[nodiscard]] std::optional<Error> last_error() const { return errors_.last(); }

private:
    struct ClientConnection {
        int fd = -1;
        std::string peer;
        ClientState state = ClientState::Connecting;
    };

    void serve_loop(std::stop_token stop);
    void accept_clients();
    void promote_client(uint64_t id);
    void drain_client(uint64_t id);
    void close_client(ClientConnection& client);
    void reap_closed();

    static bool send_all(int fd, const char* data, size_t len, uint32_t timeout_ms);

    std::shared_ptr<Logger> logger_;
    ErrorLatch errors_;

    int server_fd_ = -1;
    std::jthread serve_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex clients_mutex_;
    std::map<uint64_t, ClientConnection> clients_;
    uint64_t next_client_id_ = 1;

    std::atomic<uint64_t> published_{0};
};

}  // namespace exo_watch
