/**
 * @file node_registry.hpp
 * @brief Thread-safe table of discovered peers keyed by network address.
 *
 * Written by the discovery listener, the announcer's scanner and the sweep
 * thread; read by telemetry through snapshot(). Change notifications are
 * delivered outside the table lock so subscribers may call back into the
 * registry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace exo_watch {

using NodeChangeCallback = std::function<void(const NodeChange&)>;
using SubscriptionId = uint64_t;

class NodeRegistry {
public:
    explicit NodeRegistry(std::shared_ptr<Logger> logger = nullptr);
    ~NodeRegistry();

    // Non-copyable
    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    /**
     * @brief Merge a sighting into the table.
     *
     * A new address gets a fresh id, online = true and an Added notification.
     * An existing address keeps its id, refreshes last-seen and descriptive
     * fields, and emits Updated. A scan sighting of a node that announced
     * itself only refreshes last-seen, because a probe carries no metadata.
     * A default-constructed `last_seen` is stamped with the current time.
     *
     * @return The node as stored after the merge.
     */
    Node upsert(Node node);

    /**
     * @brief Remove every node whose last-seen is older than `now - ttl`.
     * @return Number of nodes removed.
     */
    size_t sweep_stale(std::chrono::milliseconds ttl, Timestamp now);

    /**
     * @brief Refresh last-seen of an existing node without touching its metadata.
     * @return false when the address is unknown.
     */
    bool touch(const std::string& address, Timestamp now);

    void clear();

    [[nodiscard]] std::vector<Node> snapshot() const;
    [[nodiscard]] std::optional<Node> find(const std::string& address) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] ClusterInfo cluster_info() const;

    SubscriptionId subscribe(NodeChangeCallback callback);
    void unsubscribe(SubscriptionId id);

    /// Run sweep_stale(ttl, now) every `interval` on a background thread.
    void start_sweeper(std::chrono::milliseconds ttl, std::chrono::milliseconds interval);
    void stop_sweeper();

private:
    void notify(const std::vector<NodeChange>& changes);
    void sweep_loop(std::stop_token stop,
                    std::chrono::milliseconds ttl,
                    std::chrono::milliseconds interval);
    NodeId generate_id();

    std::shared_ptr<Logger> logger_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Node> nodes_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    std::mutex callback_mutex_;
    SubscriptionId next_subscription_{1};
    std::vector<std::pair<SubscriptionId, NodeChangeCallback>> callbacks_;

    std::jthread sweep_thread_;
};

}  // namespace exo_watch
