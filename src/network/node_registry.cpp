/**
 * @file node_registry.cpp
 * @brief NodeRegistry implementation.
 */

#include "network/node_registry.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstdio>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "registry";

}  // anonymous namespace

NodeRegistry::NodeRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
    , rng_(std::random_device{}()) {}

NodeRegistry::~NodeRegistry() {
    stop_sweeper();
}

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

Node NodeRegistry::upsert(Node node) {
    if (node.last_seen == Timestamp{}) {
        node.last_seen = std::chrono::system_clock::now();
    }
    node.online = true;

    NodeChange change{ChangeKind::Added, {}, 0};
    {
        std::unique_lock lock(mutex_);
        auto it = nodes_.find(node.address);
        if (it == nodes_.end()) {
            node.id = generate_id();
            it = nodes_.emplace(node.address, std::move(node)).first;
        } else {
            change.kind = ChangeKind::Updated;
            Node& existing = it->second;
            if (node.source == SightingSource::Scan
                && existing.source == SightingSource::Announcement) {
                existing.last_seen = std::max(existing.last_seen, node.last_seen);
                existing.online = true;
            } else {
                node.id = existing.id;
                node.last_seen = std::max(existing.last_seen, node.last_seen);
                existing = std::move(node);
            }
        }
        change.node = it->second;
        change.total_nodes = nodes_.size();
    }

    if (logger_ && change.kind == ChangeKind::Added) {
        logger_->info(COMPONENT, "Node added: " + change.node.display_name()
                      + " (" + change.node.address + ", via "
                      + std::string(to_string(change.node.source)) + ")");
    }

    notify({change});
    return change.node;
}

size_t NodeRegistry::sweep_stale(std::chrono::milliseconds ttl, Timestamp now) {
    const auto cutoff = now - ttl;
    std::vector<NodeChange> removed;

    {
        std::unique_lock lock(mutex_);
        for (auto it = nodes_.begin(); it != nodes_.end(); ) {
            if (it->second.last_seen < cutoff) {
                Node gone = std::move(it->second);
                gone.online = false;
                it = nodes_.erase(it);
                removed.push_back(NodeChange{ChangeKind::Removed, std::move(gone), 0});
            } else {
                ++it;
            }
        }
        for (auto& change : removed) {
            change.total_nodes = nodes_.size();
        }
    }

    if (logger_) {
        for (const auto& change : removed) {
            logger_->info(COMPONENT, "Node expired: " + change.node.display_name()
                          + " (" + change.node.address + ")");
        }
    }

    notify(removed);
    return removed.size();
}

bool NodeRegistry::touch(const std::string& address, Timestamp now) {
    NodeChange change{ChangeKind::Updated, {}, 0};
    {
        std::unique_lock lock(mutex_);
        auto it = nodes_.find(address);
        if (it == nodes_.end()) return false;
        it->second.last_seen = std::max(it->second.last_seen, now);
        it->second.online = true;
        change.node = it->second;
        change.total_nodes = nodes_.size();
    }
    notify({change});
    return true;
}

void NodeRegistry::clear() {
    std::unique_lock lock(mutex_);
    nodes_.clear();
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<Node> NodeRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<Node> view;
    view.reserve(nodes_.size());
    for (const auto& [address, node] : nodes_) {
        view.push_back(node);
    }
    return view;
}

std::optional<Node> NodeRegistry::find(const std::string& address) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(address);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

size_t NodeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

ClusterInfo NodeRegistry::cluster_info() const {
    ClusterInfo info;
    for (const auto& node : snapshot()) {
        ++info.total_nodes;
        if (node.online) ++info.online_nodes;
        info.total_memory_bytes += node.memory_bytes;
        info.capabilities.insert(node.capabilities.begin(), node.capabilities.end());
    }
    return info;
}

// ─────────────────────────────────────────────
// Subscriptions
// ─────────────────────────────────────────────

SubscriptionId NodeRegistry::subscribe(NodeChangeCallback callback) {
    std::lock_guard lock(callback_mutex_);
    auto id = next_subscription_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

void NodeRegistry::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(callback_mutex_);
    std::erase_if(callbacks_, [id](const auto& entry) { return entry.first == id; });
}

void NodeRegistry::notify(const std::vector<NodeChange>& changes) {
    if (changes.empty()) return;

    std::vector<NodeChangeCallback> targets;
    {
        std::lock_guard lock(callback_mutex_);
        targets.reserve(callbacks_.size());
        for (const auto& [id, cb] : callbacks_) {
            targets.push_back(cb);
        }
    }

    for (const auto& change : changes) {
        for (const auto& cb : targets) {
            cb(change);
        }
    }
}

// ─────────────────────────────────────────────
// Sweep Thread
// ─────────────────────────────────────────────

void NodeRegistry::start_sweeper(std::chrono::milliseconds ttl,
                                 std::chrono::milliseconds interval) {
    stop_sweeper();
    sweep_thread_ = std::jthread([this, ttl, interval](std::stop_token stop) {
        sweep_loop(stop, ttl, interval);
    });
}

void NodeRegistry::stop_sweeper() {
    if (sweep_thread_.joinable()) {
        sweep_thread_.request_stop();
        sweep_thread_.join();
    }
}

void NodeRegistry::sweep_loop(std::stop_token stop,
                              std::chrono::milliseconds ttl,
                              std::chrono::milliseconds interval) {
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex);
            wait_cv.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        sweep_stale(ttl, std::chrono::system_clock::now());
    }
}

// ─────────────────────────────────────────────
// Identifiers
// ─────────────────────────────────────────────

NodeId NodeRegistry::generate_id() {
    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard lock(rng_mutex_);
        hi = rng_();
        lo = rng_();
    }

    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return NodeId(buf);
}

}  // namespace exo_watch
