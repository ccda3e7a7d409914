/**
 * @file test_node_registry.cpp
 * @brief Unit tests for NodeRegistry upsert, sweep, queries and subscriptions.
 */

#include "network/announcement.hpp"
#include "network/node_registry.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace exo_watch;
using namespace std::chrono_literals;

namespace {

Node make_node(const std::string& address,
               Timestamp last_seen,
               const std::string& name = "node",
               SightingSource source = SightingSource::Announcement) {
    Node node;
    node.name = name;
    node.address = address;
    node.port = DEFAULT_SERVICE_PORT;
    node.capabilities = {"api"};
    node.memory_bytes = 1024;
    node.last_seen = last_seen;
    node.source = source;
    return node;
}

const Timestamp T0 = Timestamp{} + std::chrono::hours(24 * 365 * 50);

}  // namespace

TEST(NodeRegistryTest, EmptyByDefault) {
    NodeRegistry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.snapshot().empty());
    EXPECT_FALSE(registry.find("10.0.0.1").has_value());
}

TEST(NodeRegistryTest, AnnouncedNodeAppearsWithAllFields) {
    NodeRegistry registry;
    auto parsed = parse_announcement(
        "EXO_DISCOVERY|MacMini|192.168.1.50|52415|mlx,api|17179869184|Apple Silicon");
    ASSERT_TRUE(parsed.has_value());
    registry.upsert(std::move(*parsed));

    auto node = registry.find("192.168.1.50");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "MacMini");
    EXPECT_EQ(node->port, 52415);
    EXPECT_EQ(node->capabilities, (std::set<std::string>{"mlx", "api"}));
    EXPECT_EQ(node->memory_bytes, 17179869184LL);
    EXPECT_EQ(node->gpu.value_or(""), "Apple Silicon");
    EXPECT_TRUE(node->online);
    EXPECT_FALSE(node->id.empty());
}

TEST(NodeRegistryTest, AssignsUuidIdentifier) {
    NodeRegistry registry;
    auto node = registry.upsert(make_node("10.0.0.1", T0));
    ASSERT_EQ(node.id.size(), 36u);
    EXPECT_EQ(node.id[8], '-');
    EXPECT_EQ(node.id[14], '4');
}

TEST(NodeRegistryTest, RepeatedUpsertIsIdempotent) {
    NodeRegistry registry;
    auto first = registry.upsert(make_node("10.0.0.1", T0));

    Timestamp previous = first.last_seen;
    for (int i = 1; i <= 5; ++i) {
        auto updated = registry.upsert(make_node("10.0.0.1", T0 + std::chrono::seconds(i)));
        EXPECT_EQ(updated.id, first.id);
        EXPECT_GT(updated.last_seen, previous);
        previous = updated.last_seen;
    }
    EXPECT_EQ(registry.size(), 1u);
}

TEST(NodeRegistryTest, LastSeenNeverMovesBackwards) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0 + 10s));
    registry.upsert(make_node("10.0.0.1", T0));
    EXPECT_EQ(registry.find("10.0.0.1")->last_seen, T0 + 10s);
}

TEST(NodeRegistryTest, UpdateReplacesMetadata) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0, "old-name"));
    registry.upsert(make_node("10.0.0.1", T0 + 1s, "new-name"));
    EXPECT_EQ(registry.find("10.0.0.1")->name, "new-name");
}

TEST(NodeRegistryTest, ScanSightingKeepsAnnouncedMetadata) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0, "MacMini"));
    registry.upsert(make_node("10.0.0.1", T0 + 5s, "Discovered Node", SightingSource::Scan));

    auto node = registry.find("10.0.0.1");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "MacMini");
    EXPECT_EQ(node->source, SightingSource::Announcement);
    EXPECT_EQ(node->last_seen, T0 + 5s);
}

TEST(NodeRegistryTest, AnnouncementUpgradesScannedNode) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0, "Discovered Node", SightingSource::Scan));
    registry.upsert(make_node("10.0.0.1", T0 + 1s, "MacMini"));

    auto node = registry.find("10.0.0.1");
    EXPECT_EQ(node->name, "MacMini");
    EXPECT_EQ(node->source, SightingSource::Announcement);
}

TEST(NodeRegistryTest, SweepRemovesAfterTtlAndKeepsWithin) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0));

    EXPECT_EQ(registry.sweep_stale(60s, T0 + 55s), 0u);
    EXPECT_TRUE(registry.find("10.0.0.1").has_value());

    EXPECT_EQ(registry.sweep_stale(60s, T0 + 65s), 1u);
    EXPECT_FALSE(registry.find("10.0.0.1").has_value());
}

TEST(NodeRegistryTest, SweepRemovesOnlyStaleNodes) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0, "A"));
    registry.upsert(make_node("10.0.0.2", T0 - 65s, "B"));

    EXPECT_EQ(registry.sweep_stale(60s, T0 + 10s), 1u);
    EXPECT_TRUE(registry.find("10.0.0.1").has_value());
    EXPECT_FALSE(registry.find("10.0.0.2").has_value());
}

TEST(NodeRegistryTest, SweepAtExactTtlKeepsNode) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0));
    EXPECT_EQ(registry.sweep_stale(60s, T0 + 60s), 0u);
}

TEST(NodeRegistryTest, SubscribersSeeAddUpdateRemove) {
    NodeRegistry registry;
    std::vector<NodeChange> changes;
    registry.subscribe([&changes](const NodeChange& change) { changes.push_back(change); });

    registry.upsert(make_node("10.0.0.1", T0));
    registry.upsert(make_node("10.0.0.1", T0 + 1s));
    registry.sweep_stale(60s, T0 + 120s);

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].kind, ChangeKind::Added);
    EXPECT_EQ(changes[0].total_nodes, 1u);
    EXPECT_EQ(changes[1].kind, ChangeKind::Updated);
    EXPECT_EQ(changes[2].kind, ChangeKind::Removed);
    EXPECT_EQ(changes[2].total_nodes, 0u);
    EXPECT_FALSE(changes[2].node.online);
    EXPECT_EQ(changes[0].node.id, changes[2].node.id);
}

TEST(NodeRegistryTest, UnsubscribeStopsNotifications) {
    NodeRegistry registry;
    int calls = 0;
    auto id = registry.subscribe([&calls](const NodeChange&) { ++calls; });

    registry.upsert(make_node("10.0.0.1", T0));
    registry.unsubscribe(id);
    registry.upsert(make_node("10.0.0.2", T0));

    EXPECT_EQ(calls, 1);
}

TEST(NodeRegistryTest, SubscriberMayQueryRegistry) {
    NodeRegistry registry;
    size_t seen_size = 0;
    registry.subscribe([&](const NodeChange&) { seen_size = registry.size(); });

    registry.upsert(make_node("10.0.0.1", T0));
    EXPECT_EQ(seen_size, 1u);
}

TEST(NodeRegistryTest, TouchRefreshesKnownNodeOnly) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0));

    EXPECT_TRUE(registry.touch("10.0.0.1", T0 + 30s));
    EXPECT_EQ(registry.find("10.0.0.1")->last_seen, T0 + 30s);
    EXPECT_FALSE(registry.touch("10.0.0.9", T0 + 30s));
}

TEST(NodeRegistryTest, ClusterInfoAggregates) {
    NodeRegistry registry;
    auto a = make_node("10.0.0.1", T0);
    a.memory_bytes = 8LL * 1024 * 1024 * 1024;
    a.capabilities = {"mlx", "api"};
    auto b = make_node("10.0.0.2", T0);
    b.memory_bytes = 16LL * 1024 * 1024 * 1024;
    b.capabilities = {"cuda", "api"};
    registry.upsert(a);
    registry.upsert(b);

    auto info = registry.cluster_info();
    EXPECT_EQ(info.total_nodes, 2u);
    EXPECT_EQ(info.online_nodes, 2u);
    EXPECT_DOUBLE_EQ(info.total_memory_gb(), 24.0);
    EXPECT_EQ(info.capabilities, (std::set<std::string>{"api", "cuda", "mlx"}));
}

TEST(NodeRegistryTest, ClearEmptiesTable) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", T0));
    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST(NodeRegistryTest, BackgroundSweeperEvictsStaleNodes) {
    NodeRegistry registry;
    registry.upsert(make_node("10.0.0.1", std::chrono::system_clock::now() - 10s));
    registry.upsert(make_node("10.0.0.2", std::chrono::system_clock::now()));

    registry.start_sweeper(5s, 20ms);
    for (int i = 0; i < 100 && registry.size() > 1; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    registry.stop_sweeper();

    EXPECT_FALSE(registry.find("10.0.0.1").has_value());
    EXPECT_TRUE(registry.find("10.0.0.2").has_value());
}

TEST(NodeRegistryTest, ConcurrentUpsertsKeepOneEntryPerAddress) {
    NodeRegistry registry;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&registry, t] {
            for (int i = 0; i < 200; ++i) {
                registry.upsert(make_node("10.0.0." + std::to_string(i % 10),
                                          T0 + std::chrono::milliseconds(t * 1000 + i)));
            }
        });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(registry.size(), 10u);
}
