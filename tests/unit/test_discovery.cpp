/**
 * @file test_discovery.cpp
 * @brief Unit tests for DiscoveryListener and DiscoveryAnnouncer over loopback.
 */

#include "network/discovery_announcer.hpp"
#include "network/discovery_listener.hpp"
#include "network/udp_socket.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace exo_watch;
using namespace std::chrono_literals;

namespace {

constexpr const char* MAC_MINI =
    "EXO_DISCOVERY|MacMini|192.168.1.50|52415|mlx,api|17179869184|Apple Silicon";

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

HostProfile test_profile() {
    HostProfile profile;
    profile.name = "tester";
    profile.address = "10.9.8.7";
    profile.port = 52415;
    profile.capabilities = {"tinygrad", "api"};
    profile.memory_bytes = 4096;
    return profile;
}

DiscoveryConfig scan_only_config(std::vector<std::string> prefixes, uint32_t concurrency = 8) {
    DiscoveryConfig config;
    config.broadcast_addresses.clear();
    config.scan_prefixes = std::move(prefixes);
    config.probe_concurrency = concurrency;
    config.probe_timeout_ms = 50;
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════
// DiscoveryListener
// ═══════════════════════════════════════════════

TEST(DiscoveryListenerTest, HandleValidDatagram) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);

    EXPECT_TRUE(listener.handle_datagram(MAC_MINI));

    auto node = registry.find("192.168.1.50");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "MacMini");
    EXPECT_EQ(listener.accepted_count(), 1u);
}

TEST(DiscoveryListenerTest, GarbageNeverMutatesRegistry) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);

    EXPECT_FALSE(listener.handle_datagram("GARBAGE"));
    EXPECT_FALSE(listener.handle_datagram("EXO_DISCOVERY|only|three"));
    EXPECT_FALSE(listener.handle_datagram(""));

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(listener.dropped_count(), 3u);
    EXPECT_FALSE(listener.last_error().has_value());
}

TEST(DiscoveryListenerTest, RepeatedDatagramsYieldOneNode) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);

    for (int i = 0; i < 10; ++i) {
        listener.handle_datagram(MAC_MINI);
    }
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(listener.accepted_count(), 10u);
}

TEST(DiscoveryListenerTest, OwnAnnouncementIgnored) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);
    listener.set_self_address("192.168.1.50");

    EXPECT_FALSE(listener.handle_datagram(MAC_MINI));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(DiscoveryListenerTest, ReceivesOverLoopback) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);
    ASSERT_TRUE(listener.start().has_value());
    ASSERT_TRUE(listener.is_running());
    ASSERT_NE(listener.bound_port(), 0);

    auto sender = create_udp_socket(false);
    ASSERT_TRUE(sender.has_value());
    ASSERT_TRUE(send_datagram(*sender, "GARBAGE", "127.0.0.1", listener.bound_port()).has_value());
    ASSERT_TRUE(send_datagram(*sender, MAC_MINI, "127.0.0.1", listener.bound_port()).has_value());
    ::close(*sender);

    EXPECT_TRUE(wait_until([&] { return registry.find("192.168.1.50").has_value(); }));
    EXPECT_EQ(registry.size(), 1u);

    listener.stop();
    EXPECT_FALSE(listener.is_running());
}

TEST(DiscoveryListenerTest, StopIsIdempotent) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);
    ASSERT_TRUE(listener.start().has_value());
    listener.stop();
    listener.stop();
    EXPECT_FALSE(listener.is_running());
}

// ═══════════════════════════════════════════════
// DiscoveryAnnouncer
// ═══════════════════════════════════════════════

TEST(DiscoveryAnnouncerTest, ScanTargetsCoverHostRange) {
    auto targets = DiscoveryAnnouncer::scan_targets({"10.0.0", "192.168.1"});
    ASSERT_EQ(targets.size(), 508u);
    EXPECT_EQ(targets.front(), "10.0.0.1");
    EXPECT_EQ(targets[253], "10.0.0.254");
    EXPECT_EQ(targets.back(), "192.168.1.254");
}

TEST(DiscoveryAnnouncerTest, ScanTargetsSkipOwnAddress) {
    auto targets = DiscoveryAnnouncer::scan_targets({"10.0.0"}, "10.0.0.5");
    EXPECT_EQ(targets.size(), 253u);
    EXPECT_EQ(std::find(targets.begin(), targets.end(), "10.0.0.5"), targets.end());
}

TEST(DiscoveryAnnouncerTest, AnnouncementUsesProfile) {
    NodeRegistry registry;
    DiscoveryAnnouncer announcer(registry, test_profile(), DiscoveryConfig{});
    EXPECT_EQ(announcer.announcement(), "EXO_DISCOVERY|tester|10.9.8.7|52415|tinygrad,api|4096|");

    auto updated = test_profile();
    updated.gpu = "NVIDIA";
    announcer.update_profile(updated);
    EXPECT_EQ(announcer.profile().gpu, "NVIDIA");
    EXPECT_EQ(announcer.announcement().substr(announcer.announcement().size() - 7), "|NVIDIA");
}

TEST(DiscoveryAnnouncerTest, ScanRecordsOnlyPositiveProbes) {
    NodeRegistry registry;
    DiscoveryAnnouncer announcer(registry, test_profile(), scan_only_config({"10.0.0"}));
    announcer.set_probe_function([](const std::string& address, uint16_t, const std::string&,
                                    uint32_t) -> Result<int> {
        if (address == "10.0.0.7") return 200;
        if (address == "10.0.0.9") return 302;
        if (address == "10.0.0.11") return 404;
        return Error{ErrorKind::ProbeTimeout, "timed out"};
    });

    EXPECT_EQ(announcer.scan_once(), 2u);
    EXPECT_EQ(registry.size(), 2u);

    auto node = registry.find("10.0.0.7");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "Discovered Node");
    EXPECT_EQ(node->port, 52415);
    EXPECT_EQ(node->capabilities, (std::set<std::string>{"web_interface"}));
    EXPECT_EQ(node->memory_bytes, 0);
    EXPECT_FALSE(node->gpu.has_value());
    EXPECT_EQ(node->source, SightingSource::Scan);
    EXPECT_FALSE(registry.find("10.0.0.11").has_value());
}

TEST(DiscoveryAnnouncerTest, ScanProbesServicePortAtRoot) {
    NodeRegistry registry;
    DiscoveryAnnouncer announcer(registry, test_profile(), scan_only_config({"10.0.0"}));
    std::atomic<int> wrong{0};
    announcer.set_probe_function([&wrong](const std::string&, uint16_t port, const std::string& path,
                                          uint32_t timeout_ms) -> Result<int> {
        if (port != 52415 || path != "/" || timeout_ms != 50) ++wrong;
        return Error{ErrorKind::ProbeTimeout, "timed out"};
    });

    EXPECT_EQ(announcer.scan_once(), 0u);
    EXPECT_EQ(wrong.load(), 0);
}

TEST(DiscoveryAnnouncerTest, ScanConcurrencyIsBounded) {
    NodeRegistry registry;
    DiscoveryAnnouncer announcer(registry, test_profile(), scan_only_config({"10.0.0"}, 4));

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    std::atomic<int> calls{0};
    announcer.set_probe_function([&](const std::string&, uint16_t, const std::string&,
                                     uint32_t) -> Result<int> {
        int now = ++in_flight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(1ms);
        --in_flight;
        ++calls;
        return Error{ErrorKind::ProbeTimeout, "timed out"};
    });

    announcer.scan_once();
    EXPECT_EQ(calls.load(), 254);
    EXPECT_LE(peak.load(), 4);
}

TEST(DiscoveryAnnouncerTest, ScanDoesNotClobberAnnouncedNode) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);
    listener.handle_datagram("EXO_DISCOVERY|MacMini|10.0.0.7|52415|mlx,api|17179869184|Apple Silicon");

    DiscoveryAnnouncer announcer(registry, test_profile(), scan_only_config({"10.0.0"}));
    announcer.set_probe_function([](const std::string& address, uint16_t, const std::string&,
                                    uint32_t) -> Result<int> {
        if (address == "10.0.0.7") return 200;
        return Error{ErrorKind::ProbeTimeout, "timed out"};
    });
    announcer.scan_once();

    auto node = registry.find("10.0.0.7");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "MacMini");
    EXPECT_EQ(node->memory_bytes, 17179869184LL);
}

TEST(DiscoveryAnnouncerTest, PingRefreshesOnAnyHttpAnswer) {
    NodeRegistry registry;
    Node known;
    known.name = "peer";
    known.address = "10.0.0.3";
    known.port = 52415;
    known.last_seen = std::chrono::system_clock::now() - 50s;
    registry.upsert(known);

    DiscoveryAnnouncer announcer(registry, test_profile(), scan_only_config({}));
    std::string requested_path;
    announcer.set_probe_function([&](const std::string&, uint16_t, const std::string& path,
                                     uint32_t) -> Result<int> {
        requested_path = path;
        return 404;
    });

    ASSERT_TRUE(announcer.ping_node(known).has_value());
    EXPECT_EQ(requested_path, "/v1/chat/completions");
    EXPECT_GT(registry.find("10.0.0.3")->last_seen, known.last_seen);
}

TEST(DiscoveryAnnouncerTest, PingReportsUnreachableNode) {
    NodeRegistry registry;
    Node known;
    known.address = "10.0.0.3";
    registry.upsert(known);

    DiscoveryAnnouncer announcer(registry, test_profile(), scan_only_config({}));
    announcer.set_probe_function([](const std::string&, uint16_t, const std::string&,
                                    uint32_t) -> Result<int> {
        return Error{ErrorKind::Transport, "Connect failed: Connection refused"};
    });

    auto result = announcer.ping_node(known);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Transport);
}

TEST(DiscoveryAnnouncerTest, BroadcastReachesListener) {
    NodeRegistry registry;
    DiscoveryListener listener(registry, 0);
    ASSERT_TRUE(listener.start().has_value());

    DiscoveryConfig config;
    config.port = listener.bound_port();
    config.broadcast_addresses = {"127.0.0.1"};
    config.scan_enabled = false;
    config.announce_interval_ms = 50;

    NodeRegistry announcer_registry;
    DiscoveryAnnouncer announcer(announcer_registry, test_profile(), config);
    ASSERT_TRUE(announcer.start().has_value());

    EXPECT_TRUE(wait_until([&] { return registry.find("10.9.8.7").has_value(); }));
    auto node = registry.find("10.9.8.7");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "tester");
    EXPECT_EQ(node->memory_bytes, 4096);

    announcer.stop();
    listener.stop();
    EXPECT_FALSE(announcer.is_running());
}

TEST(DiscoveryAnnouncerTest, AnnounceOnceWithoutSocketSendsNothing) {
    NodeRegistry registry;
    DiscoveryAnnouncer announcer(registry, test_profile(), DiscoveryConfig{});
    EXPECT_EQ(announcer.announce_once(), 0u);
}
