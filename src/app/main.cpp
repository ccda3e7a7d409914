/**
 * @file main.cpp
 * @brief ExoWatch daemon entry point.
 *
 * Wires all modules into the discovery and telemetry pipeline:
 *   Config → Logger → NodeRegistry → Listener/Announcer → BroadcastServer → TelemetryHub
 *   SystemSampler, ServiceMonitor and LogTail feed the hub as well.
 */

#include "core/config.hpp"
#include "core/log_sinks.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "logs/log_tail.hpp"
#include "network/discovery_announcer.hpp"
#include "network/discovery_listener.hpp"
#include "network/node_registry.hpp"
#include "resource_monitor/host_profile.hpp"
#include "resource_monitor/system_sampler.hpp"
#include "service/service_monitor.hpp"
#include "telemetry/broadcast_server.hpp"
#include "telemetry/telemetry_hub.hpp"

#include <charconv>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

using namespace exo_watch;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr std::string_view COMPONENT = "daemon";
constexpr int SUMMARY_EVERY_TICKS = 300;  // 30 s at 100 ms

struct CLIArgs {
    std::filesystem::path config_path = "config/exo_watch.toml";
    std::string name;
    std::optional<uint16_t> discovery_port;
    std::optional<uint16_t> telemetry_port;
    std::string log_dir;
    bool no_scan = false;
};

std::optional<uint16_t> parse_port(std::string_view text) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

void print_usage() {
    std::cout << "Usage: exo_watchd [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/exo_watch.toml)\n"
              << "  --name <name>            Node name to announce (default: hostname)\n"
              << "  --discovery-port <port>  UDP discovery port (default: 52416)\n"
              << "  --telemetry-port <port>  TCP telemetry port, 0 = any (default: 52417)\n"
              << "  --log-dir <path>         Log output directory (default: stdout)\n"
              << "  --no-scan                Disable the active subnet scan\n"
              << "  --help, -h               Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    auto port_arg = [&](int& i, const std::string& flag) -> uint16_t {
        auto port = parse_port(argv[++i]);
        if (!port) {
            std::cerr << "Invalid value for " << flag << ": " << argv[i] << "\n";
            std::exit(2);
        }
        return *port;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            args.name = argv[++i];
        } else if (arg == "--discovery-port" && i + 1 < argc) {
            args.discovery_port = port_arg(i, arg);
        } else if (arg == "--telemetry-port" && i + 1 < argc) {
            args.telemetry_port = port_arg(i, arg);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--no-scan") {
            args.no_scan = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::string cluster_summary(const ClusterInfo& info, size_t clients) {
    std::ostringstream oss;
    oss << "Cluster: " << info.online_nodes << "/" << info.total_nodes << " nodes online, "
        << std::fixed << std::setprecision(1) << info.total_memory_gb() << " GB total memory, "
        << info.capabilities.size() << " capabilities, "
        << clients << " telemetry client(s)";
    return oss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.name.empty()) config.node.name = args.name;
    if (args.discovery_port) config.discovery.port = *args.discovery_port;
    if (args.telemetry_port) config.telemetry.port = *args.telemetry_port;
    if (!args.log_dir.empty()) config.logging.log_dir = args.log_dir;
    if (args.no_scan) config.discovery.scan_enabled = false;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.logging.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "exo_watch",
                                                  config.logging.max_file_size_mb,
                                                  config.logging.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.logging.log_level).value_or(LogLevel::Info);
    auto logger = std::make_shared<Logger>(std::move(log_sink), level);

    auto self = detect_host_profile(config.node.service_port, config.node.name, config.node.address);
    logger->info(COMPONENT, "ExoWatch starting as " + self.name + " (" + self.address + ")");
    if (!config_result) {
        logger->warn(COMPONENT, config_result.error().message);
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Telemetry ────────────────────────────
    BroadcastServer server(logger);
    if (auto listening = server.listen(config.telemetry.port); !listening) {
        logger->warn(COMPONENT, "Telemetry disabled: " + listening.error().message);
    }
    TelemetryHub hub(server, logger);

    // ── Node Registry ────────────────────────
    NodeRegistry registry(logger);
    auto subscription = registry.subscribe([&hub](const NodeChange& change) {
        hub.on_node_change(change);
    });
    registry.start_sweeper(std::chrono::milliseconds(config.discovery.node_ttl_ms),
                           std::chrono::milliseconds(config.discovery.sweep_interval_ms));

    // ── Discovery ────────────────────────────
    hub.set_discovering(true);
    DiscoveryListener listener(registry, config.discovery.port, logger);
    listener.set_self_address(self.address);
    if (auto started = listener.start(); !started) {
        logger->warn(COMPONENT, "Passive discovery disabled: " + started.error().message);
        hub.publish_debug(COMPONENT, "Discovery listener failed: " + started.error().message);
    }

    DiscoveryAnnouncer announcer(registry, self, config.discovery, logger);
    if (auto started = announcer.start(); !started) {
        logger->warn(COMPONENT, "Broadcast announce disabled: " + started.error().message);
        hub.publish_debug(COMPONENT, "Discovery announcer failed: " + started.error().message);
    }

    hub.set_discovering(listener.is_running() || announcer.is_running());

    // ── Collaborators ────────────────────────
    SamplerPaths paths;
    paths.disk = config.telemetry.disk_path;
    SystemSampler sampler(paths, config.telemetry.metrics_interval_ms, logger);
    sampler.on_sample([&hub](const MetricsSample& sample) { hub.on_metrics(sample); });
    sampler.start();

    ServiceMonitor service(config.telemetry.service_unit_path, config.node.service_port,
                           config.telemetry.service_poll_interval_ms, logger);
    service.on_change([&hub](const ServiceStatus& status) { hub.on_service_status(status); });
    service.start();

    LogTail log_tail(config.telemetry.exo_log_path, LogTail::DEFAULT_POLL_MS, logger);
    log_tail.on_entry([&hub](const LogEntry& entry) { hub.on_log_entry(entry); });
    log_tail.start();

    hub.publish_debug(COMPONENT, "ExoWatch started");

    // ── Main Loop ────────────────────────────
    logger->info(COMPONENT, "Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        if (loop_count % SUMMARY_EVERY_TICKS == 0 && loop_count > 0) {
            logger->info(COMPONENT, cluster_summary(registry.cluster_info(), server.connected_clients()));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger->info(COMPONENT, "Shutdown requested. Cleaning up...");
    log_tail.stop();
    service.stop();
    sampler.stop();
    hub.set_discovering(false);
    announcer.stop();
    listener.stop();
    registry.stop_sweeper();
    registry.unsubscribe(subscription);
    server.stop();

    logger->info(COMPONENT, "ExoWatch stopped.");
    return 0;
}
