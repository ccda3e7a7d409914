/**
 * @file discovery_listener.cpp
 * @brief DiscoveryListener implementation using a polled non-blocking UDP socket.
 */

#include "network/discovery_listener.hpp"
#include "network/announcement.hpp"
#include "network/udp_socket.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "discovery.listener";

}  // anonymous namespace

DiscoveryListener::DiscoveryListener(NodeRegistry& registry,
                                     uint16_t port,
                                     std::shared_ptr<Logger> logger)
    : registry_(registry)
    , port_(port)
    , logger_(logger)
    , errors_(std::move(logger), std::string(COMPONENT)) {}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> DiscoveryListener::start() {
    if (running_) return Result<void>{};

    auto fd = create_udp_socket(false);
    if (!fd) {
        errors_.report(fd.error());
        return fd.error();
    }

    if (auto bound = bind_udp_socket(*fd, port_); !bound) {
        ::close(*fd);
        errors_.report(bound.error());
        return bound.error();
    }

    listen_fd_ = *fd;
    bound_port_ = local_port(listen_fd_);
    running_ = true;

    listen_thread_ = std::jthread([this](std::stop_token stop) {
        listen_loop(stop);
    });

    if (logger_) {
        logger_->info(COMPONENT, "Listening for announcements on UDP port "
                      + std::to_string(bound_port_.load()));
    }
    return Result<void>{};
}

void DiscoveryListener::stop() {
    if (listen_thread_.joinable()) {
        listen_thread_.request_stop();
        listen_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    running_ = false;
}

void DiscoveryListener::set_self_address(std::string address) {
    std::lock_guard lock(self_mutex_);
    self_address_ = std::move(address);
}

// ─────────────────────────────────────────────
// Datagram Handling
// ─────────────────────────────────────────────

bool DiscoveryListener::handle_datagram(std::string_view payload) {
    auto parsed = parse_announcement(payload);
    if (!parsed) {
        ++dropped_;
        return false;
    }

    {
        std::lock_guard lock(self_mutex_);
        if (!self_address_.empty() && parsed->address == self_address_) {
            return false;
        }
    }

    Node node = std::move(*parsed);
    node.last_seen = std::chrono::system_clock::now();
    registry_.upsert(std::move(node));
    ++accepted_;
    return true;
}

// ─────────────────────────────────────────────
// Listen Thread
// ─────────────────────────────────────────────

void DiscoveryListener::listen_loop(std::stop_token stop) {
    char buf[MAX_DATAGRAM_SIZE];

    while (!stop.stop_requested()) {
        // Use poll with short timeout to check stop_requested
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 100);
        if (ready == 0) continue;
        if (ready < 0) {
            if (errno == EINTR) continue;
            errors_.report(Error{ErrorKind::Transport,
                                 "poll failed: " + std::string(std::strerror(errno))});
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        sockaddr_in sender_addr{};
        socklen_t addr_len = sizeof(sender_addr);
        auto bytes_read = ::recvfrom(listen_fd_, buf, sizeof(buf), 0,
                                     reinterpret_cast<sockaddr*>(&sender_addr), &addr_len);

        if (bytes_read < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            errors_.report(Error{ErrorKind::Transport,
                                 "recvfrom failed: " + std::string(std::strerror(errno))});
            continue;
        }

        errors_.clear_streak();
        handle_datagram(std::string_view(buf, static_cast<size_t>(bytes_read)));
    }
}

}  // namespace exo_watch
