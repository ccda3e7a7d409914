/**
 * @file broadcast_server.cpp
 * @brief BroadcastServer implementation. A single poll() loop handles accepts
 *        and disconnect detection; publish() writes from the caller's thread.
 */

#include "telemetry/broadcast_server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "telemetry.server";

bool configure_socket(int fd) {
    int flag = 1;
    return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0
        && ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag)) == 0;
}

std::string describe_peer(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

BroadcastServer::BroadcastServer(std::shared_ptr<Logger> logger)
    : logger_(logger), errors_(std::move(logger), std::string(COMPONENT)) {}

BroadcastServer::~BroadcastServer() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> BroadcastServer::listen(uint16_t port, int backlog) {
    if (server_fd_ >= 0) {
        return Error{ErrorKind::Transport, "Already listening"};
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        Error err{ErrorKind::Transport, "Failed to create server socket: " + std::string(std::strerror(errno))};
        errors_.report(err);
        return err;
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        Error err{ErrorKind::Transport, "Bind to TCP port " + std::to_string(port)
                  + " failed: " + std::string(std::strerror(errno))};
        ::close(fd);
        errors_.report(err);
        return err;
    }

    if (::listen(fd, backlog) < 0) {
        Error err{ErrorKind::Transport, "Listen failed: " + std::string(std::strerror(errno))};
        ::close(fd);
        errors_.report(err);
        return err;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    server_fd_ = fd;
    running_ = true;
    serve_thread_ = std::jthread([this](std::stop_token stop) {
        serve_loop(stop);
    });

    if (logger_) {
        logger_->info(COMPONENT, "Telemetry server listening on TCP port "
                      + std::to_string(bound_port_.load()));
    }
    publish(make_server_status_event("running", bound_port_.load(),
                                     std::chrono::system_clock::now()));
    return Result<void>{};
}

void BroadcastServer::stop() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    size_t closed = 0;
    {
        std::lock_guard lock(clients_mutex_);
        for (auto& [id, client] : clients_) {
            if (client.fd >= 0) {
                ::shutdown(client.fd, SHUT_RDWR);
                ::close(client.fd);
                client.fd = -1;
                ++closed;
            }
            client.state = ClientState::Closed;
        }
        clients_.clear();
    }

    if (running_.exchange(false) && logger_) {
        logger_->info(COMPONENT, "Telemetry server stopped, closed "
                      + std::to_string(closed) + " client(s)");
    }
}

size_t BroadcastServer::connected_clients() const {
    return client_count(ClientState::Ready);
}

size_t BroadcastServer::client_count(ClientState state) const {
    std::lock_guard lock(clients_mutex_);
    size_t count = 0;
    for (const auto& [id, client] : clients_) {
        if (client.state == state) ++count;
    }
    return count;
}

// ─────────────────────────────────────────────
// Fan-out
// ─────────────────────────────────────────────

void BroadcastServer::publish(const TelemetryEvent& event) {
    auto frame = encode_event(event);
    if (!frame) {
        errors_.report(frame.error());
        return;
    }
    ++published_;

    std::lock_guard lock(clients_mutex_);
    bool failed = false;
    for (auto& [id, client] : clients_) {
        if (client.state != ClientState::Ready) continue;
        if (!send_all(client.fd, frame->data(), frame->size(), SEND_TIMEOUT_MS)) {
            errors_.report(Error{ErrorKind::Transport,
                                 "Write to " + client.peer + " failed, dropping client"});
            // The serve loop owns close(); shutdown wakes its poll with POLLHUP.
            ::shutdown(client.fd, SHUT_RDWR);
            client.state = ClientState::Closed;
            failed = true;
        }
    }
    if (!failed) errors_.clear_streak();
}

bool BroadcastServer::send_all(int fd, const char* data, size_t len, uint32_t timeout_ms) {
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return false;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return false;

        auto sent = ::send(fd, data, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;
        }

        data += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

// ─────────────────────────────────────────────
// Serve Loop
// ─────────────────────────────────────────────

void BroadcastServer::serve_loop(std::stop_token stop) {
    std::vector<pollfd> fds;
    std::vector<uint64_t> ids;

    while (!stop.stop_requested()) {
        reap_closed();

        fds.clear();
        ids.clear();
        fds.push_back(pollfd{server_fd_, POLLIN, 0});
        {
            std::lock_guard lock(clients_mutex_);
            for (const auto& [id, client] : clients_) {
                // Connecting clients wait for writability before they join the fan-out.
                short events = client.state == ClientState::Connecting ? (POLLIN | POLLOUT) : POLLIN;
                fds.push_back(pollfd{client.fd, events, 0});
                ids.push_back(id);
            }
        }

        int ready = ::poll(fds.data(), fds.size(), 100);  // 100ms timeout for stop check
        if (ready == 0) continue;
        if (ready < 0) {
            if (errno == EINTR) continue;
            errors_.report(Error{ErrorKind::Transport,
                                 "poll failed: " + std::string(std::strerror(errno))});
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        if (fds[0].revents & POLLIN) {
            accept_clients();
        }

        for (size_t i = 1; i < fds.size(); ++i) {
            auto revents = fds[i].revents;
            if (revents == 0) continue;
            if ((revents & POLLOUT) && !(revents & (POLLERR | POLLHUP))) {
                promote_client(ids[i - 1]);
            }
            if (revents & (POLLIN | POLLERR | POLLHUP)) {
                drain_client(ids[i - 1]);
            }
        }
    }
}

void BroadcastServer::accept_clients() {
    for (;;) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int fd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return;
            errors_.report(Error{ErrorKind::Transport,
                                 "accept failed: " + std::string(std::strerror(errno))});
            return;
        }

        ClientConnection client;
        client.fd = fd;
        client.peer = describe_peer(client_addr);
        client.state = ClientState::Connecting;

        std::lock_guard lock(clients_mutex_);
        clients_.emplace(next_client_id_++, std::move(client));
    }
}

void BroadcastServer::promote_client(uint64_t id) {
    std::string peer;
    size_t total = 0;
    {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.find(id);
        if (it == clients_.end() || it->second.state != ClientState::Connecting) return;

        if (!configure_socket(it->second.fd)) {
            errors_.report(Error{ErrorKind::Transport,
                                 "Socket setup for " + it->second.peer + " failed: "
                                 + std::strerror(errno)});
            it->second.state = ClientState::Closed;
            return;
        }
        it->second.state = ClientState::Ready;
        peer = it->second.peer;
        total = clients_.size();
    }
    if (logger_) {
        logger_->info(COMPONENT, "Client connected: " + peer
                      + " (" + std::to_string(total) + " total)");
    }
}

void BroadcastServer::drain_client(uint64_t id) {
    std::lock_guard lock(clients_mutex_);
    auto it = clients_.find(id);
    if (it == clients_.end() || it->second.state == ClientState::Closed) return;

    char buf[512];
    for (;;) {
        auto n = ::recv(it->second.fd, buf, sizeof(buf), 0);
        if (n > 0) continue;  // client payloads are ignored
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        if (n < 0 && errno == EINTR) continue;
        break;  // orderly shutdown or hard error
    }
    it->second.state = ClientState::Closed;
}

void BroadcastServer::close_client(ClientConnection& client) {
    if (client.fd >= 0) {
        ::close(client.fd);
        client.fd = -1;
    }
    client.state = ClientState::Closed;
}

void BroadcastServer::reap_closed() {
    std::vector<std::string> dropped;
    {
        std::lock_guard lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (it->second.state == ClientState::Closed) {
                close_client(it->second);
                dropped.push_back(std::move(it->second.peer));
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (logger_) {
        for (const auto& peer : dropped) {
            logger_->info(COMPONENT, "Client disconnected: " + peer);
        }
    }
}

}  // namespace exo_watch
