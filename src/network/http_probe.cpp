/**
 * @file http_probe.cpp
 * @brief probe_http implementation using poll() for connect and read timeouts.
 */

#include "network/http_probe.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace exo_watch {

namespace {

constexpr size_t MAX_STATUS_LINE = 1024;

/**
 * @brief Closes the descriptor on scope exit.
 */
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) ::close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    [[nodiscard]] int get() const noexcept { return fd_; }
private:
    int fd_;
};

using Deadline = std::chrono::steady_clock::time_point;

/// Wait for `events` until `deadline`; every stage of a probe shares one deadline.
Result<void> wait_for(int fd, short events, Deadline deadline, const char* what) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return Error{ErrorKind::ProbeTimeout, std::string(what) + " timed out"};
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;

    int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready == 0) {
        return Error{ErrorKind::ProbeTimeout, std::string(what) + " timed out"};
    }
    if (ready < 0) {
        return Error{ErrorKind::Transport, std::string("poll failed: ") + std::strerror(errno)};
    }
    return Result<void>{};
}

}  // anonymous namespace

Result<int> parse_status_line(const std::string& line) {
    // "HTTP/1.1 200 OK"
    if (line.rfind("HTTP/", 0) != 0) {
        return Error{ErrorKind::MalformedMessage, "not an HTTP response"};
    }
    auto space = line.find(' ');
    if (space == std::string::npos || space + 4 > line.size()) {
        return Error{ErrorKind::MalformedMessage, "truncated status line"};
    }

    int status = 0;
    for (size_t i = space + 1; i < space + 4; ++i) {
        char c = line[i];
        if (c < '0' || c > '9') {
            return Error{ErrorKind::MalformedMessage, "non-numeric status code"};
        }
        status = status * 10 + (c - '0');
    }
    return status;
}

Result<int> probe_http(const std::string& address,
                       uint16_t port,
                       const std::string& path,
                       uint32_t timeout_ms) {
    const Deadline deadline = std::chrono::steady_clock::now()
                            + std::chrono::milliseconds(timeout_ms);

    sockaddr_in server{};
    server.sin_family = AF_INET;
    server.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &server.sin_addr) != 1) {
        return Error{ErrorKind::Transport, "Invalid address: " + address};
    }

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (sock.get() < 0) {
        return Error{ErrorKind::Transport,
                     "Failed to create socket: " + std::string(std::strerror(errno))};
    }

    int ret = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&server), sizeof(server));
    if (ret < 0 && errno != EINPROGRESS) {
        return Error{ErrorKind::Transport, "Connect failed: " + std::string(std::strerror(errno))};
    }

    if (ret < 0) {
        if (auto waited = wait_for(sock.get(), POLLOUT, deadline, "connect"); !waited) {
            return waited.error();
        }

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            return Error{ErrorKind::Transport, "Connect failed: " + std::string(std::strerror(err))};
        }
    }

    int flag = 1;
    ::setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    std::string request = "GET " + path + " HTTP/1.0\r\n"
                          "Host: " + address + ":" + std::to_string(port) + "\r\n"
                          "User-Agent: exo-watch\r\n"
                          "Connection: close\r\n\r\n";

    size_t sent_total = 0;
    while (sent_total < request.size()) {
        if (auto waited = wait_for(sock.get(), POLLOUT, deadline, "send"); !waited) {
            return waited.error();
        }
        auto sent = ::send(sock.get(), request.data() + sent_total,
                           request.size() - sent_total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Error{ErrorKind::Transport, "Send failed: " + std::string(std::strerror(errno))};
        }
        sent_total += static_cast<size_t>(sent);
    }

    std::string line;
    char buf[256];
    while (line.find("\r\n") == std::string::npos && line.size() < MAX_STATUS_LINE) {
        if (auto waited = wait_for(sock.get(), POLLIN, deadline, "response"); !waited) {
            return waited.error();
        }
        auto received = ::recv(sock.get(), buf, sizeof(buf), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Error{ErrorKind::Transport, "Receive failed: " + std::string(std::strerror(errno))};
        }
        if (received == 0) break;
        line.append(buf, static_cast<size_t>(received));
    }

    auto eol = line.find("\r\n");
    if (eol != std::string::npos) line.resize(eol);
    return parse_status_line(line);
}

}  // namespace exo_watch
