/**
 * @file udp_socket.cpp
 * @brief UDP socket helpers.
 */

#include "network/udp_socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace exo_watch {

Result<int> create_udp_socket(bool enable_broadcast) {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Error{ErrorKind::Transport,
                     "Failed to create UDP socket: " + std::string(std::strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (enable_broadcast
        && ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        return Error{ErrorKind::Transport, "Failed to enable SO_BROADCAST: " + reason};
    }

    return fd;
}

Result<void> bind_udp_socket(int fd, uint16_t port) {
    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(port);
    bind_addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(fd, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        return Error{ErrorKind::Transport,
                     "Bind to UDP port " + std::to_string(port) + " failed: "
                     + std::string(std::strerror(errno))};
    }
    return Result<void>{};
}

uint16_t local_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

Result<void> send_datagram(int fd, std::string_view payload,
                           const std::string& address, uint16_t port) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        return Error{ErrorKind::Transport, "Invalid address: " + address};
    }

    auto sent = ::sendto(fd, payload.data(), payload.size(), 0,
                         reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        return Error{ErrorKind::Transport,
                     "sendto " + address + " failed: " + std::string(std::strerror(errno))};
    }
    return Result<void>{};
}

}  // namespace exo_watch
