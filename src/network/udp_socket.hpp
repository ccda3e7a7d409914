/**
 * @file udp_socket.hpp
 * @brief POSIX UDP socket helpers shared by the discovery listener and announcer.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace exo_watch {

/**
 * @brief Create a non-blocking UDP socket with SO_REUSEADDR (and SO_BROADCAST if asked).
 * @return The file descriptor, or ErrorKind::Transport.
 */
Result<int> create_udp_socket(bool enable_broadcast);

/**
 * @brief Bind `fd` to INADDR_ANY:`port` (0 = OS-assigned).
 */
Result<void> bind_udp_socket(int fd, uint16_t port);

/// Port the socket is bound to, 0 on failure.
[[nodiscard]] uint16_t local_port(int fd) noexcept;

/**
 * @brief Send one datagram to `address`:`port`.
 */
Result<void> send_datagram(int fd, std::string_view payload,
                           const std::string& address, uint16_t port);

}  // namespace exo_watch
