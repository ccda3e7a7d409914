/**
 * @file http_probe.hpp
 * @brief Minimal HTTP/1.0 status probe over a non-blocking POSIX socket.
 *
 * Only the status line is read; the body is never consumed. Used by the
 * active scanner, the node ping, and the local service status monitor.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>

namespace exo_watch {

inline constexpr uint32_t DEFAULT_PROBE_TIMEOUT_MS = 2000;

/**
 * @brief Issue `GET <path>` and return the response status code.
 *
 * `timeout_ms` is one deadline for the whole exchange: connect, request and
 * status line together.
 * Errors: ProbeTimeout (no answer in time), Transport (refused, unreachable,
 * bad address), MalformedMessage (the peer did not speak HTTP).
 */
Result<int> probe_http(const std::string& address,
                       uint16_t port,
                       const std::string& path = "/",
                       uint32_t timeout_ms = DEFAULT_PROBE_TIMEOUT_MS);

/// A scan probe counts as a peer sighting on any 2xx or 3xx answer.
[[nodiscard]] constexpr bool is_peer_status(int status) noexcept {
    return status >= 200 && status < 400;
}

/// Parse "HTTP/1.x NNN ..." and return NNN.
Result<int> parse_status_line(const std::string& line);

}  // namespace exo_watch
