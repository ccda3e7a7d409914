/**
 * @file host_profile.hpp
 * @brief Local hardware introspection for the self-announcement.
 *
 * Data sources:
 *   gethostname()              : node name
 *   getifaddrs()               : first non-loopback IPv4 address
 *   /proc/meminfo              : total memory
 *   /proc/driver/nvidia/version : NVIDIA accelerator presence
 *   /proc/cpuinfo              : CPU vendor fallback label
 */

#pragma once

#include "network/announcement.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace exo_watch {

/**
 * @brief Accelerator label for this host ("NVIDIA", "Apple Silicon", "Intel", "AMD" or empty).
 */
[[nodiscard]] std::string detect_accelerator();

/**
 * @brief Capability list derived from the accelerator label.
 *
 * "cuda" for NVIDIA, "mlx" for Apple Silicon, then always "tinygrad",
 * "web_interface" and "api".
 */
[[nodiscard]] std::vector<std::string> capabilities_for(const std::string& accelerator);

[[nodiscard]] std::string local_hostname();

/// First non-loopback IPv4 address, "127.0.0.1" when none is up.
[[nodiscard]] std::string local_ipv4_address();

/// MemTotal in bytes, 0 when unavailable.
[[nodiscard]] int64_t total_memory_bytes(const std::filesystem::path& meminfo = "/proc/meminfo");

/**
 * @brief Assemble the full self-descriptor.
 *
 * Empty `name_override` / `address_override` select the detected values.
 */
[[nodiscard]] HostProfile detect_host_profile(uint16_t service_port,
                                              const std::string& name_override = {},
                                              const std::string& address_override = {});

}  // namespace exo_watch
