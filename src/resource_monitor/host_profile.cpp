/**
 * @file host_profile.cpp
 * @brief Host introspection from POSIX calls and Linux pseudo-filesystems.
 */

#include "resource_monitor/host_profile.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <unistd.h>

#include <climits>
#include <fstream>
#include <sstream>
#include <system_error>

namespace exo_watch {

namespace {

std::string cpu_vendor_label() {
    std::ifstream ifs("/proc/cpuinfo");
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with("vendor_id") || line.starts_with("model name")) {
            if (line.find("Intel") != std::string::npos) return "Intel";
            if (line.find("AMD") != std::string::npos) return "AMD";
        }
    }
    return {};
}

}  // anonymous namespace

std::string detect_accelerator() {
#if defined(__APPLE__) && defined(__aarch64__)
    return "Apple Silicon";
#else
    std::error_code ec;
    if (std::filesystem::exists("/proc/driver/nvidia/version", ec)) {
        return "NVIDIA";
    }
    return cpu_vendor_label();
#endif
}

std::vector<std::string> capabilities_for(const std::string& accelerator) {
    std::vector<std::string> caps;
    if (accelerator == "NVIDIA") {
        caps.emplace_back("cuda");
    } else if (accelerator == "Apple Silicon") {
        caps.emplace_back("mlx");
    }
    caps.emplace_back("tinygrad");
    caps.emplace_back("web_interface");
    caps.emplace_back("api");
    return caps;
}

std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "Unknown";
    }
    return std::string(buf);
}

std::string local_ipv4_address() {
    std::string address = "127.0.0.1";

    ifaddrs* ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) != 0) {
        return address;
    }

    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;

        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (ntohl(sin->sin_addr.s_addr) >> 24 == 127) continue;

        char buf[INET_ADDRSTRLEN] = {};
        if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr) {
            address = buf;
            break;
        }
    }

    ::freeifaddrs(ifaddr);
    return address;
}

int64_t total_memory_bytes(const std::filesystem::path& meminfo) {
    std::ifstream ifs(meminfo);
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            int64_t kb = 0;
            iss >> kb;
            return kb * 1024;
        }
    }
    return 0;
}

HostProfile detect_host_profile(uint16_t service_port,
                                const std::string& name_override,
                                const std::string& address_override) {
    HostProfile profile;
    profile.name = name_override.empty() ? local_hostname() : name_override;
    profile.address = address_override.empty() ? local_ipv4_address() : address_override;
    profile.port = service_port;
    profile.gpu = detect_accelerator();
    profile.capabilities = capabilities_for(profile.gpu);
    profile.memory_bytes = total_memory_bytes();
    return profile;
}

}  // namespace exo_watch
