/**
 * @file announcement.cpp
 * @brief Announcement encode/decode.
 */

#include "network/announcement.hpp"

#include <charconv>

namespace exo_watch {

namespace {

template <typename Int>
bool parse_int(std::string_view text, Int& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // anonymous namespace

std::vector<std::string_view> split_fields(std::string_view text, char delim) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        auto pos = text.find(delim, start);
        if (pos == std::string_view::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::string format_announcement(const HostProfile& profile) {
    std::string caps;
    for (size_t i = 0; i < profile.capabilities.size(); ++i) {
        if (i > 0) caps.push_back(',');
        caps += profile.capabilities[i];
    }

    std::string out{ANNOUNCEMENT_TAG};
    out.push_back('|');
    out += profile.name;
    out.push_back('|');
    out += profile.address;
    out.push_back('|');
    out += std::to_string(profile.port);
    out.push_back('|');
    out += caps;
    out.push_back('|');
    out += std::to_string(profile.memory_bytes);
    out.push_back('|');
    out += profile.gpu;
    return out;
}

Result<Node> parse_announcement(std::string_view datagram) {
    // Datagrams sent by line-oriented tools often carry a trailing newline
    while (!datagram.empty() && (datagram.back() == '\n' || datagram.back() == '\r')) {
        datagram.remove_suffix(1);
    }

    auto fields = split_fields(datagram, '|');
    if (fields.size() < ANNOUNCEMENT_MIN_FIELDS) {
        return Error{ErrorKind::MalformedMessage,
                     "expected " + std::to_string(ANNOUNCEMENT_MIN_FIELDS) + " fields, got "
                     + std::to_string(fields.size())};
    }
    if (fields[0] != ANNOUNCEMENT_TAG) {
        return Error{ErrorKind::MalformedMessage, "missing announcement tag"};
    }

    Node node;
    node.name = std::string(fields[1]);
    node.address = std::string(fields[2]);

    int port = 0;
    node.port = (parse_int(fields[3], port) && port > 0 && port <= 65535)
        ? static_cast<uint16_t>(port)
        : DEFAULT_SERVICE_PORT;

    for (auto cap : split_fields(fields[4], ',')) {
        if (!cap.empty()) node.capabilities.emplace(cap);
    }

    int64_t memory = 0;
    node.memory_bytes = parse_int(fields[5], memory) ? memory : 0;

    if (!fields[6].empty()) {
        node.gpu = std::string(fields[6]);
    }

    node.online = true;
    node.source = SightingSource::Announcement;
    return node;
}

}  // namespace exo_watch
