/**
 * @file announcement.hpp
 * @brief Text codec for UDP peer self-announcements.
 *
 * Wire format (UTF-8 plaintext, pipe-delimited):
 *
 *   EXO_DISCOVERY|<name>|<address>|<port>|<cap1,cap2,...>|<memoryBytes>|<gpuLabelOrEmpty>
 *
 * Receivers require the leading tag and at least seven fields; anything
 * after the seventh field is ignored.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace exo_watch {

inline constexpr std::string_view ANNOUNCEMENT_TAG = "EXO_DISCOVERY";
inline constexpr size_t ANNOUNCEMENT_MIN_FIELDS = 7;

/**
 * @brief What a node advertises about itself.
 */
struct HostProfile {
    std::string name;
    std::string address;
    uint16_t port{DEFAULT_SERVICE_PORT};
    std::vector<std::string> capabilities;      ///< Order preserved on the wire
    int64_t memory_bytes{0};
    std::string gpu;                            ///< Empty = no accelerator label
};

/**
 * @brief Render a self-announcement datagram.
 */
[[nodiscard]] std::string format_announcement(const HostProfile& profile);

/**
 * @brief Parse an announcement into a Node (online, source = Announcement).
 *
 * Fails with ErrorKind::MalformedMessage when the tag is wrong or fields are
 * missing. A non-numeric port falls back to DEFAULT_SERVICE_PORT and a
 * non-numeric memory field to 0. `last_seen` is left for the caller to stamp.
 */
[[nodiscard]] Result<Node> parse_announcement(std::string_view datagram);

/// Split on a single-character delimiter, keeping empty fields.
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view text, char delim);

}  // namespace exo_watch
