/**
 * @file json.hpp
 * @brief Minimal JSON string helpers shared by the logger and the event codec.
 */

#pragma once

#include <string>
#include <string_view>

namespace exo_watch::json {

/**
 * @brief Append `value` to `out` as a quoted JSON string literal.
 *
 * Escapes quotes, backslashes and control characters. Bytes >= 0x80 are
 * copied through unchanged; callers that need strict output validate with
 * is_valid_utf8() first.
 */
void append_string(std::string& out, std::string_view value);

[[nodiscard]] std::string quote(std::string_view value);

/// True when `text` is well-formed UTF-8 (no overlongs, no surrogates).
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

}  // namespace exo_watch::json
