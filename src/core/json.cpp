/**
 * @file json.cpp
 * @brief JSON string escaping and UTF-8 validation.
 */

#include "core/json.hpp"

#include <cstdint>

namespace exo_watch::json {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

}  // anonymous namespace

void append_string(std::string& out, std::string_view value) {
    out.reserve(out.size() + value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: {
                auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20) {
                    out += "\\u00";
                    out.push_back(HEX_DIGITS[byte >> 4]);
                    out.push_back(HEX_DIGITS[byte & 0x0F]);
                } else {
                    out.push_back(c);
                }
            }
        }
    }
    out.push_back('"');
}

std::string quote(std::string_view value) {
    std::string out;
    append_string(out, value);
    return out;
}

bool is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto b0 = static_cast<uint8_t>(text[i]);
        if (b0 < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((b0 & 0xE0) == 0xC0) {
            len = 2; cp = b0 & 0x1F; min_cp = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3; cp = b0 & 0x0F; min_cp = 0x800;
        } else if ((b0 & 0xF8) == 0xF0) {
            len = 4; cp = b0 & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto b = static_cast<uint8_t>(text[i + k]);
            if ((b & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (b & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += len;
    }
    return true;
}

}  // namespace exo_watch::json
