#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace svga {

// =============================================================================
// Asset Keys
// =============================================================================

inline bool isKeyChar(char c) {
    return (c >= 'a' && c <= 'z')
        || (c >= 'A' && c <= 'Z')
        || (c >= '0' && c <= '9')
        || c == '_'
        || c == '-';
}

/**
 * Replace every character outside [A-Za-z0-9_-] with '_'.
 * Operates on bytes, so a multi-byte UTF-8 character becomes several underscores.
 */
inline std::string sanitizeKey(std::string_view key) {
    std::string out(key);
    for (char& c : out) {
        if (!isKeyChar(c)) c = '_';
    }
    return out;
}

// =============================================================================
// Base64
// =============================================================================

inline constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64Encode(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16)
            | (static_cast<std::uint32_t>(data[i + 1]) << 8)
            | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[n & 0x3F]);
    }
    const std::size_t rest = len - i;
    if (rest == 1) {
        const std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16)
            | (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

inline std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
    return base64Encode(bytes.data(), bytes.size());
}

inline int base64Index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

inline std::string_view trimWhitespace(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    const std::size_t first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const std::size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

/**
 * Lenient base64 decode.
 * Strips a data-URI prefix (everything up to the first ','), trims whitespace and
 * tolerates missing padding. Returns false on any character outside the alphabet.
 */
inline bool base64Decode(std::string_view text, std::vector<std::uint8_t>& out) {
    out.clear();
    const std::size_t comma = text.find(',');
    if (comma != std::string_view::npos) text = text.substr(comma + 1);
    text = trimWhitespace(text);
    while (!text.empty() && text.back() == '=') text.remove_suffix(1);
    if (text.size() % 4 == 1) return false;

    out.reserve((text.size() * 3) / 4);
    std::uint32_t acc = 0;
    int bits = 0;
    for (const char c : text) {
        const int v = base64Index(c);
        if (v < 0) {
            out.clear();
            return false;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return true;
}

// =============================================================================
// Number Formatting
// =============================================================================

/**
 * Plain decimal with at most three fractional digits, trailing zeros dropped.
 * Used for SVG path data, where sub-pixel precision beyond 1e-3 is noise.
 */
inline std::string formatPathNumber(double v) {
    if (!std::isfinite(v)) return "0";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    std::string s(buf);
    const std::size_t dot = s.find('.');
    if (dot != std::string::npos) {
        std::size_t end = s.size();
        while (end > dot + 1 && s[end - 1] == '0') --end;
        if (end == dot + 1) --end;
        s.resize(end);
    }
    if (s == "-0") s = "0";
    return s;
}

} // namespace svga
