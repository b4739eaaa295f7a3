#pragma once

/// @file detail/utf8.hpp
/// @brief UTF-8 helpers for \uXXXX escapes in exchange text.

#include <cstdint>

namespace treedit::detail::utf8 {

/// @brief Encode a code point into a fixed buffer.
/// @return Number of bytes written (1-4), or 0 for an invalid code point.
inline unsigned encode(uint32_t cp, char* buf) noexcept {
    if (cp < 0x80) {
        buf[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buf[0] = static_cast<char>(0xC0 | (cp >> 6));
        buf[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buf[0] = static_cast<char>(0xE0 | (cp >> 12));
        buf[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buf[0] = static_cast<char>(0xF0 | (cp >> 18));
        buf[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buf[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

/// @brief Decode one UTF-8 sequence starting at @p ptr and advance it.
///
/// Malformed or truncated sequences yield U+FFFD and consume one byte, so
/// the serializer can always make progress on arbitrary string payloads.
inline uint32_t decode(const char*& ptr, const char* end) noexcept {
    const auto lead = static_cast<unsigned char>(*ptr);
    unsigned len = 0;
    uint32_t cp = 0;
    if (lead < 0x80)                { ++ptr; return lead; }
    else if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }
    else                            { ++ptr; return 0xFFFD; }

    if (end - ptr < static_cast<long>(len)) { ++ptr; return 0xFFFD; }
    for (unsigned i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(ptr[i]);
        if ((c & 0xC0) != 0x80) { ++ptr; return 0xFFFD; }
        cp = (cp << 6) | (c & 0x3F);
    }
    ptr += len;
    return cp;
}

} // namespace treedit::detail::utf8
