#pragma once

/// @file detail/number.hpp
/// @brief Number formatting for the serializer.
///
/// Integers are written with std::to_chars. Doubles use the shortest
/// round-trip representation from std::to_chars and always carry a '.' or
/// an exponent, so a printed float parses back as a float and the
/// parse(print(d)) == d law holds for every finite value.

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace treedit::detail {

/// @param buf Output buffer (>= 21 bytes).
/// @return Number of characters written.
inline size_t write_integer(char* buf, int64_t val) noexcept {
    auto [ptr, ec] = std::to_chars(buf, buf + 21, val);
    (void)ec;  // 21 bytes always fit an int64_t
    return static_cast<size_t>(ptr - buf);
}

inline size_t write_uinteger(char* buf, uint64_t val) noexcept {
    auto [ptr, ec] = std::to_chars(buf, buf + 21, val);
    (void)ec;
    return static_cast<size_t>(ptr - buf);
}

/// @brief Shortest decimal text for a finite double.
/// @param buf Output buffer (>= 32 bytes).
/// @param val Value (must NOT be NaN/Inf, caller handles them).
/// @return Number of characters written.
inline size_t write_double(char* buf, double val) noexcept {
    // JSON has no negative zero literal that survives every reader.
    if (val == 0.0) {
        buf[0] = '0'; buf[1] = '.'; buf[2] = '0';
        return 3;
    }
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [ptr, ec] = std::to_chars(buf, buf + 29, val);
    (void)ec;
    size_t len = static_cast<size_t>(ptr - buf);
#else
    int n = std::snprintf(buf, 29, "%.17g", val);
    size_t len = n > 0 ? static_cast<size_t>(n) : 0;
#endif
    for (size_t i = 0; i < len; ++i) {
        const char c = buf[i];
        if (c == '.' || c == 'e' || c == 'E') return len;
    }
    buf[len++] = '.';
    buf[len++] = '0';
    return len;
}

} // namespace treedit::detail
