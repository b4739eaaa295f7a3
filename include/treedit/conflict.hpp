#pragma once

/// @file conflict.hpp
/// @brief Key-collision policy for keys introduced into an Object.

#include "value.hpp"

#include <string>

namespace treedit {

/// @brief Return @p key if it is free in @p dest, otherwise the first free
/// candidate of key_1, key_2, ...
///
/// Used by cross-container moves into an Object and by grouping. Never used
/// for Array destinations or same-container reorders.
[[nodiscard]] inline std::string deconflict_key(const Object& dest, const std::string& key) {
    if (!dest.contains(key)) return key;
    for (size_t n = 1;; ++n) {
        std::string candidate = key + "_" + std::to_string(n);
        if (!dest.contains(candidate)) return candidate;
    }
}

} // namespace treedit
