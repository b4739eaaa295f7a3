#pragma once

/// @file projection.hpp
/// @brief Flattened read-only view of a document for tree renderers.
///
/// The table is recomputed from scratch after every change; views keep no
/// paths of their own across edits.

#include "path.hpp"
#include "serializer.hpp"
#include "value.hpp"

#include <string>
#include <vector>

namespace treedit {

/// @brief One row of the tree view.
struct TreeEntry {
    Path path;
    std::string label;    ///< "root", the Object key, or the Array index
    Type type;
    std::string preview;  ///< "{...}", "[...]", or the scalar text (strings unquoted)
};

namespace detail {

inline std::string preview_of(const Node& n) {
    switch (n.type()) {
        case Type::Object: return "{...}";
        case Type::Array:  return "[...]";
        case Type::String: return n.as_string();
        default:           return n.dump();
    }
}

inline void project_into(const Node& n, Path& path, std::string label,
                         std::vector<TreeEntry>& out) {
    out.push_back(TreeEntry{path, std::move(label), n.type(), preview_of(n)});
    if (n.is_object()) {
        for (const auto& [key, child] : n.as_object()) {
            path.append(key);
            project_into(child, path, key, out);
            path.pop_back();
        }
    } else if (n.is_array()) {
        const auto& arr = n.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            path.append(i);
            project_into(arr[i], path, std::to_string(i), out);
            path.pop_back();
        }
    }
}

} // namespace detail

/// @brief Depth-first pre-order path table of @p root, root row first.
[[nodiscard]] inline std::vector<TreeEntry> project(const Node& root) {
    std::vector<TreeEntry> out;
    Path path;
    detail::project_into(root, path, "root", out);
    return out;
}

} // namespace treedit
