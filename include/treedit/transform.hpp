#pragma once

/// @file transform.hpp
/// @brief Structural edits on a document root.
///
/// Every function here follows the same protocol:
///   1. resolve and validate everything, throwing an EditError subclass on
///      failure with the document untouched;
///   2. call @p before_mutate exactly once (the undo hook);
///   3. mutate. Nothing in this phase can fail except allocation.
///
/// Functions return the path of the node the edit produced or affected, so a
/// caller can reselect it in its view.

#include "config.hpp"
#include "conflict.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
#include "path.hpp"
#include "value.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treedit {

/// Called once per committed edit, after validation and before any change.
using BeforeMutate = std::function<void()>;

/// Key given to an Array element moved into an Object.
inline constexpr std::string_view kDefaultFallbackKey = "item";

enum class MoveMode : uint8_t {
    InsertBefore,
    InsertAfter,
    Nest
};

inline const char* move_mode_name(MoveMode m) noexcept {
    switch (m) {
        case MoveMode::InsertBefore: return "before";
        case MoveMode::InsertAfter:  return "after";
        case MoveMode::Nest:         return "nest";
    }
    return "unknown";
}

/// Accepts "before", "after", "nest" (and the insert_before/insert_after spellings).
inline std::optional<MoveMode> parse_move_mode(std::string_view s) noexcept {
    if (s == "before" || s == "insert_before") return MoveMode::InsertBefore;
    if (s == "after" || s == "insert_after")   return MoveMode::InsertAfter;
    if (s == "nest")                           return MoveMode::Nest;
    return std::nullopt;
}

namespace detail {

inline void notify(const BeforeMutate& hook) {
    if (hook) hook();
}

[[noreturn]] inline void throw_root(const char* op) {
    throw InvalidTarget(errc::root_not_editable,
                        std::string("cannot ") + op + " the root", {std::string()});
}

/// Resolve @p path as an existing child and return its parent container.
inline ParentRef resolve_child(Node& root, const Path& path) {
    ParentRef ref = resolve_parent(root, path);
    if (!try_resolve(ref.container, Path{ref.segment}))
        throw_path(errc::path_not_found, "no node at " + ref.segment.token(), path);
    return ref;
}

/// @p p as it reads after Array element @p removed has been erased.
inline Path after_removal(const Path& p, const Path& removed) {
    const size_t d = removed.depth() - 1;
    if (!removed.back().is_index() || p.depth() <= d || !p.starts_with(removed.parent()))
        return p;
    Path::container_type segs = p.segments();
    if (segs[d].is_index() && segs[d].index() > removed.back().index())
        segs[d] = Segment(segs[d].index() - 1);
    return Path(std::move(segs));
}

/// @p p as it reads after the elements at @p indices (sorted, none of them on
/// @p p) of the Array at @p parent were replaced by one element at indices[0].
inline Path after_regroup(const Path& p, const Path& parent, const std::vector<size_t>& indices) {
    const size_t d = parent.depth();
    if (p.depth() <= d || !p.starts_with(parent)) return p;
    Path::container_type segs = p.segments();
    const size_t k = segs[d].index();
    const auto removed_before = static_cast<size_t>(
        std::count_if(indices.begin(), indices.end(), [k](size_t i) { return i < k; }));
    if (removed_before > 0) segs[d] = Segment(k - removed_before + 1);
    return Path(std::move(segs));
}

} // namespace detail

// =====================================================================
// Rename
// =====================================================================

/// @brief Rename the Object entry at @p path to @p new_key, keeping its position.
///
/// Renaming to the current key is a successful no-op that records nothing.
/// @throws InvalidTarget for the root or an Array element, KeyConflict if
///         @p new_key is taken by a sibling, PathError if @p path does not resolve.
inline Path rename_key(Node& root, const Path& path, const std::string& new_key,
                       const BeforeMutate& before_mutate = {}) {
    if (path.empty()) detail::throw_root("rename");
    auto [parent, seg] = detail::resolve_child(root, path);
    if (seg.is_index())
        throw InvalidTarget(errc::kind_mismatch, "array elements have no key to rename",
                            {path.to_pointer()});

    Path renamed = path.parent().child(new_key);
    if (seg.key() == new_key) return renamed;

    auto& obj = parent.as_object();
    if (obj.contains(new_key)) throw KeyConflict(new_key, path.parent().to_pointer());

    detail::notify(before_mutate);
    obj.rename(seg.key(), new_key);
    spdlog::debug("rename {} -> {}", path.to_pointer(), renamed.to_pointer());
    return renamed;
}

// =====================================================================
// Set value
// =====================================================================

/// @brief Replace the node at @p path with @p raw_text parsed as exchange text.
///
/// Text that does not parse is stored as a literal string; this never fails
/// on content. The empty path replaces the whole document.
/// @throws PathError if @p path does not resolve.
inline Path set_value(Node& root, const Path& path, std::string_view raw_text,
                      const ParseOptions& opts = {},
                      const BeforeMutate& before_mutate = {}) {
    Node& target = resolve(root, path);

    auto [parsed, ec] = try_parse(raw_text, opts);
    if (ec) {
        spdlog::debug("set {}: storing text as string ({})", path.to_pointer(), ec.message());
        parsed = Node(std::string(raw_text));
    }

    detail::notify(before_mutate);
    target = std::move(parsed);
    spdlog::debug("set {} = {}", path.to_pointer(), type_name(target.type()));
    return path;
}

// =====================================================================
// Add child
// =====================================================================

/// @brief Add an empty-string child under the container at @p parent_path.
///
/// Objects require @p key and append it to their order; Arrays append a new
/// element and ignore @p key.
/// @throws InvalidTarget for a Scalar parent or a missing key, KeyConflict if
///         @p key exists, PathError if @p parent_path does not resolve.
inline Path add_child(Node& root, const Path& parent_path,
                      const std::optional<std::string>& key = std::nullopt,
                      const BeforeMutate& before_mutate = {}) {
    Node& parent = resolve(root, parent_path);

    if (parent.is_object()) {
        if (!key || key->empty())
            throw InvalidTarget(errc::missing_key, "a key is required to add to an object",
                                {parent_path.to_pointer()});
        if (parent.contains(*key)) throw KeyConflict(*key, parent_path.to_pointer());

        detail::notify(before_mutate);
        parent.as_object().emplace_back(*key, Node(""));
        Path added = parent_path.child(*key);
        spdlog::debug("add {}", added.to_pointer());
        return added;
    }
    if (parent.is_array()) {
        detail::notify(before_mutate);
        parent.push_back(Node(""));
        Path added = parent_path.child(parent.size() - 1);
        spdlog::debug("add {}", added.to_pointer());
        return added;
    }
    throw InvalidTarget(errc::kind_mismatch,
                        std::string("cannot add a child to a ") + type_name(parent.type()),
                        {parent_path.to_pointer()});
}

// =====================================================================
// Delete
// =====================================================================

/// @brief Remove the node at @p path and everything beneath it.
/// @return Path of the former parent.
inline Path delete_subtree(Node& root, const Path& path,
                           const BeforeMutate& before_mutate = {}) {
    if (path.empty()) detail::throw_root("delete");
    auto [parent, seg] = detail::resolve_child(root, path);

    detail::notify(before_mutate);
    if (seg.is_key()) {
        parent.erase(seg.key());
    } else {
        auto& arr = parent.as_array();
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(seg.index()));
    }
    spdlog::debug("delete {}", path.to_pointer());
    return path.parent();
}

/// @brief Remove the container at @p path and splice its content into its parent.
///
/// Object into Object: the removed Object's entries take the removed key's
/// place, in their order. No renaming is applied; any entry whose key is
/// already present in the parent fails, the removed key itself included.
/// Array into Array: the elements replace the removed slot.
/// @throws InvalidTarget for the root or mismatched kinds, KeyConflict on a
///         colliding key, PathError if @p path does not resolve.
/// @return Path of the parent that received the content.
inline Path delete_and_transfer(Node& root, const Path& path,
                                const BeforeMutate& before_mutate = {}) {
    if (path.empty()) detail::throw_root("delete");
    auto [parent, seg] = detail::resolve_child(root, path);
    const Path parent_path = path.parent();

    if (parent.is_object()) {
        Node& node = parent.as_object().at(seg.key());
        if (!node.is_object())
            throw InvalidTarget(errc::kind_mismatch,
                                std::string("cannot merge ") + type_name(node.type()) +
                                    " content into an object",
                                {path.to_pointer()});
        for (const auto& [k, v] : node.as_object()) {
            if (parent.contains(k)) throw KeyConflict(k, parent_path.to_pointer());
        }

        detail::notify(before_mutate);
        auto& obj = parent.as_object();
        size_t pos = obj.position_of(seg.key());
        Node removed = obj.take(seg.key());
        for (auto& [k, v] : removed.as_object().storage()) {
            obj.insert_at(pos++, std::move(k), std::move(v));
        }
        spdlog::debug("transfer {} into {}", path.to_pointer(), parent_path.to_pointer());
        return parent_path;
    }

    auto& arr = parent.as_array();
    Node& node = arr[seg.index()];
    if (!node.is_array())
        throw InvalidTarget(errc::kind_mismatch,
                            std::string("cannot merge ") + type_name(node.type()) +
                                " content into an array",
                            {path.to_pointer()});

    detail::notify(before_mutate);
    const auto at = arr.begin() + static_cast<std::ptrdiff_t>(seg.index());
    Array removed = std::move(node.as_array());
    auto next = arr.erase(at);
    arr.insert(next, std::make_move_iterator(removed.begin()),
               std::make_move_iterator(removed.end()));
    spdlog::debug("transfer {} into {}", path.to_pointer(), parent_path.to_pointer());
    return parent_path;
}

// =====================================================================
// Move
// =====================================================================

/// @brief Move the node at @p source next to or into the node at @p target.
///
/// The source is detached before it is inserted, so it never exists twice.
///   - Nest onto a container: the target is the destination. Arrays receive
///     the node at the end; Objects receive it at the end under its own key
///     (or @p fallback_key for an Array element), deconflicted.
///   - Nest onto a Scalar: the destination is the target's parent. An Array
///     parent receives the node at the end; the source's own Object places it
///     after the target; any other Object appends it as below.
///   - InsertBefore/InsertAfter: the destination is the target's parent.
///     In an Array the node lands next to the target. In the source's own
///     Object the entries are reordered. In a different Object the node is
///     appended under its deconflicted key; its position there is not
///     controlled by the target.
///
/// @throws InvalidTarget for a root source, a missing target, a target inside
///         the source, or a root target that is not a container destination;
///         PathError if @p source does not resolve.
/// @return Path of the moved node.
inline Path move_node(Node& root, const Path& source, const Path& target, MoveMode mode,
                      std::string_view fallback_key = kDefaultFallbackKey,
                      const BeforeMutate& before_mutate = {}) {
    if (source.empty()) detail::throw_root("move");
    auto [src_parent, src_seg] = detail::resolve_child(root, source);

    Node* target_node = try_resolve(root, target);
    if (!target_node)
        throw InvalidTarget(errc::target_not_found, "move target does not resolve",
                            {target.to_pointer()});
    if (target.starts_with(source))
        throw InvalidTarget(errc::target_inside_source, "cannot move a node into itself",
                            {source.to_pointer(), target.to_pointer()});

    const bool nest = mode == MoveMode::Nest;
    const bool nest_into = nest && target_node->is_container();
    if (!nest_into && target.empty())
        throw InvalidTarget(errc::root_not_editable, "the root has no siblings",
                            {target.to_pointer()});

    const Path dest_path = nest_into ? target : target.parent();
    Node& dest_node = nest_into ? *target_node : resolve(root, dest_path);

    // Container payloads live on the heap and stay put while the source is
    // detached, even when an ancestor Array shifts its elements.
    Array* dest_arr = dest_node.is_array() ? &dest_node.as_array() : nullptr;
    Object* dest_obj = dest_node.is_object() ? &dest_node.as_object() : nullptr;
    const bool same_container = dest_path == source.parent();
    const std::string moved_key =
        src_seg.is_key() ? src_seg.key() : std::string(fallback_key);

    detail::notify(before_mutate);

    Node moved;
    if (src_seg.is_key()) {
        moved = src_parent.as_object().take(src_seg.key());
    } else {
        auto& arr = src_parent.as_array();
        moved = std::move(arr[src_seg.index()]);
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(src_seg.index()));
    }

    const Path dest_after = src_seg.is_index() ? detail::after_removal(dest_path, source) : dest_path;
    Path result;
    if (dest_arr) {
        size_t index = dest_arr->size();
        if (!nest) {
            size_t anchor = target.back().index();
            if (same_container && src_seg.index() < anchor) --anchor;
            index = mode == MoveMode::InsertBefore ? anchor : anchor + 1;
            index = std::min(index, dest_arr->size());
        }
        dest_arr->insert(dest_arr->begin() + static_cast<std::ptrdiff_t>(index), std::move(moved));
        result = dest_after.child(index);
    } else if (!nest_into && same_container) {
        size_t j = dest_obj->position_of(target.back().key());
        size_t pos = mode == MoveMode::InsertBefore ? j : j + 1;
        dest_obj->insert_at(pos, moved_key, std::move(moved));
        result = dest_after.child(moved_key);
    } else {
        std::string key = deconflict_key(*dest_obj, moved_key);
        dest_obj->emplace_back(key, std::move(moved));
        result = dest_after.child(std::move(key));
    }

    spdlog::debug("move {} -> {} ({} {})", source.to_pointer(), result.to_pointer(),
                  move_mode_name(mode), target.to_pointer());
    return result;
}

// =====================================================================
// Group
// =====================================================================

/// @brief Collect the selected nodes into a new container, per parent.
///
/// Selections are partitioned by parent path, in order of first appearance.
///   - Object parent: the selected entries move, in the parent's order, into a
///     new Object named @p group_name (deconflicted) appended to the parent.
///   - Array parent: the selected elements move, in index order, into a new
///     Array wrapped as {group_name: [...]} at the smallest selected index.
/// All partitions are applied to a working copy; the document changes only
/// if every partition succeeds.
///
/// @throws InvalidTarget if fewer than two distinct nodes are selected, if
///         the root or nested selections are included, or the name is empty;
///         PathError if a selection does not resolve.
/// @return Paths of the created groups, one per partition.
inline std::vector<Path> group_nodes(Node& root, const std::vector<Path>& selected,
                                     const std::string& group_name,
                                     const BeforeMutate& before_mutate = {}) {
    std::vector<Path> unique;
    for (const auto& p : selected) {
        if (p.empty()) detail::throw_root("group");
        if (std::find(unique.begin(), unique.end(), p) == unique.end()) unique.push_back(p);
    }
    if (unique.size() < 2)
        throw InvalidTarget(errc::selection_too_small, "select at least two nodes to group", {});
    if (group_name.empty())
        throw InvalidTarget(errc::missing_key, "group name must not be empty", {});
    for (const auto& a : unique) {
        for (const auto& b : unique) {
            if (&a != &b && b.starts_with(a))
                throw InvalidTarget(errc::target_inside_source,
                                    "selection contains a node and its descendant",
                                    {a.to_pointer(), b.to_pointer()});
        }
        (void)detail::resolve_child(root, a);
    }

    std::vector<std::pair<Path, std::vector<Segment>>> partitions;
    for (const auto& p : unique) {
        Path parent = p.parent();
        auto it = std::find_if(partitions.begin(), partitions.end(),
                               [&](const auto& part) { return part.first == parent; });
        if (it == partitions.end()) {
            partitions.emplace_back(std::move(parent), std::vector<Segment>{p.back()});
        } else {
            it->second.push_back(p.back());
        }
    }

    // A partition only reshapes its own parent, so applying deeper parents
    // first keeps every remaining parent path valid. Group paths recorded
    // below an Array are shifted when that Array is regrouped later.
    std::vector<size_t> order(partitions.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return partitions[b].first < partitions[a].first;
    });

    Node work = root;
    std::vector<Path> groups(partitions.size());
    for (size_t n : order) {
        const Path& parent_path = partitions[n].first;
        const auto& segs = partitions[n].second;
        Node& parent = resolve(work, parent_path);

        if (parent.is_object()) {
            auto& obj = parent.as_object();
            Object collected;
            for (auto& entry : obj.storage()) {
                const bool picked = std::any_of(segs.begin(), segs.end(), [&](const Segment& s) {
                    return s.key() == entry.first;
                });
                if (picked) collected.emplace_back(entry.first, std::move(entry.second));
            }
            for (const auto& s : segs) obj.erase(s.key());
            std::string name = deconflict_key(obj, group_name);
            obj.emplace_back(name, Node(std::move(collected)));
            groups[n] = parent_path.child(std::move(name));
            continue;
        }

        auto& arr = parent.as_array();
        std::vector<size_t> indices;
        for (const auto& s : segs) indices.push_back(s.index());
        std::sort(indices.begin(), indices.end());
        Array collected;
        for (size_t idx : indices) collected.push_back(std::move(arr[idx]));
        for (auto it = indices.rbegin(); it != indices.rend(); ++it)
            arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(*it));
        Object wrapper;
        wrapper.emplace_back(group_name, Node(std::move(collected)));
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(indices.front()),
                   Node(std::move(wrapper)));

        for (auto& g : groups) {
            if (!g.empty()) g = detail::after_regroup(g, parent_path, indices);
        }
        groups[n] = parent_path.child(indices.front());
    }

    detail::notify(before_mutate);
    root = std::move(work);
    spdlog::debug("group {} nodes into \"{}\" ({} partitions)", unique.size(), group_name,
                  partitions.size());
    return groups;
}

} // namespace treedit
