#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for treedit.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treedit {

// ─── Forward declarations ───────────────────────────────────────────────
class Node;
class Path;
class Editor;
namespace detail { class Parser; }

/// Node kinds
enum class Type : uint8_t {
    Null     = 0,
    Bool     = 1,
    Integer  = 2,
    Float    = 3,
    String   = 4,
    Array    = 5,
    Object   = 6,
    UInteger = 7
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:     return "null";
        case Type::Bool:     return "bool";
        case Type::Integer:  return "integer";
        case Type::Float:    return "float";
        case Type::String:   return "string";
        case Type::Array:    return "array";
        case Type::Object:   return "object";
        case Type::UInteger: return "uinteger";
    }
    return "unknown";
}

/// @brief True for the two container kinds.
inline bool is_container(Type t) noexcept {
    return t == Type::Array || t == Type::Object;
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// Array: ordered sequence of nodes, index order is significant.
using Array = std::vector<Node>;

/// @brief Object: ordered key/node entries.
///
/// Insertion order is part of the document and is preserved by every
/// operation. Keys are unique; lookups are linear, which is what an
/// interactively edited document needs and keeps positional edits
/// (insert_at, rename, take) trivially consistent.
class Object {
public:
    using entry_type   = std::pair<std::string, Node>;
    using storage_type = std::vector<entry_type>;
    using size_type    = std::size_t;

    static constexpr size_type npos = static_cast<size_type>(-1);

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}
    Object(std::initializer_list<entry_type> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries_.empty(); }
    size_type size() const noexcept { return entries_.size(); }
    void reserve(size_type n) { entries_.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries_.begin(); }
    auto end()   noexcept { return entries_.end(); }
    auto begin()  const noexcept { return entries_.begin(); }
    auto end()    const noexcept { return entries_.end(); }

    // ─── Lookup (defined in value.hpp) ──────────────────────────────────
    Node* find(std::string_view key) noexcept;
    const Node* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Position of @p key in insertion order, or npos.
    size_type position_of(std::string_view key) const noexcept;

    /// Checked access. Throws OutOfRangeError if the key is absent.
    Node& at(std::string_view key);
    const Node& at(std::string_view key) const;

    /// Entry at a position in insertion order (unchecked).
    entry_type& entry(size_type pos) noexcept { return entries_[pos]; }
    const entry_type& entry(size_type pos) const noexcept { return entries_[pos]; }

    // ─── Modifiers ───────────────────────────────────────────────────────

    /// Replace the value of an existing key, or append a new entry.
    void insert(std::string key, Node value);

    /// Insert a new entry at @p pos (clamped to size()). The key must be absent.
    void insert_at(size_type pos, std::string key, Node value);

    /// Append without a uniqueness check (parser fast path).
    template <typename K, typename V>
    void emplace_back(K&& key, V&& value);

    /// Erase by key. Returns false if absent.
    bool erase(std::string_view key);

    /// Remove @p key and return its value. Throws OutOfRangeError if absent.
    Node take(std::string_view key);

    /// Rename in place keeping the entry's position. The new key must be absent.
    bool rename(std::string_view from, std::string to);

    /// Keys in insertion order.
    std::vector<std::string> keys() const;

    void clear() noexcept { entries_.clear(); }

    /// Order-sensitive comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

    const storage_type& storage() const noexcept { return entries_; }
    storage_type& storage() noexcept { return entries_; }

private:
    storage_type entries_;
};

} // namespace treedit
