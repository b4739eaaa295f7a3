#pragma once

/// @file path.hpp
/// @brief Typed paths into a document and the resolver that walks them.
///
/// A Path is a sequence of Segments, each either an Object key or an Array
/// index. The empty path denotes the root. Paths are positional: they are
/// recomputed from the live tree after every structural change.
///
/// Text form is RFC 6901:
///   "" -> root document
///   "/foo" -> key "foo"
///   "/foo/0" -> first element of array "foo"
///   "/a~1b" -> key "a/b" (~ encoding: ~0 = ~, ~1 = /)

#include "error.hpp"
#include "value.hpp"

#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treedit {

/// @brief One step of a Path: an Object key or an Array index.
class Segment {
public:
    Segment(std::string key) : is_index_(false), key_(std::move(key)) {}
    Segment(const char* key) : is_index_(false), key_(key) {}
    Segment(std::string_view key) : is_index_(false), key_(key) {}
    Segment(size_t index) noexcept : is_index_(true), index_(index) {}
    Segment(int index) noexcept : is_index_(true), index_(static_cast<size_t>(index)) {}

    [[nodiscard]] bool is_key() const noexcept { return !is_index_; }
    [[nodiscard]] bool is_index() const noexcept { return is_index_; }

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] size_t index() const noexcept { return index_; }

    /// Unescaped token text (the key, or the decimal index).
    [[nodiscard]] std::string token() const {
        return is_index_ ? std::to_string(index_) : key_;
    }

    bool operator==(const Segment& o) const noexcept {
        if (is_index_ != o.is_index_) return false;
        return is_index_ ? index_ == o.index_ : key_ == o.key_;
    }
    bool operator!=(const Segment& o) const noexcept { return !(*this == o); }

    /// Indices order before keys; then numerically or lexicographically.
    bool operator<(const Segment& o) const noexcept {
        if (is_index_ != o.is_index_) return is_index_;
        return is_index_ ? index_ < o.index_ : key_ < o.key_;
    }

private:
    bool is_index_;
    size_t index_ = 0;
    std::string key_;
};

/// @brief Ordered sequence of Segments addressing a Node from the root.
class Path {
public:
    using container_type = std::vector<Segment>;
    using const_iterator = container_type::const_iterator;

    Path() = default;
    Path(std::initializer_list<Segment> segs) : segments_(segs) {}
    explicit Path(container_type segs) : segments_(std::move(segs)) {}

    /// Parse RFC 6901 text, typing each token against the live tree.
    /// Throws PathError for malformed text or a token that does not resolve.
    static Path from_pointer(std::string_view text, const Node& root);

    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return segments_.size(); }
    [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

    const_iterator begin() const noexcept { return segments_.begin(); }
    const_iterator end() const noexcept { return segments_.end(); }
    const Segment& operator[](size_t i) const noexcept { return segments_[i]; }

    /// Last segment. Precondition: !empty().
    [[nodiscard]] const Segment& back() const noexcept { return segments_.back(); }

    /// Path minus its last segment (root for a depth-1 path and for the root).
    [[nodiscard]] Path parent() const {
        if (segments_.empty()) return {};
        return Path(container_type(segments_.begin(), segments_.end() - 1));
    }

    Path& append(Segment seg) {
        segments_.push_back(std::move(seg));
        return *this;
    }

    void pop_back() { segments_.pop_back(); }

    /// Copy with one more segment.
    [[nodiscard]] Path child(Segment seg) const {
        Path out(*this);
        out.segments_.push_back(std::move(seg));
        return out;
    }

    /// True if @p prefix addresses this node or one of its ancestors.
    [[nodiscard]] bool starts_with(const Path& prefix) const noexcept {
        if (prefix.segments_.size() > segments_.size()) return false;
        for (size_t i = 0; i < prefix.segments_.size(); ++i)
            if (segments_[i] != prefix.segments_[i]) return false;
        return true;
    }

    /// RFC 6901 text; empty string for the root.
    [[nodiscard]] std::string to_pointer() const {
        std::string out;
        for (const auto& seg : segments_) {
            out.push_back('/');
            if (seg.is_index()) {
                out += std::to_string(seg.index());
                continue;
            }
            for (char c : seg.key()) {
                if (c == '~')      out += "~0";
                else if (c == '/') out += "~1";
                else               out.push_back(c);
            }
        }
        return out;
    }

    bool operator==(const Path& o) const noexcept { return segments_ == o.segments_; }
    bool operator!=(const Path& o) const noexcept { return segments_ != o.segments_; }
    bool operator<(const Path& o) const noexcept { return segments_ < o.segments_; }

    const container_type& segments() const noexcept { return segments_; }

private:
    container_type segments_;
};

inline std::ostream& operator<<(std::ostream& os, const Path& p) {
    return os << '"' << p.to_pointer() << '"';
}

namespace detail {

[[noreturn]] inline void throw_path(errc code, const std::string& what, const Path& path) {
    throw PathError(code, what, path.to_pointer());
}

/// One resolution step. Returns nullptr when the key/index is absent; throws
/// path_kind_mismatch when the segment does not fit the container kind.
template <typename NodeT>
NodeT* step(NodeT& cur, const Segment& seg, const Path& path) {
    if (seg.is_key()) {
        if (TREEDIT_UNLIKELY(!cur.is_object()))
            throw_path(errc::path_kind_mismatch,
                       "key \"" + seg.key() + "\" applied to " + type_name(cur.type()), path);
        return cur.as_object().find(seg.key());
    }
    if (TREEDIT_UNLIKELY(!cur.is_array()))
        throw_path(errc::path_kind_mismatch,
                   "index " + std::to_string(seg.index()) + " applied to " + type_name(cur.type()),
                   path);
    auto& arr = cur.as_array();
    return seg.index() < arr.size() ? &arr[seg.index()] : nullptr;
}

inline std::string unescape_token(std::string_view tok, std::string_view text) {
    std::string out;
    out.reserve(tok.size());
    for (size_t i = 0; i < tok.size(); ++i) {
        if (tok[i] != '~') { out.push_back(tok[i]); continue; }
        if (i + 1 >= tok.size() || (tok[i + 1] != '0' && tok[i + 1] != '1'))
            throw PathError(errc::invalid_pointer, "invalid ~ escape in path pointer",
                            std::string(text));
        out.push_back(tok[i + 1] == '0' ? '~' : '/');
        ++i;
    }
    return out;
}

inline bool parse_index(std::string_view tok, size_t& out) noexcept {
    if (tok.empty() || (tok.size() > 1 && tok[0] == '0')) return false;
    size_t idx = 0;
    for (char c : tok) {
        if (c < '0' || c > '9') return false;
        const size_t next = idx * 10 + static_cast<size_t>(c - '0');
        if (next < idx) return false;
        idx = next;
    }
    out = idx;
    return true;
}

} // namespace detail

// ─── Resolver ────────────────────────────────────────────────────────────

/// @brief Walk @p path from @p root. Throws PathError if any step fails.
inline const Node& resolve(const Node& root, const Path& path) {
    const Node* cur = &root;
    for (const auto& seg : path) {
        cur = detail::step(*cur, seg, path);
        if (!cur) detail::throw_path(errc::path_not_found, "no node at " + seg.token(), path);
    }
    return *cur;
}

inline Node& resolve(Node& root, const Path& path) {
    return const_cast<Node&>(resolve(static_cast<const Node&>(root), path));
}

/// @brief Resolve without exceptions; nullptr if the path does not address a node.
inline const Node* try_resolve(const Node& root, const Path& path) noexcept {
    const Node* cur = &root;
    for (const auto& seg : path) {
        if (seg.is_key()) {
            cur = cur->find(seg.key());
        } else {
            if (!cur->is_array() || seg.index() >= cur->size()) return nullptr;
            cur = &cur->as_array()[seg.index()];
        }
        if (!cur) return nullptr;
    }
    return cur;
}

inline Node* try_resolve(Node& root, const Path& path) noexcept {
    return const_cast<Node*>(try_resolve(static_cast<const Node&>(root), path));
}

/// @brief A container plus the segment that selects a child inside it.
struct ParentRef {
    Node& container;
    Segment segment;
};

/// @brief Resolve the container holding the node at @p path.
///
/// The container must be of the kind the last segment addresses; the child
/// itself need not exist (addChild and transforms check that separately).
inline ParentRef resolve_parent(Node& root, const Path& path) {
    if (path.empty())
        detail::throw_path(errc::root_has_no_parent, "root has no parent", path);
    Node& container = resolve(root, path.parent());
    const Segment& last = path.back();
    if ((last.is_key() && !container.is_object()) || (last.is_index() && !container.is_array()))
        detail::throw_path(errc::path_kind_mismatch,
                           "segment " + last.token() + " does not match " +
                               type_name(container.type()),
                           path);
    return {container, last};
}

/// @brief Replace the node at @p path. The empty path replaces the root.
inline void set(Node& root, const Path& path, Node value) {
    resolve(root, path) = std::move(value);
}

// ─── RFC 6901 parsing ────────────────────────────────────────────────────

inline Path Path::from_pointer(std::string_view text, const Node& root) {
    Path out;
    if (text.empty()) return out;
    if (text[0] != '/')
        throw PathError(errc::invalid_pointer, "path pointer must start with '/' or be empty",
                        std::string(text));

    const Node* cur = &root;
    std::string_view rest = text.substr(1);
    while (true) {
        const auto pos = rest.find('/');
        const auto raw = pos == std::string_view::npos ? rest : rest.substr(0, pos);
        std::string tok = detail::unescape_token(raw, text);

        if (cur->is_object()) {
            const Node* next = cur->find(tok);
            if (!next)
                throw PathError(errc::path_not_found, "key not found \"" + tok + "\"",
                                std::string(text));
            out.append(Segment(std::move(tok)));
            cur = next;
        } else if (cur->is_array()) {
            size_t idx = 0;
            if (!detail::parse_index(tok, idx))
                throw PathError(errc::path_kind_mismatch, "\"" + tok + "\" is not an array index",
                                std::string(text));
            if (idx >= cur->size())
                throw PathError(errc::path_not_found, "index " + tok + " out of range",
                                std::string(text));
            out.append(Segment(idx));
            cur = &cur->as_array()[idx];
        } else {
            throw PathError(errc::path_kind_mismatch,
                            std::string("cannot descend into ") + type_name(cur->type()),
                            std::string(text));
        }

        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    return out;
}

} // namespace treedit
