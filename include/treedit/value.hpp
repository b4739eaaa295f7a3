#pragma once

/// @file value.hpp
/// @brief Document model core: Node, a tagged union over the JSON kinds.
///
/// Implementation:
///   - Compact tagged union: scalars inline, string/array/object on the heap
///   - Manual resource management (deep copy / ownership-transferring move / destroy)
///   - Ordered Object with positional edits (insert_at, take, rename)
///   - Structural, order-sensitive equality

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace treedit {

class Node {
public:
    Node() noexcept : kind_(Type::Null) { u_.i = 0; }
    Node(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    Node(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }
    Node(int v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Node(int64_t v) noexcept : kind_(Type::Integer) { u_.i = v; }
    Node(unsigned v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Node(uint64_t v) noexcept : kind_(Type::UInteger) { u_.u = v; }
    Node(double v) noexcept : kind_(Type::Float) { u_.d = v; }
    Node(const char* v) : kind_(Type::Null) {
        u_.i = 0;
        if (TREEDIT_UNLIKELY(!v)) return;
        u_.str = new std::string(v);
        kind_ = Type::String;
    }
    Node(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    Node(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    Node(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }

    Node(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    Node(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    Node(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    Node(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    Node(const Node& o) : kind_(o.kind_) { copy_payload(o); }
    Node(Node&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Node& operator=(const Node& o) {
        if (this != &o) { Node tmp(o); swap(tmp); }
        return *this;
    }
    Node& operator=(Node&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Node() { destroy(); }

    void swap(Node& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static Node array() { return Node(Array{}); }
    [[nodiscard]] static Node object() { return Node(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()      const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()      const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer()   const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_uinteger()  const noexcept { return kind_ == Type::UInteger; }
    [[nodiscard]] bool is_float()     const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_string()    const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()     const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()    const noexcept { return kind_ == Type::Object; }
    [[nodiscard]] bool is_number()    const noexcept { return is_integer() || is_uinteger() || is_float(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }
    [[nodiscard]] bool is_scalar()    const noexcept { return !is_container(); }

    bool as_bool() const {
        if (TREEDIT_UNLIKELY(!is_bool())) throw_type("bool");
        return u_.b;
    }
    int64_t as_integer() const {
        if (is_integer()) return u_.i;
        if (is_uinteger() && u_.u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return static_cast<int64_t>(u_.u);
        throw_type("integer");
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return u_.u;
        if (is_integer() && u_.i >= 0) return static_cast<uint64_t>(u_.i);
        throw_type("uinteger");
    }
    double as_float() const {
        if (is_float()) return u_.d;
        if (is_integer()) return static_cast<double>(u_.i);
        if (is_uinteger()) return static_cast<double>(u_.u);
        throw_type("number");
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (TREEDIT_UNLIKELY(!is_string())) throw_type("string");
        return *u_.str;
    }
    [[nodiscard]] const std::string& as_string() const {
        if (TREEDIT_UNLIKELY(!is_string())) throw_type("string");
        return *u_.str;
    }

    [[nodiscard]] const Array& as_array() const {
        if (TREEDIT_UNLIKELY(!is_array())) throw_type("array");
        return *u_.arr;
    }
    Array& as_array() {
        if (TREEDIT_UNLIKELY(!is_array())) throw_type("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (TREEDIT_UNLIKELY(!is_object())) throw_type("object");
        return *u_.obj;
    }
    Object& as_object() {
        if (TREEDIT_UNLIKELY(!is_object())) throw_type("object");
        return *u_.obj;
    }

    /// Typed access with fallback, no exceptions.
    template <typename T>
    [[nodiscard]] T get_or(const T& dv) const noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return is_bool() ? u_.b : dv;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int> ||
                             std::is_same_v<T, long> || std::is_same_v<T, size_t>) {
            if (is_integer()) return static_cast<T>(u_.i);
            if (is_uinteger()) return static_cast<T>(u_.u);
            return dv;
        } else if constexpr (std::is_same_v<T, double>) {
            if (is_float()) return u_.d;
            if (is_integer()) return static_cast<double>(u_.i);
            if (is_uinteger()) return static_cast<double>(u_.u);
            return dv;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return is_string() ? *u_.str : dv;
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for get_or<T>()");
        }
    }

    Node& operator[](size_t index) {
        auto& a = as_array();
        if (TREEDIT_UNLIKELY(index >= a.size())) throw_index(index, a.size());
        return a[index];
    }
    const Node& operator[](size_t index) const {
        const auto& a = as_array();
        if (TREEDIT_UNLIKELY(index >= a.size())) throw_index(index, a.size());
        return a[index];
    }
    Node& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const Node& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    Node& operator[](std::string_view key) { return as_object().at(key); }
    const Node& operator[](std::string_view key) const { return as_object().at(key); }
    Node& operator[](const char* key) { return operator[](std::string_view(key)); }
    const Node& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const Node* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] Node* find(std::string_view key) {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return is_null();
    }

    void push_back(const Node& v) { as_array().push_back(v); }
    void push_back(Node&& v)      { as_array().push_back(std::move(v)); }
    void insert(std::string key, Node v) { as_object().insert(std::move(key), std::move(v)); }
    bool erase(std::string_view key) { return as_object().erase(key); }

    /// Structural equality. Object and Array comparisons are order-sensitive;
    /// numbers compare by value across integer/float kinds.
    [[nodiscard]] bool operator==(const Node& other) const {
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number()) {
                if ((is_integer() && other.is_uinteger()) || (is_uinteger() && other.is_integer())) {
                    int64_t  sv = is_integer()  ? u_.i : other.u_.i;
                    uint64_t uv = is_uinteger() ? u_.u : other.u_.u;
                    return sv >= 0 && static_cast<uint64_t>(sv) == uv;
                }
                return as_float() == other.as_float();
            }
            return false;
        }
        switch (kind_) {
            case Type::Null:     return true;
            case Type::Bool:     return u_.b == other.u_.b;
            case Type::Integer:  return u_.i == other.u_.i;
            case Type::UInteger: return u_.u == other.u_.u;
            case Type::Float:    return u_.d == other.u_.d;
            case Type::String:   return *u_.str == *other.u_.str;
            case Type::Array:    return *u_.arr == *other.u_.arr;
            case Type::Object:   return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Node& other) const { return !(*this == other); }

    [[nodiscard]] std::string dump(int indent = -1) const;
    [[nodiscard]] std::string dump(const struct SerializeOptions& opts) const;

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; uint64_t u; double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    [[noreturn]] TREEDIT_NOINLINE void throw_type(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    [[noreturn]] TREEDIT_NOINLINE static void throw_index(size_t index, size_t size) {
        throw OutOfRangeError("array index " + std::to_string(index) +
                              " out of range (size=" + std::to_string(size) + ")");
    }

    void copy_payload(const Node& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
    }
};

// ─── Object special member functions ─────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries_(o.entries_) {}
inline Object::Object(Object&& o) noexcept : entries_(std::move(o.entries_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) entries_ = o.entries_;
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) entries_ = std::move(o.entries_);
    return *this;
}
inline Object::Object(std::initializer_list<entry_type> init) {
    entries_.reserve(init.size());
    for (const auto& e : init) insert(e.first, e.second);
}

// ─── Object lookup and modifiers ─────────────────────────────────────────

inline Node* Object::find(std::string_view key) noexcept {
    for (auto& [k, v] : entries_) if (k == key) return &v;
    return nullptr;
}
inline const Node* Object::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : entries_) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline Object::size_type Object::position_of(std::string_view key) const noexcept {
    for (size_type i = 0; i < entries_.size(); ++i)
        if (entries_[i].first == key) return i;
    return npos;
}
inline Node& Object::at(std::string_view key) {
    auto* p = find(key);
    if (TREEDIT_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline const Node& Object::at(std::string_view key) const {
    auto* p = find(key);
    if (TREEDIT_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline void Object::insert(std::string key, Node value) {
    if (auto* p = find(key)) { *p = std::move(value); return; }
    entries_.emplace_back(std::move(key), std::move(value));
}
inline void Object::insert_at(size_type pos, std::string key, Node value) {
    pos = std::min(pos, entries_.size());
    entries_.emplace(entries_.begin() + static_cast<std::ptrdiff_t>(pos),
                     std::move(key), std::move(value));
}
template <typename K, typename V>
void Object::emplace_back(K&& key, V&& value) {
    entries_.emplace_back(std::forward<K>(key), std::forward<V>(value));
}
inline bool Object::erase(std::string_view key) {
    const auto pos = position_of(key);
    if (pos == npos) return false;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    return true;
}
inline Node Object::take(std::string_view key) {
    const auto pos = position_of(key);
    if (TREEDIT_UNLIKELY(pos == npos))
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    Node out = std::move(entries_[pos].second);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    return out;
}
inline bool Object::rename(std::string_view from, std::string to) {
    const auto pos = position_of(from);
    if (pos == npos || (from != to && contains(to))) return false;
    entries_[pos].first = std::move(to);
    return true;
}
inline std::vector<std::string> Object::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.first);
    return out;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (size_type i = 0; i < entries_.size(); ++i) {
        if (entries_[i].first != other.entries_[i].first) return false;
        if (entries_[i].second != other.entries_[i].second) return false;
    }
    return true;
}

} // namespace treedit
