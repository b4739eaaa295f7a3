#pragma once

/// @file serializer.hpp
/// @brief Deterministic printer for the exchange text.
///
/// Features:
///   - Output to string (print / dump) and streaming output (ostream)
///   - Stable indentation, Object entries in insertion order, Array in index order
///   - ensure_ascii mode for encoding non-ASCII -> \uXXXX
///   - NaN/Infinity printed as null unless allow_nan_inf is set

#include "config.hpp"
#include "detail/number.hpp"
#include "detail/utf8.hpp"
#include "value.hpp"

#include <cmath>
#include <ostream>
#include <string>
#include <string_view>

namespace treedit {

/// @brief Serialization options.
struct SerializeOptions {
    int indent = TREEDIT_DEFAULT_INDENT; ///< Indentation (-1 = compact, >= 0 = pretty-printed)
    bool ensure_ascii = false;           ///< Encode all non-ASCII characters as \uXXXX
    bool allow_nan_inf = false;          ///< Serialize NaN/Infinity instead of null

    static SerializeOptions compact() noexcept {
        SerializeOptions opts;
        opts.indent = -1;
        return opts;
    }
};

namespace detail {

inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

/// @brief Output adapter: appends to a std::string.
class StringOutput {
public:
    void write(char c) { result_.push_back(c); }
    void write(const char* s, size_t n) { result_.append(s, n); }
    std::string& result() noexcept { return result_; }

private:
    std::string result_;
};

/// @brief Output adapter: writes through to a std::ostream.
class StreamOutput {
public:
    explicit StreamOutput(std::ostream& os) noexcept : os_(os) {}

    StreamOutput(const StreamOutput&) = delete;
    StreamOutput& operator=(const StreamOutput&) = delete;

    void write(char c) { os_.put(c); }
    void write(const char* s, size_t n) { os_.write(s, static_cast<std::streamsize>(n)); }

private:
    std::ostream& os_;
};

template <typename Output>
class SerializerImpl {
public:
    SerializerImpl(Output& out, const SerializeOptions& opts) noexcept
        : out_(out), opts_(opts), pretty_(opts.indent >= 0) {}

    void serialize(const Node& value) {
        current_indent_ = 0;
        write_value(value);
    }

private:
    Output& out_;
    const SerializeOptions& opts_;
    const bool pretty_;
    int current_indent_ = 0;

    void write_indent() {
        for (int i = 0; i < current_indent_; ++i) out_.write(' ');
    }

    void write_newline() {
        if (pretty_) out_.write('\n');
    }

    void write_value(const Node& v) {
        switch (v.type()) {
            case Type::Null:
                out_.write("null", 4);
                break;
            case Type::Bool:
                if (v.as_bool()) out_.write("true", 4);
                else out_.write("false", 5);
                break;
            case Type::Integer: {
                char buf[24];
                out_.write(buf, write_integer(buf, v.as_integer()));
                break;
            }
            case Type::UInteger: {
                char buf[24];
                out_.write(buf, write_uinteger(buf, v.as_uinteger()));
                break;
            }
            case Type::Float:
                write_float(v.as_float());
                break;
            case Type::String:
                write_string(v.as_string_view());
                break;
            case Type::Array:
                write_array(v.as_array());
                break;
            case Type::Object:
                write_object(v.as_object());
                break;
        }
    }

    void write_float(double val) {
        if (TREEDIT_UNLIKELY(std::isnan(val))) {
            if (opts_.allow_nan_inf) out_.write("NaN", 3);
            else out_.write("null", 4);
            return;
        }
        if (TREEDIT_UNLIKELY(std::isinf(val))) {
            if (opts_.allow_nan_inf) {
                if (val < 0) out_.write('-');
                out_.write("Infinity", 8);
            } else {
                out_.write("null", 4);
            }
            return;
        }
        char buf[32];
        out_.write(buf, write_double(buf, val));
    }

    void write_u16_escape(uint32_t val) {
        const char buf[6] = {'\\', 'u',
            kHexDigits[(val >> 12) & 0xF],
            kHexDigits[(val >> 8) & 0xF],
            kHexDigits[(val >> 4) & 0xF],
            kHexDigits[val & 0xF]};
        out_.write(buf, 6);
    }

    void write_string(std::string_view s) {
        out_.write('"');
        const char* ptr = s.data();
        const char* const str_end = ptr + s.size();
        while (ptr < str_end) {
            const auto c = static_cast<unsigned char>(*ptr);
            switch (c) {
                case '"':  out_.write("\\\"", 2); ++ptr; continue;
                case '\\': out_.write("\\\\", 2); ++ptr; continue;
                case '\b': out_.write("\\b", 2);  ++ptr; continue;
                case '\f': out_.write("\\f", 2);  ++ptr; continue;
                case '\n': out_.write("\\n", 2);  ++ptr; continue;
                case '\r': out_.write("\\r", 2);  ++ptr; continue;
                case '\t': out_.write("\\t", 2);  ++ptr; continue;
                default: break;
            }
            if (c < 0x20) {
                write_u16_escape(c);
                ++ptr;
            } else if (c >= 0x80 && opts_.ensure_ascii) {
                const uint32_t cp = utf8::decode(ptr, str_end);
                if (cp <= 0xFFFF) {
                    write_u16_escape(cp);
                } else {
                    const uint32_t adj = cp - 0x10000;
                    write_u16_escape(0xD800 + (adj >> 10));
                    write_u16_escape(0xDC00 + (adj & 0x3FF));
                }
            } else {
                out_.write(static_cast<char>(c));
                ++ptr;
            }
        }
        out_.write('"');
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { out_.write("[]", 2); return; }
        out_.write('[');
        if (pretty_) current_indent_ += opts_.indent;
        write_newline();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) { out_.write(','); write_newline(); }
            write_indent();
            write_value(arr[i]);
        }
        if (pretty_) current_indent_ -= opts_.indent;
        write_newline();
        write_indent();
        out_.write(']');
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { out_.write("{}", 2); return; }
        out_.write('{');
        if (pretty_) current_indent_ += opts_.indent;
        write_newline();
        bool first = true;
        for (const auto& [key, value] : obj) {
            if (!first) { out_.write(','); write_newline(); }
            first = false;
            write_indent();
            write_string(key);
            out_.write(':');
            if (pretty_) out_.write(' ');
            write_value(value);
        }
        if (pretty_) current_indent_ -= opts_.indent;
        write_newline();
        write_indent();
        out_.write('}');
    }
};

} // namespace detail

/// @brief Print a document to exchange text (2-space indentation by default).
[[nodiscard]] inline std::string print(const Node& value, const SerializeOptions& opts = {}) {
    detail::StringOutput out;
    detail::SerializerImpl<detail::StringOutput>(out, opts).serialize(value);
    return std::move(out.result());
}

/// @brief Print to an ostream.
inline void print(std::ostream& os, const Node& value, const SerializeOptions& opts = {}) {
    detail::StreamOutput out(os);
    detail::SerializerImpl<detail::StreamOutput>(out, opts).serialize(value);
}

// ─── Node::dump() implementation ─────────────────────────────────────────

inline std::string Node::dump(int indent) const {
    SerializeOptions opts;
    opts.indent = indent;
    return print(*this, opts);
}

inline std::string Node::dump(const SerializeOptions& opts) const {
    return print(*this, opts);
}

/// @brief Compact form for diagnostics and gtest failure messages.
inline std::ostream& operator<<(std::ostream& os, const Node& value) {
    print(os, value, SerializeOptions::compact());
    return os;
}

} // namespace treedit
