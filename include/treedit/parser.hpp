#pragma once

/// @file parser.hpp
/// @brief Recursive-descent parser for the exchange text.
///
/// Features:
///   - Object key order in the source text becomes insertion order
///   - Inline integer accumulation, uint64 range for large positives
///   - Non-standard extensions (comments, trailing commas, etc.)
///   - Exception-free parsing via try_parse() with error_code
///   - Recursion depth limiting to protect against stack overflow
///   - Full \uXXXX support, including surrogate pairs

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>

namespace treedit {
namespace detail {

class Parser {
public:
    /// @brief Parse exchange text (with exceptions).
    /// @throws FormatError on malformed input.
    [[nodiscard]] static Node parse(std::string_view input,
                                    const ParseOptions& opts = {}) {
        Parser p(input.data(), input.data() + input.size(), opts);
        Node result = p.parse_value();
        p.skip_ws_and_comments();
        if (TREEDIT_UNLIKELY(p.ptr_ < p.end_)) {
            p.error("unexpected trailing content", errc::trailing_content);
        }
        return result;
    }

    /// @brief Parse exchange text (no exceptions, error_code).
    [[nodiscard]] static result<Node> try_parse(
            std::string_view input, const ParseOptions& opts = {}) noexcept {
        try {
            return {parse(input, opts), {}};
        } catch (const FormatError& e) {
            return {Node{}, e.code()};
        } catch (const std::bad_alloc&) {
            return {Node{}, std::make_error_code(std::errc::not_enough_memory)};
        }
    }

private:
    const char* ptr_;
    const char* end_;
    const char* begin_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;

    Parser(const char* begin, const char* end, const ParseOptions& opts) noexcept
        : ptr_(begin), end_(end), begin_(begin), opts_(opts)
        , max_depth_(opts.depth_limit()) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation current_location() const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(ptr_ - begin_);
        for (const char* p = begin_; p < ptr_; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] TREEDIT_NOINLINE void error(const std::string& msg,
                                              errc code = errc::unexpected_character) {
        throw FormatError(msg, current_location(), code);
    }

    [[noreturn]] TREEDIT_NOINLINE void error_unexpected_end() {
        throw FormatError("unexpected end of input", current_location(),
                          errc::unexpected_end_of_input);
    }

    [[noreturn]] TREEDIT_NOINLINE void error_unexpected_char() {
        if (ptr_ >= end_) error_unexpected_end();
        throw FormatError(std::string("unexpected character '") + *ptr_ + "'",
                          current_location(), errc::unexpected_character);
    }

    // ─── Depth tracking ──────────────────────────────────────────────────────

    void push_depth() {
        if (TREEDIT_UNLIKELY(++depth_ > max_depth_)) {
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Whitespace and comments ───────────────────────────────────────

    void skip_whitespace() noexcept {
        while (ptr_ < end_) {
            const char c = *ptr_;
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') ++ptr_;
            else return;
        }
    }

    void skip_ws_and_comments() {
        skip_whitespace();
        if (!opts_.allow_comments) return;
        while (ptr_ + 1 < end_ && *ptr_ == '/') {
            if (ptr_[1] == '/') {
                ptr_ += 2;
                while (ptr_ < end_ && *ptr_ != '\n') ++ptr_;
            } else if (ptr_[1] == '*') {
                ptr_ += 2;
                bool closed = false;
                while (ptr_ + 1 < end_) {
                    if (ptr_[0] == '*' && ptr_[1] == '/') {
                        ptr_ += 2;
                        closed = true;
                        break;
                    }
                    ++ptr_;
                }
                if (!closed) error("unterminated block comment", errc::unexpected_end_of_input);
            } else {
                return;
            }
            skip_whitespace();
        }
    }

    // ─── Character reading ────────────────────────────────────────────

    void expect(char c) {
        if (TREEDIT_LIKELY(ptr_ < end_ && *ptr_ == c)) {
            ++ptr_;
            return;
        }
        if (ptr_ >= end_) error_unexpected_end();
        error(std::string("expected '") + c + "', got '" + *ptr_ + "'");
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        if (static_cast<size_t>(end_ - ptr_) < len ||
            std::memcmp(ptr_, literal, len) != 0) {
            error(std::string("expected '") + literal + "'", errc::invalid_literal);
        }
        ptr_ += len;
    }

    // ─── Value parsing ───────────────────────────────────────────────────────

    Node parse_value() {
        skip_ws_and_comments();
        if (TREEDIT_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

        switch (*ptr_) {
            case '"': return Node(parse_string('"'));
            case '\'':
                if (opts_.allow_single_quotes) return Node(parse_string('\''));
                error_unexpected_char();
            case '{': return parse_object();
            case '[': return parse_array();
            case 't': expect_literal("true");  return Node(true);
            case 'f': expect_literal("false"); return Node(false);
            case 'n': expect_literal("null");  return Node(nullptr);
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return parse_number();
            case 'N':
                if (opts_.allow_nan_inf) {
                    expect_literal("NaN");
                    return Node(std::numeric_limits<double>::quiet_NaN());
                }
                error_unexpected_char();
            case 'I':
                if (opts_.allow_nan_inf) return parse_infinity(false);
                error_unexpected_char();
            default:
                error_unexpected_char();
        }
    }

    Node parse_infinity(bool negative) {
        expect_literal("Infinity");
        const double val = std::numeric_limits<double>::infinity();
        return Node(negative ? -val : val);
    }

    // ─── String parsing ──────────────────────────────────────────────────

    std::string parse_string(char quote) {
        expect(quote);
        std::string out;
        for (;;) {
            const char* run_start = ptr_;
            while (ptr_ < end_ && *ptr_ != quote && *ptr_ != '\\') {
                if (TREEDIT_UNLIKELY(static_cast<unsigned char>(*ptr_) < 0x20))
                    error("control character in string", errc::unexpected_character);
                ++ptr_;
            }
            if (ptr_ > run_start) out.append(run_start, static_cast<size_t>(ptr_ - run_start));

            if (TREEDIT_UNLIKELY(ptr_ >= end_)) error("unterminated string", errc::unterminated_string);
            if (*ptr_ == quote) {
                ++ptr_;
                return out;
            }
            ++ptr_;
            parse_escape(out);
        }
    }

    void parse_escape(std::string& out) {
        if (TREEDIT_UNLIKELY(ptr_ >= end_))
            error("unterminated escape sequence", errc::invalid_escape);
        const char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case '\'':
                if (opts_.allow_single_quotes) { out.push_back('\''); return; }
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
            case 'u':  parse_unicode_escape(out); return;
            default:
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    uint32_t parse_hex4() {
        if (TREEDIT_UNLIKELY(end_ - ptr_ < 4))
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = ptr_[i];
            uint32_t nib;
            if (h >= '0' && h <= '9')      nib = static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') nib = static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') nib = static_cast<uint32_t>(h - 'A' + 10);
            else error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | nib;
        }
        ptr_ += 4;
        return val;
    }

    void parse_unicode_escape(std::string& out) {
        uint32_t cp = parse_hex4();

        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (TREEDIT_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u')) {
                error("missing low surrogate", errc::invalid_unicode_escape);
            }
            ptr_ += 2;
            const uint32_t low = parse_hex4();
            if (TREEDIT_UNLIKELY(low < 0xDC00 || low > 0xDFFF)) {
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            }
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (TREEDIT_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }

        char buf[4];
        const unsigned n = utf8::encode(cp, buf);
        out.append(buf, n);
    }

    // ─── Number parsing ──────────────────────────────────────────────────────

    static bool is_digit(char c) noexcept { return static_cast<unsigned>(c - '0') <= 9u; }

    Node parse_number() {
        const char* start = ptr_;
        bool negative = false;

        if (*ptr_ == '-') {
            negative = true;
            ++ptr_;
            if (TREEDIT_UNLIKELY(ptr_ >= end_)) error("invalid number", errc::invalid_number);
            if (opts_.allow_nan_inf && *ptr_ == 'I') return parse_infinity(true);
        }
        if (TREEDIT_UNLIKELY(!is_digit(*ptr_))) error("invalid number", errc::invalid_number);

        uint64_t int_val = 0;
        bool int_overflow = false;
        if (*ptr_ == '0') {
            ++ptr_;
            if (ptr_ < end_ && is_digit(*ptr_))
                error("leading zeros are not allowed", errc::invalid_number);
        } else {
            constexpr uint64_t kOverflowThreshold = std::numeric_limits<uint64_t>::max() / 10;
            constexpr uint64_t kOverflowLastDigit = std::numeric_limits<uint64_t>::max() % 10;
            while (ptr_ < end_ && is_digit(*ptr_)) {
                const auto digit = static_cast<uint64_t>(*ptr_ - '0');
                if (int_val > kOverflowThreshold ||
                    (int_val == kOverflowThreshold && digit > kOverflowLastDigit)) {
                    int_overflow = true;
                }
                if (!int_overflow) int_val = int_val * 10 + digit;
                ++ptr_;
            }
        }

        bool is_float = false;
        if (ptr_ < end_ && *ptr_ == '.') {
            is_float = true;
            ++ptr_;
            if (TREEDIT_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit after decimal point", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }
        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            is_float = true;
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (TREEDIT_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit in exponent", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (!is_float && !int_overflow) {
            if (negative) {
                constexpr uint64_t kMaxNeg =
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
                if (int_val <= kMaxNeg) {
                    // ~x + 1 avoids UB when negating INT64_MIN
                    return Node(static_cast<int64_t>(~int_val + 1));
                }
            } else {
                if (int_val <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                    return Node(static_cast<int64_t>(int_val));
                return Node(int_val);
            }
        }
        return parse_float(start);
    }

    TREEDIT_NOINLINE Node parse_float(const char* start) {
        const std::string num(start, ptr_);
        char* end_ptr = nullptr;
        const double val = std::strtod(num.c_str(), &end_ptr);
        if (TREEDIT_UNLIKELY(end_ptr != num.c_str() + num.size()))
            error("invalid number", errc::invalid_number);
        return Node(val);
    }

    // ─── Array parsing ────────────────────────────────────────────────────

    Node parse_array() {
        ++ptr_;
        push_depth();
        skip_ws_and_comments();

        if (TREEDIT_UNLIKELY(ptr_ >= end_)) error("unterminated array", errc::unterminated_array);

        Array arr;
        if (*ptr_ == ']') {
            ++ptr_;
            pop_depth();
            return Node(std::move(arr));
        }

        for (;;) {
            arr.push_back(parse_value());
            skip_ws_and_comments();

            if (TREEDIT_UNLIKELY(ptr_ >= end_)) error("unterminated array", errc::unterminated_array);

            if (*ptr_ == ',') {
                ++ptr_;
                skip_ws_and_comments();
                if (opts_.allow_trailing_commas && ptr_ < end_ && *ptr_ == ']') {
                    ++ptr_;
                    break;
                }
                continue;
            }
            if (TREEDIT_LIKELY(*ptr_ == ']')) {
                ++ptr_;
                break;
            }
            error("expected ',' or ']' in array");
        }
        pop_depth();
        return Node(std::move(arr));
    }

    // ─── Object parsing ──────────────────────────────────────────────────

    static bool is_ident_start(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
    }

    static bool is_ident_char(char c) noexcept {
        return is_ident_start(c) || is_digit(c);
    }

    std::string parse_unquoted_key() {
        const char* start = ptr_;
        ++ptr_;
        while (ptr_ < end_ && is_ident_char(*ptr_)) ++ptr_;
        return std::string(start, static_cast<size_t>(ptr_ - start));
    }

    Node parse_object() {
        ++ptr_;
        push_depth();
        skip_ws_and_comments();

        if (TREEDIT_UNLIKELY(ptr_ >= end_)) error("unterminated object", errc::unterminated_object);

        Object obj;
        if (*ptr_ == '}') {
            ++ptr_;
            pop_depth();
            return Node(std::move(obj));
        }

        std::unordered_set<std::string> seen_keys;
        for (;;) {
            skip_ws_and_comments();

            std::string key;
            if (ptr_ < end_ && *ptr_ == '"') {
                key = parse_string('"');
            } else if (opts_.allow_single_quotes && ptr_ < end_ && *ptr_ == '\'') {
                key = parse_string('\'');
            } else if (opts_.allow_unquoted_keys && ptr_ < end_ && is_ident_start(*ptr_)) {
                key = parse_unquoted_key();
            } else {
                if (ptr_ >= end_) error("unterminated object", errc::unterminated_object);
                error("expected string key in object");
            }

            skip_ws_and_comments();
            expect(':');

            Node value = parse_value();

            if (TREEDIT_LIKELY(seen_keys.insert(key).second)) {
                obj.emplace_back(std::move(key), std::move(value));
            } else if (opts_.allow_duplicate_keys) {
                // Last value wins, the key keeps its first position.
                *obj.find(key) = std::move(value);
            } else {
                error("duplicate key: \"" + key + "\"", errc::duplicate_key);
            }

            skip_ws_and_comments();
            if (TREEDIT_UNLIKELY(ptr_ >= end_)) error("unterminated object", errc::unterminated_object);

            if (*ptr_ == ',') {
                ++ptr_;
                skip_ws_and_comments();
                if (opts_.allow_trailing_commas && ptr_ < end_ && *ptr_ == '}') {
                    ++ptr_;
                    break;
                }
                continue;
            }
            if (TREEDIT_LIKELY(*ptr_ == '}')) {
                ++ptr_;
                break;
            }
            error("expected ',' or '}' in object");
        }
        pop_depth();
        return Node(std::move(obj));
    }
};

} // namespace detail

// ─── Public parsing API ─────────────────────────────────────────────────────

/// @brief Parse exchange text into a document (with exceptions).
[[nodiscard]] inline Node parse(std::string_view input, const ParseOptions& opts = {}) {
    return detail::Parser::parse(input, opts);
}

/// @brief Parse exchange text (no exceptions, returns result with error_code).
[[nodiscard]] inline result<Node> try_parse(std::string_view input,
                                             const ParseOptions& opts = {}) noexcept {
    return detail::Parser::try_parse(input, opts);
}

} // namespace treedit
