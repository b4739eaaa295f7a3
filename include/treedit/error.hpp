#pragma once

/// @file error.hpp
/// @brief Error types for treedit: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: FormatError, PathError, KeyConflict, InvalidTarget,
///     TypeError, OutOfRangeError, IoError (default)
///   - Via error_code: treedit::errc enum + treedit_category() (exception-free)
///
/// Every engine failure is local and recoverable: the operation is aborted
/// and the document is left as it was before the call.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace treedit {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source exchange text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief treedit error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Format errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,
    duplicate_key           = 12,
    invalid_pointer         = 13,

    // Path errors (50-59)
    path_not_found          = 50,
    path_kind_mismatch      = 51,
    root_has_no_parent      = 52,

    // Value access errors (60-69)
    type_mismatch           = 60,
    out_of_range            = 61,

    // Edit errors (80-99)
    key_conflict            = 80,
    root_not_editable       = 81,
    kind_mismatch           = 82,
    missing_key             = 83,
    target_not_found        = 84,
    target_inside_source    = 85,
    selection_too_small     = 86,

    // I/O errors (100-109)
    file_open_failed        = 100,
    file_write_failed       = 101,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class treedit_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "treedit";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after JSON";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::duplicate_key:           return "duplicate key";
            case errc::invalid_pointer:         return "malformed path pointer";
            case errc::path_not_found:          return "path does not resolve";
            case errc::path_kind_mismatch:      return "path segment does not match container kind";
            case errc::root_has_no_parent:      return "root has no parent";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "index out of range";
            case errc::key_conflict:            return "key already exists";
            case errc::root_not_editable:       return "operation not allowed on the root";
            case errc::kind_mismatch:           return "node kind not valid for this operation";
            case errc::missing_key:             return "object child requires a key";
            case errc::target_not_found:        return "target does not resolve";
            case errc::target_inside_source:    return "target lies inside the moved node";
            case errc::selection_too_small:     return "at least two nodes must be selected";
            case errc::file_open_failed:        return "cannot open file";
            case errc::file_write_failed:       return "cannot write file";
            default:                            return "unknown treedit error";
        }
    }
};

} // namespace detail

/// @brief Get the treedit error category singleton.
inline const std::error_category& treedit_category() noexcept {
    static const detail::treedit_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from treedit::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), treedit_category()};
}

/// @brief Create an error_condition from treedit::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), treedit_category()};
}

/// @brief True for codes produced by the parser.
inline bool is_format_error(std::error_code ec) noexcept {
    return ec.category() == treedit_category() && ec.value() > 0 && ec.value() < 50;
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Exchange text does not parse, with source position information.
class FormatError : public std::system_error {
public:
    FormatError(const std::string& message, SourceLocation loc,
                errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Base of all structural engine failures.
///
/// Carries the offending path(s) in RFC 6901 form so the caller can report
/// them next to the description.
class EditError : public std::system_error {
public:
    EditError(errc code, const std::string& msg, std::vector<std::string> paths)
        : std::system_error(make_error_code(code), msg)
        , paths_(std::move(paths)) {}

    [[nodiscard]] const std::vector<std::string>& paths() const noexcept {
        return paths_;
    }

private:
    std::vector<std::string> paths_;
};

/// @brief Path does not resolve or addresses the wrong container kind.
class PathError : public EditError {
public:
    PathError(errc code, const std::string& msg, std::string path)
        : EditError(code, msg, {std::move(path)}) {}
};

/// @brief Destination key already occupied where no deconfliction applies.
class KeyConflict : public EditError {
public:
    KeyConflict(const std::string& key, std::string path)
        : EditError(errc::key_conflict, "key conflict: \"" + key + "\" already exists",
                    {std::move(path)})
        , key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// @brief Move/group/insert target unusable.
class InvalidTarget : public EditError {
public:
    InvalidTarget(errc code, const std::string& msg, std::vector<std::string> paths)
        : EditError(code, msg, std::move(paths)) {}
};

/// @brief Type mismatch error when accessing a node.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range), msg) {}
};

/// @brief File could not be opened or written.
class IoError : public std::system_error {
public:
    IoError(errc code, const std::string& path)
        : std::system_error(make_error_code(code), path) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = treedit::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace treedit

// Register treedit::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<treedit::errc> : true_type {};
} // namespace std
