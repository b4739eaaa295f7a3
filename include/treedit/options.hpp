#pragma once

/// @file options.hpp
/// @brief Run-time configuration of an Editor.
///
/// Options can be built in code or read from a configuration document:
/// @code
///   {
///     "history_limit": 100,
///     "fallback_key": "item",
///     "log_level": "debug",
///     "print": { "indent": 2, "ensure_ascii": false },
///     "parse": { "allow_comments": true, "allow_duplicate_keys": false }
///   }
/// @endcode
/// Unknown fields are ignored; a field of the wrong type throws TypeError.

#include "error.hpp"
#include "parse_options.hpp"
#include "serializer.hpp"
#include "transform.hpp"
#include "value.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

namespace treedit {

struct EditorOptions {
    /// Parsing of setValue input and committed text.
    ParseOptions parse;

    /// Layout of text() and saved files.
    SerializeOptions print;

    /// Maximum undo depth (0 = unlimited).
    size_t history_limit = 0;

    /// Key for an Array element moved into an Object.
    std::string fallback_key = std::string(kDefaultFallbackKey);

    /// Applied to the default logger by tools; the library never sets it.
    spdlog::level::level_enum log_level = spdlog::level::info;

    static EditorOptions from_node(const Node& config);
};

namespace detail {

inline const Node* find_section(const Node& config, const char* name) {
    const Node* section = config.find(name);
    if (section && !section->is_object())
        throw TypeError(std::string("\"") + name + "\" must be an object, got " +
                        type_name(section->type()));
    return section;
}

inline void read_flag(const Node& obj, const char* name, bool& out) {
    if (const Node* v = obj.find(name)) out = v->as_bool();
}

} // namespace detail

inline EditorOptions EditorOptions::from_node(const Node& config) {
    if (!config.is_object())
        throw TypeError(std::string("editor options must be an object, got ") +
                        type_name(config.type()));

    EditorOptions opts;
    if (const Node* v = config.find("history_limit"))
        opts.history_limit = static_cast<size_t>(v->as_uinteger());
    if (const Node* v = config.find("fallback_key")) {
        opts.fallback_key = v->as_string();
        if (opts.fallback_key.empty()) throw TypeError("fallback_key must not be empty");
    }
    if (const Node* v = config.find("log_level")) {
        opts.log_level = spdlog::level::from_str(v->as_string());
    }

    if (const Node* print = detail::find_section(config, "print")) {
        if (const Node* v = print->find("indent"))
            opts.print.indent = static_cast<int>(v->as_integer());
        detail::read_flag(*print, "ensure_ascii", opts.print.ensure_ascii);
        detail::read_flag(*print, "allow_nan_inf", opts.print.allow_nan_inf);
    }

    if (const Node* parse = detail::find_section(config, "parse")) {
        if (const Node* v = parse->find("lenient"); v && v->as_bool())
            opts.parse = ParseOptions::lenient();
        detail::read_flag(*parse, "allow_comments", opts.parse.allow_comments);
        detail::read_flag(*parse, "allow_trailing_commas", opts.parse.allow_trailing_commas);
        detail::read_flag(*parse, "allow_single_quotes", opts.parse.allow_single_quotes);
        detail::read_flag(*parse, "allow_unquoted_keys", opts.parse.allow_unquoted_keys);
        detail::read_flag(*parse, "allow_nan_inf", opts.parse.allow_nan_inf);
        detail::read_flag(*parse, "allow_duplicate_keys", opts.parse.allow_duplicate_keys);
        if (const Node* v = parse->find("max_depth"))
            opts.parse.max_depth = static_cast<size_t>(v->as_uinteger());
    }
    return opts;
}

} // namespace treedit
