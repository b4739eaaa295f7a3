#pragma once

/// @file parse_options.hpp
/// @brief How exchange text is read: by load, commit_text and set_value.
///
/// The default is strict RFC 8259. lenient() accepts what people tend to
/// type by hand into a value field or a config file:
/// @code
///   {
///     // comment
///     name: 'x',          // unquoted key, single quotes
///     limits: [1, 2,],    // trailing comma
///     ratio: NaN,
///   }
/// @endcode

#include "config.hpp"

#include <cstddef>

namespace treedit {

struct ParseOptions {
    bool allow_comments        = false;  ///< `// ...` and `/* ... */`
    bool allow_trailing_commas = false;  ///< `[1,2,]`, `{"a":1,}`
    bool allow_single_quotes   = false;  ///< `'text'`
    bool allow_unquoted_keys   = false;  ///< `{key: 1}`
    bool allow_nan_inf         = false;  ///< `NaN`, `Infinity`, `-Infinity`

    /// A repeated key overwrites the earlier value in its original position.
    /// When false the text is rejected with errc::duplicate_key.
    bool allow_duplicate_keys  = true;

    /// Nesting limit; 0 means TREEDIT_MAX_DEPTH.
    size_t max_depth = 0;

    [[nodiscard]] constexpr size_t depth_limit() const noexcept {
        return max_depth > 0 ? max_depth : TREEDIT_MAX_DEPTH;
    }

    static constexpr ParseOptions strict() noexcept { return {}; }

    static constexpr ParseOptions lenient() noexcept {
        ParseOptions opts;
        opts.allow_comments = opts.allow_trailing_commas = true;
        opts.allow_single_quotes = opts.allow_unquoted_keys = true;
        opts.allow_nan_inf = true;
        return opts;
    }
};

} // namespace treedit
