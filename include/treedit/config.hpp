#pragma once

/// @file config.hpp
/// @brief Configuration macros for the treedit library.
///
/// Controls:
///   - Branch prediction hints
///   - Parser recursion depth limit
///   - Default pretty-print indentation

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define TREEDIT_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define TREEDIT_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define TREEDIT_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define TREEDIT_LIKELY(x)   (x)
    #define TREEDIT_UNLIKELY(x) (x)
    #define TREEDIT_NOINLINE    __declspec(noinline)
#else
    #define TREEDIT_LIKELY(x)   (x)
    #define TREEDIT_UNLIKELY(x) (x)
    #define TREEDIT_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================

#if !defined(TREEDIT_MAX_DEPTH)
    #define TREEDIT_MAX_DEPTH 512
#endif

// =====================================================================
// Exchange text layout
// =====================================================================

/// Indentation used when printing a document for the text view and files.
#if !defined(TREEDIT_DEFAULT_INDENT)
    #define TREEDIT_DEFAULT_INDENT 2
#endif
