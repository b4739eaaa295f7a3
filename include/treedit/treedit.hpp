#pragma once

/// @file treedit.hpp
/// @brief Main header of the treedit library. Include this for full functionality.
///
/// treedit: a path-addressable editing engine for JSON documents.
///   - Ordered document model (Object keeps insertion order)
///   - Typed paths with RFC 6901 text form
///   - Structural transforms: rename, set, add, delete, transfer, move, group
///   - Linear undo/redo over whole-document snapshots
///   - Deterministic parse/print round trip
///   - Path-table projection for tree views
///
/// Usage:
/// @code
///   #include <treedit/treedit.hpp>
///
///   treedit::Editor ed(treedit::parse(R"({"a":1,"b":2})"));
///   ed.move({"a"}, {"b"}, treedit::MoveMode::InsertAfter);
///   std::string text = ed.text();   // {"b": 2, "a": 1}, 2-space indented
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "value.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "path.hpp"
#include "conflict.hpp"
#include "history.hpp"
#include "transform.hpp"
#include "projection.hpp"
#include "document_io.hpp"
#include "options.hpp"
#include "editor.hpp"
