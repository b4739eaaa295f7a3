#pragma once

/// @file editor.hpp
/// @brief The document-editing engine: one document, its history, its views.
///
/// Editor is the only mutator of its document. Each public edit validates,
/// records one undo snapshot and mutates, or throws with nothing changed and
/// nothing recorded. After every change the registered listener receives a
/// fresh path table; views hold no paths of their own across edits.
///
/// Usage:
/// @code
///   treedit::Editor ed(treedit::parse(R"({"x":1,"y":2,"z":3})"));
///   ed.group_nodes({{"x"}, {"y"}}, "g");   // {"z":3,"g":{"x":1,"y":2}}
///   ed.undo();                              // {"x":1,"y":2,"z":3}
/// @endcode

#include "document_io.hpp"
#include "error.hpp"
#include "history.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "path.hpp"
#include "projection.hpp"
#include "serializer.hpp"
#include "transform.hpp"
#include "value.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treedit {

class Editor {
public:
    /// Receives the operation name and the path table after each change.
    using ChangeListener =
        std::function<void(std::string_view op, const std::vector<TreeEntry>& table)>;

    explicit Editor(EditorOptions opts = {})
        : Editor(Node::object(), std::move(opts)) {}

    explicit Editor(Node document, EditorOptions opts = {})
        : doc_(std::move(document))
        , opts_(std::move(opts))
        , history_(opts_.history_limit) {}

    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    [[nodiscard]] const Node& document() const noexcept { return doc_; }
    [[nodiscard]] const EditorOptions& options() const noexcept { return opts_; }
    [[nodiscard]] const History& history() const noexcept { return history_; }

    void set_listener(ChangeListener listener) { listener_ = std::move(listener); }

    // ─── Structural edits ────────────────────────────────────────────────

    Path rename_key(const Path& path, const std::string& new_key) {
        return apply("rename", [&](const BeforeMutate& hook) {
            return treedit::rename_key(doc_, path, new_key, hook);
        });
    }

    Path set_value(const Path& path, std::string_view raw_text) {
        return apply("set", [&](const BeforeMutate& hook) {
            return treedit::set_value(doc_, path, raw_text, opts_.parse, hook);
        });
    }

    Path add_child(const Path& parent, const std::optional<std::string>& key = std::nullopt) {
        return apply("add", [&](const BeforeMutate& hook) {
            return treedit::add_child(doc_, parent, key, hook);
        });
    }

    Path delete_subtree(const Path& path) {
        return apply("delete", [&](const BeforeMutate& hook) {
            return treedit::delete_subtree(doc_, path, hook);
        });
    }

    Path delete_and_transfer(const Path& path) {
        return apply("transfer", [&](const BeforeMutate& hook) {
            return treedit::delete_and_transfer(doc_, path, hook);
        });
    }

    Path move(const Path& source, const Path& target, MoveMode mode) {
        return apply("move", [&](const BeforeMutate& hook) {
            return treedit::move_node(doc_, source, target, mode, opts_.fallback_key, hook);
        });
    }

    std::vector<Path> group_nodes(const std::vector<Path>& selected, const std::string& group_name) {
        return apply("group", [&](const BeforeMutate& hook) {
            return treedit::group_nodes(doc_, selected, group_name, hook);
        });
    }

    // ─── History ─────────────────────────────────────────────────────────

    bool undo() {
        if (!history_.undo(doc_)) return false;
        text_valid_ = true;
        spdlog::debug("undo ({} left)", history_.undo_size());
        notify("undo");
        return true;
    }

    bool redo() {
        if (!history_.redo(doc_)) return false;
        text_valid_ = true;
        spdlog::debug("redo ({} left)", history_.redo_size());
        notify("redo");
        return true;
    }

    [[nodiscard]] bool can_undo() const noexcept { return history_.can_undo(); }
    [[nodiscard]] bool can_redo() const noexcept { return history_.can_redo(); }

    // ─── Text view ───────────────────────────────────────────────────────

    /// Current document as exchange text.
    [[nodiscard]] std::string text() const { return print(doc_, opts_.print); }

    /// False after a commit_text() that did not parse, until the next change.
    [[nodiscard]] bool text_valid() const noexcept { return text_valid_; }

    /// @brief Replace the document with parsed @p text.
    ///
    /// Bad text is not an error for the engine: the text is flagged invalid,
    /// the document is kept, and the format error code is returned.
    /// @return value is true if the document changed.
    result<bool> commit_text(std::string_view text) {
        Node parsed;
        try {
            parsed = parse(text, opts_.parse);
        } catch (const FormatError& e) {
            text_valid_ = false;
            spdlog::warn("text not committed: {}", e.what());
            return {false, e.code()};
        }
        text_valid_ = true;
        if (parsed.dump() == doc_.dump()) return {false, {}};

        history_.before_mutate(doc_);
        doc_ = std::move(parsed);
        spdlog::debug("commit_text");
        notify("commit_text");
        return {true, {}};
    }

    // ─── Files ───────────────────────────────────────────────────────────

    /// Replace the document with the content of @p path and clear the history.
    /// @throws IoError, FormatError (the current document is kept).
    void load(const std::string& path) {
        Node doc = load_file(path, opts_.parse);
        reset(std::move(doc));
        notify("load");
    }

    void save(const std::string& path) const { save_file(path, doc_, opts_.print); }

    /// Install @p doc as a fresh document with an empty history.
    void reset(Node doc) {
        doc_ = std::move(doc);
        history_.clear();
        text_valid_ = true;
    }

    [[nodiscard]] std::vector<TreeEntry> projection() const { return project(doc_); }

private:
    template <typename Fn>
    auto apply(const char* op, Fn&& fn) -> decltype(fn(std::declval<const BeforeMutate&>())) {
        bool mutated = false;
        const BeforeMutate hook = [&] {
            history_.before_mutate(doc_);
            mutated = true;
        };
        try {
            auto out = fn(hook);
            if (mutated) {
                text_valid_ = true;
                notify(op);
            }
            return out;
        } catch (const EditError& e) {
            spdlog::debug("{} rejected: {}", op, e.what());
            throw;
        }
    }

    void notify(std::string_view op) {
        if (listener_) listener_(op, project(doc_));
    }

    Node doc_;
    EditorOptions opts_;
    History history_;
    ChangeListener listener_;
    bool text_valid_ = true;
};

} // namespace treedit
