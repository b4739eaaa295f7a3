#pragma once

/// @file history.hpp
/// @brief Linear undo/redo over whole-document snapshots.
///
/// Every committed edit pushes a deep copy of the document as it was just
/// before the change. A new edit invalidates the redo branch; there is no
/// branching timeline. Memory is O(history depth x document size).

#include "value.hpp"

#include <cstddef>
#include <deque>
#include <utility>

namespace treedit {

class History {
public:
    /// @param limit Maximum number of undo snapshots kept (0 = unlimited).
    explicit History(size_t limit = 0) noexcept : limit_(limit) {}

    /// Record @p current as the state to return to, and drop the redo branch.
    /// Call exactly once per edit, after validation and before the first change.
    void before_mutate(const Node& current) {
        undo_.push_back(current);
        redo_.clear();
        trim();
    }

    /// Restore the previous snapshot into @p doc. Returns false if there is none.
    bool undo(Node& doc) {
        if (undo_.empty()) return false;
        redo_.push_back(std::move(doc));
        doc = std::move(undo_.back());
        undo_.pop_back();
        return true;
    }

    /// Re-apply the most recently undone state. Returns false if there is none.
    bool redo(Node& doc) {
        if (redo_.empty()) return false;
        undo_.push_back(std::move(doc));
        doc = std::move(redo_.back());
        redo_.pop_back();
        trim();
        return true;
    }

    [[nodiscard]] bool can_undo() const noexcept { return !undo_.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return !redo_.empty(); }
    [[nodiscard]] size_t undo_size() const noexcept { return undo_.size(); }
    [[nodiscard]] size_t redo_size() const noexcept { return redo_.size(); }

    [[nodiscard]] size_t limit() const noexcept { return limit_; }
    void set_limit(size_t limit) {
        limit_ = limit;
        trim();
    }

    void clear() noexcept {
        undo_.clear();
        redo_.clear();
    }

private:
    void trim() {
        if (limit_ == 0) return;
        while (undo_.size() > limit_) undo_.pop_front();
    }

    std::deque<Node> undo_;
    std::deque<Node> redo_;
    size_t limit_;
};

} // namespace treedit
