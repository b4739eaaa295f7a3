/// @file test_transfer.cpp
/// @brief Unit tests for delete_and_transfer.

#include <treedit/treedit.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace treedit;

// ═══════════════════════════════════════════════════════════════════════════════
// Object into Object
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Transfer, ObjectEntriesTakeTheRemovedPosition) {
    Node doc = parse(R"({"a": 1, "m": {"x": 2, "y": [3]}, "b": 4})");
    int calls = 0;
    EXPECT_EQ(delete_and_transfer(doc, Path{"m"}, [&] { ++calls; }), Path{});
    EXPECT_EQ(doc.as_object().keys(), (std::vector<std::string>{"a", "x", "y", "b"}));
    EXPECT_EQ(doc, parse(R"({"a": 1, "x": 2, "y": [3], "b": 4})"));
    EXPECT_EQ(calls, 1);
}

TEST(Transfer, NestedObject) {
    Node doc = parse(R"({"outer": {"keep": 0, "inner": {"k": "v"}}})");
    EXPECT_EQ(delete_and_transfer(doc, Path{"outer", "inner"}), Path{"outer"});
    EXPECT_EQ(doc, parse(R"({"outer": {"keep": 0, "k": "v"}})"));
}

TEST(Transfer, EmptyObjectJustDisappears) {
    Node doc = parse(R"({"a": 1, "m": {}})");
    delete_and_transfer(doc, Path{"m"});
    EXPECT_EQ(doc, parse(R"({"a": 1})"));
}

TEST(Transfer, ChildNamedLikeRemovedKeyConflicts) {
    Node doc = parse(R"({"a": {"a": 1, "b": 2}, "c": 3})");
    const Node before = doc;
    try {
        delete_and_transfer(doc, Path{"a"});
        FAIL() << "expected KeyConflict";
    } catch (const KeyConflict& e) {
        EXPECT_EQ(e.key(), "a");
        EXPECT_EQ(e.code(), errc::key_conflict);
    }
    EXPECT_EQ(doc, before);
}

TEST(Transfer, CollidingKeyFailsUnchanged) {
    Node doc = parse(R"({"x": 0, "m": {"y": 1, "x": 2}})");
    const Node before = doc;
    int calls = 0;
    try {
        delete_and_transfer(doc, Path{"m"}, [&] { ++calls; });
        FAIL() << "expected KeyConflict";
    } catch (const KeyConflict& e) {
        EXPECT_EQ(e.key(), "x");
    }
    EXPECT_EQ(doc, before);
    EXPECT_EQ(calls, 0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Array into Array
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Transfer, ArrayElementsSpliceIntoSlot) {
    Node doc = parse(R"([1, [2, 3], 4])");
    EXPECT_EQ(delete_and_transfer(doc, Path{1}), Path{});
    EXPECT_EQ(doc, parse("[1, 2, 3, 4]"));
}

TEST(Transfer, EmptyArraySlotVanishes) {
    Node doc = parse(R"({"l": [1, [], 2]})");
    EXPECT_EQ(delete_and_transfer(doc, Path{"l", 1}), Path{"l"});
    EXPECT_EQ(doc["l"], parse("[1, 2]"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rejections
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Transfer, KindMismatchFails) {
    const char* docs[][2] = {
        {R"({"m": [1, 2]})", "/m"},
        {R"({"m": 5})", "/m"},
        {R"([1, {"a": 1}])", "/1"},
        {R"([1, "s"])", "/1"},
    };
    for (const auto& c : docs) {
        Node doc = parse(c[0]);
        const Node before = doc;
        try {
            delete_and_transfer(doc, Path::from_pointer(c[1], doc));
            FAIL() << c[0];
        } catch (const InvalidTarget& e) {
            EXPECT_EQ(e.code(), errc::kind_mismatch) << c[0];
        }
        EXPECT_EQ(doc, before);
    }
}

TEST(Transfer, RootAndMissingFail) {
    Node doc = parse(R"({"m": {}})");
    try {
        delete_and_transfer(doc, Path{});
        FAIL();
    } catch (const InvalidTarget& e) {
        EXPECT_EQ(e.code(), errc::root_not_editable);
    }
    EXPECT_THROW(delete_and_transfer(doc, Path{"nope"}), PathError);
}
