/// @file test_move.cpp
/// @brief Unit tests for move_node in all three modes.

#include <treedit/treedit.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace treedit;

// ═══════════════════════════════════════════════════════════════════════════════
// Mode names
// ═══════════════════════════════════════════════════════════════════════════════

TEST(MoveMode, ParseAndName) {
    EXPECT_EQ(parse_move_mode("before"), MoveMode::InsertBefore);
    EXPECT_EQ(parse_move_mode("insert_after"), MoveMode::InsertAfter);
    EXPECT_EQ(parse_move_mode("nest"), MoveMode::Nest);
    EXPECT_FALSE(parse_move_mode("inside").has_value());
    EXPECT_STREQ(move_mode_name(MoveMode::InsertAfter), "after");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Reordering siblings
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Move, ObjectEntryAfterSibling) {
    Node doc = parse(R"({"a": 1, "b": 2})");
    int calls = 0;
    Path moved = move_node(doc, Path{"a"}, Path{"b"}, MoveMode::InsertAfter,
                           kDefaultFallbackKey, [&] { ++calls; });
    EXPECT_EQ(moved, Path{"a"});
    EXPECT_EQ(doc.as_object().keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(doc["a"].as_integer(), 1);
    EXPECT_EQ(calls, 1);
}

TEST(Move, ObjectEntryBeforeSibling) {
    Node doc = parse(R"({"a": 1, "b": 2, "c": 3})");
    move_node(doc, Path{"c"}, Path{"a"}, MoveMode::InsertBefore);
    EXPECT_EQ(doc.as_object().keys(), (std::vector<std::string>{"c", "a", "b"}));
}

TEST(Move, ArrayAfterThenBeforeIsInverse) {
    Node doc = parse("[1, 2, 3]");
    Path p = move_node(doc, Path{0}, Path{2}, MoveMode::InsertAfter);
    EXPECT_EQ(doc, parse("[2, 3, 1]"));
    EXPECT_EQ(p, Path{2});

    p = move_node(doc, p, Path{0}, MoveMode::InsertBefore);
    EXPECT_EQ(doc, parse("[1, 2, 3]"));
    EXPECT_EQ(p, Path{0});
}

TEST(Move, ArrayForwardBeforeAdjustsForRemoval) {
    Node doc = parse("[0, 1, 2, 3]");
    Path p = move_node(doc, Path{0}, Path{3}, MoveMode::InsertBefore);
    EXPECT_EQ(doc, parse("[1, 2, 0, 3]"));
    EXPECT_EQ(p, Path{2});
    EXPECT_EQ(resolve(doc, p).as_integer(), 0);
}

TEST(Move, BetweenArraysLandsNextToTarget) {
    Node doc = parse(R"({"a": [1, 2], "b": [10, 20]})");
    Path p = move_node(doc, Path{"a", 0}, Path{"b", 1}, MoveMode::InsertBefore);
    EXPECT_EQ(doc, parse(R"({"a": [2], "b": [10, 1, 20]})"));
    EXPECT_EQ(p, (Path{"b", 1}));
}

TEST(Move, IntoOtherObjectAppendsUnderDeconflictedKey) {
    Node doc = parse(R"({"p": {"x": 1}, "q": {"y": 2, "x": 0, "z": 3}})");
    Path p = move_node(doc, Path{"p", "x"}, Path{"q", "y"}, MoveMode::InsertAfter);
    EXPECT_EQ(p, (Path{"q", "x_1"}));
    EXPECT_EQ(doc["q"].as_object().keys(), (std::vector<std::string>{"y", "x", "z", "x_1"}));
    EXPECT_TRUE(doc["p"].empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Nesting
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Move, NestIntoObjectDeconflicts) {
    Node doc = parse(R"({"a": 1, "o": {"a": 2}})");
    Path p = move_node(doc, Path{"a"}, Path{"o"}, MoveMode::Nest);
    EXPECT_EQ(p, (Path{"o", "a_1"}));
    EXPECT_EQ(doc, parse(R"({"o": {"a": 2, "a_1": 1}})"));
}

TEST(Move, NestIntoArrayAppends) {
    Node doc = parse(R"({"a": {"k": true}, "l": [0]})");
    Path p = move_node(doc, Path{"a"}, Path{"l"}, MoveMode::Nest);
    EXPECT_EQ(p, (Path{"l", 1}));
    EXPECT_EQ(doc, parse(R"({"l": [0, {"k": true}]})"));
}

TEST(Move, ArrayElementIntoObjectGetsFallbackKey) {
    Node doc = parse(R"({"l": [5, 6], "o": {"item": 0}})");
    Path p = move_node(doc, Path{"l", 0}, Path{"o"}, MoveMode::Nest);
    EXPECT_EQ(p, (Path{"o", "item_1"}));
    EXPECT_EQ(doc, parse(R"({"l": [6], "o": {"item": 0, "item_1": 5}})"));

    p = move_node(doc, Path{"l", 0}, Path{"o"}, MoveMode::Nest, "entry");
    EXPECT_EQ(p, (Path{"o", "entry"}));
}

TEST(Move, DestinationPathShiftsAfterSourceRemoval) {
    Node doc = parse(R"([7, [8]])");
    Path p = move_node(doc, Path{0}, Path{1}, MoveMode::Nest);
    EXPECT_EQ(doc, parse("[[8, 7]]"));
    EXPECT_EQ(p, (Path{0, 1}));
    EXPECT_EQ(resolve(doc, p).as_integer(), 7);
}

TEST(Move, NestOntoScalarInArrayAppendsToThatArray) {
    Node doc = parse(R"({"l": [1, 2, 3], "o": {}})");
    Path p = move_node(doc, Path{"l", 0}, Path{"l", 1}, MoveMode::Nest);
    EXPECT_EQ(doc["l"], parse("[2, 3, 1]"));
    EXPECT_EQ(p, (Path{"l", 2}));

    p = move_node(doc, Path{"o"}, Path{"l", 0}, MoveMode::Nest);
    EXPECT_EQ(doc, parse(R"({"l": [2, 3, 1, {}]})"));
    EXPECT_EQ(p, (Path{"l", 3}));
}

TEST(Move, NestOntoScalarInOwnObjectLandsAfterIt) {
    Node doc = parse(R"({"a": 1, "b": 2, "c": 3})");
    Path p = move_node(doc, Path{"c"}, Path{"a"}, MoveMode::Nest);
    EXPECT_EQ(p, Path{"c"});
    EXPECT_EQ(doc.as_object().keys(), (std::vector<std::string>{"a", "c", "b"}));
}

TEST(Move, NestOntoScalarInOtherObjectAppends) {
    Node doc = parse(R"({"m": [true], "o": {"s": "x", "m": 0, "t": 1}})");
    Path p = move_node(doc, Path{"m"}, Path{"o", "s"}, MoveMode::Nest);
    EXPECT_EQ(p, (Path{"o", "m_1"}));
    EXPECT_EQ(doc, parse(R"({"o": {"s": "x", "m": 0, "t": 1, "m_1": [true]}})"));
}

TEST(Move, ValueIsNeverDuplicated) {
    Node doc = parse(R"({"a": {"deep": [1, 2, 3]}, "b": []})");
    move_node(doc, Path{"a"}, Path{"b"}, MoveMode::Nest);
    EXPECT_FALSE(doc.contains("a"));
    EXPECT_EQ(doc["b"].size(), 1u);
    EXPECT_EQ(doc["b"][0]["deep"].size(), 3u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rejections leave the document and history untouched
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

errc move_error(Node& doc, const Path& src, const Path& dst, MoveMode mode) {
    const Node before = doc;
    int calls = 0;
    errc code = errc::ok;
    try {
        move_node(doc, src, dst, mode, kDefaultFallbackKey, [&] { ++calls; });
    } catch (const InvalidTarget& e) {
        code = static_cast<errc>(e.code().value());
    }
    EXPECT_EQ(doc, before);
    EXPECT_EQ(calls, 0);
    return code;
}

} // namespace

TEST(Move, Rejections) {
    Node doc = parse(R"({"a": {"b": {"c": 1}}, "s": "x", "l": [1]})");
    EXPECT_EQ(move_error(doc, Path{}, Path{"l"}, MoveMode::Nest), errc::root_not_editable);
    EXPECT_EQ(move_error(doc, Path{"s"}, Path{"nope"}, MoveMode::Nest), errc::target_not_found);
    EXPECT_EQ(move_error(doc, Path{"a"}, Path{"a", "b"}, MoveMode::Nest),
              errc::target_inside_source);
    EXPECT_EQ(move_error(doc, Path{"a"}, Path{"a"}, MoveMode::InsertAfter),
              errc::target_inside_source);
    EXPECT_EQ(move_error(doc, Path{"s"}, Path{}, MoveMode::InsertBefore),
              errc::root_not_editable);
}

TEST(Move, MissingSourceIsPathError) {
    Node doc = parse(R"({"a": 1})");
    EXPECT_THROW(move_node(doc, Path{"zz"}, Path{"a"}, MoveMode::InsertAfter), PathError);
}
