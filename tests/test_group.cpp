/// @file test_group.cpp
/// @brief Unit tests for group_nodes.

#include <treedit/treedit.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace treedit;

// ═══════════════════════════════════════════════════════════════════════════════
// Object parents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Group, ObjectEntriesMoveIntoAppendedGroup) {
    Node doc = parse(R"({"x": 1, "y": 2, "z": 3})");
    int calls = 0;
    auto groups = group_nodes(doc, {Path{"x"}, Path{"y"}}, "g", [&] { ++calls; });
    EXPECT_EQ(groups, std::vector<Path>{Path{"g"}});
    EXPECT_EQ(doc, parse(R"({"z": 3, "g": {"x": 1, "y": 2}})"));
    EXPECT_EQ(calls, 1);
}

TEST(Group, GroupKeepsParentOrderNotSelectionOrder) {
    Node doc = parse(R"({"a": 1, "b": 2, "c": 3})");
    group_nodes(doc, {Path{"c"}, Path{"a"}}, "g");
    EXPECT_EQ(doc["g"].as_object().keys(), (std::vector<std::string>{"a", "c"}));
}

TEST(Group, NameIsDeconflicted) {
    Node doc = parse(R"({"g": 0, "x": 1, "y": 2})");
    auto groups = group_nodes(doc, {Path{"x"}, Path{"y"}}, "g");
    EXPECT_EQ(groups.front(), Path{"g_1"});
    EXPECT_EQ(doc, parse(R"({"g": 0, "g_1": {"x": 1, "y": 2}})"));
}

TEST(Group, NameFreedBySelectionIsReused) {
    Node doc = parse(R"({"g": 0, "h": 1})");
    auto groups = group_nodes(doc, {Path{"g"}, Path{"h"}}, "g");
    EXPECT_EQ(groups.front(), Path{"g"});
    EXPECT_EQ(doc, parse(R"({"g": {"g": 0, "h": 1}})"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Array parents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Group, ArrayElementsWrapAtSmallestIndex) {
    Node doc = parse(R"({"l": [1, 2, 3, 4]})");
    auto groups = group_nodes(doc, {Path{"l", 3}, Path{"l", 1}}, "g");
    EXPECT_EQ(groups, std::vector<Path>{(Path{"l", 1})});
    EXPECT_EQ(doc["l"], parse(R"([1, {"g": [2, 4]}, 3])"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Several parents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Group, OnePartitionPerParent) {
    Node doc = parse(R"({"a": {"x": 1, "y": 2}, "b": [1, 2, 3]})");
    auto groups = group_nodes(
        doc, {Path{"a", "x"}, Path{"b", 0}, Path{"a", "y"}, Path{"b", 2}}, "g");
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (Path{"a", "g"}));
    EXPECT_EQ(groups[1], (Path{"b", 0}));
    EXPECT_EQ(doc, parse(R"({"a": {"g": {"x": 1, "y": 2}}, "b": [{"g": [1, 3]}, 2]})"));
}

TEST(Group, ReturnedPathsFollowArrayShifts) {
    Node doc = parse(R"([1, 2, [3, 4]])");
    auto groups = group_nodes(doc, {Path{0}, Path{1}, Path{2, 0}, Path{2, 1}}, "g");
    EXPECT_EQ(doc, parse(R"([{"g": [1, 2]}, [{"g": [3, 4]}]])"));
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], Path{0});
    EXPECT_EQ(groups[1], (Path{1, 0}));
    for (const auto& g : groups) {
        EXPECT_TRUE(resolve(doc, g).is_object());
        EXPECT_TRUE(resolve(doc, g).contains("g"));
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rejections are atomic
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

void expect_rejected(const char* text, const std::vector<Path>& selected,
                     const std::string& name, errc expected) {
    Node doc = parse(text);
    const Node before = doc;
    int calls = 0;
    try {
        group_nodes(doc, selected, name, [&] { ++calls; });
        ADD_FAILURE() << "expected InvalidTarget for " << text;
    } catch (const InvalidTarget& e) {
        EXPECT_EQ(e.code(), expected) << text;
    }
    EXPECT_EQ(doc, before);
    EXPECT_EQ(calls, 0);
}

} // namespace

TEST(Group, TooFewDistinctNodes) {
    expect_rejected(R"({"x": 1})", {Path{"x"}}, "g", errc::selection_too_small);
    expect_rejected(R"({"x": 1})", {Path{"x"}, Path{"x"}}, "g", errc::selection_too_small);
    expect_rejected(R"({"x": 1})", {}, "g", errc::selection_too_small);
}

TEST(Group, RootEmptyNameAndNesting) {
    expect_rejected(R"({"x": 1, "y": 2})", {Path{}, Path{"x"}}, "g", errc::root_not_editable);
    expect_rejected(R"({"x": 1, "y": 2})", {Path{"x"}, Path{"y"}}, "", errc::missing_key);
    expect_rejected(R"({"x": {"k": 1}, "y": 2})", {Path{"x", "k"}, Path{"x"}}, "g",
                    errc::target_inside_source);
}

TEST(Group, MissingSelectionFailsWholeGroup) {
    Node doc = parse(R"({"a": {"x": 1, "y": 2}, "b": 3})");
    const Node before = doc;
    EXPECT_THROW(group_nodes(doc, {Path{"a", "x"}, Path{"a", "y"}, Path{"c"}, Path{"b"}}, "g"),
                 PathError);
    EXPECT_EQ(doc, before);
}
