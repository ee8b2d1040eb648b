// =============================================================================
// docrecon - Element and Group Tests
// =============================================================================

#include <gtest/gtest.h>

#include <vector>

#include "docrecon/model/element.h"
#include "docrecon/model/group.h"
#include "test_support.h"

namespace docrecon::test {

// =============================================================================
// Anchor Number Parsing
// =============================================================================

TEST(AnchorNumberTest, PlainAndDecorated) {
    EXPECT_EQ(parseAnchorNumber("12"), 12);
    EXPECT_EQ(parseAnchorNumber("12."), 12);
    EXPECT_EQ(parseAnchorNumber("(7)"), 7);
    EXPECT_EQ(parseAnchorNumber("Q3"), 3);
    EXPECT_EQ(parseAnchorNumber("문 15"), 15);
}

TEST(AnchorNumberTest, CircledNumerals) {
    EXPECT_EQ(parseAnchorNumber("①"), 1);
    EXPECT_EQ(parseAnchorNumber("④"), 4);
    EXPECT_EQ(parseAnchorNumber("⑳"), 20);
}

TEST(AnchorNumberTest, FirstDigitRunWins) {
    EXPECT_EQ(parseAnchorNumber("3-2"), 3);
}

TEST(AnchorNumberTest, Unparsed) {
    EXPECT_EQ(parseAnchorNumber(""), kUnparsedNumber);
    EXPECT_EQ(parseAnchorNumber("Question"), kUnparsedNumber);
    EXPECT_EQ(parseAnchorNumber("1234567890"), kUnparsedNumber);
}

TEST(AnchorNumberTest, LowConfidenceTextIsIgnored) {
    Element anchor = makeAnchor(1, 5, BoundingBox{0, 0, 20, 20});
    EXPECT_EQ(anchorNumberOf(anchor), 5);
    anchor.textConfidence = 0.5;
    EXPECT_EQ(anchorNumberOf(anchor), kUnparsedNumber);
    anchor.textConfidence.reset();
    EXPECT_EQ(anchorNumberOf(anchor), 5);
    anchor.text.reset();
    EXPECT_EQ(anchorNumberOf(anchor), kUnparsedNumber);
}

TEST(ElementTest, ReadingOrderComparesTopThenLeftThenId) {
    const Element a = makeText(3, BoundingBox{50, 10, 60, 20});
    const Element b = makeText(1, BoundingBox{10, 10, 20, 20});
    const Element c = makeText(2, BoundingBox{0, 30, 20, 40});
    EXPECT_TRUE(readingOrderLess(b, a));
    EXPECT_TRUE(readingOrderLess(a, c));
    EXPECT_FALSE(readingOrderLess(a, a));

    const Element twin = makeText(0, a.box);
    EXPECT_TRUE(readingOrderLess(twin, a));
}

// =============================================================================
// Group
// =============================================================================

TEST(GroupTest, AnchorDefinesNumber) {
    const Group group(makeAnchor(0, 4, BoundingBox{0, 0, 20, 20}));
    EXPECT_TRUE(group.hasAnchor());
    EXPECT_FALSE(group.isOrphan());
    EXPECT_EQ(group.number(), 4);
    EXPECT_EQ(group.size(), 1U);
    EXPECT_EQ(group.envelope(), (BoundingBox{0, 0, 20, 20}));
}

TEST(GroupTest, ChildrenKeepInsertionOrderAndGrowEnvelope) {
    Group group(makeAnchor(0, 1, BoundingBox{0, 0, 20, 20}));
    group.addChild(makeText(1, BoundingBox{30, 0, 200, 40}));
    group.addChild(makeText(2, BoundingBox{0, 50, 100, 90}));
    group.prependChild(makeElement(3, ElementClass::kFigure, BoundingBox{0, 100, 150, 300}));

    ASSERT_EQ(group.children().size(), 3U);
    EXPECT_EQ(group.children()[0].id, 3U);
    EXPECT_EQ(group.children()[1].id, 1U);
    EXPECT_EQ(group.children()[2].id, 2U);
    EXPECT_EQ(group.envelope(), (BoundingBox{0, 0, 200, 300}));

    const auto members = group.members();
    ASSERT_EQ(members.size(), 4U);
    EXPECT_EQ(members.front().id, 0U);
}

TEST(GroupTest, RemovalShrinksEnvelope) {
    Group group(makeAnchor(0, 1, BoundingBox{0, 0, 20, 20}));
    group.addChild(makeText(1, BoundingBox{0, 30, 100, 60}));
    group.addChild(makeText(2, BoundingBox{0, 70, 500, 400}));

    const auto removed = group.removeChildByBox(BoundingBox{0.4, 70, 500, 400.6});
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->id, 2U);
    EXPECT_EQ(group.envelope(), (BoundingBox{0, 0, 100, 60}));

    EXPECT_FALSE(group.removeChild(99).has_value());
    EXPECT_TRUE(group.removeChild(1).has_value());
    EXPECT_EQ(group.envelope(), (BoundingBox{0, 0, 20, 20}));
}

TEST(GroupTest, OrphanGroup) {
    const Group orphan = Group::orphan({makeText(5, BoundingBox{0, 200, 50, 250}),
                                        makeText(6, BoundingBox{10, 100, 60, 150})});
    EXPECT_TRUE(orphan.isOrphan());
    EXPECT_EQ(orphan.number(), kUnparsedNumber);
    EXPECT_DOUBLE_EQ(orphan.sortY(), 100.0);
    EXPECT_EQ(orphan.envelope(), (BoundingBox{0, 100, 60, 250}));
}

// =============================================================================
// GroupSet helpers
// =============================================================================

TEST(GroupSetTest, SequenceAndLookup) {
    const std::vector<AnchorNumber> numbers{1, 2, 2, 4};
    GroupSet groups = stackedGroups(numbers);
    groups.push_back(Group(makeElement(100, ElementClass::kQuestionType,
                                       BoundingBox{100, 1000, 300, 1030}, "Part 9")));

    EXPECT_EQ(totalElementCount(groups), 9U);
    EXPECT_EQ(anchorSequence(groups), (std::vector<AnchorNumber>{1, 2, 2, 4}));
    EXPECT_EQ(findGroupIndex(groups, 2), 1U);
    EXPECT_FALSE(findGroupIndex(groups, 3).has_value());

    const auto located = locateChildByBox(groups, BoundingBox{150, 500, 900, 620});
    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->first, 2U);
    EXPECT_EQ(located->second, 5U);
}

TEST(GroupSetTest, FlattenAssignsPositions) {
    const std::vector<AnchorNumber> numbers{1, 2};
    const auto ordered = flattenGroups(stackedGroups(numbers));
    ASSERT_EQ(ordered.size(), 4U);
    EXPECT_EQ(ordered[0], (OrderedElement{0, 0, 0, 0}));
    EXPECT_EQ(ordered[1], (OrderedElement{1, 0, 1, 1}));
    EXPECT_EQ(ordered[2], (OrderedElement{2, 1, 0, 2}));
    EXPECT_EQ(ordered[3], (OrderedElement{3, 1, 1, 3}));
}

}  // namespace docrecon::test
