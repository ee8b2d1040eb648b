// =============================================================================
// docrecon - Spatial Validator Tests
// =============================================================================

#include <gtest/gtest.h>

#include <vector>

#include "docrecon/validation/spatial_validator.h"
#include "test_support.h"

namespace docrecon::test {

using validation::SpatialValidator;

TEST(SpatialValidatorTest, ReportsOverlappingGroups) {
    const auto conflicts = SpatialValidator{}.checkOverlap(overlappingGroups());
    ASSERT_EQ(conflicts.size(), 1U);

    const auto& conflict = conflicts[0];
    EXPECT_EQ(conflict.groupA, 1);
    EXPECT_EQ(conflict.groupB, 2);
    EXPECT_EQ(conflict.indexA, 0U);
    EXPECT_EQ(conflict.indexB, 1U);
    EXPECT_DOUBLE_EQ(conflict.overlapArea, 12000.0);
    EXPECT_NEAR(conflict.iou, 0.15, 1e-12);
    EXPECT_TRUE(conflict.severe);
    EXPECT_EQ(conflict.contributingElements, (std::vector<ElementId>{2, 4}));
}

TEST(SpatialValidatorTest, ThresholdsAreConfigurable) {
    EXPECT_TRUE(SpatialValidator{0.2}.checkOverlap(overlappingGroups()).empty());

    const auto mild = SpatialValidator{0.1, 20000.0}.checkOverlap(overlappingGroups());
    ASSERT_EQ(mild.size(), 1U);
    EXPECT_FALSE(mild[0].severe);
}

TEST(SpatialValidatorTest, SeparatedGroupsDoNotConflict) {
    const std::vector<AnchorNumber> numbers{1, 2, 3};
    EXPECT_TRUE(SpatialValidator{}.checkOverlap(stackedGroups(numbers)).empty());
}

TEST(SpatialValidatorTest, OrphanGroupsAreIgnored) {
    GroupSet groups = overlappingGroups();
    groups.insert(groups.begin(), Group::orphan({makeText(9, BoundingBox{0, 0, 380, 260})}));
    const auto conflicts = SpatialValidator{}.checkOverlap(groups);
    ASSERT_EQ(conflicts.size(), 1U);
    EXPECT_EQ(conflicts[0].indexA, 1U);
    EXPECT_EQ(conflicts[0].indexB, 2U);
}

TEST(SpatialValidatorTest, AbnormalRange) {
    const Group tall = makeGroup(makeAnchor(0, 1, BoundingBox{0, 0, 40, 30}),
                                 {makeText(1, BoundingBox{0, 40, 300, 1200})});
    EXPECT_TRUE(SpatialValidator::isAbnormalRange(tall, 3000.0));
    EXPECT_FALSE(SpatialValidator::isAbnormalRange(tall, 4000.0));
    EXPECT_FALSE(SpatialValidator::isAbnormalRange(tall, 0.0));
    EXPECT_FALSE(SpatialValidator::isAbnormalRange(Group{}, 3000.0));
}

}  // namespace docrecon::test
