// =============================================================================
// docrecon - Sequence Validator Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <vector>

#include "docrecon/validation/context_validator.h"
#include "docrecon/validation/sequence_validator.h"
#include "test_support.h"

namespace docrecon::test {

using validation::GapKind;
using validation::SequenceGap;
using validation::SequenceValidator;
using validation::ValidationResult;

TEST(SequenceValidatorTest, ContiguousSequenceHasNoGaps) {
    const std::vector<AnchorNumber> numbers{1, 2, 3, 4, 5};
    EXPECT_TRUE(SequenceValidator{}.checkContinuity(numbers).empty());
}

TEST(SequenceValidatorTest, RepeatedNumbersAreAllowed) {
    const std::vector<AnchorNumber> numbers{1, 2, 2, 3};
    EXPECT_TRUE(SequenceValidator{}.checkContinuity(numbers).empty());
}

TEST(SequenceValidatorTest, ForwardGapListsMissingNumbers) {
    const std::vector<AnchorNumber> numbers{1, 2, 5, 6};
    const auto gaps = SequenceValidator{}.checkContinuity(numbers);
    ASSERT_EQ(gaps.size(), 1U);
    EXPECT_EQ(gaps[0].kind, GapKind::kForwardGap);
    EXPECT_EQ(gaps[0].before, 2);
    EXPECT_EQ(gaps[0].after, 5);
    EXPECT_EQ(gaps[0].missing, (std::vector<AnchorNumber>{3, 4}));
    EXPECT_EQ(gaps[0].expectedNext(), 3);
}

TEST(SequenceValidatorTest, ReverseAndLargeJump) {
    const std::vector<AnchorNumber> numbers{295, 204, 296};
    const auto gaps = SequenceValidator{}.checkContinuity(numbers);
    ASSERT_EQ(gaps.size(), 2U);
    EXPECT_EQ(gaps[0].kind, GapKind::kReverse);
    EXPECT_EQ(gaps[0].before, 295);
    EXPECT_EQ(gaps[0].after, 204);
    EXPECT_TRUE(gaps[0].missing.empty());
    EXPECT_EQ(gaps[1].kind, GapKind::kLargeJump);
    EXPECT_EQ(gaps[1].before, 204);
    EXPECT_EQ(gaps[1].after, 296);
}

TEST(SequenceValidatorTest, LargeJumpBoundIsConfigurable) {
    const std::vector<AnchorNumber> numbers{1, 8};
    EXPECT_EQ(SequenceValidator{}.checkContinuity(numbers)[0].kind, GapKind::kForwardGap);
    EXPECT_EQ(SequenceValidator{5}.checkContinuity(numbers)[0].kind, GapKind::kLargeJump);
}

TEST(SequenceValidatorTest, UnparsedNumbersAreSkipped) {
    const std::vector<AnchorNumber> numbers{kUnparsedNumber, 1, kUnparsedNumber, 2};
    EXPECT_TRUE(SequenceValidator{}.checkContinuity(numbers).empty());
    EXPECT_TRUE(SequenceValidator{}.checkContinuity(std::vector<AnchorNumber>{}).empty());
}

TEST(SequenceValidatorTest, LikelyMisread) {
    EXPECT_TRUE(SequenceValidator::isLikelyMisread(295, 205));
    EXPECT_TRUE(SequenceValidator::isLikelyMisread(16, 10));
    EXPECT_FALSE(SequenceValidator::isLikelyMisread(295, 204));
    EXPECT_FALSE(SequenceValidator::isLikelyMisread(9, 10));
    EXPECT_FALSE(SequenceValidator::isLikelyMisread(7, 7));

    const SequenceGap reverse{12, 10, GapKind::kReverse, {}};
    EXPECT_TRUE(SequenceValidator::isLikelyMisread(reverse));
    const SequenceGap forward{12, 14, GapKind::kForwardGap, {13}};
    EXPECT_FALSE(SequenceValidator::isLikelyMisread(forward));
}

// =============================================================================
// ValidationResult
// =============================================================================

TEST(ValidationResultTest, LargeJumpsDoNotInvalidate) {
    const ValidationResult result{std::vector<SequenceGap>{{3, 50, GapKind::kLargeJump, {}}}};
    EXPECT_TRUE(result.isValid());
    EXPECT_EQ(result.largeJumps().size(), 1U);
    EXPECT_EQ(result.summary(), "valid: 1 large jump(s) ignored");
    EXPECT_FALSE(validation::ContextValidator::needsCorrection(result));
}

TEST(ValidationResultTest, SummaryCountsFindings) {
    const ValidationResult result{std::vector<SequenceGap>{
        {2, 1, GapKind::kReverse, {}}, {1, 3, GapKind::kForwardGap, {2}}}};
    EXPECT_FALSE(result.isValid());
    EXPECT_EQ(result.summary(), "invalid: 1 reverse gap(s), 1 forward gap(s)");
    EXPECT_TRUE(validation::ContextValidator::needsCorrection(result));
    EXPECT_EQ(ValidationResult{}.summary(), "valid: all checks passed");
}

TEST(ValidationResultTest, GapDescriptions) {
    EXPECT_EQ((SequenceGap{2, 5, GapKind::kForwardGap, {3, 4}}).toString(),
              "forward gap 2 -> 5 (missing 3, 4)");
    EXPECT_EQ((SequenceGap{295, 204, GapKind::kReverse, {}}).toString(),
              "reverse 295 -> 204 (expected 296)");
}

// =============================================================================
// ContextValidator
// =============================================================================

TEST(ContextValidatorTest, ValidatesAnchorSequenceOfGroups) {
    const std::vector<AnchorNumber> numbers{1, 2, 4};
    const auto result = validation::ContextValidator{}.validate(stackedGroups(numbers));
    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.forwardGaps().size(), 1U);
    EXPECT_EQ(result.forwardGaps()[0].missing, (std::vector<AnchorNumber>{3}));
    EXPECT_TRUE(result.rangeConflicts().empty());
}

TEST(ContextValidatorTest, EmptyGroupingIsValid) {
    EXPECT_TRUE(validation::ContextValidator{}.validate({}).isValid());
}

TEST(ContextValidatorTest, QuickValidateSkipsOverlap) {
    const validation::ContextValidator validator;
    EXPECT_FALSE(validator.validate(overlappingGroups()).isValid());
    EXPECT_TRUE(validator.quickValidate(overlappingGroups()).isValid());
}

RC_GTEST_PROP(SequenceValidatorProperty, AscendingRunsAreGapFree, ()) {
    const auto start = *rc::gen::inRange<AnchorNumber>(1, 500);
    const auto length = *rc::gen::inRange<AnchorNumber>(0, 60);
    std::vector<AnchorNumber> numbers;
    for (AnchorNumber n = start; n < start + length; ++n) {
        numbers.push_back(n);
    }
    RC_ASSERT(SequenceValidator{}.checkContinuity(numbers).empty());
}

RC_GTEST_PROP(SequenceValidatorProperty, ForwardGapsListEveryMissingNumber, ()) {
    const auto numbers = *rc::gen::container<std::vector<AnchorNumber>>(
        rc::gen::inRange<AnchorNumber>(0, 40));
    for (const auto& gap : SequenceValidator{}.checkContinuity(numbers)) {
        if (gap.kind == GapKind::kForwardGap) {
            RC_ASSERT(static_cast<AnchorNumber>(gap.missing.size()) == gap.after - gap.before - 1);
        } else if (gap.kind == GapKind::kReverse) {
            RC_ASSERT(gap.after < gap.before);
        } else {
            RC_ASSERT(gap.after - gap.before > kDefaultSequenceLargeJump);
        }
    }
}

}  // namespace docrecon::test
