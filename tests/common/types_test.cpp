// =============================================================================
// docrecon - Taxonomy Parsing Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstddef>

#include "docrecon/common/types.h"

namespace docrecon::test {

TEST(ElementClassTest, ParsesCanonicalNames) {
    EXPECT_EQ(parseElementClass("question_number"), ElementClass::kQuestionNumber);
    EXPECT_EQ(parseElementClass("second_question_number"), ElementClass::kSecondQuestionNumber);
    EXPECT_EQ(parseElementClass("figure"), ElementClass::kFigure);
    EXPECT_EQ(parseElementClass("page_number"), ElementClass::kPageNumber);
}

TEST(ElementClassTest, FoldsCaseSpacesAndHyphens) {
    EXPECT_EQ(parseElementClass("Question Number"), ElementClass::kQuestionNumber);
    EXPECT_EQ(parseElementClass("question-type"), ElementClass::kQuestionType);
    EXPECT_EQ(parseElementClass("  Plain_Text "), ElementClass::kPlainText);
}

TEST(ElementClassTest, UnknownLabels) {
    EXPECT_FALSE(parseElementClass("watermark").has_value());
    EXPECT_FALSE(parseElementClass("").has_value());
    EXPECT_EQ(elementClassFromLabel("watermark"), ElementClass::kUnknown);
}

TEST(ElementClassTest, EveryNameRoundTrips) {
    for (std::size_t i = 0; i < kElementClassCount; ++i) {
        const auto cls = static_cast<ElementClass>(i);
        EXPECT_EQ(parseElementClass(elementClassToString(cls)), cls)
            << elementClassToString(cls);
    }
}

TEST(ElementClassTest, Roles) {
    EXPECT_TRUE(isAnchorCapable(ElementClass::kUnit));
    EXPECT_FALSE(isAnchorCapable(ElementClass::kFigure));
    EXPECT_TRUE(isNumberedAnchor(ElementClass::kQuestionNumber));
    EXPECT_FALSE(isNumberedAnchor(ElementClass::kQuestionType));
    EXPECT_TRUE(isVisualBlock(ElementClass::kTable));
    EXPECT_FALSE(isVisualBlock(ElementClass::kQuestionText));
}

TEST(StrategyKindTest, AcceptsAliases) {
    EXPECT_EQ(parseStrategyKind("direct"), StrategyKind::kDirect);
    EXPECT_EQ(parseStrategyKind("GLOBAL_FIRST"), StrategyKind::kDirect);
    EXPECT_EQ(parseStrategyKind("local_first"), StrategyKind::kLegacyLocal);
    EXPECT_EQ(parseStrategyKind("legacy-local"), StrategyKind::kLegacyLocal);
    EXPECT_EQ(parseStrategyKind("hybrid"), StrategyKind::kHybrid);
    EXPECT_FALSE(parseStrategyKind("greedy").has_value());
}

TEST(DocumentModeTest, Parse) {
    EXPECT_EQ(parseDocumentMode("question_based"), DocumentMode::kQuestionBased);
    EXPECT_EQ(parseDocumentMode("reading order"), DocumentMode::kReadingOrder);
    EXPECT_FALSE(parseDocumentMode("magazine").has_value());
}

}  // namespace docrecon::test
