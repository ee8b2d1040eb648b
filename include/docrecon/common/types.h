// =============================================================================
// docrecon - Common Type Definitions
// =============================================================================
// Core type definitions shared by every engine stage.
//
// This module defines:
// - ElementId, AnchorNumber, JobId: identifier aliases
// - ElementClass: closed taxonomy of layout-detector labels
// - DocumentMode: worksheet grouping vs. plain reading order
// - LayoutTopology: page topology detected from anchor positions
// - StrategyKind: anchor/child assignment strategies
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef DOCRECON_COMMON_TYPES_H
#define DOCRECON_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace docrecon {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Identifier of a detected element, assigned by the upstream detector.
using ElementId = std::uint64_t;

/// @brief Parsed anchor identifier ("question 12" -> 12).
using AnchorNumber = std::int64_t;

/// @brief Identifier of a reconstruction job.
using JobId = std::string;

/// @brief Fingerprint of a committed result (xxHash64).
using Fingerprint = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Anchor identifier used when the recognized text holds no number.
inline constexpr AnchorNumber kUnparsedNumber = -1;

/// @brief Invalid element ID sentinel value.
inline constexpr ElementId kInvalidElementId = std::numeric_limits<ElementId>::max();

/// @brief Minimum recognized-text confidence trusted for anchor numbers.
/// @note Below this the anchor is kept but treated as unparsed.
inline constexpr double kMinAnchorTextConfidence = 0.65;

// =============================================================================
// Element Class Enumeration
// =============================================================================

/// @brief Closed taxonomy of layout-detector class labels.
/// @note The first four classes can root a group; whether they do is decided
///       by EngineConfig::allowedAnchorClasses.
enum class ElementClass : std::uint8_t {
    // Anchor-capable
    kQuestionNumber = 0,
    kSecondQuestionNumber,
    kQuestionType,
    kUnit,

    // Question content
    kQuestionText,
    kChoices,
    kChoiceText,
    kAnswerText,
    kExplanationText,
    kList,

    // Visual content
    kFigure,
    kTable,
    kFlowchart,
    kFormula,
    kEquation,
    kImage,
    kChart,
    kGraph,
    kDiagram,
    kIllustration,
    kPhoto,

    // Document furniture
    kCaption,
    kTitle,
    kHeading,
    kHeader,
    kFooter,
    kPageNumber,
    kSectionTitle,

    // Generic text
    kText,
    kPlainText,
    kParagraph,
    kTableCaption,
    kTableCell,
    kCodeBlock,
    kQuote,
    kReference,
    kFootnote,
    kAnnotation,

    kUnknown
};

/// @brief Number of ElementClass values, kUnknown included.
inline constexpr std::size_t kElementClassCount =
    static_cast<std::size_t>(ElementClass::kUnknown) + 1;

/// @brief Canonical snake_case name of an element class.
[[nodiscard]] constexpr std::string_view elementClassToString(ElementClass cls) noexcept {
    switch (cls) {
        case ElementClass::kQuestionNumber:
            return "question_number";
        case ElementClass::kSecondQuestionNumber:
            return "second_question_number";
        case ElementClass::kQuestionType:
            return "question_type";
        case ElementClass::kUnit:
            return "unit";
        case ElementClass::kQuestionText:
            return "question_text";
        case ElementClass::kChoices:
            return "choices";
        case ElementClass::kChoiceText:
            return "choice_text";
        case ElementClass::kAnswerText:
            return "answer_text";
        case ElementClass::kExplanationText:
            return "explanation_text";
        case ElementClass::kList:
            return "list";
        case ElementClass::kFigure:
            return "figure";
        case ElementClass::kTable:
            return "table";
        case ElementClass::kFlowchart:
            return "flowchart";
        case ElementClass::kFormula:
            return "formula";
        case ElementClass::kEquation:
            return "equation";
        case ElementClass::kImage:
            return "image";
        case ElementClass::kChart:
            return "chart";
        case ElementClass::kGraph:
            return "graph";
        case ElementClass::kDiagram:
            return "diagram";
        case ElementClass::kIllustration:
            return "illustration";
        case ElementClass::kPhoto:
            return "photo";
        case ElementClass::kCaption:
            return "caption";
        case ElementClass::kTitle:
            return "title";
        case ElementClass::kHeading:
            return "heading";
        case ElementClass::kHeader:
            return "header";
        case ElementClass::kFooter:
            return "footer";
        case ElementClass::kPageNumber:
            return "page_number";
        case ElementClass::kSectionTitle:
            return "section_title";
        case ElementClass::kText:
            return "text";
        case ElementClass::kPlainText:
            return "plain_text";
        case ElementClass::kParagraph:
            return "paragraph";
        case ElementClass::kTableCaption:
            return "table_caption";
        case ElementClass::kTableCell:
            return "table_cell";
        case ElementClass::kCodeBlock:
            return "code_block";
        case ElementClass::kQuote:
            return "quote";
        case ElementClass::kReference:
            return "reference";
        case ElementClass::kFootnote:
            return "footnote";
        case ElementClass::kAnnotation:
            return "annotation";
        case ElementClass::kUnknown:
            return "unknown";
    }
    return "unknown";
}

/// @brief Parse a detector label into an element class.
/// @param label Label as emitted by the detector ("question number",
///        "Question-Number" and "question_number" are equivalent).
/// @return The class, or std::nullopt for labels outside the taxonomy.
[[nodiscard]] std::optional<ElementClass> parseElementClass(std::string_view label) noexcept;

/// @brief Parse a detector label, mapping unrecognized labels to kUnknown.
[[nodiscard]] ElementClass elementClassFromLabel(std::string_view label) noexcept;

/// @brief Check if the class is one that can root a group.
[[nodiscard]] constexpr bool isAnchorCapable(ElementClass cls) noexcept {
    switch (cls) {
        case ElementClass::kQuestionNumber:
        case ElementClass::kSecondQuestionNumber:
        case ElementClass::kQuestionType:
        case ElementClass::kUnit:
            return true;
        default:
            return false;
    }
}

/// @brief Check if the class carries a sequential question number.
/// @note Only these anchors take part in numbering validation.
[[nodiscard]] constexpr bool isNumberedAnchor(ElementClass cls) noexcept {
    return cls == ElementClass::kQuestionNumber;
}

/// @brief Check if the class is a large visual block (lookahead candidate).
[[nodiscard]] constexpr bool isVisualBlock(ElementClass cls) noexcept {
    switch (cls) {
        case ElementClass::kFigure:
        case ElementClass::kTable:
        case ElementClass::kFlowchart:
        case ElementClass::kFormula:
        case ElementClass::kEquation:
        case ElementClass::kImage:
        case ElementClass::kChart:
        case ElementClass::kGraph:
        case ElementClass::kDiagram:
        case ElementClass::kIllustration:
        case ElementClass::kPhoto:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Document Mode Enumeration
// =============================================================================

/// @brief How a page is to be grouped.
enum class DocumentMode : std::uint8_t {
    /// @brief Anchor-rooted grouping of worksheet questions (default).
    kQuestionBased = 0,

    /// @brief No grouping; every element in (y, x) reading order.
    kReadingOrder = 1
};

[[nodiscard]] constexpr std::string_view documentModeToString(DocumentMode mode) noexcept {
    switch (mode) {
        case DocumentMode::kQuestionBased:
            return "question_based";
        case DocumentMode::kReadingOrder:
            return "reading_order";
    }
    return "unknown";
}

/// @brief Parse a document mode name.
[[nodiscard]] std::optional<DocumentMode> parseDocumentMode(std::string_view name) noexcept;

// =============================================================================
// Layout Topology Enumeration
// =============================================================================

/// @brief Page topology derived from the distribution of anchors.
enum class LayoutTopology : std::uint8_t {
    kSingleColumn = 0,
    kTwoColumn,
    /// @brief Single-column header block above a two-column body.
    kMixedTop1Bottom2,
    /// @brief Two-column body above a single-column footer block.
    kMixedTop2Bottom1,
    /// @brief Full-width section separator near the top of the page.
    kHorizontalSplit,
    /// @brief Two anchor clusters overall, but neither half looks multi-column.
    kUnknown
};

[[nodiscard]] constexpr std::string_view layoutTopologyToString(LayoutTopology topology) noexcept {
    switch (topology) {
        case LayoutTopology::kSingleColumn:
            return "single_column";
        case LayoutTopology::kTwoColumn:
            return "two_column";
        case LayoutTopology::kMixedTop1Bottom2:
            return "mixed_top1_bottom2";
        case LayoutTopology::kMixedTop2Bottom1:
            return "mixed_top2_bottom1";
        case LayoutTopology::kHorizontalSplit:
            return "horizontal_split";
        case LayoutTopology::kUnknown:
            return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool isMixedTopology(LayoutTopology topology) noexcept {
    return topology == LayoutTopology::kMixedTop1Bottom2 ||
           topology == LayoutTopology::kMixedTop2Bottom1;
}

// =============================================================================
// Strategy Kind Enumeration
// =============================================================================

/// @brief Anchor/child assignment strategies.
enum class StrategyKind : std::uint8_t {
    /// @brief Recursive partitioner with weighted-distance pass and lookahead.
    kDirect = 0,

    /// @brief Adjacency-first, median column split, no lookahead.
    kLegacyLocal = 1,

    /// @brief Run both, keep the lower-penalty grouping.
    kHybrid = 2
};

[[nodiscard]] constexpr std::string_view strategyKindToString(StrategyKind kind) noexcept {
    switch (kind) {
        case StrategyKind::kDirect:
            return "direct";
        case StrategyKind::kLegacyLocal:
            return "legacy_local";
        case StrategyKind::kHybrid:
            return "hybrid";
    }
    return "unknown";
}

/// @brief Parse a strategy name.
/// @note Accepts "direct"/"global_first", "legacy_local"/"local_first" and
///       "hybrid", case-insensitively.
[[nodiscard]] std::optional<StrategyKind> parseStrategyKind(std::string_view name) noexcept;

}  // namespace docrecon

#endif  // DOCRECON_COMMON_TYPES_H
