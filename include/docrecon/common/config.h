// =============================================================================
// docrecon - Engine Configuration
// =============================================================================
// The tuning surface honoured by every engine stage.
//
// This module provides:
// - ElementClassSet: compact allow-list of element classes
// - DigitConfusionTable: symmetric table of digits OCR tends to confuse
// - EngineConfig: all named tuning options with validated defaults
//
// Defaults were calibrated on scanned worksheet pages (~2480x3508 px). The
// digit-confusion heuristics are data, not code, so they can be recalibrated
// without touching the correction algorithm.
// =============================================================================

#ifndef DOCRECON_COMMON_CONFIG_H
#define DOCRECON_COMMON_CONFIG_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "docrecon/common/error.h"
#include "docrecon/common/types.h"

namespace docrecon {

// =============================================================================
// Constants
// =============================================================================

inline constexpr double kDefaultColumnGapMarginPx = 20.0;
inline constexpr double kDefaultProximityXWeight = 0.2;
inline constexpr double kDefaultProximityMaxDistancePx = 250.0;
inline constexpr std::size_t kDefaultLookaheadMaxGroups = 2;
inline constexpr std::size_t kMaxLookaheadGroups = 8;
inline constexpr double kDefaultLookaheadClosenessRatio = 1.0;
inline constexpr double kDefaultLargeElementAreaPx2 = 120'000.0;
inline constexpr double kDefaultIouConflictThreshold = 0.1;
inline constexpr double kDefaultSevereOverlapAreaPx2 = 10'000.0;
inline constexpr AnchorNumber kDefaultSequenceLargeJump = 10;
inline constexpr std::chrono::seconds kDefaultJobLockTimeout{30};
inline constexpr AnchorNumber kDefaultRepairWindow = 2;
inline constexpr double kDefaultReassignmentIouMargin = 0.15;

// =============================================================================
// ElementClassSet
// =============================================================================

/// @brief Set of element classes backed by a bit mask.
class ElementClassSet {
public:
    constexpr ElementClassSet() noexcept = default;

    constexpr ElementClassSet(std::initializer_list<ElementClass> classes) noexcept {
        for (ElementClass cls : classes) {
            insert(cls);
        }
    }

    constexpr void insert(ElementClass cls) noexcept { bits_ |= bit(cls); }

    constexpr void erase(ElementClass cls) noexcept { bits_ &= ~bit(cls); }

    constexpr void clear() noexcept { bits_ = 0; }

    [[nodiscard]] constexpr bool contains(ElementClass cls) const noexcept {
        return (bits_ & bit(cls)) != 0;
    }

    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

    [[nodiscard]] constexpr std::size_t size() const noexcept {
        std::size_t n = 0;
        for (std::uint64_t b = bits_; b != 0; b &= b - 1) {
            ++n;
        }
        return n;
    }

    /// @brief Members in enumeration order.
    [[nodiscard]] std::vector<ElementClass> toVector() const;

    [[nodiscard]] constexpr bool operator==(const ElementClassSet&) const noexcept = default;

private:
    static constexpr std::uint64_t bit(ElementClass cls) noexcept {
        return std::uint64_t{1} << static_cast<unsigned>(cls);
    }

    std::uint64_t bits_ = 0;
};

static_assert(kElementClassCount <= 64, "ElementClassSet holds at most 64 classes");

/// @brief Worksheet anchors kept by default.
inline constexpr ElementClassSet kDefaultAnchorClasses{
    ElementClass::kQuestionType, ElementClass::kQuestionNumber,
    ElementClass::kSecondQuestionNumber};

/// @brief Worksheet children kept by default.
inline constexpr ElementClassSet kDefaultChildClasses{
    ElementClass::kQuestionText, ElementClass::kList,   ElementClass::kChoices,
    ElementClass::kFigure,       ElementClass::kTable,  ElementClass::kFlowchart};

// =============================================================================
// DigitConfusionTable
// =============================================================================

/// @brief Symmetric relation of decimal digits that OCR confuses.
class DigitConfusionTable {
public:
    constexpr DigitConfusionTable() noexcept = default;

    /// @brief Mark two digits as mutually confusable.
    /// @note Out-of-range digits and self-pairs are ignored.
    constexpr void addPair(int a, int b) noexcept {
        if (a < 0 || a > 9 || b < 0 || b > 9 || a == b) {
            return;
        }
        masks_[static_cast<std::size_t>(a)] |= static_cast<std::uint16_t>(1u << b);
        masks_[static_cast<std::size_t>(b)] |= static_cast<std::uint16_t>(1u << a);
    }

    [[nodiscard]] constexpr bool confusable(int a, int b) const noexcept {
        if (a < 0 || a > 9 || b < 0 || b > 9) {
            return false;
        }
        return (masks_[static_cast<std::size_t>(a)] & (1u << b)) != 0;
    }

    /// @brief Digits that may have been misread as @p digit, ascending.
    [[nodiscard]] std::vector<int> alternatives(int digit) const;

    /// @brief The table calibrated on worksheet scans: 0-6, 0-9, 1-7, 2-9, 3-8.
    [[nodiscard]] static constexpr DigitConfusionTable standard() noexcept {
        DigitConfusionTable table;
        table.addPair(0, 6);
        table.addPair(0, 9);
        table.addPair(1, 7);
        table.addPair(2, 9);
        table.addPair(3, 8);
        return table;
    }

    [[nodiscard]] constexpr bool operator==(const DigitConfusionTable&) const noexcept = default;

private:
    std::array<std::uint16_t, 10> masks_{};
};

// =============================================================================
// EngineConfig
// =============================================================================

/// @brief Tuning options for partitioning, validation, correction and commit.
struct EngineConfig {
    /// @brief Classes that may root a group (worksheet mode).
    ElementClassSet allowedAnchorClasses = kDefaultAnchorClasses;

    /// @brief Classes kept as children (worksheet mode).
    ElementClassSet allowedChildClasses = kDefaultChildClasses;

    /// @brief Grouping mode applied when the page does not name one.
    DocumentMode documentMode = DocumentMode::kQuestionBased;

    /// @brief Column boundary offset left of the right column's anchor center.
    double columnGapMarginPx = kDefaultColumnGapMarginPx;

    /// @brief X weight in the child-to-anchor distance (Y weight is 1).
    double proximityXWeight = kDefaultProximityXWeight;

    /// @brief Weighted distances at or beyond this leave a child unassigned.
    double proximityMaxDistancePx = kDefaultProximityMaxDistancePx;

    /// @brief How many following groups a large element may move ahead.
    std::size_t lookaheadMaxGroups = kDefaultLookaheadMaxGroups;

    /// @brief A large element moves ahead when the target anchor is closer in Y
    ///        than ratio * its distance to the current owner (1 = simply closer).
    double lookaheadClosenessRatio = kDefaultLookaheadClosenessRatio;

    /// @brief Children at least this large are lookahead candidates by area.
    double largeElementAreaPx2 = kDefaultLargeElementAreaPx2;

    /// @brief Envelope IoU above which two groups conflict.
    double iouConflictThreshold = kDefaultIouConflictThreshold;

    /// @brief Overlap area above which a conflict is severe.
    double severeOverlapAreaPx2 = kDefaultSevereOverlapAreaPx2;

    /// @brief Ascending steps larger than this are section breaks, not gaps.
    AnchorNumber sequenceLargeJump = kDefaultSequenceLargeJump;

    /// @brief Bounded wait for a per-job lock.
    std::chrono::milliseconds jobLockTimeout = kDefaultJobLockTimeout;

    /// @brief Bypass profiling and always use this strategy.
    std::optional<StrategyKind> forcedStrategy;

    /// @brief Maximum distance of a digit repair from the expected number.
    AnchorNumber repairWindow = kDefaultRepairWindow;

    /// @brief Digits considered confusable by the repair search.
    DigitConfusionTable confusableDigits = DigitConfusionTable::standard();

    /// @brief IoU difference below which reassignment falls back to centers.
    double reassignmentIouMargin = kDefaultReassignmentIouMargin;

    /// @brief Interleave columns by anchor Y instead of column-major output.
    bool rowMajorColumns = false;

    /// @brief Check every option for a usable value.
    /// @return VoidResult carrying ErrorCode::kConfigError on failure.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Check if a class roots groups under this configuration.
    [[nodiscard]] bool isAnchorClass(ElementClass cls) const noexcept {
        return allowedAnchorClasses.contains(cls);
    }

    /// @brief Check if a class is kept as a child under this configuration.
    [[nodiscard]] bool isChildClass(ElementClass cls) const noexcept {
        return allowedChildClasses.contains(cls);
    }

    [[nodiscard]] bool operator==(const EngineConfig&) const = default;
};

/// @brief Render the configuration as "key=value" pairs for logging.
[[nodiscard]] std::string describeConfig(const EngineConfig& config);

}  // namespace docrecon

#endif  // DOCRECON_COMMON_CONFIG_H
