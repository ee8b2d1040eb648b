// =============================================================================
// docrecon - Digit Repair
// =============================================================================
// Recovers anchor numbers that OCR misread by a single confusable digit,
// e.g. "294" read as "204".
// =============================================================================

#ifndef DOCRECON_CORRECTION_DIGIT_REPAIR_H
#define DOCRECON_CORRECTION_DIGIT_REPAIR_H

#include <optional>
#include <span>
#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"

namespace docrecon::correction {

/// @brief @p number plus every value reachable by substituting one digit with a
///        confusable alternative, ascending and without duplicates.
/// @note Negative numbers yield only themselves.
[[nodiscard]] std::vector<AnchorNumber> repairCandidates(AnchorNumber number,
                                                         const DigitConfusionTable& table);

/// @brief Pick the candidate that best continues the sequence.
///
/// An exact match with @p expected wins. Otherwise the candidate within
/// @p window of @p expected with the smallest distance is chosen; ties go to
/// the smaller value.
/// @return std::nullopt when no candidate lies within the window.
[[nodiscard]] std::optional<AnchorNumber> selectRepair(std::span<const AnchorNumber> candidates,
                                                       AnchorNumber expected,
                                                       AnchorNumber window) noexcept;

}  // namespace docrecon::correction

#endif  // DOCRECON_CORRECTION_DIGIT_REPAIR_H
