// =============================================================================
// docrecon - Sequence Validator
// =============================================================================
// Checks that anchor numbers continue one by one in reading order.
//
// The reading order is the order in which the partitioner emitted the
// groups; numbers are never re-sorted, so a misread "204" between 295 and
// 296 surfaces as a reverse step instead of disappearing into the sort.
// =============================================================================

#ifndef DOCRECON_VALIDATION_SEQUENCE_VALIDATOR_H
#define DOCRECON_VALIDATION_SEQUENCE_VALIDATOR_H

#include <span>
#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::validation {

class SequenceValidator {
public:
    explicit SequenceValidator(AnchorNumber largeJump = kDefaultSequenceLargeJump) noexcept
        : largeJump_(largeJump) {}

    /// @brief Classify every adjacent pair of @p numbers.
    /// @note kUnparsedNumber entries are skipped; fewer than two parsed
    ///       numbers yield no gaps.
    [[nodiscard]] std::vector<SequenceGap> checkContinuity(
        std::span<const AnchorNumber> numbers) const;

    /// @brief Check that @p a and @p b have the same digit count and differ in
    ///        exactly one digit.
    [[nodiscard]] static bool isLikelyMisread(AnchorNumber a, AnchorNumber b);

    /// @brief Shorthand for a reverse gap whose numbers look like a misread.
    [[nodiscard]] static bool isLikelyMisread(const SequenceGap& gap);

    [[nodiscard]] AnchorNumber largeJump() const noexcept { return largeJump_; }

private:
    AnchorNumber largeJump_;
};

}  // namespace docrecon::validation

#endif  // DOCRECON_VALIDATION_SEQUENCE_VALIDATOR_H
