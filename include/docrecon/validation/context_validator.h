// =============================================================================
// docrecon - Context Validator
// =============================================================================
// Runs the sequence and spatial checks over an initial grouping and decides
// whether the correction pass is needed.
// =============================================================================

#ifndef DOCRECON_VALIDATION_CONTEXT_VALIDATOR_H
#define DOCRECON_VALIDATION_CONTEXT_VALIDATOR_H

#include "docrecon/common/config.h"
#include "docrecon/model/group.h"
#include "docrecon/validation/sequence_validator.h"
#include "docrecon/validation/spatial_validator.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::validation {

class ContextValidator {
public:
    explicit ContextValidator(const EngineConfig& config = {});

    /// @brief Sequence continuity plus pairwise range conflicts.
    [[nodiscard]] ValidationResult validate(const GroupSet& groups) const;

    /// @brief Sequence continuity only; no geometry is inspected.
    [[nodiscard]] ValidationResult quickValidate(const GroupSet& groups) const;

    /// @brief Check if @p result holds anything the correction pass acts on:
    ///        a reverse gap, a forward gap or a severe conflict.
    [[nodiscard]] static bool needsCorrection(const ValidationResult& result) noexcept;

    [[nodiscard]] const SequenceValidator& sequenceValidator() const noexcept { return sequence_; }
    [[nodiscard]] const SpatialValidator& spatialValidator() const noexcept { return spatial_; }

private:
    void logReport(const ValidationResult& result) const;

    SequenceValidator sequence_;
    SpatialValidator spatial_;
};

}  // namespace docrecon::validation

#endif  // DOCRECON_VALIDATION_CONTEXT_VALIDATOR_H
