// =============================================================================
// docrecon - Reconstruction Engine
// =============================================================================
// The per-page pipeline and its parallel batch driver.
//
// Phases of one page:
// 1. Preprocess: drop unusable elements (reading-order pages stop here)
// 2. Profile + assign: LayoutProfiler, StrategySelector, chosen strategy
// 3. Validate: sequence continuity and range conflicts
// 4. Correct: digit repair, gap recording, reassignment, merge
//
// A page is processed single-threaded and shares no mutable state with other
// pages, so reconstructBatch() simply runs pages through tbb::parallel_for.
// =============================================================================

#ifndef DOCRECON_PIPELINE_RECONSTRUCTION_ENGINE_H
#define DOCRECON_PIPELINE_RECONSTRUCTION_ENGINE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/common/error.h"
#include "docrecon/common/types.h"
#include "docrecon/correction/correction_engine.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/model/group.h"
#include "docrecon/model/page.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::pipeline {

class ReconstructionEngineImpl;

// =============================================================================
// Page Result
// =============================================================================

/// @brief Everything produced for one page, including the audit trail.
struct PageReconstruction {
    JobId jobId;
    std::uint32_t page = 0;
    DocumentMode documentMode = DocumentMode::kQuestionBased;

    /// @brief Elements received and elements kept by preprocessing.
    std::size_t inputElements = 0;
    std::size_t keptElements = 0;

    layout::LayoutProfile profile;

    /// @brief Strategy actually run (absent for reading-order pages).
    std::optional<StrategyKind> strategy;

    GroupSet initialGroups;
    validation::ValidationResult validation;
    correction::CorrectionResult correction;
    GroupSet finalGroups;

    std::vector<OrderedElement> ordering;

    /// @brief XXH64 over the final ordering and group numbers.
    Fingerprint fingerprint = 0;

    std::chrono::microseconds elapsed{0};
};

/// @brief Fingerprint of a final grouping; equal groupings hash equal.
[[nodiscard]] Fingerprint fingerprintGrouping(const GroupSet& groups);

// =============================================================================
// Batch Statistics
// =============================================================================

struct BatchStats {
    std::size_t pages = 0;
    std::size_t failedPages = 0;
    std::size_t elements = 0;
    std::size_t groups = 0;
    std::size_t correctedPages = 0;
    std::uint64_t processingTimeMs = 0;

    /// @brief Pages per second.
    [[nodiscard]] double throughput() const noexcept {
        if (processingTimeMs == 0) return 0.0;
        return static_cast<double>(pages) * 1000.0 / static_cast<double>(processingTimeMs);
    }
};

// =============================================================================
// ReconstructionEngine
// =============================================================================

/// @brief Turns detector output into validated, ordered groups.
///
/// Usage:
/// @code
/// EngineConfig config;
/// config.forcedStrategy = StrategyKind::kDirect;
///
/// ReconstructionEngine engine(config);
/// auto result = engine.reconstructPage(page);
/// if (result) {
///     for (const auto& entry : result->ordering) {
///         // ...
///     }
/// }
/// @endcode
class ReconstructionEngine {
public:
    explicit ReconstructionEngine(EngineConfig config = {});

    ~ReconstructionEngine();

    ReconstructionEngine(const ReconstructionEngine&) = delete;
    ReconstructionEngine& operator=(const ReconstructionEngine&) = delete;
    ReconstructionEngine(ReconstructionEngine&&) noexcept;
    ReconstructionEngine& operator=(ReconstructionEngine&&) noexcept;

    /// @brief Run all phases on one page.
    /// @param forced Strategy override for this call; beats the config.
    /// @return kConfigError when the configuration is invalid. Geometric
    ///         problems never fail a page.
    [[nodiscard]] Result<PageReconstruction> reconstructPage(
        const PageInput& page, std::optional<StrategyKind> forced = std::nullopt) const;

    /// @brief Group a page without validating or correcting it.
    [[nodiscard]] Result<PageReconstruction> assignPage(
        const PageInput& page, std::optional<StrategyKind> forced = std::nullopt) const;

    /// @brief Reconstruct pages in parallel.
    /// @return One result per page, in input order.
    [[nodiscard]] std::vector<Result<PageReconstruction>> reconstructBatch(
        std::span<const PageInput> pages, std::optional<StrategyKind> forced = std::nullopt);

    /// @brief Statistics of the last reconstructBatch() call.
    [[nodiscard]] const BatchStats& stats() const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    std::unique_ptr<ReconstructionEngineImpl> impl_;
};

}  // namespace docrecon::pipeline

#endif  // DOCRECON_PIPELINE_RECONSTRUCTION_ENGINE_H
