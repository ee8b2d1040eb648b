// =============================================================================
// docrecon - Reconstruction Engine Implementation
// =============================================================================

#include "docrecon/pipeline/reconstruction_engine.h"

#include <chrono>
#include <new>
#include <utility>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <xxhash.h>

#include "docrecon/common/logger.h"
#include "docrecon/correction/correction_engine.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/layout/spatial_partitioner.h"
#include "docrecon/layout/strategy_selector.h"
#include "docrecon/validation/context_validator.h"

namespace docrecon::pipeline {

namespace {

template <typename T>
void hashValue(XXH64_state_t* state, const T& value) {
    XXH64_update(state, &value, sizeof(value));
}

}  // namespace

Fingerprint fingerprintGrouping(const GroupSet& groups) {
    XXH64_state_t* state = XXH64_createState();
    if (state == nullptr) {
        throw std::bad_alloc();
    }
    XXH64_reset(state, 0);

    hashValue(state, static_cast<std::uint64_t>(groups.size()));
    for (const auto& group : groups) {
        hashValue(state, group.number());
        hashValue(state, static_cast<std::uint64_t>(group.size()));
        hashValue(state, static_cast<std::uint8_t>(group.hasAnchor() ? 1 : 0));
        if (group.hasAnchor()) {
            hashValue(state, group.anchor().id);
        }
        for (const auto& child : group.children()) {
            hashValue(state, child.id);
        }
    }

    const Fingerprint digest = XXH64_digest(state);
    XXH64_freeState(state);
    return digest;
}

// =============================================================================
// ReconstructionEngineImpl
// =============================================================================

class ReconstructionEngineImpl {
public:
    explicit ReconstructionEngineImpl(EngineConfig config)
        : config_(std::move(config)),
          partitioner_(config_),
          profiler_(config_),
          selector_(config_),
          validator_(config_),
          corrector_(config_) {}

    Result<PageReconstruction> run(const PageInput& page, std::optional<StrategyKind> forced,
                                   bool correct) const {
        if (auto result = config_.validate(); !result) {
            return std::unexpected(result.error());
        }

        const auto startTime = std::chrono::steady_clock::now();

        PageReconstruction out;
        out.jobId = page.jobId;
        out.page = page.page;
        out.documentMode = page.documentMode.value_or(config_.documentMode);
        out.inputElements = page.elements.size();

        const std::vector<Element> kept = partitioner_.preprocess(page.elements, out.documentMode);
        out.keptElements = kept.size();
        if (kept.size() != page.elements.size()) {
            DOCRECON_LOG_DEBUG("Page {}#{}: preprocessing dropped {} of {} elements", page.jobId,
                               page.page, page.elements.size() - kept.size(),
                               page.elements.size());
        }

        if (out.documentMode == DocumentMode::kReadingOrder) {
            const auto size = layout::resolvePageSize(kept, page.pageWidth, page.pageHeight);
            out.profile.pageWidth = size.width;
            out.profile.pageHeight = size.height;
            out.initialGroups = layout::SpatialPartitioner::readingOrder(kept);
            out.finalGroups = out.initialGroups;
        } else {
            out.profile = profiler_.profile(kept, page.pageWidth, page.pageHeight);
            out.strategy = forced ? *forced : selector_.choose(out.profile);
            out.initialGroups = selector_.assign(kept, out.profile, out.strategy);

            if (correct) {
                out.validation = validator_.validate(out.initialGroups);
                auto corrected = corrector_.correct(out.initialGroups, out.validation);
                out.finalGroups = std::move(corrected.groups);
                out.correction = std::move(corrected.result);
            } else {
                out.finalGroups = out.initialGroups;
            }
        }

        out.ordering = flattenGroups(out.finalGroups);
        out.fingerprint = fingerprintGrouping(out.finalGroups);
        out.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);

        DOCRECON_LOG_INFO("Page {}#{}: {} elements -> {} groups ({}, {}) in {} us", page.jobId,
                          page.page, out.keptElements, out.finalGroups.size(),
                          documentModeToString(out.documentMode),
                          out.strategy ? strategyKindToString(*out.strategy) : "none",
                          out.elapsed.count());
        return out;
    }

    std::vector<Result<PageReconstruction>> runBatch(std::span<const PageInput> pages,
                                                     std::optional<StrategyKind> forced) {
        const auto startTime = std::chrono::steady_clock::now();
        stats_ = BatchStats{};

        std::vector<Result<PageReconstruction>> results(pages.size());

        // Pages share no mutable state; each task writes only its own slot.
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, pages.size()),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  results[i] = tryExecute([&] {
                                      return unwrapOrThrow(run(pages[i], forced, true));
                                  });
                              }
                          });

        stats_.pages = pages.size();
        for (std::size_t i = 0; i < results.size(); ++i) {
            const auto& result = results[i];
            if (!result) {
                ++stats_.failedPages;
                DOCRECON_LOG_ERROR("Page {}#{} failed: {}", pages[i].jobId, pages[i].page,
                                   result.error().message());
                continue;
            }
            stats_.elements += result->keptElements;
            stats_.groups += result->finalGroups.size();
            if (result->correction.hasCorrections()) {
                ++stats_.correctedPages;
            }
        }

        stats_.processingTimeMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime)
                .count());

        DOCRECON_LOG_INFO("Batch complete: {} pages ({} failed, {} corrected), {} groups, "
                          "{:.1f} pages/s",
                          stats_.pages, stats_.failedPages, stats_.correctedPages, stats_.groups,
                          stats_.throughput());
        return results;
    }

    [[nodiscard]] const BatchStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    layout::SpatialPartitioner partitioner_;
    layout::LayoutProfiler profiler_;
    layout::StrategySelector selector_;
    validation::ContextValidator validator_;
    correction::CorrectionEngine corrector_;
    BatchStats stats_;
};

// =============================================================================
// ReconstructionEngine
// =============================================================================

ReconstructionEngine::ReconstructionEngine(EngineConfig config)
    : impl_(std::make_unique<ReconstructionEngineImpl>(std::move(config))) {}

ReconstructionEngine::~ReconstructionEngine() = default;

ReconstructionEngine::ReconstructionEngine(ReconstructionEngine&&) noexcept = default;

ReconstructionEngine& ReconstructionEngine::operator=(ReconstructionEngine&&) noexcept = default;

Result<PageReconstruction> ReconstructionEngine::reconstructPage(
    const PageInput& page, std::optional<StrategyKind> forced) const {
    return impl_->run(page, forced, true);
}

Result<PageReconstruction> ReconstructionEngine::assignPage(
    const PageInput& page, std::optional<StrategyKind> forced) const {
    return impl_->run(page, forced, false);
}

std::vector<Result<PageReconstruction>> ReconstructionEngine::reconstructBatch(
    std::span<const PageInput> pages, std::optional<StrategyKind> forced) {
    return impl_->runBatch(pages, forced);
}

const BatchStats& ReconstructionEngine::stats() const noexcept {
    return impl_->stats();
}

const EngineConfig& ReconstructionEngine::config() const noexcept {
    return impl_->config();
}

}  // namespace docrecon::pipeline
