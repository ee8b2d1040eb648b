// =============================================================================
// docrecon - Reconstruct Command Implementation
// =============================================================================

#include "reconstruct_command.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "docrecon/common/logger.h"
#include "docrecon/concurrency/job_guard.h"
#include "docrecon/concurrency/result_store.h"
#include "docrecon/io/page_reader.h"
#include "docrecon/io/report_writer.h"
#include "docrecon/pipeline/reconstruction_engine.h"

namespace docrecon::commands {

namespace {

/// Commit every successful page; pages of one job serialize on its lock.
/// @return Exit code of the first failed commit, or 0.
int commitPages(const std::filesystem::path& dir, std::chrono::milliseconds lockTimeout,
                std::span<const Result<pipeline::PageReconstruction>> results) {
    concurrency::DirectoryResultStore store(dir);
    concurrency::JobGuard guard(lockTimeout);
    std::atomic<int> firstError{0};
    std::atomic<std::size_t> committed{0};

    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, results.size()),
                      [&](const tbb::blocked_range<std::size_t>& range) {
                          for (std::size_t i = range.begin(); i != range.end(); ++i) {
                              const auto& result = results[i];
                              if (!result) continue;

                              // Committed payloads carry no timing.
                              Json::Value report = io::pageReportToJson(*result);
                              report.removeMember("elapsed_us");

                              const concurrency::ResultKey key{result->jobId, result->page};
                              auto stored = concurrency::commitResult(
                                  store, guard, key, io::renderJson(report));
                              if (!stored) {
                                  DOCRECON_LOG_ERROR("Commit of {} failed: {}", key.toString(),
                                                     stored.error().message());
                                  int expected = 0;
                                  firstError.compare_exchange_strong(expected,
                                                                     stored.error().exitCode());
                                  continue;
                              }
                              committed.fetch_add(1, std::memory_order_relaxed);
                          }
                      });

    guard.logStats();
    DOCRECON_LOG_INFO("Committed {} page result(s) under {}", committed.load(), dir.string());
    return firstError.load();
}

}  // namespace

// =============================================================================
// ReconstructCommand Implementation
// =============================================================================

ReconstructCommand::ReconstructCommand(ReconstructOptions options)
    : options_(std::move(options)) {}

ReconstructCommand::~ReconstructCommand() = default;

ReconstructCommand::ReconstructCommand(ReconstructCommand&&) noexcept = default;
ReconstructCommand& ReconstructCommand::operator=(ReconstructCommand&&) noexcept = default;

int ReconstructCommand::execute() {
    auto pages = io::readPages(options_.inputPath);
    if (!pages) {
        DOCRECON_LOG_ERROR("Cannot read {}: {}", options_.inputPath.string(),
                           pages.error().message());
        return pages.error().exitCode();
    }

    if (options_.documentMode) {
        for (auto& page : *pages) {
            page.documentMode = options_.documentMode;
        }
    }

    pipeline::ReconstructionEngine engine(options_.config);
    const auto results = engine.reconstructBatch(*pages, options_.strategy);

    int exitCode = 0;
    for (const auto& result : results) {
        if (!result) {
            exitCode = result.error().exitCode();
            break;
        }
    }

    // A single-page document gets a single-page report.
    const bool singlePage = results.size() == 1 && results.front().has_value();
    const Json::Value report = singlePage
                                   ? io::pageReportToJson(*results.front())
                                   : io::batchReportToJson(*pages, results, engine.stats());
    if (auto written = io::writeJson(report, options_.outputPath, options_.pretty); !written) {
        DOCRECON_LOG_ERROR("{}", written.error().message());
        return written.error().exitCode();
    }

    if (options_.commitDir) {
        const int commitCode =
            commitPages(*options_.commitDir, options_.config.jobLockTimeout, results);
        if (exitCode == 0) {
            exitCode = commitCode;
        }
    }

    return exitCode;
}

}  // namespace docrecon::commands
