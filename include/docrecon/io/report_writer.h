// =============================================================================
// docrecon - Report Writer
// =============================================================================
// Renders engine output as JSON documents.
//
// A page report carries the final groups, the flattened reading order and the
// full audit trail (profile, strategy, validation findings, corrections), so a
// consumer can tell what was changed and why. Element ids in the report are
// the detector's ids, never re-numbered.
// =============================================================================

#ifndef DOCRECON_IO_REPORT_WRITER_H
#define DOCRECON_IO_REPORT_WRITER_H

#include <filesystem>
#include <span>
#include <string>

#include <json/json.h>

#include "docrecon/common/error.h"
#include "docrecon/correction/correction_engine.h"
#include "docrecon/geometry/bounding_box.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/model/group.h"
#include "docrecon/model/page.h"
#include "docrecon/pipeline/reconstruction_engine.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::io {

/// @brief Output path meaning "write to stdout".
inline constexpr const char* kStdoutPath = "-";

// =============================================================================
// JSON Builders
// =============================================================================

[[nodiscard]] Json::Value boxToJson(const geometry::BoundingBox& box);

[[nodiscard]] Json::Value elementToJson(const Element& element);

/// @brief Groups with number, anchor, children and envelope.
[[nodiscard]] Json::Value groupsToJson(const GroupSet& groups);

[[nodiscard]] Json::Value orderingToJson(std::span<const OrderedElement> ordering);

[[nodiscard]] Json::Value profileToJson(const layout::LayoutProfile& profile);

[[nodiscard]] Json::Value validationToJson(const validation::ValidationResult& result);

[[nodiscard]] Json::Value correctionToJson(const correction::CorrectionResult& result);

/// @brief Full report of one reconstructed page.
[[nodiscard]] Json::Value pageReportToJson(const pipeline::PageReconstruction& page);

/// @brief Report of a batch: one entry per page, failed pages carry their error.
/// @param pages The inputs, used to name pages that failed.
[[nodiscard]] Json::Value batchReportToJson(
    std::span<const PageInput> pages,
    std::span<const Result<pipeline::PageReconstruction>> results,
    const pipeline::BatchStats& stats);

// =============================================================================
// Output
// =============================================================================

/// @brief Serialize a JSON value.
/// @param pretty Indent with two spaces; otherwise emit a single line.
[[nodiscard]] std::string renderJson(const Json::Value& value, bool pretty = true);

/// @brief Write a document to @p path, or to stdout when it is "-" or empty.
/// @note Files are written to a temporary sibling and renamed into place.
[[nodiscard]] VoidResult writeJson(const Json::Value& value, const std::filesystem::path& path,
                                   bool pretty = true);

}  // namespace docrecon::io

#endif  // DOCRECON_IO_REPORT_WRITER_H
