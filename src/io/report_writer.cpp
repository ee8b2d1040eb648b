// =============================================================================
// docrecon - Report Writer Implementation
// =============================================================================

#include "docrecon/io/report_writer.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "docrecon/common/logger.h"

namespace docrecon::io {

namespace {

[[nodiscard]] Json::Value toJson(AnchorNumber number) {
    return Json::Value(static_cast<Json::Int64>(number));
}

[[nodiscard]] Json::Value toJson(std::size_t count) {
    return Json::Value(static_cast<Json::UInt64>(count));
}

[[nodiscard]] Json::Value toJson(std::string_view text) {
    return Json::Value(std::string(text));
}

[[nodiscard]] Json::Value numberList(std::span<const AnchorNumber> numbers) {
    Json::Value list(Json::arrayValue);
    for (AnchorNumber n : numbers) {
        list.append(toJson(n));
    }
    return list;
}

[[nodiscard]] Json::Value fingerprintToJson(Fingerprint fingerprint) {
    // Hex string: 64-bit values do not survive every JSON consumer.
    return Json::Value(fmt::format("{:016x}", fingerprint));
}

}  // namespace

// =============================================================================
// JSON Builders
// =============================================================================

Json::Value boxToJson(const geometry::BoundingBox& box) {
    Json::Value list(Json::arrayValue);
    list.append(box.x1);
    list.append(box.y1);
    list.append(box.x2);
    list.append(box.y2);
    return list;
}

Json::Value elementToJson(const Element& element) {
    Json::Value out(Json::objectValue);
    out["id"] = static_cast<Json::UInt64>(element.id);
    out["class"] = toJson(elementClassToString(element.cls));
    if (element.label != elementClassToString(element.cls)) {
        out["label"] = element.label;
    }
    out["bbox"] = boxToJson(element.box);
    out["confidence"] = element.confidence;
    if (element.text) {
        out["text"] = *element.text;
    }
    if (element.textConfidence) {
        out["text_confidence"] = *element.textConfidence;
    }
    if (element.description) {
        out["description"] = *element.description;
    }
    return out;
}

Json::Value groupsToJson(const GroupSet& groups) {
    Json::Value list(Json::arrayValue);
    for (std::size_t i = 0; i < groups.size(); ++i) {
        const Group& group = groups[i];
        Json::Value entry(Json::objectValue);
        entry["index"] = toJson(i);
        if (group.hasAnchor()) {
            entry["number"] = group.number() == kUnparsedNumber ? Json::Value(Json::nullValue)
                                                                : toJson(group.number());
            entry["anchor"] = elementToJson(group.anchor());
        } else {
            entry["number"] = Json::Value(Json::nullValue);
            entry["anchor"] = Json::Value(Json::nullValue);
        }
        entry["column"] = static_cast<Json::UInt>(group.column());

        Json::Value children(Json::arrayValue);
        for (const auto& child : group.children()) {
            children.append(elementToJson(child));
        }
        entry["children"] = std::move(children);
        entry["envelope"] = boxToJson(group.envelope());
        list.append(std::move(entry));
    }
    return list;
}

Json::Value orderingToJson(std::span<const OrderedElement> ordering) {
    Json::Value list(Json::arrayValue);
    for (const auto& entry : ordering) {
        Json::Value item(Json::objectValue);
        item["element_id"] = static_cast<Json::UInt64>(entry.elementId);
        item["group_index"] = toJson(entry.groupIndex);
        item["order_in_group"] = toJson(entry.orderInGroup);
        item["global_order"] = toJson(entry.globalOrder);
        list.append(std::move(item));
    }
    return list;
}

Json::Value profileToJson(const layout::LayoutProfile& profile) {
    Json::Value out(Json::objectValue);
    out["page_width"] = profile.pageWidth;
    out["page_height"] = profile.pageHeight;
    out["topology"] = toJson(layoutTopologyToString(profile.topology));
    out["anchor_count"] = toJson(profile.anchorCount);
    out["anchor_x_std"] = profile.anchorXStd;
    out["anchor_y_variance"] = profile.anchorYVariance;
    out["global_consistency"] = profile.globalConsistency;
    out["horizontal_adjacency"] = profile.horizontalAdjacency;
    out["recommended_strategy"] = toJson(strategyKindToString(profile.recommendedStrategy));
    return out;
}

Json::Value validationToJson(const validation::ValidationResult& result) {
    Json::Value out(Json::objectValue);
    out["valid"] = result.isValid();

    Json::Value gaps(Json::arrayValue);
    for (const auto& gap : result.sequenceGaps()) {
        Json::Value item(Json::objectValue);
        item["kind"] = toJson(validation::gapKindToString(gap.kind));
        item["before"] = toJson(gap.before);
        item["after"] = toJson(gap.after);
        if (!gap.missing.empty()) {
            item["missing"] = numberList(gap.missing);
        }
        gaps.append(std::move(item));
    }
    out["sequence_gaps"] = std::move(gaps);

    Json::Value conflicts(Json::arrayValue);
    for (const auto& conflict : result.rangeConflicts()) {
        Json::Value item(Json::objectValue);
        item["group_a"] = toJson(conflict.groupA);
        item["group_b"] = toJson(conflict.groupB);
        item["iou"] = conflict.iou;
        item["overlap_area"] = conflict.overlapArea;
        item["severe"] = conflict.severe;
        Json::Value elements(Json::arrayValue);
        for (ElementId id : conflict.contributingElements) {
            elements.append(static_cast<Json::UInt64>(id));
        }
        item["contributing_elements"] = std::move(elements);
        conflicts.append(std::move(item));
    }
    out["range_conflicts"] = std::move(conflicts);
    return out;
}

Json::Value correctionToJson(const correction::CorrectionResult& result) {
    Json::Value out(Json::objectValue);
    out["final_state"] = toJson(correction::correctionStateToString(result.finalState));

    Json::Value renames(Json::arrayValue);
    for (const auto& rename : result.renames) {
        Json::Value item(Json::objectValue);
        item["from"] = toJson(rename.from);
        item["to"] = toJson(rename.to);
        renames.append(std::move(item));
    }
    out["renames"] = std::move(renames);
    out["recovered_unassigned"] = numberList(result.recoveredUnassigned);

    Json::Value moves(Json::arrayValue);
    for (const auto& move : result.reassignments) {
        Json::Value item(Json::objectValue);
        item["element_id"] = static_cast<Json::UInt64>(move.elementId);
        item["from_group"] = toJson(move.fromGroup);
        item["to_group"] = toJson(move.toGroup);
        item["basis"] = toJson(correction::reassignmentBasisToString(move.basis));
        item["iou_from"] = move.iouFrom;
        item["iou_to"] = move.iouTo;
        moves.append(std::move(item));
    }
    out["reassignments"] = std::move(moves);

    Json::Value failed(Json::arrayValue);
    for (const auto& repair : result.failedRepairs) {
        Json::Value item(Json::objectValue);
        item["number"] = toJson(repair.number);
        item["expected"] = toJson(repair.expected);
        item["candidates"] = numberList(repair.candidates);
        failed.append(std::move(item));
    }
    out["failed_repairs"] = std::move(failed);
    out["merged_groups"] = toJson(result.mergedGroups);
    return out;
}

Json::Value pageReportToJson(const pipeline::PageReconstruction& page) {
    Json::Value out(Json::objectValue);
    out["job_id"] = page.jobId;
    out["page"] = static_cast<Json::UInt>(page.page);
    out["document_type"] = toJson(documentModeToString(page.documentMode));
    out["input_elements"] = toJson(page.inputElements);
    out["kept_elements"] = toJson(page.keptElements);
    out["profile"] = profileToJson(page.profile);
    out["strategy"] = page.strategy ? toJson(strategyKindToString(*page.strategy))
                                    : Json::Value(Json::nullValue);
    out["groups"] = groupsToJson(page.finalGroups);
    out["ordering"] = orderingToJson(page.ordering);
    out["validation"] = validationToJson(page.validation);
    out["correction"] = correctionToJson(page.correction);
    out["fingerprint"] = fingerprintToJson(page.fingerprint);
    out["elapsed_us"] = static_cast<Json::Int64>(page.elapsed.count());
    return out;
}

Json::Value batchReportToJson(std::span<const PageInput> pages,
                              std::span<const Result<pipeline::PageReconstruction>> results,
                              const pipeline::BatchStats& stats) {
    Json::Value out(Json::objectValue);

    Json::Value list(Json::arrayValue);
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (result) {
            list.append(pageReportToJson(*result));
            continue;
        }
        Json::Value failed(Json::objectValue);
        if (i < pages.size()) {
            failed["job_id"] = pages[i].jobId;
            failed["page"] = static_cast<Json::UInt>(pages[i].page);
        }
        Json::Value error(Json::objectValue);
        error["code"] = toJson(errorCodeToString(result.error().code()));
        error["message"] = result.error().message();
        error["retryable"] = result.error().isRetryable();
        failed["error"] = std::move(error);
        list.append(std::move(failed));
    }
    out["pages"] = std::move(list);

    Json::Value summary(Json::objectValue);
    summary["pages"] = toJson(stats.pages);
    summary["failed_pages"] = toJson(stats.failedPages);
    summary["corrected_pages"] = toJson(stats.correctedPages);
    summary["elements"] = toJson(stats.elements);
    summary["groups"] = toJson(stats.groups);
    summary["processing_time_ms"] = static_cast<Json::UInt64>(stats.processingTimeMs);
    out["summary"] = std::move(summary);
    return out;
}

// =============================================================================
// Output
// =============================================================================

std::string renderJson(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["precision"] = 6;
    std::string text = Json::writeString(builder, value);
    text.push_back('\n');
    return text;
}

VoidResult writeJson(const Json::Value& value, const std::filesystem::path& path, bool pretty) {
    const std::string text = renderJson(value, pretty);

    if (path.empty() || path == kStdoutPath) {
        std::cout << text;
        std::cout.flush();
        if (!std::cout) {
            return makeVoidError(ErrorCode::kIOError, "failed to write report to stdout");
        }
        return makeVoidSuccess();
    }

    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("cannot open output file '{}'", tempPath.string()));
        }
        stream << text;
        stream.flush();
        if (!stream) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("write to '{}' failed", tempPath.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return makeVoidError(ErrorCode::kIOError, fmt::format("cannot move report into '{}': {}",
                                                              path.string(), ec.message()));
    }

    DOCRECON_LOG_DEBUG("Wrote report ({} bytes) to {}", text.size(), path.string());
    return makeVoidSuccess();
}

}  // namespace docrecon::io
