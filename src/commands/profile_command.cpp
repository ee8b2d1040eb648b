// =============================================================================
// docrecon - Profile Command Implementation
// =============================================================================

#include "profile_command.h"

#include <iostream>
#include <utility>

#include <json/json.h>

#include "docrecon/common/logger.h"
#include "docrecon/io/page_reader.h"
#include "docrecon/io/report_writer.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/layout/spatial_partitioner.h"
#include "docrecon/layout/strategy_selector.h"

namespace docrecon::commands {

ProfileCommand::ProfileCommand(ProfileOptions options) : options_(std::move(options)) {}

ProfileCommand::~ProfileCommand() = default;

ProfileCommand::ProfileCommand(ProfileCommand&&) noexcept = default;
ProfileCommand& ProfileCommand::operator=(ProfileCommand&&) noexcept = default;

int ProfileCommand::execute() {
    if (auto valid = options_.config.validate(); !valid) {
        DOCRECON_LOG_ERROR("{}", valid.error().message());
        return valid.error().exitCode();
    }

    const auto pages = io::readPages(options_.inputPath);
    if (!pages) {
        DOCRECON_LOG_ERROR("Cannot read {}: {}", options_.inputPath.string(),
                           pages.error().message());
        return pages.error().exitCode();
    }

    const layout::SpatialPartitioner partitioner(options_.config);
    const layout::LayoutProfiler profiler(options_.config);
    const layout::StrategySelector selector(options_.config);

    Json::Value list(Json::arrayValue);
    for (const auto& page : *pages) {
        const DocumentMode mode = page.documentMode.value_or(options_.config.documentMode);
        const auto kept = partitioner.preprocess(page.elements, mode);
        const auto profile = profiler.profile(kept, page.pageWidth, page.pageHeight);
        const StrategyKind selected = selector.choose(profile);

        if (options_.jsonOutput) {
            Json::Value entry(Json::objectValue);
            entry["job_id"] = page.jobId;
            entry["page"] = static_cast<Json::UInt>(page.page);
            entry["document_type"] = std::string(documentModeToString(mode));
            entry["kept_elements"] = static_cast<Json::UInt64>(kept.size());
            entry["profile"] = io::profileToJson(profile);
            entry["selected_strategy"] = std::string(strategyKindToString(selected));
            list.append(std::move(entry));
        } else {
            std::cout << page.jobId << "#" << page.page << ": " << profile.toString()
                      << " -> " << strategyKindToString(selected) << "\n";
        }
    }

    if (options_.jsonOutput) {
        Json::Value out(Json::objectValue);
        out["pages"] = std::move(list);
        if (auto written = io::writeJson(out, io::kStdoutPath); !written) {
            DOCRECON_LOG_ERROR("{}", written.error().message());
            return written.error().exitCode();
        }
    }
    return 0;
}

}  // namespace docrecon::commands
