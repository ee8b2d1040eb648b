// =============================================================================
// docrecon - Validate Command Implementation
// =============================================================================

#include "validate_command.h"

#include <iostream>
#include <utility>

#include <json/json.h>

#include "docrecon/common/logger.h"
#include "docrecon/io/page_reader.h"
#include "docrecon/io/report_writer.h"
#include "docrecon/pipeline/reconstruction_engine.h"
#include "docrecon/validation/context_validator.h"

namespace docrecon::commands {

ValidateCommand::ValidateCommand(ValidateOptions options) : options_(std::move(options)) {}

ValidateCommand::~ValidateCommand() = default;

ValidateCommand::ValidateCommand(ValidateCommand&&) noexcept = default;
ValidateCommand& ValidateCommand::operator=(ValidateCommand&&) noexcept = default;

int ValidateCommand::execute() {
    const auto pages = io::readPages(options_.inputPath);
    if (!pages) {
        DOCRECON_LOG_ERROR("Cannot read {}: {}", options_.inputPath.string(),
                           pages.error().message());
        return pages.error().exitCode();
    }

    const pipeline::ReconstructionEngine engine(options_.config);
    const validation::ContextValidator validator(options_.config);

    Json::Value list(Json::arrayValue);
    for (const auto& page : *pages) {
        const auto assigned = engine.assignPage(page, options_.strategy);
        if (!assigned) {
            DOCRECON_LOG_ERROR("Page {}#{}: {}", page.jobId, page.page,
                               assigned.error().message());
            return assigned.error().exitCode();
        }

        const auto result = validator.validate(assigned->initialGroups);
        const bool needsCorrection = validation::ContextValidator::needsCorrection(result);

        if (options_.jsonOutput) {
            Json::Value entry(Json::objectValue);
            entry["job_id"] = page.jobId;
            entry["page"] = static_cast<Json::UInt>(page.page);
            entry["groups"] = static_cast<Json::UInt64>(assigned->initialGroups.size());
            entry["validation"] = io::validationToJson(result);
            entry["needs_correction"] = needsCorrection;
            list.append(std::move(entry));
        } else {
            std::cout << page.jobId << "#" << page.page << ": " << result.summary();
            if (needsCorrection) {
                std::cout << " (correction needed)";
            }
            std::cout << "\n";
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
