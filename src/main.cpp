// =============================================================================
// docrecon - Layout Reconstruction Engine
// =============================================================================
// Main entry point for the docrecon command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: reconstruct, profile, validate
// - Global options: threads, verbosity, log file, engine config file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <tbb/global_control.h>

#include "docrecon/common/config.h"
#include "docrecon/common/error.h"
#include "docrecon/common/logger.h"
#include "docrecon/common/types.h"
#include "docrecon/io/config_loader.h"

// Command implementations
#include "commands/profile_command.h"
#include "commands/reconstruct_command.h"
#include "commands/validate_command.h"

namespace docrecon::commands {
int runReconstruct(CLI::App* app);
int runProfile(CLI::App* app);
int runValidate(CLI::App* app);
}  // namespace docrecon::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "docrecon: reconstructs question groups and reading order from layout-detector output.\n"
    "Input is the detector's JSON (one page or {\"pages\": [...]}); output is a JSON report\n"
    "with groups, ordering and the validation/correction audit trail.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = TBB default
    int verbosity = 0;  // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
    std::string configFile;
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliReconstructOptions {
    std::string input;
    std::string output = "-";
    std::string strategy;
    std::string mode;
    bool rowMajor = false;
    std::string commitDir;
    bool compact = false;
};

CliReconstructOptions gReconstructOpts;

struct CliProfileOptions {
    std::string input;
    bool json = false;
};

CliProfileOptions gProfileOpts;

struct CliValidateOptions {
    std::string input;
    bool json = false;
    std::string strategy;
};

CliValidateOptions gValidateOpts;

const std::vector<std::string> kStrategyNames = {"direct", "global_first", "legacy_local",
                                                 "local_first", "hybrid"};

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupReconstructCommand(CLI::App& app) {
    auto* reconstruct =
        app.add_subcommand("reconstruct", "Group elements and emit the reading order");
    reconstruct->alias("r");

    reconstruct->add_option("-i,--input", gReconstructOpts.input, "Input page document (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    reconstruct->add_option("-o,--output", gReconstructOpts.output,
                            "Output report (or '-' for stdout)")
        ->default_val("-");

    reconstruct->add_option("--strategy", gReconstructOpts.strategy,
                            "Force an assignment strategy: direct, legacy_local, hybrid")
        ->check(CLI::IsMember(kStrategyNames, CLI::ignore_case));

    reconstruct->add_option("--mode", gReconstructOpts.mode,
                            "Override the document mode: question_based, reading_order")
        ->check(CLI::IsMember({"question_based", "reading_order"}, CLI::ignore_case));

    reconstruct->add_flag("--row-major", gReconstructOpts.rowMajor,
                          "Interleave columns by anchor Y instead of column-major output");

    reconstruct->add_option("--commit-dir", gReconstructOpts.commitDir,
                            "Commit each page result under this directory");

    reconstruct->add_flag("--compact", gReconstructOpts.compact, "Emit single-line JSON");
}

void setupProfileCommand(CLI::App& app) {
    auto* profile = app.add_subcommand("profile", "Print each page's layout profile");
    profile->alias("p");

    profile->add_option("-i,--input", gProfileOpts.input, "Input page document (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    profile->add_flag("--json", gProfileOpts.json, "Output as JSON");
}

void setupValidateCommand(CLI::App& app) {
    auto* validate =
        app.add_subcommand("validate", "Group each page and report validation findings");
    validate->alias("v");

    validate->add_option("-i,--input", gValidateOpts.input, "Input page document (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    validate->add_flag("--json", gValidateOpts.json, "Output as JSON");

    validate->add_option("--strategy", gValidateOpts.strategy,
                         "Force an assignment strategy: direct, legacy_local, hybrid")
        ->check(CLI::IsMember(kStrategyNames, CLI::ignore_case));
}

/// Engine configuration from --config, or the defaults.
[[nodiscard]] docrecon::EngineConfig loadEngineConfig() {
    if (gOptions.configFile.empty()) {
        return {};
    }
    return docrecon::unwrapOrThrow(docrecon::io::loadConfig(gOptions.configFile));
}

[[nodiscard]] std::optional<docrecon::StrategyKind> strategyOption(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const auto kind = docrecon::parseStrategyKind(name);
    if (!kind) {
        throw docrecon::UsageError("unknown strategy '" + name + "'");
    }
    return kind;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    app.add_option("-c,--config", gOptions.configFile, "Engine configuration file (JSON)")
        ->check(CLI::ExistingFile);

    // Setup subcommands
    setupReconstructCommand(app);
    setupProfileCommand(app);
    setupValidateCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        auto logLevel = docrecon::log::Level::kInfo;
        if (gOptions.quiet) {
            logLevel = docrecon::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = docrecon::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logLevel = docrecon::log::Level::kDebug;
        }
        docrecon::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::unique_ptr<tbb::global_control> threadLimit;
    if (gOptions.threads > 0) {
        threadLimit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism,
            static_cast<std::size_t>(gOptions.threads));
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("reconstruct")) {
            exitCode = docrecon::commands::runReconstruct(app.get_subcommand("reconstruct"));
        } else if (app.got_subcommand("profile")) {
            exitCode = docrecon::commands::runProfile(app.get_subcommand("profile"));
        } else if (app.got_subcommand("validate")) {
            exitCode = docrecon::commands::runValidate(app.get_subcommand("validate"));
        }
    } catch (const docrecon::DocreconException& ex) {
        DOCRECON_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        DOCRECON_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    docrecon::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace docrecon::commands {

int runReconstruct([[maybe_unused]] CLI::App* app) {
    ReconstructOptions opts;
    opts.inputPath = gReconstructOpts.input;
    opts.outputPath = gReconstructOpts.output;
    opts.pretty = !gReconstructOpts.compact;
    opts.config = loadEngineConfig();
    opts.strategy = strategyOption(gReconstructOpts.strategy);

    if (gReconstructOpts.rowMajor) {
        opts.config.rowMajorColumns = true;
    }
    if (!gReconstructOpts.mode.empty()) {
        opts.documentMode = parseDocumentMode(gReconstructOpts.mode);
        if (!opts.documentMode) {
            throw UsageError("unknown mode '" + gReconstructOpts.mode + "'");
        }
    }
    if (!gReconstructOpts.commitDir.empty()) {
        opts.commitDir = gReconstructOpts.commitDir;
    }

    DOCRECON_LOG_DEBUG("Engine config: {}", describeConfig(opts.config));

    auto cmd = std::make_unique<ReconstructCommand>(std::move(opts));
    return cmd->execute();
}

int runProfile([[maybe_unused]] CLI::App* app) {
    ProfileOptions opts;
    opts.inputPath = gProfileOpts.input;
    opts.jsonOutput = gProfileOpts.json;
    opts.config = loadEngineConfig();

    auto cmd = std::make_unique<ProfileCommand>(std::move(opts));
    return cmd->execute();
}

int runValidate([[maybe_unused]] CLI::App* app) {
    ValidateOptions opts;
    opts.inputPath = gValidateOpts.input;
    opts.jsonOutput = gValidateOpts.json;
    opts.config = loadEngineConfig();
    opts.strategy = strategyOption(gValidateOpts.strategy);

    auto cmd = std::make_unique<ValidateCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace docrecon::commands
