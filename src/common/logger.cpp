// =============================================================================
// docrecon - Logger Module Implementation
// =============================================================================
// Quill backend startup, sink wiring and level conversion.
// =============================================================================

#include "docrecon/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace docrecon::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

std::atomic<quill::Logger*> gLogger{nullptr};

std::atomic<bool> gInitialized{false};

/// @brief Serializes init() and shutdown().
std::mutex gInitMutex;

struct LevelName {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

constexpr std::array<LevelName, 6> kLevelNames = {{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
}};

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(
        path,
        []() {
            quill::FileSinkConfig fileSinkConfig;
            fileSinkConfig.set_open_mode('w');
            return fileSinkConfig;
        }(),
        quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.quillLevel;
        }
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);
    if (lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "fatal") {
        return Level::kCritical;
    }
    for (const auto& entry : kLevelNames) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

// =============================================================================
// Initialization
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gInitialized.load(std::memory_order_acquire)) {
        // A second init only adjusts the threshold of the existing logger.
        gLogger.load(std::memory_order_acquire)->set_log_level(toQuillLevel(config.level));
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Access and Teardown
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* loggerPtr = logger(); loggerPtr != nullptr) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }
    flush();
    quill::Backend::stop();
    gLogger.store(nullptr, std::memory_order_release);
    gInitialized.store(false, std::memory_order_release);
}

}  // namespace docrecon::log
