// =============================================================================
// docrecon - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// The DOCRECON_LOG_* macros are no-ops until init() has run, so library code
// can log unconditionally and unit tests need no logger setup.
//
// Usage:
//   docrecon::log::init("docrecon.log", docrecon::log::Level::kInfo);
//   DOCRECON_LOG_INFO("Reconstructed {} groups", count);
// =============================================================================

#ifndef DOCRECON_COMMON_LOGGER_H
#define DOCRECON_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace docrecon::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Enable colored console output.
    bool enableColors = true;

    /// @brief Logger name for identification.
    std::string loggerName = "docrecon";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Called once from main() before any batch work is spawned.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert docrecon::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level.
/// @param levelStr String representation (case-insensitive).
/// @return Corresponding log level, defaults to kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace docrecon::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define DOCRECON_LOG_IMPL_(quillMacro, fmt, ...)                          \
    do {                                                                  \
        if (quill::Logger* docreconLogger_ = ::docrecon::log::logger()) { \
            quillMacro(docreconLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);  \
        }                                                                 \
    } while (false)

/// @brief Log a trace message.
#define DOCRECON_LOG_TRACE(fmt, ...) \
    DOCRECON_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define DOCRECON_LOG_DEBUG(fmt, ...) \
    DOCRECON_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define DOCRECON_LOG_INFO(fmt, ...) \
    DOCRECON_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define DOCRECON_LOG_WARNING(fmt, ...) \
    DOCRECON_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define DOCRECON_LOG_ERROR(fmt, ...) \
    DOCRECON_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define DOCRECON_LOG_CRITICAL(fmt, ...) \
    DOCRECON_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // DOCRECON_COMMON_LOGGER_H
