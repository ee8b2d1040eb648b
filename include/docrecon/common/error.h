// =============================================================================
// docrecon - Error Handling Framework
// =============================================================================
// Error handling for the layout reconstruction library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - DocreconException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Only hard failures travel through this module: malformed input, I/O,
// invalid configuration, lock timeouts and duplicate-key races. Geometric and
// identifier ambiguity is absorbed by the engine and never becomes an Error.
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Malformed input document
// - 4: Invalid engine configuration
// - 5: Job lock timeout (retryable)
// - 6: Duplicate result key
// =============================================================================

#ifndef DOCRECON_COMMON_ERROR_H
#define DOCRECON_COMMON_ERROR_H

#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace docrecon {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Input document is malformed.
    /// @note Missing bounding box, wrong JSON types, invalid coordinates.
    kMalformedInput = 3,

    /// @brief Engine configuration failed validation.
    kConfigError = 4,

    /// @brief Bounded wait for a job lock expired.
    /// @note Retryable: the caller may resubmit the job.
    kTimeout = 5,

    /// @brief A result for this key was already committed.
    kDuplicateKey = 6,

    /// @brief Requested entity does not exist.
    kNotFound = 7,

    /// @brief Invalid state for operation.
    kInvalidState = 8
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kMalformedInput:
            return "malformed input";
        case ErrorCode::kConfigError:
            return "configuration error";
        case ErrorCode::kTimeout:
            return "timeout";
        case ErrorCode::kDuplicateKey:
            return "duplicate key";
        case ErrorCode::kNotFound:
            return "not found";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

/// @brief Check if an operation failing with this code may be retried as-is.
[[nodiscard]] constexpr bool isRetryable(ErrorCode code) noexcept {
    return code == ErrorCode::kTimeout;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Job identifier (if applicable).
    std::string jobId;

    /// @brief Page index within the job (if applicable).
    std::optional<std::uint32_t> pageIndex;

    /// @brief Element identifier (if applicable).
    std::optional<std::uint64_t> elementId;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the job identifier.
    ErrorContext& withJob(std::string id) {
        jobId = std::move(id);
        return *this;
    }

    /// @brief Set the page index.
    ErrorContext& withPage(std::uint32_t index) {
        pageIndex = index;
        return *this;
    }

    /// @brief Set the element identifier.
    ErrorContext& withElement(std::uint64_t id) {
        elementId = id;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all docrecon errors.
class DocreconException : public std::exception {
public:
    DocreconException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    DocreconException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~DocreconException() override = default;

    DocreconException(const DocreconException&) = default;
    DocreconException(DocreconException&&) noexcept = default;
    DocreconException& operator=(const DocreconException&) = default;
    DocreconException& operator=(DocreconException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public DocreconException {
public:
    explicit UsageError(std::string message)
        : DocreconException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : DocreconException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public DocreconException {
public:
    explicit IOError(std::string message)
        : DocreconException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : DocreconException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : DocreconException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed page documents (exit code 3).
/// @note Thrown for missing fields, wrong JSON types and invalid boxes.
class MalformedInputError : public DocreconException {
public:
    explicit MalformedInputError(std::string message)
        : DocreconException(ErrorCode::kMalformedInput, std::move(message)) {}

    MalformedInputError(std::string message, ErrorContext context)
        : DocreconException(ErrorCode::kMalformedInput, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid engine configuration (exit code 4).
class ConfigError : public DocreconException {
public:
    explicit ConfigError(std::string message)
        : DocreconException(ErrorCode::kConfigError, std::move(message)) {}

    ConfigError(std::string message, ErrorContext context)
        : DocreconException(ErrorCode::kConfigError, std::move(message), std::move(context)) {}
};

/// @brief Exception for expired job-lock waits (exit code 5).
/// @note The operation never ran; it is safe to retry.
class TimeoutError : public DocreconException {
public:
    explicit TimeoutError(std::string message)
        : DocreconException(ErrorCode::kTimeout, std::move(message)) {}

    TimeoutError(std::string jobId, std::chrono::milliseconds waited)
        : DocreconException(ErrorCode::kTimeout, formatTimeout(jobId, waited),
                            ErrorContext{}.withJob(jobId)),
          waited_(waited) {}

    /// @brief Get how long the caller waited before giving up.
    [[nodiscard]] std::optional<std::chrono::milliseconds> waited() const noexcept {
        return waited_;
    }

private:
    static std::string formatTimeout(const std::string& jobId, std::chrono::milliseconds waited);

    std::optional<std::chrono::milliseconds> waited_;
};

/// @brief Exception for duplicate result commits (exit code 6).
class DuplicateKeyError : public DocreconException {
public:
    explicit DuplicateKeyError(std::string message)
        : DocreconException(ErrorCode::kDuplicateKey, std::move(message)) {}

    DuplicateKeyError(std::string message, ErrorContext context)
        : DocreconException(ErrorCode::kDuplicateKey, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a DocreconException.
    explicit Error(const DocreconException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Check whether the failed operation may be retried.
    [[nodiscard]] bool isRetryable() const noexcept { return docrecon::isRetryable(code_); }

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const DocreconException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws DocreconException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
/// @note A void-returning function yields a VoidResult.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const DocreconException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInvalidState, ex.what()});
    }
}

}  // namespace docrecon

#endif  // DOCRECON_COMMON_ERROR_H
