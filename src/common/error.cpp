// =============================================================================
// docrecon - Error Handling Framework Implementation
// =============================================================================

#include "docrecon/common/error.h"

#include <fmt/format.h>
#include <sstream>

namespace docrecon {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (!jobId.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "job: " << jobId;
        hasContent = true;
    }

    if (pageIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "page: " << *pageIndex;
        hasContent = true;
    }

    if (elementId.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "element: " << *elementId;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// DocreconException Implementation
// =============================================================================

void DocreconException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError / TimeoutError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string TimeoutError::formatTimeout(const std::string& jobId,
                                        std::chrono::milliseconds waited) {
    return fmt::format("could not acquire lock for job '{}' within {} ms", jobId,
                       waited.count());
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kMalformedInput:
            throw MalformedInputError(message_);
        case ErrorCode::kConfigError:
            throw ConfigError(message_);
        case ErrorCode::kTimeout:
            throw TimeoutError(message_);
        case ErrorCode::kDuplicateKey:
            throw DuplicateKeyError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kNotFound:
        case ErrorCode::kInvalidState:
            break;
    }
    throw DocreconException(code_, message_);
}

}  // namespace docrecon
