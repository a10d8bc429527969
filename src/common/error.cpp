// =============================================================================
// genoqc - Error Handling Framework Implementation
// =============================================================================

#include "gqc/common/error.h"

#include <format>
#include <sstream>

namespace gqc {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto append = [&](std::string_view label, std::string_view value) {
        if (value.empty()) {
            return;
        }
        if (hasContent) {
            oss << ", ";
        }
        oss << label << ": " << value;
        hasContent = true;
    };

    append("dataset", datasetId);
    append("url", url);
    append("file", filePath);
    append("analyzer", analyzer);

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
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
// GQCException Implementation
// =============================================================================

void GQCException::formatWhat() {
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

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string IntegrityError::formatDigestMismatch(std::string_view expected,
                                                 std::string_view actual) {
    return std::format("digest mismatch: expected {}, got {}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

GQCException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kNetworkError:
            return NetworkError(message_);
        case ErrorCode::kIntegrityMismatch:
            return IntegrityError(message_);
        case ErrorCode::kUnsupportedTechnology:
            return UnsupportedTechnologyError(message_);
        case ErrorCode::kAggregationIncomplete:
            return AggregationIncompleteError(message_);
        case ErrorCode::kFormatError:
            return FormatError(message_);
        default:
            break;
    }
    return GQCException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kNetworkError:
            throw NetworkError(message_);
        case ErrorCode::kIntegrityMismatch:
            throw IntegrityError(message_);
        case ErrorCode::kUnsupportedTechnology:
            throw UnsupportedTechnologyError(message_);
        case ErrorCode::kPartialAcquisitionFailure:
            throw PartialAcquisitionError(message_, {});
        case ErrorCode::kAggregationIncomplete:
            throw AggregationIncompleteError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        default:
            break;
    }
    throw GQCException(code_, message_);
}

}  // namespace gqc
