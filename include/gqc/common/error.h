// =============================================================================
// genoqc - Error Handling Framework
// =============================================================================
// Error handling shared by the acquisition and QC layers.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - GQCException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (local file system)
// - 3: Network error (non-retryable HTTP status, unreachable host)
// - 4: Integrity mismatch (checksum or size)
// - 5: Unsupported technology class
// - 7: Partial acquisition failure
// - 9: Aggregation incomplete (merge step failed)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef GQC_COMMON_ERROR_H
#define GQC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gqc {

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

    /// @brief Local I/O error (open, write, rename, permission denied).
    kIOError = 2,

    /// @brief Network error that retrying will not fix (404, 403, bad URL).
    kNetworkError = 3,

    /// @brief Checksum or size verification failure.
    /// @note Forces a restart of the transfer from offset 0.
    kIntegrityMismatch = 4,

    /// @brief Read technology class is not one of short-read / long-read.
    kUnsupportedTechnology = 5,

    /// @brief Transient transfer failure; resumable from the confirmed offset.
    kInterrupted = 6,

    /// @brief One or more remote objects exhausted their retry budget.
    kPartialAcquisitionFailure = 7,

    /// @brief External analyzer failed (recorded per QC run, never fatal).
    kToolError = 8,

    /// @brief External report-merge program failed.
    kAggregationIncomplete = 9,

    /// @brief Wall-clock budget exceeded.
    kTimeout = 10,

    /// @brief Operation was cancelled.
    kCancelled = 11,

    /// @brief Invalid argument value.
    kInvalidArgument = 12,

    /// @brief Invalid state for operation.
    kInvalidState = 13,

    /// @brief Malformed input (metadata, dataset sheet, tool output).
    kFormatError = 14,

    /// @brief Accession could not be resolved to remote objects.
    kResolutionFailed = 15,

    /// @brief Unexpected internal failure.
    kInternalError = 16
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kNetworkError:
            return "network error";
        case ErrorCode::kIntegrityMismatch:
            return "integrity mismatch";
        case ErrorCode::kUnsupportedTechnology:
            return "unsupported technology";
        case ErrorCode::kInterrupted:
            return "interrupted";
        case ErrorCode::kPartialAcquisitionFailure:
            return "partial acquisition failure";
        case ErrorCode::kToolError:
            return "tool error";
        case ErrorCode::kAggregationIncomplete:
            return "aggregation incomplete";
        case ErrorCode::kTimeout:
            return "timeout";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kResolutionFailed:
            return "resolution failed";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check whether a failure with this code may succeed on a later attempt.
/// @note Interrupted transfers resume; integrity mismatches restart from zero.
[[nodiscard]] constexpr bool isRetryable(ErrorCode code) noexcept {
    return code == ErrorCode::kInterrupted || code == ErrorCode::kIntegrityMismatch ||
           code == ErrorCode::kTimeout;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Dataset identifier (accession) associated with the error.
    std::string datasetId;

    /// @brief Remote URL associated with the error.
    std::string url;

    /// @brief Local file path associated with the error.
    std::string filePath;

    /// @brief Analyzer name (QC errors only).
    std::string analyzer;

    /// @brief Byte offset where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withDataset(std::string id) {
        datasetId = std::move(id);
        return *this;
    }

    ErrorContext& withUrl(std::string value) {
        url = std::move(value);
        return *this;
    }

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withAnalyzer(std::string name) {
        analyzer = std::move(name);
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all genoqc errors.
class GQCException : public std::exception {
public:
    GQCException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    GQCException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~GQCException() override = default;

    GQCException(const GQCException&) = default;
    GQCException(GQCException&&) noexcept = default;
    GQCException& operator=(const GQCException&) = default;
    GQCException& operator=(GQCException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

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
class UsageError : public GQCException {
public:
    explicit UsageError(std::string message)
        : GQCException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for local I/O errors (exit code 2).
class IOError : public GQCException {
public:
    explicit IOError(std::string message)
        : GQCException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : GQCException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : GQCException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for non-retryable network failures (exit code 3).
class NetworkError : public GQCException {
public:
    explicit NetworkError(std::string message)
        : GQCException(ErrorCode::kNetworkError, std::move(message)) {}

    NetworkError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kNetworkError, std::move(message), std::move(context)) {}
};

/// @brief Exception for checksum or size verification failures (exit code 4).
class IntegrityError : public GQCException {
public:
    explicit IntegrityError(std::string message)
        : GQCException(ErrorCode::kIntegrityMismatch, std::move(message)) {}

    IntegrityError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kIntegrityMismatch, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual digests.
    IntegrityError(std::string_view expected, std::string_view actual, ErrorContext context)
        : GQCException(ErrorCode::kIntegrityMismatch,
                       formatDigestMismatch(expected, actual),
                       std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] const std::optional<std::string>& expected() const noexcept { return expected_; }

    [[nodiscard]] const std::optional<std::string>& actual() const noexcept { return actual_; }

private:
    static std::string formatDigestMismatch(std::string_view expected, std::string_view actual);

    std::optional<std::string> expected_;
    std::optional<std::string> actual_;
};

/// @brief Exception for unknown read technology classes (exit code 5).
class UnsupportedTechnologyError : public GQCException {
public:
    explicit UnsupportedTechnologyError(std::string message)
        : GQCException(ErrorCode::kUnsupportedTechnology, std::move(message)) {}

    UnsupportedTechnologyError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kUnsupportedTechnology, std::move(message),
                       std::move(context)) {}
};

/// @brief Exception raised when some remote objects exhausted their retries (exit code 7).
/// @note Verified objects of the same batch are left on disk.
class PartialAcquisitionError : public GQCException {
public:
    PartialAcquisitionError(std::string message, std::vector<std::string> failedUrls)
        : GQCException(ErrorCode::kPartialAcquisitionFailure, std::move(message)),
          failedUrls_(std::move(failedUrls)) {}

    [[nodiscard]] const std::vector<std::string>& failedUrls() const noexcept {
        return failedUrls_;
    }

private:
    std::vector<std::string> failedUrls_;
};

/// @brief Exception for merge-step failures (exit code 9).
/// @note Per-tool outputs are preserved so the merge can be retried alone.
class AggregationIncompleteError : public GQCException {
public:
    explicit AggregationIncompleteError(std::string message)
        : GQCException(ErrorCode::kAggregationIncomplete, std::move(message)) {}

    AggregationIncompleteError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kAggregationIncomplete, std::move(message),
                       std::move(context)) {}
};

/// @brief Exception for malformed input files (exit code 14).
class FormatError : public GQCException {
public:
    explicit FormatError(std::string message)
        : GQCException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : GQCException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a GQCException.
    explicit Error(const GQCException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] GQCException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create an error value convertible to any Result<T>.
[[nodiscard]] inline std::unexpected<Error> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error value with a std::format message.
template <typename... Args>
    requires(sizeof...(Args) > 0)
[[nodiscard]] std::unexpected<Error> makeError(ErrorCode code,
                                               std::format_string<Args...> fmt,
                                               Args&&... args) {
    return std::unexpected(Error{code, std::format(fmt, std::forward<Args>(args)...)});
}

/// @brief Create an error value from an Error object.
[[nodiscard]] inline std::unexpected<Error> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error value from an exception.
[[nodiscard]] inline std::unexpected<Error> makeError(const GQCException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws GQCException (or derived) if the result contains an error.
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
    } catch (const GQCException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInternalError, ex.what()});
    }
}

}  // namespace gqc

#endif  // GQC_COMMON_ERROR_H
