// =============================================================================
// genoqc - Transfer Engine Implementation
// =============================================================================

#include "gqc/acquire/transfer_engine.h"

#include <format>
#include <fstream>
#include <system_error>

#include "gqc/common/logger.h"
#include "gqc/io/checksum.h"

namespace gqc::acquire {

namespace {

using Clock = std::chrono::steady_clock;

/// @brief Why the sink stopped accepting bytes.
enum class AbortReason : std::uint8_t {
    kNone,
    kCancelled,
    kDeadline,
    kWriteFailed,
    kSizeMismatch,
    kTruncateFailed
};

FetchOutcome failed(FetchOutcome outcome, FetchStatus status, ErrorCode code,
                    std::string message) {
    outcome.status = status;
    outcome.errorCode = code;
    outcome.message = std::move(message);
    return outcome;
}

ByteCount sizeOnDisk(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<ByteCount>(size);
}

}  // namespace

// =============================================================================
// TransferEngine Implementation
// =============================================================================

TransferEngine::TransferEngine(TransferConfig config,
                               net::RangeSourcePtr source,
                               CancellationTokenPtr cancellation)
    : config_(std::move(config)),
      source_(std::move(source)),
      cancellation_(std::move(cancellation)) {
    if (!source_) {
        throw GQCException(ErrorCode::kInvalidArgument, "TransferEngine requires a RangeSource");
    }
}

FetchOutcome TransferEngine::fetch(const RemoteObject& object,
                                   const std::filesystem::path& destination,
                                   ByteCount resumeOffset) const {
    FetchOutcome outcome;
    outcome.totalBytes = object.expectedSize;

    if (cancellation_ && cancellation_->isCancelled()) {
        outcome.confirmedBytes = sizeOnDisk(destination);
        return failed(std::move(outcome), FetchStatus::kCancelled, ErrorCode::kCancelled,
                      "cancelled before start");
    }

    // Reconcile the partial file with the requested offset.
    std::error_code ec;
    const bool exists = std::filesystem::exists(destination, ec);
    const ByteCount existing = exists ? sizeOnDisk(destination) : 0;
    if (existing < resumeOffset) {
        outcome.confirmedBytes = existing;
        return failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                      ErrorCode::kIntegrityMismatch,
                      std::format("partial file holds {} bytes, resume offset is {}", existing,
                                  resumeOffset));
    }
    if (existing > resumeOffset) {
        std::filesystem::resize_file(destination, resumeOffset, ec);
        if (ec) {
            outcome.confirmedBytes = existing;
            return failed(std::move(outcome), FetchStatus::kFailed, ErrorCode::kIOError,
                          std::format("cannot truncate '{}': {}", destination.string(),
                                      ec.message()));
        }
    }
    outcome.confirmedBytes = resumeOffset;

    if (object.expectedSize) {
        if (resumeOffset > *object.expectedSize) {
            return failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                          ErrorCode::kIntegrityMismatch,
                          std::format("resume offset {} exceeds expected size {}", resumeOffset,
                                      *object.expectedSize));
        }
        if (resumeOffset == *object.expectedSize) {
            // Every byte is already on disk; only verification is left.
            return verify(object, destination, std::move(outcome));
        }
    }

    std::ofstream out(destination, std::ios::binary | std::ios::app);
    if (!out) {
        return failed(std::move(outcome), FetchStatus::kFailed, ErrorCode::kIOError,
                      std::format("cannot open '{}' for writing", destination.string()));
    }

    const auto started = Clock::now();
    const auto deadline = started + std::chrono::seconds(config_.attemptTimeoutSec);
    const auto progressInterval = std::chrono::milliseconds(config_.progressIntervalMs);

    ByteCount baseOffset = resumeOffset;
    ByteCount written = 0;
    ByteCount sinceFlush = 0;
    auto lastReport = started;
    AbortReason abort = AbortReason::kNone;

    auto reportProgress = [&]() {
        out.flush();
        sinceFlush = 0;
        lastReport = Clock::now();
        if (progressCallback_) {
            progressCallback_(TransferProgress{
                object.url, baseOffset + written, outcome.totalBytes,
                std::chrono::duration_cast<std::chrono::milliseconds>(lastReport - started)});
        }
    };

    net::RangeRequest request;
    request.url = object.url;
    request.offset = resumeOffset;
    request.connectTimeoutSec = config_.connectTimeoutSec;
    request.readTimeoutSec = config_.readTimeoutSec;
    request.userAgent = config_.userAgent;
    request.verifyTls = config_.verifyTls;

    auto onResponse = [&](const net::RangeResponse& response) {
        if (response.totalSize) {
            if (object.expectedSize && *object.expectedSize != *response.totalSize) {
                abort = AbortReason::kSizeMismatch;
                return false;
            }
            outcome.totalBytes = response.totalSize;
        }
        if (resumeOffset > 0 && !response.partial) {
            // Full body from byte 0: rewrite the file instead of appending.
            GQC_LOG_WARNING("Server ignored Range for {}; restarting from byte 0", object.url);
            out.close();
            std::filesystem::resize_file(destination, 0, ec);
            if (ec) {
                abort = AbortReason::kTruncateFailed;
                return false;
            }
            out.open(destination, std::ios::binary | std::ios::app);
            if (!out) {
                abort = AbortReason::kWriteFailed;
                return false;
            }
            baseOffset = 0;
            outcome.rangeIgnored = true;
        }
        return true;
    };

    auto sink = [&](const char* data, std::size_t length) {
        if (cancellation_ && cancellation_->isCancelled()) {
            abort = AbortReason::kCancelled;
            return false;
        }
        if (Clock::now() >= deadline) {
            abort = AbortReason::kDeadline;
            return false;
        }
        out.write(data, static_cast<std::streamsize>(length));
        if (!out) {
            abort = AbortReason::kWriteFailed;
            return false;
        }
        written += length;
        sinceFlush += length;
        if (sinceFlush >= config_.progressIntervalBytes ||
            Clock::now() - lastReport >= progressInterval) {
            reportProgress();
        }
        return true;
    };

    auto response = source_->get(request, onResponse, sink);

    out.flush();
    const bool writeOk = static_cast<bool>(out);
    out.close();

    outcome.bytesWritten = written;
    outcome.confirmedBytes = sizeOnDisk(destination);

    switch (abort) {
        case AbortReason::kNone:
            break;
        case AbortReason::kCancelled:
            return failed(std::move(outcome), FetchStatus::kCancelled, ErrorCode::kCancelled,
                          "cancelled; partial bytes kept");
        case AbortReason::kDeadline:
            return failed(std::move(outcome), FetchStatus::kInterrupted, ErrorCode::kTimeout,
                          std::format("attempt exceeded {} s", config_.attemptTimeoutSec));
        case AbortReason::kWriteFailed:
        case AbortReason::kTruncateFailed:
            return failed(std::move(outcome), FetchStatus::kFailed, ErrorCode::kIOError,
                          std::format("write to '{}' failed", destination.string()));
        case AbortReason::kSizeMismatch:
            return failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                          ErrorCode::kIntegrityMismatch,
                          std::format("server reports a size other than the expected {}",
                                      *object.expectedSize));
    }

    if (!response) {
        const Error& error = response.error();
        switch (error.code()) {
            case ErrorCode::kInterrupted:
                return failed(std::move(outcome), FetchStatus::kInterrupted,
                              ErrorCode::kInterrupted, error.message());
            case ErrorCode::kIntegrityMismatch:
                return failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                              ErrorCode::kIntegrityMismatch, error.message());
            default:
                return failed(std::move(outcome), FetchStatus::kFailed, error.code(),
                              error.message());
        }
    }
    if (!writeOk) {
        return failed(std::move(outcome), FetchStatus::kFailed, ErrorCode::kIOError,
                      std::format("flush of '{}' failed", destination.string()));
    }

    reportProgress();
    return verify(object, destination, std::move(outcome));
}

FetchOutcome TransferEngine::verify(const RemoteObject& object,
                                    const std::filesystem::path& destination,
                                    FetchOutcome outcome) const {
    outcome.confirmedBytes = sizeOnDisk(destination);

    if (outcome.totalBytes) {
        if (outcome.confirmedBytes < *outcome.totalBytes) {
            // Body ended early without a transport error.
            return failed(std::move(outcome), FetchStatus::kInterrupted, ErrorCode::kInterrupted,
                          "connection closed before the last byte");
        }
        if (outcome.confirmedBytes > *outcome.totalBytes) {
            const ByteCount expected = *outcome.totalBytes;
            const ByteCount actual = outcome.confirmedBytes;
            return failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                          ErrorCode::kIntegrityMismatch,
                          std::format("size mismatch: expected {} bytes, have {}", expected,
                                      actual));
        }
    }

    if (object.expectedChecksum) {
        auto digest = io::hashFile(destination, object.expectedChecksum->algorithm,
                                   config_.hashBufferSize);
        if (!digest) {
            return failed(std::move(outcome), FetchStatus::kFailed, digest.error().code(),
                          digest.error().message());
        }
        outcome.actualChecksum = *digest;
        if (*digest != object.expectedChecksum->hexDigest) {
            return failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                          ErrorCode::kIntegrityMismatch,
                          std::format("checksum mismatch: expected {}, got {}",
                                      object.expectedChecksum->hexDigest, *digest));
        }
    } else if (!outcome.totalBytes) {
        return failed(std::move(outcome), FetchStatus::kUnverifiable, ErrorCode::kIntegrityMismatch,
                      "neither size nor checksum available to verify the download");
    }

    outcome.status = FetchStatus::kCompleted;
    outcome.errorCode = ErrorCode::kSuccess;
    outcome.message.clear();
    return outcome;
}

}  // namespace gqc::acquire
