// =============================================================================
// genoqc - Transfer Engine
// =============================================================================
// One resumable, verified download attempt of one remote object.
//
// A fetch appends the byte range [resumeOffset, end) of the object to the
// destination file, flushing and reporting progress at bounded intervals.
// On completion the whole file is checked against the expected size and
// checksum. The engine writes or extends exactly one file per call and never
// deletes anything; restart and cleanup decisions belong to the caller.
//
// Usage:
//   TransferEngine engine(config.transfer, net::makeHttpRangeSource(), token);
//   auto outcome = engine.fetch(object, "data/ERR1/ERR1_1.fastq.gz.part", 0);
//   if (outcome.status == FetchStatus::kInterrupted) {
//       outcome = engine.fetch(object, path, outcome.confirmedBytes);
//   }
// =============================================================================

#ifndef GQC_ACQUIRE_TRANSFER_ENGINE_H
#define GQC_ACQUIRE_TRANSFER_ENGINE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gqc/common/cancellation.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/net/range_source.h"

namespace gqc::acquire {

// =============================================================================
// Fetch Outcome
// =============================================================================

/// @brief Result category of one fetch attempt.
enum class FetchStatus : std::uint8_t {
    /// @brief All bytes received and verified.
    kCompleted = 0,

    /// @brief Transient failure; retry from confirmedBytes.
    kInterrupted = 1,

    /// @brief Size or checksum mismatch; retry must restart from offset 0.
    kIntegrityMismatch = 2,

    /// @brief Permanent failure (HTTP 4xx, local I/O error).
    kFailed = 3,

    /// @brief Batch cancellation; partial bytes are kept for a later resume.
    kCancelled = 4,

    /// @brief Bytes received but neither size nor checksum is known to verify them.
    kUnverifiable = 5
};

[[nodiscard]] constexpr std::string_view fetchStatusToString(FetchStatus status) noexcept {
    switch (status) {
        case FetchStatus::kCompleted:
            return "completed";
        case FetchStatus::kInterrupted:
            return "interrupted";
        case FetchStatus::kIntegrityMismatch:
            return "integrity-mismatch";
        case FetchStatus::kFailed:
            return "failed";
        case FetchStatus::kCancelled:
            return "cancelled";
        case FetchStatus::kUnverifiable:
            return "unverifiable";
    }
    return "unknown";
}

/// @brief What one fetch call achieved.
struct FetchOutcome {
    FetchStatus status = FetchStatus::kFailed;

    /// @brief Bytes appended by this call.
    ByteCount bytesWritten = 0;

    /// @brief Size of the destination file when the call returned.
    /// @note Safe resume offset after kInterrupted / kCancelled.
    ByteCount confirmedBytes = 0;

    /// @brief Full object size, from metadata or the server response.
    std::optional<ByteCount> totalBytes;

    /// @brief Digest computed over the completed file, when one was expected.
    std::optional<std::string> actualChecksum;

    /// @brief Server ignored the Range header and the file was rewritten from 0.
    bool rangeIgnored = false;

    ErrorCode errorCode = ErrorCode::kSuccess;

    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == FetchStatus::kCompleted; }
};

// =============================================================================
// Progress Reporting
// =============================================================================

/// @brief Progress snapshot of one running fetch.
struct TransferProgress {
    std::string_view url;

    /// @brief Bytes flushed to disk so far (including the resume offset).
    ByteCount confirmedBytes = 0;

    std::optional<ByteCount> totalBytes;

    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] double ratio() const noexcept {
        if (!totalBytes || *totalBytes == 0) {
            return 0.0;
        }
        return static_cast<double>(confirmedBytes) / static_cast<double>(*totalBytes);
    }
};

/// @brief Progress callback; invoked from worker threads.
using TransferProgressCallback = std::function<void(const TransferProgress&)>;

// =============================================================================
// TransferEngine
// =============================================================================

/// @brief Performs single resumable download attempts.
/// @note Stateless between calls; one engine may serve many threads.
class TransferEngine {
public:
    TransferEngine(TransferConfig config,
                   net::RangeSourcePtr source,
                   CancellationTokenPtr cancellation = nullptr);

    /// @brief Download @p object into @p destination starting at @p resumeOffset.
    /// @param object Remote object (URL, optional size and checksum).
    /// @param destination File to extend; usually "<final path>.part".
    /// @param resumeOffset Bytes already confirmed in @p destination.
    /// @return Outcome; failures are values, never exceptions.
    /// @note A destination shorter than @p resumeOffset yields kIntegrityMismatch.
    ///       A longer one is truncated to @p resumeOffset first.
    [[nodiscard]] FetchOutcome fetch(const RemoteObject& object,
                                     const std::filesystem::path& destination,
                                     ByteCount resumeOffset) const;

    void setProgressCallback(TransferProgressCallback callback) {
        progressCallback_ = std::move(callback);
    }

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    /// @brief Size/checksum check of a file that received every byte.
    [[nodiscard]] FetchOutcome verify(const RemoteObject& object,
                                      const std::filesystem::path& destination,
                                      FetchOutcome outcome) const;

    TransferConfig config_;
    net::RangeSourcePtr source_;
    CancellationTokenPtr cancellation_;
    TransferProgressCallback progressCallback_;
};

}  // namespace gqc::acquire

#endif  // GQC_ACQUIRE_TRANSFER_ENGINE_H
