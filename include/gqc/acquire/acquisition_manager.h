// =============================================================================
// genoqc - Acquisition Manager
// =============================================================================
// Drives the Transfer Engine for every remote object of a dataset.
//
// Each object runs an explicit state machine:
//
//   pending → in-progress → verified
//                         → paused → in-progress   (retry after backoff)
//                         → failed                 (budget exhausted / permanent)
//
// Interrupted attempts resume from the confirmed size of "<file>.part";
// integrity mismatches discard the partial file and restart from byte 0.
// Verified objects are renamed to their final path. A later acquire() reuses
// a final file only after checking it against the expected checksum, or the
// expected size when no checksum is known; anything else is downloaded again.
//
// Objects carrying a SubsetLimit are streamed through the SubsetFetcher
// instead. The R2 mate of a paired subset starts after R1 and stops at the
// read count kept for R1.
//
// All transfers of all acquire() calls on one manager share a single TBB
// task arena whose concurrency is AcquisitionConfig::maxConcurrentTransfers.
// =============================================================================

#ifndef GQC_ACQUIRE_ACQUISITION_MANAGER_H
#define GQC_ACQUIRE_ACQUISITION_MANAGER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gqc/acquire/subset_fetcher.h"
#include "gqc/acquire/transfer_engine.h"
#include "gqc/common/cancellation.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/net/range_source.h"

namespace gqc::acquire {

// =============================================================================
// Per-Object Record
// =============================================================================

/// @brief Manager-owned state of one remote object.
struct ObjectRecord {
    RemoteObject object;

    /// @brief <dataDir>/<accession>/<fileName>
    std::filesystem::path finalPath;

    /// @brief finalPath + ".part"
    std::filesystem::path partPath;

    TransferState state = TransferState::kPending;

    /// @brief Fetch attempts made by this call.
    std::uint32_t attempts = 0;

    /// @brief Bytes confirmed on disk.
    ByteCount confirmedBytes = 0;

    /// @brief Found verified from an earlier run; nothing was transferred.
    bool reused = false;

    /// @brief Digest of the verified file: the expected one after a match,
    ///        otherwise SHA-256 computed after the rename.
    std::optional<ChecksumSpec> actualChecksum;

    /// @brief Stored or reused subset, for objects with a SubsetLimit.
    std::optional<SubsetRecord> subset;

    ErrorCode lastError = ErrorCode::kSuccess;

    std::string lastMessage;
};

// =============================================================================
// Acquisition Result
// =============================================================================

/// @brief Outcome of acquire() for one dataset.
struct AcquisitionResult {
    std::string accession;

    std::vector<ObjectRecord> objects;

    /// @brief Batch cancellation stopped some objects before a terminal state.
    bool cancelled = false;

    [[nodiscard]] bool ok() const noexcept;

    [[nodiscard]] std::size_t verifiedCount() const noexcept;

    [[nodiscard]] std::vector<std::string> failedUrls() const;

    /// @brief Final paths of verified objects, in dataset order.
    [[nodiscard]] std::vector<std::filesystem::path> verifiedFiles() const;

    /// @brief kPartialAcquisitionFailure listing failed URLs, or kCancelled.
    [[nodiscard]] VoidResult status() const;
};

/// @brief Outcome of acquireBatch().
struct BatchAcquisitionResult {
    std::vector<AcquisitionResult> datasets;

    [[nodiscard]] bool ok() const noexcept;

    [[nodiscard]] std::vector<std::string> failedUrls() const;

    [[nodiscard]] VoidResult status() const;

    /// @brief Throw PartialAcquisitionError when any object failed.
    void throwIfFailed() const;
};

// =============================================================================
// AcquisitionManager
// =============================================================================

/// @brief Acquires verified local copies of resolved datasets.
class AcquisitionManager {
public:
    AcquisitionManager(AcquisitionConfig config,
                       TransferConfig transferConfig,
                       net::RangeSourcePtr source,
                       CancellationTokenPtr cancellation = nullptr);

    ~AcquisitionManager();

    AcquisitionManager(const AcquisitionManager&) = delete;
    AcquisitionManager& operator=(const AcquisitionManager&) = delete;

    /// @brief Acquire every object of @p dataset; blocks until each is terminal.
    /// @note Verified objects stay on disk when others fail.
    [[nodiscard]] AcquisitionResult acquire(const DatasetRef& dataset);

    /// @brief Acquire several datasets concurrently under the shared limit.
    [[nodiscard]] BatchAcquisitionResult acquireBatch(const std::vector<DatasetRef>& datasets);

    /// @brief Final on-disk path of an object of a dataset.
    /// @return kInvalidArgument when the accession or file name is not a
    ///         single path component.
    [[nodiscard]] Result<std::filesystem::path> finalPathFor(const DatasetRef& dataset,
                                                             const RemoteObject& object) const;

    void setProgressCallback(TransferProgressCallback callback);

    [[nodiscard]] const AcquisitionConfig& config() const noexcept { return config_; }

private:
    class Impl;

    AcquisitionConfig config_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gqc::acquire

#endif  // GQC_ACQUIRE_ACQUISITION_MANAGER_H
