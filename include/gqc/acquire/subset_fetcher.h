// =============================================================================
// genoqc - Subset Fetcher
// =============================================================================
// Streams the leading records of a remote FASTQ file into a local gzip file
// and stops at a size, read or base limit.
//
// The body may be plain text or gzip (single or multi-member); compression is
// detected from the first bytes, not from the URL. Only whole 4-line records
// are kept. A subset is written to "<final>.part" and verified by its record
// structure; the caller renames it and stores a SubsetRecord beside it so a
// later run can recognise an identical subset.
//
// Subsets never resume: every attempt restarts at byte 0 of the remote file.
//
// Usage:
//   SubsetFetcher fetcher(config.transfer, net::makeHttpRangeSource(), token);
//   SubsetLimit limit;
//   limit.maxReads = 100'000;
//   auto outcome = fetcher.fetch(object, limit, "data/ERR1/ERR1_1.fastq.gz.part");
// =============================================================================

#ifndef GQC_ACQUIRE_SUBSET_FETCHER_H
#define GQC_ACQUIRE_SUBSET_FETCHER_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "gqc/acquire/transfer_engine.h"
#include "gqc/common/cancellation.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/net/range_source.h"

namespace gqc::acquire {

/// @brief Suffix of the record stored beside a verified subset file.
inline constexpr std::string_view kSubsetRecordSuffix = ".subset.json";

/// @brief Reads between two size checks of the compressed output.
inline constexpr std::uint64_t kSubsetSizeCheckInterval = 5'000;

// =============================================================================
// Subset Outcome
// =============================================================================

/// @brief What one subset attempt achieved.
struct SubsetOutcome {
    /// @brief Status, compressed output size (confirmedBytes) and the SHA-256
    ///        of the output (actualChecksum) on success.
    FetchOutcome transfer;

    std::uint64_t reads = 0;

    std::uint64_t bases = 0;

    /// @brief Remote bytes consumed before the limit was reached.
    ByteCount sourceBytes = 0;

    /// @brief The remote file ended before any limit was reached.
    bool exhausted = false;
};

// =============================================================================
// Subset Record (sidecar)
// =============================================================================

/// @brief Description of a verified subset file, stored as JSON beside it.
struct SubsetRecord {
    std::string sourceUrl;

    SubsetLimit limit;

    std::uint64_t reads = 0;

    std::uint64_t bases = 0;

    /// @brief Size of the subset file.
    ByteCount bytes = 0;

    /// @brief SHA-256 of the subset file, lower-case hex.
    std::string sha256;

    bool operator==(const SubsetRecord&) const = default;
};

/// @brief "<dataFile>.subset.json"
[[nodiscard]] std::filesystem::path subsetRecordPath(const std::filesystem::path& dataFile);

/// @brief Load the record stored beside @p dataFile.
/// @return kIOError if missing or unreadable, kFormatError if malformed.
[[nodiscard]] Result<SubsetRecord> readSubsetRecord(const std::filesystem::path& dataFile);

/// @brief Store @p record beside @p dataFile (write to a temporary, then rename).
[[nodiscard]] VoidResult writeSubsetRecord(const std::filesystem::path& dataFile,
                                           const SubsetRecord& record);

// =============================================================================
// Subset Policy
// =============================================================================

/// @brief Attach subset limits to every object of @p datasets.
/// @note Objects that already carry a limit keep it. Stored names gain ".gz"
///       when the remote name lacks it.
void applySubsetLimits(std::vector<DatasetRef>& datasets, const SubsetConfig& config);

/// @brief Limit of the R2 mate of a paired subset: exactly @p r1Reads records.
[[nodiscard]] SubsetLimit pairedMateLimit(std::uint64_t r1Reads) noexcept;

// =============================================================================
// SubsetFetcher
// =============================================================================

/// @brief Performs single subset download attempts.
/// @note Stateless between calls; one fetcher may serve many threads.
class SubsetFetcher {
public:
    SubsetFetcher(TransferConfig config,
                  net::RangeSourcePtr source,
                  CancellationTokenPtr cancellation = nullptr);

    /// @brief Stream @p object into @p destination until @p limit is reached.
    /// @param destination Gzip output; truncated first.
    /// @return Outcome; failures are values, never exceptions.
    /// @note kFormatError (not retried) when the body is not FASTQ;
    ///       kIntegrityMismatch (retried) when the gzip stream is corrupt.
    [[nodiscard]] SubsetOutcome fetch(const RemoteObject& object,
                                      const SubsetLimit& limit,
                                      const std::filesystem::path& destination) const;

    void setProgressCallback(TransferProgressCallback callback) {
        progressCallback_ = std::move(callback);
    }

private:
    TransferConfig config_;
    net::RangeSourcePtr source_;
    CancellationTokenPtr cancellation_;
    TransferProgressCallback progressCallback_;
};

}  // namespace gqc::acquire

#endif  // GQC_ACQUIRE_SUBSET_FETCHER_H
