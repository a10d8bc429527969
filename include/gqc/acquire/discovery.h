// =============================================================================
// genoqc - Dataset Discovery
// =============================================================================
// Turns an organism search into download plans: which runs to try, in which
// order, and how much of each to keep for a target sequencing depth.
//
// Coverage planning:
//   target bases = genome size x coverage x margin
//   paired short reads: R1 keeps half the target, R2 keeps R1's read count
//   single and long reads: the one file keeps the whole target
//
// The genome size comes from the configuration, else from a small table of
// common organisms, else a 5 Mb bacterial default (logged as a warning).
// =============================================================================

#ifndef GQC_ACQUIRE_DISCOVERY_H
#define GQC_ACQUIRE_DISCOVERY_H

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "gqc/acquire/acquisition_manager.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc::acquire {

/// @brief Genome size assumed when the organism is not known.
inline constexpr std::uint64_t kDefaultGenomeSize = 5'000'000;

/// @brief Genome size of a well-known organism (case-insensitive name).
[[nodiscard]] std::optional<std::uint64_t> knownGenomeSize(std::string_view organism);

/// @brief Override, table entry or kDefaultGenomeSize, in that order.
[[nodiscard]] std::uint64_t genomeSizeFor(std::string_view organism,
                                          const DiscoveryConfig& config);

/// @brief genomeSize x coverage x margin, rounded down.
[[nodiscard]] std::uint64_t targetBases(std::uint64_t genomeSize,
                                        double coverage,
                                        double margin) noexcept;

/// @brief Runs of @p technology usable for a download plan.
/// @note Short-read runs need both mates and keep only R1 and R2; long-read
///       runs keep their first file. Runs whose reported base count is below
///       @p neededBases move behind the others; registry order is kept otherwise.
[[nodiscard]] std::vector<DatasetRef> selectCandidates(const std::vector<DatasetRef>& runs,
                                                       ReadTechnology technology,
                                                       std::uint64_t neededBases);

/// @brief Limit every object of @p dataset to @p bases of sequence in total.
/// @param ceiling Optional size cap applied on top of the base limit.
/// @note Stored names gain ".gz" when the remote name lacks it.
void applyCoverageLimit(DatasetRef& dataset,
                        std::uint64_t bases,
                        std::optional<ByteCount> ceiling = std::nullopt);

/// @brief Check that every long-read dataset shares its sample with a short-read one.
/// @return kInvalidArgument naming the samples on a mismatch, unless
///         @p allowMismatch (then a warning is logged). Datasets without a
///         sample accession are not compared.
[[nodiscard]] VoidResult checkSampleConsistency(const std::vector<DatasetRef>& datasets,
                                                bool allowMismatch);

/// @brief How much of a candidate run to keep.
struct CoveragePlan {
    /// @brief Sequence to keep across the run's files.
    std::uint64_t bases = 0;

    /// @brief Size cap per file on top of the base limit.
    std::optional<ByteCount> ceiling;
};

/// @brief Acquire @p candidates in order until one is fully verified.
/// @param chosen Datasets acquired before; candidates from their samples are
///        tried first and each candidate must pass checkSampleConsistency with them.
/// @return The acquired dataset with its subset limits; kCancelled,
///         kInvalidArgument on a sample mismatch, kResolutionFailed without
///         candidates, or kPartialAcquisitionFailure when every candidate failed.
[[nodiscard]] Result<DatasetRef> acquireFirstCandidate(AcquisitionManager& manager,
                                                       std::vector<DatasetRef> candidates,
                                                       const CoveragePlan& plan,
                                                       const std::vector<DatasetRef>& chosen,
                                                       bool allowSampleMismatch);

}  // namespace gqc::acquire

#endif  // GQC_ACQUIRE_DISCOVERY_H
