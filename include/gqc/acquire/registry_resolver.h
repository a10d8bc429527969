// =============================================================================
// genoqc - Registry Resolver
// =============================================================================
// Turns accessions into DatasetRefs.
//
// Sources:
// - ENA portal filereport (TSV): FASTQ links, byte sizes and MD5 digests
// - NCBI SRA runinfo (CSV): download path and instrument metadata
// - Dataset sheet (TSV file): explicit objects for offline or mirrored data
// - ENA portal search (TSV): runs of an organism, for `genoqc discover`
//
// One accession may expand to several runs (sample or study accessions);
// each run becomes its own DatasetRef keyed by its run accession. A run
// reached through two requested accessions is kept once.
// =============================================================================

#ifndef GQC_ACQUIRE_REGISTRY_RESOLVER_H
#define GQC_ACQUIRE_REGISTRY_RESOLVER_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/net/range_source.h"

namespace gqc::acquire {

/// @brief ENA filereport fields requested for each run.
inline constexpr std::string_view kEnaFilereportFields =
    "run_accession,sample_accession,study_accession,scientific_name,instrument_platform,"
    "instrument_model,library_layout,library_strategy,fastq_ftp,fastq_bytes,fastq_md5,"
    "read_count,base_count";

// =============================================================================
// Parsers (network-free)
// =============================================================================

/// @brief Parse an ENA filereport TSV body.
/// @param technology Overrides the platform-derived technology class.
[[nodiscard]] Result<std::vector<DatasetRef>> parseEnaFilereport(
    std::string_view body, std::optional<ReadTechnology> technology = std::nullopt);

/// @brief Parse an ENA search TSV body (same columns as a filereport).
/// @note Runs whose platform maps to no technology class, or without FASTQ
///       links, are skipped instead of failing the search.
[[nodiscard]] Result<std::vector<DatasetRef>> parseEnaSearch(std::string_view body);

/// @brief Parse an NCBI runinfo CSV body.
[[nodiscard]] Result<std::vector<DatasetRef>> parseNcbiRuninfo(
    std::string_view body, std::optional<ReadTechnology> technology = std::nullopt);

/// @brief Parse a dataset sheet.
/// @note Columns: accession, registry, technology, url, size, checksum.
///       Empty or "-" size/checksum cells mean unknown; '#' starts a comment line.
///       Rows of one accession are merged; two rows naming the same file fail.
[[nodiscard]] Result<std::vector<DatasetRef>> parseDatasetSheet(std::string_view text);

/// @brief Read and parse a dataset sheet file.
[[nodiscard]] Result<std::vector<DatasetRef>> loadDatasetSheet(const std::filesystem::path& path);

/// @brief Assign object roles and order R1 before R2.
/// @note Short-read files matching "_1.f"/"_R1" are R1, "_2.f"/"_R2" are R2,
///       anything else is single; long-read files are all long.
void assignObjectRoles(DatasetRef& dataset);

/// @brief Last path segment of a URL, without query string.
/// @return Empty when the segment is missing, "." or "..".
[[nodiscard]] std::string fileNameFromUrl(std::string_view url);

/// @brief Drop repeated run accessions, keeping the first occurrence.
/// @return Number of datasets dropped.
std::size_t dropDuplicateAccessions(std::vector<DatasetRef>& datasets);

// =============================================================================
// RegistryResolver
// =============================================================================

/// @brief Resolves accessions against ENA and NCBI.
class RegistryResolver {
public:
    RegistryResolver(ResolverConfig config, TransferConfig transfer, net::RangeSourcePtr source);

    /// @brief Resolve one accession into one DatasetRef per run.
    /// @return kResolutionFailed for unknown prefixes or empty reports,
    ///         kUnsupportedTechnology for unmapped platforms without override.
    [[nodiscard]] Result<std::vector<DatasetRef>> resolve(
        std::string_view accession,
        std::optional<ReadTechnology> technology = std::nullopt) const;

    /// @brief Resolve several accessions; the first failure is returned.
    /// @note Each run appears once, in first-seen order.
    [[nodiscard]] Result<std::vector<DatasetRef>> resolveAll(
        const std::vector<std::string>& accessions,
        std::optional<ReadTechnology> technology = std::nullopt) const;

    /// @brief Search ENA for runs of @p organism.
    /// @param strategy Library strategy filter ("WGS"); empty means any.
    /// @return Runs in registry order; kResolutionFailed when none match.
    [[nodiscard]] Result<std::vector<DatasetRef>> discover(std::string_view organism,
                                                           std::string_view strategy) const;

    /// @brief URL of the ENA search issued by discover().
    [[nodiscard]] std::string searchUrl(std::string_view organism,
                                        std::string_view strategy) const;

private:
    [[nodiscard]] net::RangeRequest request(std::string url) const;

    ResolverConfig config_;
    TransferConfig transfer_;
    net::RangeSourcePtr source_;
};

}  // namespace gqc::acquire

#endif  // GQC_ACQUIRE_REGISTRY_RESOLVER_H
