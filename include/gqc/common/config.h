// =============================================================================
// genoqc - Configuration
// =============================================================================
// Explicit configuration passed into each component at construction.
//
// Retry counts, backoff and timeouts are not fixed by the data sources, so
// all of them are exposed here with the defaults below. The CLI fills these
// structs from command-line flags and from an optional --config file.
// =============================================================================

#ifndef GQC_COMMON_CONFIG_H
#define GQC_COMMON_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc {

// =============================================================================
// Defaults
// =============================================================================

inline constexpr std::uint32_t kDefaultMaxAttempts = 5;
inline constexpr std::uint32_t kDefaultInitialBackoffMs = 1'000;
inline constexpr double kDefaultBackoffMultiplier = 2.0;
inline constexpr std::uint32_t kDefaultMaxBackoffMs = 60'000;
inline constexpr std::uint32_t kDefaultConnectTimeoutSec = 10;
inline constexpr std::uint32_t kDefaultReadTimeoutSec = 120;
inline constexpr std::uint32_t kDefaultAttemptTimeoutSec = 3'600;
inline constexpr std::size_t kDefaultProgressIntervalBytes = 8 * 1024 * 1024;  // 8MB
inline constexpr std::uint32_t kDefaultProgressIntervalMs = 500;
inline constexpr std::size_t kDefaultHashBufferSize = 8 * 1024 * 1024;  // 8MB
inline constexpr std::size_t kDefaultMaxConcurrentTransfers = 4;
inline constexpr std::size_t kDefaultMaxConcurrentTools = 2;
inline constexpr std::uint32_t kDefaultToolTimeoutSec = 3'600;
inline constexpr std::uint32_t kDefaultKillGraceMs = 2'000;
inline constexpr std::uint32_t kDefaultMergeTimeoutSec = 1'800;
inline constexpr std::size_t kDefaultSampleCap = 2'000;
inline constexpr std::string_view kDefaultUserAgent = "genoqc/0.1";
inline constexpr std::string_view kDefaultEnaFilereportUrl =
    "https://www.ebi.ac.uk/ena/portal/api/filereport";
inline constexpr std::string_view kDefaultNcbiRuninfoUrl =
    "https://trace.ncbi.nlm.nih.gov/Traces/sra-db-be/runinfo";
inline constexpr std::string_view kDefaultEnaSearchUrl = "https://www.ebi.ac.uk/ena/portal/api/search";
inline constexpr std::size_t kDefaultSearchLimit = 200;
inline constexpr double kDefaultSubsetShortMb = 50.0;
inline constexpr double kDefaultSubsetLongMb = 200.0;
inline constexpr double kDefaultShortCoverage = 50.0;
inline constexpr double kDefaultLongCoverage = 30.0;
inline constexpr double kDefaultCoverageMargin = 1.1;

// =============================================================================
// Transfer Engine
// =============================================================================

/// @brief Per-attempt settings of the Transfer Engine.
struct TransferConfig {
    /// @brief TCP connect timeout (seconds).
    std::uint32_t connectTimeoutSec = kDefaultConnectTimeoutSec;

    /// @brief Socket read timeout; a stalled stream counts as interrupted (seconds).
    std::uint32_t readTimeoutSec = kDefaultReadTimeoutSec;

    /// @brief Wall-clock budget of one attempt, distinct from the retry budget (seconds).
    std::uint32_t attemptTimeoutSec = kDefaultAttemptTimeoutSec;

    /// @brief Flush and report progress at most every this many bytes.
    std::size_t progressIntervalBytes = kDefaultProgressIntervalBytes;

    /// @brief ...or at most every this many milliseconds.
    std::uint32_t progressIntervalMs = kDefaultProgressIntervalMs;

    /// @brief Read size used when hashing a completed file.
    std::size_t hashBufferSize = kDefaultHashBufferSize;

    std::string userAgent{kDefaultUserAgent};

    /// @brief Verify TLS peer certificates.
    bool verifyTls = true;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Registry Resolver
// =============================================================================

/// @brief Metadata endpoints queried when resolving accessions.
struct ResolverConfig {
    /// @brief ENA portal filereport endpoint (TSV).
    std::string enaFilereportUrl{kDefaultEnaFilereportUrl};

    /// @brief NCBI SRA runinfo endpoint (CSV).
    std::string ncbiRuninfoUrl{kDefaultNcbiRuninfoUrl};

    /// @brief ENA portal search endpoint used by organism discovery (TSV).
    std::string enaSearchUrl{kDefaultEnaSearchUrl};

    /// @brief Maximum runs returned by one discovery query.
    std::size_t searchLimit = kDefaultSearchLimit;

    /// @brief Accept short- and long-read datasets from different samples.
    bool allowSampleMismatch = false;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Subset Acquisition
// =============================================================================

/// @brief Download leading subsets of FASTQ files instead of whole objects.
/// @note Paired R2 files always stop at the read count kept for R1.
struct SubsetConfig {
    bool enabled = false;

    /// @brief Compressed size kept per short-read file (MiB).
    double shortReadMb = kDefaultSubsetShortMb;

    /// @brief Compressed size kept per long-read file (MiB).
    double longReadMb = kDefaultSubsetLongMb;

    /// @brief Read count kept per file; replaces the size limits when set.
    std::optional<std::uint64_t> reads;

    /// @brief Limit applied to one object of a dataset of @p technology.
    [[nodiscard]] SubsetLimit limitFor(ReadTechnology technology) const;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Dataset Discovery
// =============================================================================

/// @brief Organism search and coverage targets of `genoqc discover`.
struct DiscoveryConfig {
    /// @brief Library strategy filter ("WGS", "AMPLICON"); empty means any.
    std::string strategy = "WGS";

    /// @brief Target depth of the short-read dataset.
    double shortCoverage = kDefaultShortCoverage;

    /// @brief Target depth of the long-read dataset.
    double longCoverage = kDefaultLongCoverage;

    /// @brief Factor applied to genome size x coverage.
    double coverageMargin = kDefaultCoverageMargin;

    /// @brief Genome size override (bases); otherwise looked up by organism.
    std::optional<std::uint64_t> genomeSize;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Acquisition Manager
// =============================================================================

/// @brief Retry and concurrency policy of the Acquisition Manager.
struct AcquisitionConfig {
    /// @brief Root of verified dataset files (<dataDir>/<accession>/<file>).
    std::filesystem::path dataDir = "data";

    /// @brief Attempts per remote object before it is marked failed.
    std::uint32_t maxAttempts = kDefaultMaxAttempts;

    /// @brief Delay before the second attempt (milliseconds).
    std::uint32_t initialBackoffMs = kDefaultInitialBackoffMs;

    /// @brief Growth factor of the delay between consecutive attempts.
    double backoffMultiplier = kDefaultBackoffMultiplier;

    /// @brief Upper bound of any single delay (milliseconds).
    std::uint32_t maxBackoffMs = kDefaultMaxBackoffMs;

    /// @brief Transfers in flight across the whole batch.
    std::size_t maxConcurrentTransfers = kDefaultMaxConcurrentTransfers;

    /// @brief Append verified objects to <dataDir>/manifest.tsv.
    bool writeManifest = true;

    /// @brief Delay to wait after attempt @p failedAttempt (1-based) failed.
    [[nodiscard]] std::chrono::milliseconds backoffAfter(std::uint32_t failedAttempt) const noexcept;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Tool Orchestrator
// =============================================================================

/// @brief How to invoke one external analyzer.
struct AnalyzerConfig {
    /// @brief Name used for output directories and metric keys.
    std::string name;

    /// @brief Executable (looked up in PATH when not absolute).
    std::string executable;

    /// @brief Extra arguments appended after the built-in ones.
    std::vector<std::string> extraArgs;
};

/// @brief Settings of the Tool Orchestrator.
struct OrchestratorConfig {
    /// @brief Root of per-tool outputs (<qcDir>/<datasetId>/<analyzer>/).
    std::filesystem::path qcDir = "qc_results";

    AnalyzerConfig shortRead{"fastqc", "fastqc", {}};

    AnalyzerConfig longRead{"nanoplot", "NanoPlot", {}};

    /// @brief Wall-clock budget per invocation (seconds).
    std::uint32_t toolTimeoutSec = kDefaultToolTimeoutSec;

    /// @brief Delay between SIGTERM and SIGKILL when terminating an analyzer.
    std::uint32_t killGraceMs = kDefaultKillGraceMs;

    /// @brief Analyzer processes running at the same time.
    std::size_t maxConcurrentTools = kDefaultMaxConcurrentTools;

    /// @brief Analyzer settings for a technology family.
    [[nodiscard]] const AnalyzerConfig& analyzer(AnalyzerKind kind) const noexcept;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Aggregator
// =============================================================================

/// @brief Settings of the Aggregator.
struct AggregatorConfig {
    /// @brief Root of the merge input layout and consolidated report.
    std::filesystem::path reportDir = "reports";

    /// @brief External report-merge program; empty means the merge is emulated.
    std::string mergeProgram = "multiqc";

    /// @brief Extra arguments for the merge program.
    std::vector<std::string> mergeArgs;

    /// @brief Wall-clock budget of the merge program (seconds).
    std::uint32_t mergeTimeoutSec = kDefaultMergeTimeoutSec;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Sampling Reducer
// =============================================================================

struct SamplingConfig {
    /// @brief Maximum points of a sampled series.
    std::size_t cap = kDefaultSampleCap;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Aggregate Configuration
// =============================================================================

/// @brief Full configuration of a genoqc batch.
struct Config {
    TransferConfig transfer;
    ResolverConfig resolver;
    AcquisitionConfig acquisition;
    SubsetConfig subset;
    DiscoveryConfig discovery;
    OrchestratorConfig orchestrator;
    AggregatorConfig aggregator;
    SamplingConfig sampling;

    /// @brief Validate every section; the first failure is returned.
    [[nodiscard]] VoidResult validate() const;
};

}  // namespace gqc

#endif  // GQC_COMMON_CONFIG_H
