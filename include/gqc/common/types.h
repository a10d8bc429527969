// =============================================================================
// genoqc - Common Type Definitions
// =============================================================================
// Core data model shared by the acquisition and QC layers.
//
// This module defines:
// - Registry, ReadTechnology: where a dataset comes from and how it was sequenced
// - ChecksumAlgorithm, ChecksumSpec: expected digests of remote objects
// - RemoteObject, DatasetRef: resolved dataset descriptors
// - TransferState: per-object state machine of the Acquisition Manager
// - AnalyzerKind, QCOutcome, QCRun: per-analyzer QC records
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef GQC_COMMON_TYPES_H
#define GQC_COMMON_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gqc/common/error.h"

namespace gqc {

// =============================================================================
// Type Aliases and Constants
// =============================================================================

/// @brief Byte offsets and sizes of remote objects.
using ByteCount = std::uint64_t;

/// @brief Suffix of in-progress transfer files.
inline constexpr std::string_view kPartialSuffix = ".part";

/// @brief File name of the acquisition manifest inside the data directory.
inline constexpr std::string_view kManifestFileName = "manifest.tsv";

/// @brief File name of the consolidated report inside the report directory.
inline constexpr std::string_view kReportFileName = "aggregate_report.json";

// =============================================================================
// Registry Enumeration
// =============================================================================

/// @brief Public sequence registry a dataset was resolved against.
enum class Registry : std::uint8_t {
    /// @brief NCBI Sequence Read Archive.
    kNcbi = 0,

    /// @brief European Nucleotide Archive (EMBL-EBI).
    kEna = 1
};

[[nodiscard]] constexpr std::string_view registryToString(Registry registry) noexcept {
    switch (registry) {
        case Registry::kNcbi:
            return "NCBI";
        case Registry::kEna:
            return "ENA/EBI";
    }
    return "unknown";
}

/// @brief Parse a registry name ("ncbi", "sra", "ena", "ebi", "ENA/EBI").
[[nodiscard]] Result<Registry> parseRegistry(std::string_view name);

/// @brief Detect the registry from an accession prefix.
/// @note SRR/SRX/SRS/SRP → NCBI; ERR/ERX/ERS/ERP and DRR/DRX/DRS/DRP → ENA.
[[nodiscard]] Result<Registry> registryForAccession(std::string_view accession);

// =============================================================================
// Read Technology Enumeration
// =============================================================================

/// @brief Sequencing technology class; selects the QC analyzer.
enum class ReadTechnology : std::uint8_t {
    /// @brief Illumina-style short reads.
    kShortRead = 0,

    /// @brief Nanopore / PacBio long reads.
    kLongRead = 1
};

[[nodiscard]] constexpr std::string_view readTechnologyToString(ReadTechnology tech) noexcept {
    switch (tech) {
        case ReadTechnology::kShortRead:
            return "short-read";
        case ReadTechnology::kLongRead:
            return "long-read";
    }
    return "unknown";
}

/// @brief Parse a technology class name.
/// @note Accepts "short-read"/"short" and "long-read"/"long" (case-insensitive);
///       anything else yields kUnsupportedTechnology.
[[nodiscard]] Result<ReadTechnology> parseReadTechnology(std::string_view name);

/// @brief Map a registry instrument platform to a technology class.
/// @note ILLUMINA, ION_TORRENT, BGISEQ, DNBSEQ → short; PACBIO_SMRT,
///       OXFORD_NANOPORE → long.
[[nodiscard]] Result<ReadTechnology> technologyForPlatform(std::string_view platform);

// =============================================================================
// Checksums
// =============================================================================

/// @brief Digest algorithm of an expected checksum.
enum class ChecksumAlgorithm : std::uint8_t {
    kMd5 = 0,
    kSha256 = 1,
    kXxHash64 = 2
};

[[nodiscard]] constexpr std::string_view checksumAlgorithmToString(
    ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::kMd5:
            return "md5";
        case ChecksumAlgorithm::kSha256:
            return "sha256";
        case ChecksumAlgorithm::kXxHash64:
            return "xxh64";
    }
    return "unknown";
}

/// @brief Expected digest of a remote object, lower-case hex.
struct ChecksumSpec {
    ChecksumAlgorithm algorithm = ChecksumAlgorithm::kMd5;
    std::string hexDigest;

    /// @brief Format as "algo:hex".
    [[nodiscard]] std::string toString() const;

    bool operator==(const ChecksumSpec&) const = default;
};

/// @brief Parse "md5:…", "sha256:…", "xxh64:…" or a bare 32/64-hex digest.
[[nodiscard]] Result<ChecksumSpec> parseChecksumSpec(std::string_view text);

// =============================================================================
// Remote Objects and Dataset References
// =============================================================================

/// @brief Role of a file inside its dataset.
enum class ObjectRole : std::uint8_t {
    kSingle = 0,
    kShortR1 = 1,
    kShortR2 = 2,
    kLong = 3
};

[[nodiscard]] constexpr std::string_view objectRoleToString(ObjectRole role) noexcept {
    switch (role) {
        case ObjectRole::kSingle:
            return "single";
        case ObjectRole::kShortR1:
            return "short-r1";
        case ObjectRole::kShortR2:
            return "short-r2";
        case ObjectRole::kLong:
            return "long";
    }
    return "unknown";
}

/// @brief Stop condition of a subset download; the first limit reached wins.
/// @note A subset keeps only whole FASTQ records and is stored gzip-compressed.
struct SubsetLimit {
    /// @brief Compressed size of the stored subset.
    std::optional<ByteCount> maxBytes;

    std::optional<std::uint64_t> maxReads;

    std::optional<std::uint64_t> maxBases;

    [[nodiscard]] bool empty() const noexcept { return !maxBytes && !maxReads && !maxBases; }

    bool operator==(const SubsetLimit&) const = default;
};

/// @brief One downloadable file of a dataset.
struct RemoteObject {
    /// @brief Source URL (https:// after resolution).
    std::string url;

    /// @brief Local file name inside the dataset directory.
    std::string fileName;

    /// @brief Role inside the dataset.
    ObjectRole role = ObjectRole::kSingle;

    /// @brief Expected byte size, if the registry reported one.
    std::optional<ByteCount> expectedSize;

    /// @brief Expected digest, if the registry reported one.
    std::optional<ChecksumSpec> expectedChecksum;

    /// @brief Download only a leading subset of the records.
    /// @note expectedSize and expectedChecksum describe the whole remote file and
    ///       are not used to verify a subset.
    std::optional<SubsetLimit> subset;
};

/// @brief Descriptive metadata carried from the registry record.
struct DatasetMetadata {
    std::string sampleAccession;
    std::string studyAccession;
    std::string scientificName;
    std::string instrumentPlatform;
    std::string instrumentModel;
    std::string libraryLayout;
    std::string libraryStrategy;

    /// @brief Totals over the whole run, when the registry reports them.
    std::optional<std::uint64_t> readCount;
    std::optional<std::uint64_t> baseCount;
};

/// @brief Resolved dataset; built once by the resolver and passed by const reference.
struct DatasetRef {
    /// @brief Accession (run id) used as dataset identifier.
    std::string accession;

    Registry registry = Registry::kEna;

    ReadTechnology technology = ReadTechnology::kShortRead;

    /// @brief Remote objects, R1 before R2 for paired short reads.
    std::vector<RemoteObject> objects;

    DatasetMetadata metadata;
};

// =============================================================================
// Transfer State
// =============================================================================

/// @brief Per-object state machine driven by the Acquisition Manager.
/// @note pending → in-progress → {verified | paused (awaiting retry) | failed};
///       paused → in-progress on the next attempt.
enum class TransferState : std::uint8_t {
    kPending = 0,
    kInProgress = 1,
    kPaused = 2,
    kVerified = 3,
    kFailed = 4
};

[[nodiscard]] constexpr std::string_view transferStateToString(TransferState state) noexcept {
    switch (state) {
        case TransferState::kPending:
            return "pending";
        case TransferState::kInProgress:
            return "in-progress";
        case TransferState::kPaused:
            return "paused";
        case TransferState::kVerified:
            return "verified";
        case TransferState::kFailed:
            return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool isTerminal(TransferState state) noexcept {
    return state == TransferState::kVerified || state == TransferState::kFailed;
}

// =============================================================================
// QC Runs
// =============================================================================

/// @brief External analyzer families; closed set.
enum class AnalyzerKind : std::uint8_t {
    /// @brief Short-read analyzer (FastQC-compatible).
    kShortRead = 0,

    /// @brief Long-read analyzer (NanoPlot-compatible).
    kLongRead = 1
};

/// @brief Outcome of one analyzer invocation.
enum class QCOutcome : std::uint8_t {
    kOk = 0,
    kToolError = 1,
    kNotRun = 2
};

[[nodiscard]] constexpr std::string_view qcOutcomeToString(QCOutcome outcome) noexcept {
    switch (outcome) {
        case QCOutcome::kOk:
            return "ok";
        case QCOutcome::kToolError:
            return "tool-error";
        case QCOutcome::kNotRun:
            return "not-run";
    }
    return "unknown";
}

/// @brief Record of one analyzer invocation for one dataset.
struct QCRun {
    std::string datasetId;

    AnalyzerKind analyzer = AnalyzerKind::kShortRead;

    /// @brief Analyzer name used in output paths and metric keys.
    std::string analyzerName;

    /// @brief Input files handed to the analyzer.
    std::vector<std::filesystem::path> inputs;

    /// @brief Exit status, when the process exited normally.
    std::optional<int> exitCode;

    /// @brief Terminating signal, when the process was killed.
    std::optional<int> termSignal;

    /// @brief Wall-clock budget was exceeded and the process was terminated.
    bool timedOut = false;

    /// @brief Batch cancellation terminated (or prevented) the run.
    bool cancelled = false;

    /// @brief Directory holding the analyzer's raw output.
    std::filesystem::path outputDir;

    /// @brief Captured stdout/stderr of the analyzer.
    std::filesystem::path logPath;

    QCOutcome outcome = QCOutcome::kNotRun;

    /// @brief Human-readable reason for tool-error / not-run.
    std::string message;

    std::chrono::milliseconds duration{0};
};

}  // namespace gqc

#endif  // GQC_COMMON_TYPES_H
