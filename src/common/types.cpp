// =============================================================================
// genoqc - Common Type Helpers
// =============================================================================

#include "gqc/common/types.h"

#include <algorithm>
#include <array>
#include <format>

#include "gqc/common/strings.h"

namespace gqc {

namespace {

constexpr std::array<std::string_view, 4> kNcbiPrefixes = {"SRR", "SRX", "SRS", "SRP"};
constexpr std::array<std::string_view, 8> kEnaPrefixes = {"ERR", "ERX", "ERS", "ERP",
                                                          "DRR", "DRX", "DRS", "DRP"};

}  // namespace

// =============================================================================
// Registry
// =============================================================================

Result<Registry> parseRegistry(std::string_view name) {
    const std::string lower = toLower(trim(name));
    if (lower == "ncbi" || lower == "sra") {
        return Registry::kNcbi;
    }
    if (lower == "ena" || lower == "ebi" || lower == "ena/ebi") {
        return Registry::kEna;
    }
    return makeError(ErrorCode::kInvalidArgument, "unknown registry '{}'", name);
}

Result<Registry> registryForAccession(std::string_view accession) {
    const std::string upper = toUpper(trim(accession));
    if (upper.size() < 4) {
        return makeError(ErrorCode::kResolutionFailed, "accession '{}' is too short", accession);
    }
    const std::string_view prefix = std::string_view(upper).substr(0, 3);
    if (std::find(kNcbiPrefixes.begin(), kNcbiPrefixes.end(), prefix) != kNcbiPrefixes.end()) {
        return Registry::kNcbi;
    }
    if (std::find(kEnaPrefixes.begin(), kEnaPrefixes.end(), prefix) != kEnaPrefixes.end()) {
        return Registry::kEna;
    }
    return makeError(ErrorCode::kResolutionFailed,
                     "cannot infer registry for accession '{}'", accession);
}

// =============================================================================
// Read Technology
// =============================================================================

Result<ReadTechnology> parseReadTechnology(std::string_view name) {
    const std::string lower = toLower(trim(name));
    if (lower == "short-read" || lower == "short" || lower == "short_read") {
        return ReadTechnology::kShortRead;
    }
    if (lower == "long-read" || lower == "long" || lower == "long_read") {
        return ReadTechnology::kLongRead;
    }
    return makeError(ErrorCode::kUnsupportedTechnology,
                     "unsupported technology class '{}'", name);
}

Result<ReadTechnology> technologyForPlatform(std::string_view platform) {
    const std::string upper = toUpper(trim(platform));
    if (upper == "ILLUMINA" || upper == "ION_TORRENT" || upper == "BGISEQ" ||
        upper == "DNBSEQ") {
        return ReadTechnology::kShortRead;
    }
    if (upper == "PACBIO_SMRT" || upper == "OXFORD_NANOPORE") {
        return ReadTechnology::kLongRead;
    }
    return makeError(ErrorCode::kUnsupportedTechnology,
                     "no technology class for instrument platform '{}'", platform);
}

// =============================================================================
// Checksum Specification
// =============================================================================

std::string ChecksumSpec::toString() const {
    return std::format("{}:{}", checksumAlgorithmToString(algorithm), hexDigest);
}

Result<ChecksumSpec> parseChecksumSpec(std::string_view text) {
    text = trim(text);
    ChecksumSpec spec;
    std::string_view digest = text;

    if (auto colon = text.find(':'); colon != std::string_view::npos) {
        const std::string algo = toLower(text.substr(0, colon));
        digest = text.substr(colon + 1);
        if (algo == "md5") {
            spec.algorithm = ChecksumAlgorithm::kMd5;
        } else if (algo == "sha256" || algo == "sha-256") {
            spec.algorithm = ChecksumAlgorithm::kSha256;
        } else if (algo == "xxh64" || algo == "xxhash64") {
            spec.algorithm = ChecksumAlgorithm::kXxHash64;
        } else {
            return makeError(ErrorCode::kFormatError, "unknown checksum algorithm '{}'", algo);
        }
    } else if (digest.size() == 32) {
        spec.algorithm = ChecksumAlgorithm::kMd5;
    } else if (digest.size() == 64) {
        spec.algorithm = ChecksumAlgorithm::kSha256;
    } else {
        return makeError(ErrorCode::kFormatError,
                         "cannot infer checksum algorithm from '{}'", text);
    }

    const std::size_t expectedLength = spec.algorithm == ChecksumAlgorithm::kMd5      ? 32
                                       : spec.algorithm == ChecksumAlgorithm::kSha256 ? 64
                                                                                      : 16;
    if (digest.size() != expectedLength || !isHex(digest)) {
        return makeError(ErrorCode::kFormatError, "malformed {} digest '{}'",
                         checksumAlgorithmToString(spec.algorithm), digest);
    }

    spec.hexDigest = toLower(digest);
    return spec;
}

}  // namespace gqc
