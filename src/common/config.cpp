// =============================================================================
// genoqc - Configuration Implementation
// =============================================================================

#include "gqc/common/config.h"

#include <algorithm>
#include <cmath>

namespace gqc {

// =============================================================================
// TransferConfig
// =============================================================================

VoidResult TransferConfig::validate() const {
    if (connectTimeoutSec == 0 || readTimeoutSec == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Transfer timeouts must be > 0");
    }
    if (attemptTimeoutSec == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Attempt timeout must be > 0");
    }
    if (progressIntervalBytes == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Progress interval must be > 0 bytes");
    }
    if (hashBufferSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Hash buffer size must be > 0");
    }
    return {};
}

// =============================================================================
// ResolverConfig
// =============================================================================

VoidResult ResolverConfig::validate() const {
    if (enaFilereportUrl.empty() || ncbiRuninfoUrl.empty()) {
        return makeError(ErrorCode::kInvalidArgument, "Registry endpoints must not be empty");
    }
    if (enaSearchUrl.empty()) {
        return makeError(ErrorCode::kInvalidArgument, "Search endpoint must not be empty");
    }
    if (searchLimit == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Search limit must be > 0");
    }
    return {};
}

// =============================================================================
// SubsetConfig
// =============================================================================

SubsetLimit SubsetConfig::limitFor(ReadTechnology technology) const {
    SubsetLimit limit;
    if (reads) {
        limit.maxReads = *reads;
        return limit;
    }
    const double mb = technology == ReadTechnology::kLongRead ? longReadMb : shortReadMb;
    limit.maxBytes = static_cast<ByteCount>(mb * 1024.0 * 1024.0);
    return limit;
}

VoidResult SubsetConfig::validate() const {
    if (!(shortReadMb > 0.0) || !(longReadMb > 0.0)) {
        return makeError(ErrorCode::kInvalidArgument, "Subset sizes must be > 0 MiB");
    }
    if (reads && *reads == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Subset read count must be > 0");
    }
    return {};
}

// =============================================================================
// DiscoveryConfig
// =============================================================================

VoidResult DiscoveryConfig::validate() const {
    if (!(shortCoverage > 0.0) || !(longCoverage > 0.0)) {
        return makeError(ErrorCode::kInvalidArgument, "Coverage targets must be > 0");
    }
    if (coverageMargin < 1.0) {
        return makeError(ErrorCode::kInvalidArgument,
                         "Coverage margin must be >= 1.0 (got {})", coverageMargin);
    }
    if (genomeSize && *genomeSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Genome size must be > 0");
    }
    return {};
}

// =============================================================================
// AcquisitionConfig
// =============================================================================

std::chrono::milliseconds AcquisitionConfig::backoffAfter(std::uint32_t failedAttempt) const noexcept {
    if (failedAttempt == 0) {
        return std::chrono::milliseconds{0};
    }
    const double exponent = static_cast<double>(failedAttempt - 1);
    const double delay =
        static_cast<double>(initialBackoffMs) * std::pow(backoffMultiplier, exponent);
    const double capped = std::min(delay, static_cast<double>(maxBackoffMs));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

VoidResult AcquisitionConfig::validate() const {
    if (maxAttempts == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Max attempts must be > 0");
    }
    if (backoffMultiplier < 1.0) {
        return makeError(ErrorCode::kInvalidArgument,
                         "Backoff multiplier must be >= 1.0 (got {})", backoffMultiplier);
    }
    if (maxBackoffMs < initialBackoffMs) {
        return makeError(ErrorCode::kInvalidArgument,
                         "Max backoff ({} ms) must be >= initial backoff ({} ms)",
                         maxBackoffMs, initialBackoffMs);
    }
    if (maxConcurrentTransfers == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Max concurrent transfers must be > 0");
    }
    if (dataDir.empty()) {
        return makeError(ErrorCode::kInvalidArgument, "Data directory must not be empty");
    }
    return {};
}

// =============================================================================
// OrchestratorConfig
// =============================================================================

const AnalyzerConfig& OrchestratorConfig::analyzer(AnalyzerKind kind) const noexcept {
    switch (kind) {
        case AnalyzerKind::kShortRead:
            return shortRead;
        case AnalyzerKind::kLongRead:
            return longRead;
    }
    return shortRead;
}

VoidResult OrchestratorConfig::validate() const {
    for (const AnalyzerConfig* analyzerConfig : {&shortRead, &longRead}) {
        if (analyzerConfig->name.empty() || analyzerConfig->executable.empty()) {
            return makeError(ErrorCode::kInvalidArgument,
                             "Analyzer name and executable must not be empty");
        }
        if (analyzerConfig->name.find('/') != std::string::npos) {
            return makeError(ErrorCode::kInvalidArgument,
                             "Analyzer name '{}' must not contain '/'", analyzerConfig->name);
        }
    }
    if (shortRead.name == longRead.name) {
        return makeError(ErrorCode::kInvalidArgument,
                         "Analyzer names must differ (both are '{}')", shortRead.name);
    }
    if (toolTimeoutSec == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Tool timeout must be > 0");
    }
    if (maxConcurrentTools == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Max concurrent tools must be > 0");
    }
    if (qcDir.empty()) {
        return makeError(ErrorCode::kInvalidArgument, "QC directory must not be empty");
    }
    return {};
}

// =============================================================================
// AggregatorConfig / SamplingConfig
// =============================================================================

VoidResult AggregatorConfig::validate() const {
    if (reportDir.empty()) {
        return makeError(ErrorCode::kInvalidArgument, "Report directory must not be empty");
    }
    if (!mergeProgram.empty() && mergeTimeoutSec == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Merge timeout must be > 0");
    }
    return {};
}

VoidResult SamplingConfig::validate() const {
    if (cap < 2) {
        return makeError(ErrorCode::kInvalidArgument,
                         "Sample cap must be >= 2 to keep both extrema (got {})", cap);
    }
    return {};
}

// =============================================================================
// Config
// =============================================================================

VoidResult Config::validate() const {
    if (auto result = transfer.validate(); !result) {
        return result;
    }
    if (auto result = resolver.validate(); !result) {
        return result;
    }
    if (auto result = acquisition.validate(); !result) {
        return result;
    }
    if (auto result = subset.validate(); !result) {
        return result;
    }
    if (auto result = discovery.validate(); !result) {
        return result;
    }
    if (auto result = orchestrator.validate(); !result) {
        return result;
    }
    if (auto result = aggregator.validate(); !result) {
        return result;
    }
    return sampling.validate();
}

}  // namespace gqc
