// =============================================================================
// genoqc - Dataset Discovery Implementation
// =============================================================================

#include "gqc/acquire/discovery.h"

#include <algorithm>
#include <array>
#include <format>
#include <set>
#include <string>
#include <utility>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::acquire {

namespace {

struct GenomeSizeEntry {
    std::string_view organism;
    std::uint64_t bases;
};

constexpr std::array<GenomeSizeEntry, 9> kGenomeSizes = {{
    {"escherichia coli", 4'600'000},
    {"e. coli", 4'600'000},
    {"staphylococcus aureus", 2'800'000},
    {"s. aureus", 2'800'000},
    {"bacillus subtilis", 4'200'000},
    {"pseudomonas aeruginosa", 6'300'000},
    {"saccharomyces cerevisiae", 12'000'000},
    {"homo sapiens", 3'200'000'000},
    {"human", 3'200'000'000},
}};

[[nodiscard]] bool hasRole(const DatasetRef& dataset, ObjectRole role) {
    return std::any_of(dataset.objects.begin(), dataset.objects.end(),
                       [role](const RemoteObject& object) { return object.role == role; });
}

}  // namespace

// =============================================================================
// Coverage
// =============================================================================

std::optional<std::uint64_t> knownGenomeSize(std::string_view organism) {
    const std::string key = toLower(trim(organism));
    for (const auto& entry : kGenomeSizes) {
        if (entry.organism == key) {
            return entry.bases;
        }
    }
    return std::nullopt;
}

std::uint64_t genomeSizeFor(std::string_view organism, const DiscoveryConfig& config) {
    if (config.genomeSize) {
        return *config.genomeSize;
    }
    if (auto known = knownGenomeSize(organism)) {
        GQC_LOG_INFO("Using a genome size of {:.2f} Mb for {}", *known / 1e6, trim(organism));
        return *known;
    }
    GQC_LOG_WARNING("Genome size of {} unknown; assuming {:.1f} Mb", trim(organism),
                    kDefaultGenomeSize / 1e6);
    return kDefaultGenomeSize;
}

std::uint64_t targetBases(std::uint64_t genomeSize, double coverage, double margin) noexcept {
    return static_cast<std::uint64_t>(static_cast<double>(genomeSize) * coverage * margin);
}

// =============================================================================
// Candidates
// =============================================================================

std::vector<DatasetRef> selectCandidates(const std::vector<DatasetRef>& runs,
                                         ReadTechnology technology,
                                         std::uint64_t neededBases) {
    std::vector<DatasetRef> candidates;
    for (const auto& run : runs) {
        if (run.technology != technology || run.objects.empty()) {
            continue;
        }
        DatasetRef candidate = run;
        if (technology == ReadTechnology::kShortRead) {
            if (!hasRole(run, ObjectRole::kShortR1) || !hasRole(run, ObjectRole::kShortR2)) {
                GQC_LOG_DEBUG("{}: not paired; skipped", run.accession);
                continue;
            }
            std::erase_if(candidate.objects, [](const RemoteObject& object) {
                return object.role != ObjectRole::kShortR1 && object.role != ObjectRole::kShortR2;
            });
        } else {
            candidate.objects.resize(1);
        }
        candidates.push_back(std::move(candidate));
    }

    std::stable_partition(candidates.begin(), candidates.end(), [&](const DatasetRef& run) {
        return !run.metadata.baseCount || *run.metadata.baseCount >= neededBases;
    });
    return candidates;
}

void applyCoverageLimit(DatasetRef& dataset,
                        std::uint64_t bases,
                        std::optional<ByteCount> ceiling) {
    const bool paired = hasRole(dataset, ObjectRole::kShortR1) &&
                        hasRole(dataset, ObjectRole::kShortR2);
    for (auto& object : dataset.objects) {
        SubsetLimit limit;
        limit.maxBytes = ceiling;
        if (!paired) {
            limit.maxBases = bases;
        } else if (object.role == ObjectRole::kShortR1) {
            limit.maxBases = std::max<std::uint64_t>(bases / 2, 1);
        }
        // R2 gets R1's read count when the pair is acquired.
        object.subset = limit;
        if (!object.fileName.ends_with(".gz")) {
            object.fileName += ".gz";
        }
    }
}

// =============================================================================
// Sample Consistency
// =============================================================================

VoidResult checkSampleConsistency(const std::vector<DatasetRef>& datasets, bool allowMismatch) {
    std::set<std::string> shortSamples;
    for (const auto& dataset : datasets) {
        if (dataset.technology == ReadTechnology::kShortRead &&
            !dataset.metadata.sampleAccession.empty()) {
            shortSamples.insert(dataset.metadata.sampleAccession);
        }
    }
    if (shortSamples.empty()) {
        return {};
    }
    std::string shortList;
    for (const auto& sample : shortSamples) {
        shortList += shortList.empty() ? sample : ", " + sample;
    }

    for (const auto& dataset : datasets) {
        const std::string& sample = dataset.metadata.sampleAccession;
        if (dataset.technology != ReadTechnology::kLongRead || sample.empty() ||
            shortSamples.contains(sample)) {
            continue;
        }
        const std::string message =
            std::format("samples differ: long-read {} is {}, short reads are from {}",
                        dataset.accession, sample, shortList);
        if (!allowMismatch) {
            return makeError(ErrorCode::kInvalidArgument,
                             "{} (pass --allow-sample-mismatch to combine them)", message);
        }
        GQC_LOG_WARNING("{}; continuing as biological replicates", message);
    }
    return {};
}

// =============================================================================
// Candidate Fallback
// =============================================================================

Result<DatasetRef> acquireFirstCandidate(AcquisitionManager& manager,
                                         std::vector<DatasetRef> candidates,
                                         const CoveragePlan& plan,
                                         const std::vector<DatasetRef>& chosen,
                                         bool allowSampleMismatch) {
    if (candidates.empty()) {
        return makeError(ErrorCode::kResolutionFailed, "no candidate runs");
    }
    const ReadTechnology technology = candidates.front().technology;

    std::stable_partition(candidates.begin(), candidates.end(), [&](const DatasetRef& run) {
        return std::any_of(chosen.begin(), chosen.end(), [&](const DatasetRef& other) {
            return !run.metadata.sampleAccession.empty() &&
                   run.metadata.sampleAccession == other.metadata.sampleAccession;
        });
    });

    for (auto& candidate : candidates) {
        std::vector<DatasetRef> combined = chosen;
        combined.push_back(candidate);
        if (auto consistent = checkSampleConsistency(combined, allowSampleMismatch);
            !consistent) {
            return std::unexpected(consistent.error());
        }

        applyCoverageLimit(candidate, plan.bases, plan.ceiling);
        GQC_LOG_INFO("Trying {} ({})", candidate.accession, candidate.metadata.instrumentPlatform);
        const auto result = manager.acquire(candidate);
        if (result.cancelled) {
            return makeError(ErrorCode::kCancelled, "cancelled while acquiring {}",
                             candidate.accession);
        }
        if (result.ok()) {
            return candidate;
        }
        GQC_LOG_WARNING("{}: {} of {} file(s) verified; trying the next candidate",
                        candidate.accession, result.verifiedCount(), result.objects.size());
    }
    return makeError(ErrorCode::kPartialAcquisitionFailure, "every {} candidate failed",
                     readTechnologyToString(technology));
}

}  // namespace gqc::acquire
