// =============================================================================
// genoqc - Discover Command Implementation
// =============================================================================

#include "discover_command.h"

#include <format>
#include <iostream>

#include "acquire_command.h"
#include "gqc/acquire/discovery.h"
#include "gqc/acquire/registry_resolver.h"
#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::commands {

Result<std::vector<ReadTechnology>> discoveryTechnologies(std::string_view value) {
    const std::string lower = toLower(trim(value));
    if (lower == "both") {
        return std::vector<ReadTechnology>{ReadTechnology::kShortRead, ReadTechnology::kLongRead};
    }
    auto technology = parseReadTechnology(lower);
    if (!technology) {
        return std::unexpected(technology.error());
    }
    return std::vector<ReadTechnology>{*technology};
}

DiscoverCommand::DiscoverCommand(CommandContext& context, DiscoverOptions options)
    : context_(context), options_(std::move(options)) {}

int DiscoverCommand::execute() {
    auto technologies = discoveryTechnologies(options_.technology);
    if (!technologies) {
        return reportError(technologies.error());
    }

    const Config& config = context_.config;
    acquire::RegistryResolver resolver(config.resolver, config.transfer, context_.source());
    const auto runs =
        unwrapOrThrow(resolver.discover(options_.organism, config.discovery.strategy));
    const std::uint64_t genomeSize = acquire::genomeSizeFor(options_.organism, config.discovery);
    const auto manager = makeAcquisitionManager(context_);

    std::vector<DatasetRef> chosen;
    bool incomplete = false;
    for (ReadTechnology technology : *technologies) {
        const double coverage = technology == ReadTechnology::kShortRead
                                    ? config.discovery.shortCoverage
                                    : config.discovery.longCoverage;
        const std::uint64_t bases =
            acquire::targetBases(genomeSize, coverage, config.discovery.coverageMargin);
        auto candidates = acquire::selectCandidates(runs, technology, bases);
        GQC_LOG_INFO("{}: {} candidate run(s) for {:.0f}x ({} bases)",
                     readTechnologyToString(technology), candidates.size(), coverage, bases);
        if (candidates.empty()) {
            GQC_LOG_WARNING("No usable {} runs of {}", readTechnologyToString(technology),
                            options_.organism);
            incomplete = true;
            continue;
        }

        if (options_.dryRun) {
            DatasetRef planned = candidates.front();
            acquire::applyCoverageLimit(planned, bases);
            chosen.push_back(std::move(planned));
            continue;
        }

        acquire::CoveragePlan plan;
        plan.bases = bases;
        if (config.subset.enabled) {
            plan.ceiling = config.subset.limitFor(technology).maxBytes;
        }
        auto acquired = acquire::acquireFirstCandidate(*manager, std::move(candidates), plan,
                                                       chosen,
                                                       config.resolver.allowSampleMismatch);
        if (!acquired) {
            if (acquired.error().code() != ErrorCode::kPartialAcquisitionFailure) {
                return reportError(acquired.error());
            }
            GQC_LOG_ERROR("{}", acquired.error().message());
            incomplete = true;
            continue;
        }
        chosen.push_back(std::move(*acquired));
    }

    for (const auto& dataset : chosen) {
        const auto directory = config.acquisition.dataDir / dataset.accession;
        for (const auto& object : dataset.objects) {
            std::cout << dataset.accession << '\t' << readTechnologyToString(dataset.technology)
                      << '\t' << dataset.metadata.sampleAccession << '\t'
                      << (directory / object.fileName).string() << '\n';
        }
    }

    if (chosen.empty()) {
        return reportError(Error{ErrorCode::kResolutionFailed,
                                 std::format("nothing acquired for {}", options_.organism)});
    }
    if (incomplete) {
        return toExitCode(ErrorCode::kPartialAcquisitionFailure);
    }
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace gqc::commands
