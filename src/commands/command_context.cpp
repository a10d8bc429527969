// =============================================================================
// genoqc - Command Context Implementation
// =============================================================================

#include "command_context.h"

#include <atomic>
#include <csignal>

#include "gqc/acquire/discovery.h"
#include "gqc/acquire/registry_resolver.h"
#include "gqc/common/logger.h"

namespace gqc::commands {

// =============================================================================
// Signal Handling
// =============================================================================

namespace {

/// @brief Token cancelled by the first SIGINT/SIGTERM.
std::atomic<CancellationToken*> gCancellationToken{nullptr};

/// @brief Keeps the token alive for the lifetime of the process.
CancellationTokenPtr gCancellationOwner;

void signalHandler(int signum) {
    CancellationToken* token = gCancellationToken.load();
    if (token != nullptr && !token->isCancelled()) {
        token->requestCancel();
        return;
    }
    // Second signal: give up on a graceful stop.
    std::signal(signum, SIG_DFL);
    std::raise(signum);
}

}  // namespace

void installCancellationHandlers(const CancellationTokenPtr& token) {
    gCancellationOwner = token;
    gCancellationToken.store(token.get());

    if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
        GQC_LOG_WARNING("Failed to install SIGINT handler");
    }
    if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
        GQC_LOG_WARNING("Failed to install SIGTERM handler");
    }
    GQC_LOG_DEBUG("Signal handlers installed for SIGINT and SIGTERM");
}

// =============================================================================
// CommandContext
// =============================================================================

net::RangeSourcePtr CommandContext::source() {
    if (!rangeSource) {
        rangeSource = net::makeHttpRangeSource();
    }
    return rangeSource;
}

namespace {

Result<std::vector<DatasetRef>> loadSelection(CommandContext& context,
                                              const DatasetSelection& selection) {
    const bool haveAccessions = !selection.accessions.empty();
    const bool haveSheet = !selection.sheet.empty();
    if (haveAccessions == haveSheet) {
        return makeError(ErrorCode::kUsageError,
                         "give either accessions or --sheet, not both and not neither");
    }

    std::optional<ReadTechnology> technology;
    if (!selection.technology.empty()) {
        auto parsed = parseReadTechnology(selection.technology);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        technology = *parsed;
    }

    if (haveSheet) {
        auto datasets = acquire::loadDatasetSheet(selection.sheet);
        if (!datasets) {
            return datasets;
        }
        if (technology) {
            for (auto& dataset : *datasets) {
                dataset.technology = *technology;
                acquire::assignObjectRoles(dataset);
            }
        }
        GQC_LOG_INFO("Loaded {} dataset(s) from {}", datasets->size(), selection.sheet.string());
        return datasets;
    }

    acquire::RegistryResolver resolver(context.config.resolver, context.config.transfer,
                                       context.source());
    return resolver.resolveAll(selection.accessions, technology);
}

}  // namespace

Result<std::vector<DatasetRef>> resolveSelection(CommandContext& context,
                                                 const DatasetSelection& selection) {
    auto datasets = loadSelection(context, selection);
    if (!datasets) {
        return datasets;
    }
    if (auto consistent = acquire::checkSampleConsistency(
            *datasets, context.config.resolver.allowSampleMismatch);
        !consistent) {
        return std::unexpected(consistent.error());
    }
    if (context.config.subset.enabled) {
        acquire::applySubsetLimits(*datasets, context.config.subset);
    }
    return datasets;
}

std::vector<qc::QCJob> qcJobsFor(const std::vector<DatasetRef>& datasets,
                                 const acquire::BatchAcquisitionResult& acquired) {
    std::vector<qc::QCJob> jobs;
    for (std::size_t i = 0; i < datasets.size() && i < acquired.datasets.size(); ++i) {
        const auto& result = acquired.datasets[i];
        if (!result.ok()) {
            GQC_LOG_WARNING("{}: skipping QC, {} of {} object(s) verified", result.accession,
                            result.verifiedCount(), result.objects.size());
            continue;
        }
        jobs.push_back(qc::QCJob{qc::QCInput{datasets[i].accession, result.verifiedFiles()},
                                 datasets[i].technology});
    }
    return jobs;
}

int reportError(const Error& error) {
    GQC_LOG_ERROR("{}: {}", errorCodeToString(error.code()), error.message());
    return toExitCode(error.code());
}

}  // namespace gqc::commands
