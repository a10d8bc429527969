// =============================================================================
// genoqc - Acquire Command Implementation
// =============================================================================

#include "acquire_command.h"

#include <iostream>

#include "gqc/common/logger.h"

namespace gqc::commands {

AcquireCommand::AcquireCommand(CommandContext& context, AcquireOptions options)
    : context_(context), options_(std::move(options)) {}

int AcquireCommand::execute() {
    auto datasets = resolveSelection(context_, options_.selection);
    if (!datasets) {
        return reportError(datasets.error());
    }

    const auto batch = acquireDatasets(context_, *datasets);
    for (const auto& dataset : batch.datasets) {
        for (const auto& record : dataset.objects) {
            std::cout << dataset.accession << '\t' << transferStateToString(record.state) << '\t'
                      << record.finalPath.string() << '\n';
        }
    }

    if (auto status = batch.status(); !status) {
        return reportError(status.error());
    }
    return toExitCode(ErrorCode::kSuccess);
}

std::unique_ptr<acquire::AcquisitionManager> makeAcquisitionManager(CommandContext& context) {
    auto manager = std::make_unique<acquire::AcquisitionManager>(
        context.config.acquisition, context.config.transfer, context.source(),
        context.cancellation);
    manager->setProgressCallback([](const acquire::TransferProgress& progress) {
        if (progress.totalBytes) {
            GQC_LOG_INFO("{}: {} / {} bytes ({:.1f}%)", progress.url, progress.confirmedBytes,
                         *progress.totalBytes, 100.0 * progress.ratio());
        } else {
            GQC_LOG_INFO("{}: {} bytes", progress.url, progress.confirmedBytes);
        }
    });
    return manager;
}

acquire::BatchAcquisitionResult acquireDatasets(CommandContext& context,
                                                const std::vector<DatasetRef>& datasets) {
    const auto manager = makeAcquisitionManager(context);

    GQC_LOG_INFO("Acquiring {} dataset(s) into {}", datasets.size(),
                 context.config.acquisition.dataDir.string());
    auto batch = manager->acquireBatch(datasets);

    std::size_t verified = 0;
    std::size_t total = 0;
    for (const auto& dataset : batch.datasets) {
        verified += dataset.verifiedCount();
        total += dataset.objects.size();
    }
    GQC_LOG_INFO("Acquisition finished: {} of {} object(s) verified", verified, total);
    return batch;
}

}  // namespace gqc::commands
