// =============================================================================
// genoqc - Run Command Implementation
// =============================================================================

#include "run_command.h"

#include "acquire_command.h"
#include "aggregate_command.h"
#include "gqc/common/logger.h"
#include "qc_command.h"

namespace gqc::commands {

RunCommand::RunCommand(CommandContext& context, RunOptions options)
    : context_(context), options_(std::move(options)) {}

int RunCommand::execute() {
    auto datasets = resolveSelection(context_, options_.selection);
    if (!datasets) {
        return reportError(datasets.error());
    }

    const auto acquired = acquireDatasets(context_, *datasets);
    if (context_.cancellation->isCancelled()) {
        GQC_LOG_WARNING("Batch cancelled during acquisition; partial files kept for resume");
        return toExitCode(ErrorCode::kCancelled);
    }

    const auto jobs = qcJobsFor(*datasets, acquired);
    qc::ToolOrchestrator orchestrator(context_.config.orchestrator, context_.cancellation);
    const auto runs = orchestrator.runBatch(jobs);
    printRuns(runs);

    std::vector<std::string> ids;
    ids.reserve(datasets->size());
    for (const auto& dataset : *datasets) {
        ids.push_back(dataset.accession);
    }
    const int aggregateCode = aggregateRuns(context_, runs, ids);

    if (qc::batchStatus(runs) == ErrorCode::kCancelled) {
        return toExitCode(ErrorCode::kCancelled);
    }
    if (auto status = acquired.status(); !status) {
        return reportError(status.error());
    }
    return aggregateCode;
}

}  // namespace gqc::commands
