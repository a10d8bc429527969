// =============================================================================
// genoqc - Aggregate Command Implementation
// =============================================================================

#include "aggregate_command.h"

#include <iostream>

#include "gqc/common/logger.h"
#include "gqc/qc/aggregator.h"

namespace gqc::commands {

AggregateCommand::AggregateCommand(CommandContext& context, AggregateOptions options)
    : context_(context), options_(std::move(options)) {}

int AggregateCommand::execute() {
    const auto runs = qc::discoverRuns(context_.config.orchestrator, options_.datasetIds);
    GQC_LOG_INFO("Found {} analyzer output(s) for {} dataset(s) under {}", runs.size(),
                 options_.datasetIds.size(), context_.config.orchestrator.qcDir.string());
    return aggregateRuns(context_, runs, options_.datasetIds);
}

int aggregateRuns(CommandContext& context,
                  const std::vector<QCRun>& runs,
                  const std::vector<std::string>& datasetIds) {
    qc::Aggregator aggregator(context.config.aggregator, context.cancellation);
    auto report = aggregator.aggregate(runs, datasetIds);
    if (!report) {
        return reportError(report.error());
    }
    std::cout << aggregator.reportPath().string() << '\n';
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace gqc::commands
