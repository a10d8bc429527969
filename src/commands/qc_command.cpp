// =============================================================================
// genoqc - QC Command Implementation
// =============================================================================

#include "qc_command.h"

#include <algorithm>
#include <format>
#include <iostream>

#include "aggregate_command.h"
#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::commands {

Result<DatasetSpec> parseDatasetSpec(std::string_view text) {
    const auto first = text.find(':');
    const auto second = first == std::string_view::npos ? first : text.find(':', first + 1);
    if (second == std::string_view::npos) {
        return makeError(ErrorCode::kUsageError,
                         "dataset '{}' is not of the form id:technology:file[,file...]", text);
    }

    DatasetSpec spec;
    spec.id = std::string(trim(text.substr(0, first)));
    spec.technology = std::string(trim(text.substr(first + 1, second - first - 1)));
    for (auto file : split(text.substr(second + 1), ',')) {
        file = trim(file);
        if (!file.empty()) {
            spec.files.emplace_back(file);
        }
    }
    if (spec.id.empty() || spec.files.empty()) {
        return makeError(ErrorCode::kUsageError, "dataset '{}' needs an id and at least one file",
                         text);
    }
    return spec;
}

QcCommand::QcCommand(CommandContext& context, QcOptions options)
    : context_(context), options_(std::move(options)) {}

int QcCommand::execute() {
    // Every technology class is checked before the first analyzer starts.
    std::vector<qc::QCJob> jobs;
    std::vector<std::string> ids;
    for (const auto& text : options_.datasets) {
        auto spec = parseDatasetSpec(text);
        if (!spec) {
            return reportError(spec.error());
        }
        auto technology = parseReadTechnology(spec->technology);
        if (!technology) {
            return reportError(Error{technology.error().code(),
                                     std::format("{}: {}", spec->id, technology.error().message())});
        }
        if (std::find(ids.begin(), ids.end(), spec->id) != ids.end()) {
            return reportError(Error{ErrorCode::kUsageError,
                                     std::format("dataset id '{}' given twice", spec->id)});
        }
        ids.push_back(spec->id);
        jobs.push_back(qc::QCJob{qc::QCInput{spec->id, std::move(spec->files)}, *technology});
    }

    qc::ToolOrchestrator orchestrator(context_.config.orchestrator, context_.cancellation);
    const auto runs = orchestrator.runBatch(jobs);
    printRuns(runs);

    if (options_.aggregate) {
        if (int code = aggregateRuns(context_, runs, ids); code != 0) {
            return code;
        }
    }
    return toExitCode(qc::batchStatus(runs));
}

void printRuns(const std::vector<QCRun>& runs) {
    for (const auto& run : runs) {
        std::cout << run.datasetId << '\t' << run.analyzerName << '\t'
                  << qcOutcomeToString(run.outcome) << '\t'
                  << (run.message.empty() ? run.outputDir.string() : run.message) << '\n';
    }
}

}  // namespace gqc::commands
