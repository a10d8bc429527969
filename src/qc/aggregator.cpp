// =============================================================================
// genoqc - QC Aggregator Implementation
// =============================================================================

#include "gqc/qc/aggregator.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <system_error>
#include <tuple>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"
#include "gqc/qc/process.h"
#include "gqc/qc/tool_orchestrator.h"

namespace gqc::qc {

namespace {

constexpr std::string_view kMergeInputDir = "merge_input";
constexpr std::string_view kMergedDir = "merged";
constexpr std::string_view kEmulatedMergeFile = "merged_metrics.tsv";
constexpr std::string_view kMergeLogFile = "merge.log";

/// @brief Largest integer a double holds exactly.
constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

nlohmann::json metricValue(const std::string& value) {
    auto number = parseNumber(value);
    if (!number || value.find(',') != std::string::npos) {
        return value;
    }
    if (std::trunc(*number) == *number && std::fabs(*number) < kMaxExactInteger) {
        return static_cast<std::int64_t>(*number);
    }
    return *number;
}

}  // namespace

// =============================================================================
// AggregateReport
// =============================================================================

std::string AggregateReport::toJson() const {
    nlohmann::json root;
    root["datasets"] = nlohmann::json::array();

    for (const auto& [id, dataset] : datasets) {
        nlohmann::json entry;
        entry["id"] = id;
        entry["status"] = dataset.hasMetrics() ? "ok" : "no-metrics";

        nlohmann::json metrics = nlohmann::json::object();
        for (const auto& [name, value] : dataset.metrics) {
            metrics[name] = metricValue(value);
        }
        entry["metrics"] = std::move(metrics);

        nlohmann::json failures = nlohmann::json::array();
        for (const auto& failure : dataset.failures) {
            nlohmann::json item;
            item["analyzer"] = failure.analyzer;
            item["outcome"] = std::string(qcOutcomeToString(failure.outcome));
            item["reason"] = failure.reason;
            item["exitCode"] = failure.exitCode ? nlohmann::json(*failure.exitCode) : nullptr;
            item["timedOut"] = failure.timedOut;
            item["cancelled"] = failure.cancelled;
            failures.push_back(std::move(item));
        }
        entry["failures"] = std::move(failures);
        root["datasets"].push_back(std::move(entry));
    }

    root["mergedReport"] = mergedReport ? nlohmann::json(mergedReport->string()) : nullptr;
    return root.dump(2);
}

VoidResult AggregateReport::write(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return makeError(ErrorCode::kIOError, "cannot create '{}': {}",
                             path.parent_path().string(), ec.message());
        }
    }

    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return makeError(ErrorCode::kIOError, "cannot open '{}' for writing", temp.string());
        }
        out << toJson() << '\n';
        if (!out.flush()) {
            return makeError(ErrorCode::kIOError, "write to '{}' failed", temp.string());
        }
    }
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return makeError(ErrorCode::kIOError, "cannot rename '{}': {}", temp.string(),
                         ec.message());
    }
    return {};
}

std::vector<std::string> AggregateReport::datasetsWithoutMetrics() const {
    std::vector<std::string> ids;
    for (const auto& [id, dataset] : datasets) {
        if (!dataset.hasMetrics()) {
            ids.push_back(id);
        }
    }
    return ids;
}

// =============================================================================
// Aggregator
// =============================================================================

Aggregator::Aggregator(AggregatorConfig config, CancellationTokenPtr cancellation)
    : config_(std::move(config)),
      cancellation_(cancellation ? std::move(cancellation) : makeCancellationToken()) {
    unwrapOrThrow(config_.validate());
}

std::filesystem::path Aggregator::reportPath() const {
    return config_.reportDir / kReportFileName;
}

AggregateReport Aggregator::collect(const std::vector<QCRun>& runs,
                                    const std::vector<std::string>& expectedDatasets) const {
    AggregateReport report;
    for (const auto& id : expectedDatasets) {
        report.datasets[id].id = id;
    }

    for (const auto& run : runs) {
        DatasetReport& dataset = report.datasets[run.datasetId];
        dataset.id = run.datasetId;

        if (run.outcome != QCOutcome::kOk) {
            dataset.failures.push_back(AnalyzerFailure{run.analyzerName, run.outcome, run.message,
                                                       run.exitCode, run.timedOut,
                                                       run.cancelled});
            continue;
        }

        auto metrics = collectMetrics(run.analyzer, run.analyzerName, run.outputDir);
        if (!metrics) {
            GQC_LOG_WARNING("{}/{}: unreadable report: {}", run.datasetId, run.analyzerName,
                            metrics.error().message());
            dataset.failures.push_back(AnalyzerFailure{run.analyzerName, run.outcome,
                                                       metrics.error().message(), run.exitCode,
                                                       false, false});
            continue;
        }
        if (metrics->empty()) {
            dataset.failures.push_back(AnalyzerFailure{
                run.analyzerName, run.outcome,
                std::format("no report found in '{}'", run.outputDir.string()), run.exitCode,
                false, false});
            continue;
        }
        dataset.metrics.insert(metrics->begin(), metrics->end());
    }

    for (auto& [id, dataset] : report.datasets) {
        std::sort(dataset.failures.begin(), dataset.failures.end(),
                  [](const AnalyzerFailure& a, const AnalyzerFailure& b) {
                      return std::tie(a.analyzer, a.reason) < std::tie(b.analyzer, b.reason);
                  });
    }
    return report;
}

Result<std::filesystem::path> Aggregator::prepareMergeInput(const std::vector<QCRun>& runs) const {
    const std::filesystem::path root = config_.reportDir / kMergeInputDir;

    // The layout holds symlinks only; removing it never touches tool outputs.
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    if (ec) {
        return makeError(ErrorCode::kIOError, "cannot reset '{}': {}", root.string(),
                         ec.message());
    }

    for (const auto& run : runs) {
        if (run.outcome != QCOutcome::kOk) {
            continue;
        }
        const auto datasetDir = root / run.datasetId;
        std::filesystem::create_directories(datasetDir, ec);
        if (ec) {
            return makeError(ErrorCode::kIOError, "cannot create '{}': {}", datasetDir.string(),
                             ec.message());
        }
        const auto target = std::filesystem::absolute(run.outputDir, ec);
        if (ec) {
            return makeError(ErrorCode::kIOError, "cannot resolve '{}': {}",
                             run.outputDir.string(), ec.message());
        }
        std::filesystem::create_directory_symlink(target, datasetDir / run.analyzerName, ec);
        if (ec) {
            return makeError(ErrorCode::kIOError, "cannot link '{}': {}", target.string(),
                             ec.message());
        }
    }

    std::filesystem::create_directories(root, ec);
    if (ec) {
        return makeError(ErrorCode::kIOError, "cannot create '{}': {}", root.string(),
                         ec.message());
    }
    return root;
}

Result<std::filesystem::path> Aggregator::merge(const std::filesystem::path& mergeInput,
                                                const AggregateReport& report) const {
    const std::filesystem::path mergedDir = config_.reportDir / kMergedDir;
    std::error_code ec;
    std::filesystem::create_directories(mergedDir, ec);
    if (ec) {
        return makeError(ErrorCode::kAggregationIncomplete, "cannot create '{}': {}",
                         mergedDir.string(), ec.message());
    }

    if (config_.mergeProgram.empty()) {
        const auto table = mergedDir / kEmulatedMergeFile;
        std::ofstream out(table, std::ios::trunc);
        if (!out) {
            return makeError(ErrorCode::kAggregationIncomplete, "cannot write '{}'",
                             table.string());
        }
        out << "dataset\tmetric\tvalue\n";
        for (const auto& [id, dataset] : report.datasets) {
            if (!dataset.hasMetrics()) {
                out << id << "\t-\tno-metrics\n";
                continue;
            }
            for (const auto& [name, value] : dataset.metrics) {
                out << id << '\t' << name << '\t' << value << '\n';
            }
        }
        if (!out.flush()) {
            return makeError(ErrorCode::kAggregationIncomplete, "write to '{}' failed",
                             table.string());
        }
        GQC_LOG_INFO("Merged metrics written to {}", table.string());
        return table;
    }

    ProcessSpec spec;
    spec.executable = config_.mergeProgram;
    spec.args = {std::filesystem::absolute(mergeInput).string(), "--outdir",
                 std::filesystem::absolute(mergedDir).string(), "--force"};
    spec.args.insert(spec.args.end(), config_.mergeArgs.begin(), config_.mergeArgs.end());
    spec.logPath = config_.reportDir / kMergeLogFile;
    spec.timeout = std::chrono::seconds(config_.mergeTimeoutSec);

    GQC_LOG_INFO("Running merge program {} over {}", config_.mergeProgram, mergeInput.string());
    auto result = runProcess(spec, cancellation_.get());
    if (!result) {
        return makeError(ErrorCode::kAggregationIncomplete, "{}; per-tool outputs kept",
                         result.error().message());
    }
    if (!result->succeeded()) {
        return makeError(ErrorCode::kAggregationIncomplete,
                         "merge program '{}' failed ({}), see {}; per-tool outputs kept",
                         config_.mergeProgram, result->describe(), spec.logPath.string());
    }
    return mergedDir;
}

Result<AggregateReport> Aggregator::aggregate(const std::vector<QCRun>& runs,
                                              const std::vector<std::string>& expectedDatasets) const {
    AggregateReport report = collect(runs, expectedDatasets);

    std::optional<Error> mergeError;
    auto input = prepareMergeInput(runs);
    if (!input) {
        mergeError = Error{ErrorCode::kAggregationIncomplete, input.error().message()};
    } else {
        auto merged = merge(*input, report);
        if (merged) {
            report.mergedReport = *merged;
        } else {
            mergeError = merged.error();
        }
    }

    if (auto written = report.write(reportPath()); !written) {
        return std::unexpected(written.error());
    }

    const auto missing = report.datasetsWithoutMetrics();
    GQC_LOG_INFO("Aggregated {} dataset(s), {} without metrics; report at {}",
                 report.datasets.size(), missing.size(), reportPath().string());
    for (const auto& id : missing) {
        GQC_LOG_WARNING("{}: no metrics", id);
    }

    if (mergeError) {
        GQC_LOG_ERROR("{}", mergeError->message());
        return makeError(*mergeError);
    }
    return report;
}

// =============================================================================
// discoverRuns
// =============================================================================

std::vector<QCRun> discoverRuns(const OrchestratorConfig& config,
                                const std::vector<std::string>& datasetIds) {
    std::vector<QCRun> runs;
    for (const auto& id : datasetIds) {
        for (AnalyzerKind kind : {AnalyzerKind::kShortRead, AnalyzerKind::kLongRead}) {
            const AnalyzerConfig& analyzer = config.analyzer(kind);
            const auto outputDir = config.qcDir / id / analyzer.name;
            std::error_code ec;
            if (!std::filesystem::is_directory(outputDir, ec)) {
                continue;
            }

            auto recorded = readRunRecord(outputDir, analyzer.name);
            QCRun run;
            if (recorded) {
                run = std::move(*recorded);
            } else {
                GQC_LOG_WARNING("{}/{}: {}", id, analyzer.name, recorded.error().message());
                run.outcome = QCOutcome::kNotRun;
                run.message = "no run record; the analyzer did not finish";
                run.outputDir = outputDir;
                run.logPath = outputDir / std::format("{}.log", analyzer.name);
            }
            run.datasetId = id;
            run.analyzer = kind;
            run.analyzerName = analyzer.name;
            runs.push_back(std::move(run));
        }
    }
    return runs;
}

}  // namespace gqc::qc
