// =============================================================================
// genoqc - QC Aggregator
// =============================================================================
// Collects the outputs of a batch of QCRuns into one consolidated report.
//
// - Every dataset of the batch appears in the report. Datasets without any
//   parsed metric carry the explicit status "no-metrics".
// - Metrics come only from runs with outcome ok; failed runs are listed
//   under "failures" and never block other analyzers of the same dataset.
// - Ordering is fixed (datasets by id, metrics by name, failures by analyzer),
//   so the report does not depend on the order in which runs completed.
// - The merge step links each ok run into <reportDir>/merge_input/<id>/<analyzer>
//   and runs the external merge program over that directory, or writes a
//   merged metrics table itself when no program is configured. A failing merge
//   program yields AggregationIncomplete; per-tool outputs are left untouched.
// =============================================================================

#ifndef GQC_QC_AGGREGATOR_H
#define GQC_QC_AGGREGATOR_H

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "gqc/common/cancellation.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/qc/metrics_parser.h"

namespace gqc::qc {

// =============================================================================
// Report Model
// =============================================================================

/// @brief Why an analyzer contributed no metrics for a dataset.
struct AnalyzerFailure {
    std::string analyzer;
    QCOutcome outcome = QCOutcome::kToolError;
    std::string reason;
    std::optional<int> exitCode;
    bool timedOut = false;
    bool cancelled = false;

    bool operator==(const AnalyzerFailure&) const = default;
};

/// @brief Merged metric set of one dataset.
struct DatasetReport {
    std::string id;
    MetricMap metrics;
    std::vector<AnalyzerFailure> failures;

    [[nodiscard]] bool hasMetrics() const noexcept { return !metrics.empty(); }

    bool operator==(const DatasetReport&) const = default;
};

/// @brief Consolidated report of one batch.
struct AggregateReport {
    /// @brief Dataset id → report; ordered by id.
    std::map<std::string, DatasetReport> datasets;

    /// @brief Output of the merge step, when it ran successfully.
    std::optional<std::filesystem::path> mergedReport;

    /// @brief Serialize as pretty-printed JSON.
    [[nodiscard]] std::string toJson() const;

    /// @brief Write toJson() to @p path (via a temporary file and rename).
    [[nodiscard]] VoidResult write(const std::filesystem::path& path) const;

    /// @brief Datasets whose status is "no-metrics".
    [[nodiscard]] std::vector<std::string> datasetsWithoutMetrics() const;
};

// =============================================================================
// Aggregator
// =============================================================================

class Aggregator {
public:
    explicit Aggregator(AggregatorConfig config, CancellationTokenPtr cancellation = nullptr);

    /// @brief Build the report, run the merge step and write the report JSON.
    /// @param runs QCRuns of the batch, in any order.
    /// @param expectedDatasets Ids that must appear even without any run.
    /// @return The report, or kAggregationIncomplete when the merge program failed
    ///         (the report JSON is still written in that case).
    [[nodiscard]] Result<AggregateReport> aggregate(
        const std::vector<QCRun>& runs,
        const std::vector<std::string>& expectedDatasets = {}) const;

    /// @brief Build the report from the runs only; no files are written.
    [[nodiscard]] AggregateReport collect(const std::vector<QCRun>& runs,
                                          const std::vector<std::string>& expectedDatasets = {}) const;

    /// @brief Link ok runs into <reportDir>/merge_input/<id>/<analyzer>.
    [[nodiscard]] Result<std::filesystem::path> prepareMergeInput(
        const std::vector<QCRun>& runs) const;

    /// @brief Run (or emulate) the merge over a prepared input directory.
    /// @return Path of the merged output, or kAggregationIncomplete.
    [[nodiscard]] Result<std::filesystem::path> merge(const std::filesystem::path& mergeInput,
                                                      const AggregateReport& report) const;

    /// @brief <reportDir>/aggregate_report.json
    [[nodiscard]] std::filesystem::path reportPath() const;

    [[nodiscard]] const AggregatorConfig& config() const noexcept { return config_; }

private:
    AggregatorConfig config_;
    CancellationTokenPtr cancellation_;
};

/// @brief Rebuild QCRuns from per-tool outputs already on disk.
/// @note Used to retry only the merge step. Each output directory is described
///       by its run record; a directory without a readable record yields a
///       not-run entry, so its files never contribute metrics.
[[nodiscard]] std::vector<QCRun> discoverRuns(const OrchestratorConfig& config,
                                              const std::vector<std::string>& datasetIds);

}  // namespace gqc::qc

#endif  // GQC_QC_AGGREGATOR_H
