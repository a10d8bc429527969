// =============================================================================
// genoqc - Tool Orchestrator
// =============================================================================
// Runs the external QC analyzer that matches a dataset's read technology.
//
// Dispatch is a closed switch over ReadTechnology:
//   short-read → short-read analyzer (FastQC command line)
//   long-read  → long-read analyzer (NanoPlot command line)
//
// Every invocation is isolated: a crash, non-zero exit or timeout becomes a
// QCRun with outcome tool-error and never aborts sibling runs. Raw output lands
// in <qcDir>/<datasetId>/<analyzer>/ with the captured console output in
// <analyzer>.log next to it.
//
// Each invocation empties its output directory first and finishes by writing
// <analyzer>.run.json there, so outputs on disk always belong to the run that
// the record describes. A directory without a record holds an interrupted run.
// =============================================================================

#ifndef GQC_QC_TOOL_ORCHESTRATOR_H
#define GQC_QC_TOOL_ORCHESTRATOR_H

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gqc/common/cancellation.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/qc/process.h"

namespace gqc::qc {

/// @brief Local input of one dataset.
struct QCInput {
    std::string datasetId;

    /// @brief Read files (R1 before R2 for paired short reads).
    std::vector<std::filesystem::path> files;
};

/// @brief One dataset scheduled for QC.
struct QCJob {
    QCInput input;
    ReadTechnology technology = ReadTechnology::kShortRead;
};

/// @brief Analyzer families applicable to a technology class.
[[nodiscard]] std::vector<AnalyzerKind> analyzersFor(ReadTechnology technology);

/// @brief Suffix of the record written beside an analyzer's output.
inline constexpr std::string_view kRunRecordSuffix = ".run.json";

/// @brief <outputDir>/<analyzerName>.run.json
[[nodiscard]] std::filesystem::path runRecordPath(const std::filesystem::path& outputDir,
                                                  std::string_view analyzerName);

/// @brief Store @p run in its output directory (write to a temporary, then rename).
[[nodiscard]] VoidResult writeRunRecord(const QCRun& run);

/// @brief Load the record of the run whose output is in @p outputDir.
/// @return kIOError if missing or unreadable, kFormatError if malformed.
[[nodiscard]] Result<QCRun> readRunRecord(const std::filesystem::path& outputDir,
                                          std::string_view analyzerName);

/// @brief Batch status of a set of runs.
/// @return kCancelled when any run was cancelled, else kSuccess. Tool errors
///         stay per-run and do not fail the batch.
[[nodiscard]] ErrorCode batchStatus(const std::vector<QCRun>& runs) noexcept;

/// @brief Runs external analyzers and records QCRuns.
class ToolOrchestrator {
public:
    explicit ToolOrchestrator(OrchestratorConfig config,
                              CancellationTokenPtr cancellation = nullptr);

    ~ToolOrchestrator();

    ToolOrchestrator(const ToolOrchestrator&) = delete;
    ToolOrchestrator& operator=(const ToolOrchestrator&) = delete;

    /// @brief Run QC for a technology given by name.
    /// @return kUnsupportedTechnology for an unknown class, before any process
    ///         is started or any file is written.
    [[nodiscard]] Result<std::vector<QCRun>> run(const QCInput& input,
                                                 std::string_view technologyClass);

    /// @brief Run QC for a known technology; failures are recorded, not returned.
    [[nodiscard]] std::vector<QCRun> run(const QCInput& input, ReadTechnology technology);

    /// @brief Run QC for many datasets, at most maxConcurrentTools processes at once.
    /// @return One QCRun per (dataset, analyzer), in job order.
    [[nodiscard]] std::vector<QCRun> runBatch(const std::vector<QCJob>& jobs);

    /// @brief <qcDir>/<datasetId>/<analyzerName>
    [[nodiscard]] std::filesystem::path outputDirFor(std::string_view datasetId,
                                                     std::string_view analyzerName) const;

    /// @brief Command line for one analyzer invocation.
    [[nodiscard]] ProcessSpec commandFor(AnalyzerKind kind,
                                         const QCInput& input,
                                         const std::filesystem::path& outputDir) const;

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    /// @brief Invoke one analyzer for one dataset.
    [[nodiscard]] QCRun invoke(AnalyzerKind kind, const QCInput& input) const;

    class Impl;

    OrchestratorConfig config_;
    CancellationTokenPtr cancellation_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gqc::qc

#endif  // GQC_QC_TOOL_ORCHESTRATOR_H
