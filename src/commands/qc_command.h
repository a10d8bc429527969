// =============================================================================
// genoqc - QC Command
// =============================================================================
// Runs the analyzers of each dataset's technology class over local files.
//
// Datasets are given as "id:technology:file[,file...]", e.g.
//   --dataset ERR000001:short-read:r1.fastq.gz,r2.fastq.gz
// =============================================================================

#ifndef GQC_COMMANDS_QC_COMMAND_H
#define GQC_COMMANDS_QC_COMMAND_H

#include <string>
#include <string_view>
#include <vector>

#include "command_context.h"

namespace gqc::commands {

struct QcOptions {
    /// @brief "id:technology:file[,file...]" specifications.
    std::vector<std::string> datasets;

    /// @brief Aggregate the runs into a report afterwards.
    bool aggregate = false;
};

/// @brief Dataset specification before the technology class is checked.
struct DatasetSpec {
    std::string id;
    std::string technology;
    std::vector<std::filesystem::path> files;
};

/// @brief Split "id:technology:file[,file...]".
[[nodiscard]] Result<DatasetSpec> parseDatasetSpec(std::string_view text);

class QcCommand {
public:
    QcCommand(CommandContext& context, QcOptions options);

    /// @return 0 (tool errors are reported per run), kUsageError or
    ///         kUnsupportedTechnology before any analyzer started, kCancelled,
    ///         or the aggregation result code.
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    QcOptions options_;
};

/// @brief Print one line per run: dataset, analyzer, outcome, detail.
void printRuns(const std::vector<QCRun>& runs);


}  // namespace gqc::commands

#endif  // GQC_COMMANDS_QC_COMMAND_H
