// =============================================================================
// genoqc - Aggregate Command
// =============================================================================
// Rebuilds QCRuns from per-tool outputs already under the QC directory and
// aggregates them. This is the retry path after a failed merge step.
// =============================================================================

#ifndef GQC_COMMANDS_AGGREGATE_COMMAND_H
#define GQC_COMMANDS_AGGREGATE_COMMAND_H

#include <string>
#include <vector>

#include "command_context.h"

namespace gqc::commands {

struct AggregateOptions {
    std::vector<std::string> datasetIds;
};

class AggregateCommand {
public:
    AggregateCommand(CommandContext& context, AggregateOptions options);

    /// @return 0 or kAggregationIncomplete.
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    AggregateOptions options_;
};

/// @brief Aggregate @p runs; every id of @p datasetIds appears in the report.
/// @return Exit code of the aggregation.
[[nodiscard]] int aggregateRuns(CommandContext& context,
                                const std::vector<QCRun>& runs,
                                const std::vector<std::string>& datasetIds);

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_AGGREGATE_COMMAND_H
