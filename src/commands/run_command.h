// =============================================================================
// genoqc - Run Command
// =============================================================================
// End-to-end batch: resolve → acquire → QC → aggregate.
//
// Datasets whose acquisition failed are not analyzed but still appear in the
// report with status "no-metrics".
// =============================================================================

#ifndef GQC_COMMANDS_RUN_COMMAND_H
#define GQC_COMMANDS_RUN_COMMAND_H

#include "command_context.h"

namespace gqc::commands {

struct RunOptions {
    DatasetSelection selection;
};

class RunCommand {
public:
    RunCommand(CommandContext& context, RunOptions options);

    /// @return The most severe outcome of the batch, in this order:
    ///         kCancelled, kPartialAcquisitionFailure, kAggregationIncomplete,
    ///         success. Tool errors show in the report, not in the exit code.
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    RunOptions options_;
};

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_RUN_COMMAND_H
