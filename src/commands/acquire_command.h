// =============================================================================
// genoqc - Acquire Command
// =============================================================================
// Resolves datasets and downloads every object into the data directory,
// resuming partial files left by earlier runs.
// =============================================================================

#ifndef GQC_COMMANDS_ACQUIRE_COMMAND_H
#define GQC_COMMANDS_ACQUIRE_COMMAND_H

#include <memory>
#include <vector>

#include "command_context.h"

namespace gqc::commands {

struct AcquireOptions {
    DatasetSelection selection;
};

class AcquireCommand {
public:
    AcquireCommand(CommandContext& context, AcquireOptions options);

    /// @return 0, kPartialAcquisitionFailure when any object failed, or
    ///         kCancelled when the batch was interrupted.
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    AcquireOptions options_;
};

/// @brief Manager built from the context's configuration, logging progress.
[[nodiscard]] std::unique_ptr<acquire::AcquisitionManager> makeAcquisitionManager(
    CommandContext& context);

/// @brief Acquire @p datasets with the context's configuration and log a summary.
[[nodiscard]] acquire::BatchAcquisitionResult acquireDatasets(
    CommandContext& context, const std::vector<DatasetRef>& datasets);

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_ACQUIRE_COMMAND_H
