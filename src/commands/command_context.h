// =============================================================================
// genoqc - Command Context
// =============================================================================
// State shared by every subcommand: the batch configuration, the batch
// cancellation token and helpers to turn command-line dataset selections
// into resolved DatasetRefs and QC jobs.
// =============================================================================

#ifndef GQC_COMMANDS_COMMAND_CONTEXT_H
#define GQC_COMMANDS_COMMAND_CONTEXT_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gqc/acquire/acquisition_manager.h"
#include "gqc/common/cancellation.h"
#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"
#include "gqc/net/range_source.h"
#include "gqc/qc/tool_orchestrator.h"

namespace gqc::commands {

/// @brief Configuration and cancellation of one genoqc invocation.
struct CommandContext {
    Config config;
    CancellationTokenPtr cancellation = makeCancellationToken();

    /// @brief Source used for registry queries and transfers.
    net::RangeSourcePtr rangeSource;

    /// @brief The HTTP range source unless a test installed another one.
    [[nodiscard]] net::RangeSourcePtr source();
};

/// @brief Datasets named on the command line: accessions or a dataset sheet.
struct DatasetSelection {
    std::vector<std::string> accessions;
    std::filesystem::path sheet;

    /// @brief Technology class forced onto every resolved dataset ("" = derive).
    std::string technology;
};

/// @brief Resolve @p selection into DatasetRefs, with subset limits when enabled.
/// @return kUsageError when neither or both of accessions and sheet are given,
///         kInvalidArgument when short and long reads come from different
///         samples and that is not allowed.
[[nodiscard]] Result<std::vector<DatasetRef>> resolveSelection(CommandContext& context,
                                                               const DatasetSelection& selection);

/// @brief QC jobs for the datasets whose objects were all verified.
/// @note Datasets with failed objects are skipped with a warning.
[[nodiscard]] std::vector<qc::QCJob> qcJobsFor(const std::vector<DatasetRef>& datasets,
                                               const acquire::BatchAcquisitionResult& acquired);

/// @brief Log @p error and return its exit code.
int reportError(const Error& error);

/// @brief Route SIGINT/SIGTERM to @p token; a second signal terminates immediately.
void installCancellationHandlers(const CancellationTokenPtr& token);

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_COMMAND_CONTEXT_H
