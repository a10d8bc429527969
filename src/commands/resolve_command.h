// =============================================================================
// genoqc - Resolve Command
// =============================================================================
// Prints the DatasetRefs an accession list or dataset sheet resolves to,
// without transferring any data.
// =============================================================================

#ifndef GQC_COMMANDS_RESOLVE_COMMAND_H
#define GQC_COMMANDS_RESOLVE_COMMAND_H

#include <string>
#include <vector>

#include "command_context.h"

namespace gqc::commands {

struct ResolveOptions {
    DatasetSelection selection;

    /// @brief Print JSON instead of a TSV table.
    bool jsonOutput = false;
};

class ResolveCommand {
public:
    ResolveCommand(CommandContext& context, ResolveOptions options);

    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    ResolveOptions options_;
};

/// @brief TSV rows (one per object) describing @p datasets, header included.
[[nodiscard]] std::string formatDatasetTable(const std::vector<DatasetRef>& datasets);

/// @brief JSON array describing @p datasets.
[[nodiscard]] std::string formatDatasetJson(const std::vector<DatasetRef>& datasets);

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_RESOLVE_COMMAND_H
