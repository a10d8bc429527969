// =============================================================================
// genoqc - Discover Command
// =============================================================================
// Searches ENA for sequencing runs of an organism and acquires enough of one
// short-read run and one long-read run to reach the target coverage.
//
// Candidates are tried in registry order; when a download fails the next
// candidate of the same technology is tried. Long-read candidates from the
// short-read run's sample are tried first.
// =============================================================================

#ifndef GQC_COMMANDS_DISCOVER_COMMAND_H
#define GQC_COMMANDS_DISCOVER_COMMAND_H

#include <string>
#include <string_view>
#include <vector>

#include "command_context.h"

namespace gqc::commands {

struct DiscoverOptions {
    std::string organism;

    /// @brief "short", "long" or "both".
    std::string technology = "both";

    /// @brief Print the plan without downloading.
    bool dryRun = false;
};

class DiscoverCommand {
public:
    DiscoverCommand(CommandContext& context, DiscoverOptions options);

    /// @return 0 when every requested technology was acquired, kCancelled,
    ///         kInvalidArgument on a sample mismatch that is not allowed, or
    ///         kPartialAcquisitionFailure when every candidate of a technology failed.
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    DiscoverOptions options_;
};

/// @brief Technology classes named by a --technology value of the discover command.
[[nodiscard]] Result<std::vector<ReadTechnology>> discoveryTechnologies(std::string_view value);

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_DISCOVER_COMMAND_H
