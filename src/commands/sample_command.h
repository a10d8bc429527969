// =============================================================================
// genoqc - Sample Command
// =============================================================================
// Emits a bounded SampledSeries as JSON, either from a per-read metric of a
// FASTQ file or from a plain list of values (one number per line).
// =============================================================================

#ifndef GQC_COMMANDS_SAMPLE_COMMAND_H
#define GQC_COMMANDS_SAMPLE_COMMAND_H

#include <filesystem>
#include <string>
#include <vector>

#include "command_context.h"

namespace gqc::commands {

struct SampleOptions {
    /// @brief FASTQ input (plain or compressed).
    std::filesystem::path input;

    /// @brief Text file with one value per line; alternative to input.
    std::filesystem::path values;

    /// @brief Read metric to sample from a FASTQ input.
    std::string metric = "length";

    /// @brief Output file; empty writes to stdout.
    std::filesystem::path output;
};

class SampleCommand {
public:
    SampleCommand(CommandContext& context, SampleOptions options);

    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    CommandContext& context_;
    SampleOptions options_;
};

/// @brief Read one number per line; blank lines and '#' comments are skipped.
[[nodiscard]] Result<std::vector<double>> readValueFile(const std::filesystem::path& path);

}  // namespace gqc::commands

#endif  // GQC_COMMANDS_SAMPLE_COMMAND_H
