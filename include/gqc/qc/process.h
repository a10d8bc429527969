// =============================================================================
// genoqc - External Process Runner
// =============================================================================
// Runs one external program with a wall-clock budget.
//
// The child gets its own process group, stdin from /dev/null and stdout and
// stderr appended to a log file. On timeout or cancellation the whole group
// receives SIGTERM, then SIGKILL after a grace period, so helpers spawned by
// the analyzer (FastQC's JVM, NanoPlot's workers) die with it.
// =============================================================================

#ifndef GQC_QC_PROCESS_H
#define GQC_QC_PROCESS_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gqc/common/cancellation.h"
#include "gqc/common/error.h"

namespace gqc::qc {

/// @brief What to run.
struct ProcessSpec {
    /// @brief Program; searched in PATH when it has no '/'.
    std::string executable;

    std::vector<std::string> args;

    /// @brief Working directory of the child; empty keeps the parent's.
    std::filesystem::path workingDir;

    /// @brief Receives stdout and stderr; empty discards them.
    std::filesystem::path logPath;

    /// @brief Wall-clock budget; zero means unlimited.
    std::chrono::milliseconds timeout{0};

    /// @brief Delay between SIGTERM and SIGKILL.
    std::chrono::milliseconds killGrace{2000};
};

/// @brief How the child ended.
struct ProcessResult {
    /// @brief Exit status, when the child exited normally.
    std::optional<int> exitCode;

    /// @brief Terminating signal, when the child was killed.
    std::optional<int> termSignal;

    /// @brief Terminated because the budget ran out.
    bool timedOut = false;

    /// @brief Terminated because the batch was cancelled.
    bool cancelled = false;

    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool succeeded() const noexcept {
        return exitCode && *exitCode == 0 && !timedOut && !cancelled;
    }

    /// @brief Short human-readable summary ("exit 1", "killed by signal 9 after timeout").
    [[nodiscard]] std::string describe() const;
};

/// @brief Spawn @p spec and wait for it.
/// @param cancellation Optional batch token; polled while waiting.
/// @return ProcessResult, or kToolError when the program could not be started.
[[nodiscard]] Result<ProcessResult> runProcess(const ProcessSpec& spec,
                                               const CancellationToken* cancellation = nullptr);

/// @brief Resolve @p executable against PATH.
[[nodiscard]] std::optional<std::filesystem::path> findExecutable(const std::string& executable);

}  // namespace gqc::qc

#endif  // GQC_QC_PROCESS_H
