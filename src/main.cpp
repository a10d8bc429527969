// =============================================================================
// genoqc - Genomic Data Acquisition and QC Orchestration
// =============================================================================
// Main entry point for the genoqc command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: resolve, discover, acquire, qc, aggregate, sample, run
// - Global options: threads, verbosity, log file, directories
// - Every configuration value as an option, also readable from --config
//   (INI or TOML)
// - SIGINT/SIGTERM as batch cancellation
// =============================================================================

#include <CLI/CLI.hpp>
#include <tbb/global_control.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "commands/acquire_command.h"
#include "commands/aggregate_command.h"
#include "commands/command_context.h"
#include "commands/discover_command.h"
#include "commands/qc_command.h"
#include "commands/resolve_command.h"
#include "commands/run_command.h"
#include "commands/sample_command.h"
#include "gqc/common/error.h"
#include "gqc/common/logger.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "genoqc: resumable acquisition of public sequencing runs and orchestration of\n"
    "FastQC / NanoPlot quality control with a consolidated, MultiQC-style report.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logLevel;  // overrides -v / -q when set
    std::string logFile;
};

GlobalOptions gOptions;
gqc::commands::CommandContext gContext;

gqc::commands::ResolveOptions gResolveOpts;
gqc::commands::DiscoverOptions gDiscoverOpts;
gqc::commands::AcquireOptions gAcquireOpts;
gqc::commands::QcOptions gQcOpts;
gqc::commands::AggregateOptions gAggregateOpts;
gqc::commands::SampleOptions gSampleOpts;
gqc::commands::RunOptions gRunOpts;

// =============================================================================
// Configuration Options
// =============================================================================

void addConfigOptions(CLI::App& app, gqc::Config& config) {
    const std::string transfer = "Transfer";
    app.add_option("--connect-timeout", config.transfer.connectTimeoutSec,
                   "TCP connect timeout (seconds)")
        ->group(transfer)
        ->capture_default_str();
    app.add_option("--read-timeout", config.transfer.readTimeoutSec,
                   "Socket read timeout (seconds)")
        ->group(transfer)
        ->capture_default_str();
    app.add_option("--attempt-timeout", config.transfer.attemptTimeoutSec,
                   "Wall-clock limit of one transfer attempt (seconds)")
        ->group(transfer)
        ->capture_default_str();
    app.add_option("--progress-bytes", config.transfer.progressIntervalBytes,
                   "Report progress every N bytes")
        ->group(transfer)
        ->capture_default_str();
    app.add_option("--progress-interval-ms", config.transfer.progressIntervalMs,
                   "Report progress at least this often (ms)")
        ->group(transfer)
        ->capture_default_str();
    app.add_option("--hash-buffer", config.transfer.hashBufferSize,
                   "Checksum read buffer (bytes)")
        ->group(transfer)
        ->capture_default_str();
    app.add_option("--user-agent", config.transfer.userAgent, "HTTP User-Agent")
        ->group(transfer)
        ->capture_default_str();
    app.add_flag("--verify-tls,!--no-verify-tls", config.transfer.verifyTls,
                 "Verify server certificates")
        ->group(transfer);

    const std::string resolver = "Resolution";
    app.add_option("--ena-url", config.resolver.enaFilereportUrl, "ENA filereport endpoint")
        ->group(resolver)
        ->capture_default_str();
    app.add_option("--ncbi-url", config.resolver.ncbiRuninfoUrl, "NCBI SRA runinfo endpoint")
        ->group(resolver)
        ->capture_default_str();
    app.add_option("--ena-search-url", config.resolver.enaSearchUrl, "ENA search endpoint")
        ->group(resolver)
        ->capture_default_str();
    app.add_option("--search-limit", config.resolver.searchLimit, "Runs fetched per search")
        ->group(resolver)
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_flag("--allow-sample-mismatch", config.resolver.allowSampleMismatch,
                 "Combine short and long reads from different samples")
        ->group(resolver);

    const std::string subset = "Subsets";
    app.add_flag("--subset", config.subset.enabled,
                 "Download only the leading reads of each file")
        ->group(subset);
    app.add_option("--subset-mb", config.subset.shortReadMb,
                   "Compressed size kept per short-read file (MiB)")
        ->group(subset)
        ->capture_default_str();
    app.add_option("--subset-mb-long", config.subset.longReadMb,
                   "Compressed size kept per long-read file (MiB)")
        ->group(subset)
        ->capture_default_str();
    app.add_option("--subset-reads", config.subset.reads,
                   "Reads kept per file (replaces the size limits)")
        ->group(subset);

    const std::string discovery = "Discovery";
    app.add_option("--strategy", config.discovery.strategy,
                   "Library strategy of discovered runs ('' = any)")
        ->group(discovery)
        ->capture_default_str();
    app.add_option("--coverage-short", config.discovery.shortCoverage,
                   "Target depth of the short-read dataset")
        ->group(discovery)
        ->capture_default_str();
    app.add_option("--coverage-long", config.discovery.longCoverage,
                   "Target depth of the long-read dataset")
        ->group(discovery)
        ->capture_default_str();
    app.add_option("--coverage-margin", config.discovery.coverageMargin,
                   "Factor applied to genome size x coverage")
        ->group(discovery)
        ->capture_default_str();
    app.add_option("--genome-size", config.discovery.genomeSize,
                   "Genome size in bases (default: looked up by organism)")
        ->group(discovery);

    const std::string acquisition = "Acquisition";
    app.add_option("--data-dir", config.acquisition.dataDir, "Directory for downloaded data")
        ->group(acquisition)
        ->capture_default_str();
    app.add_option("--max-attempts", config.acquisition.maxAttempts,
                   "Attempts per object before it is marked failed")
        ->group(acquisition)
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--initial-backoff-ms", config.acquisition.initialBackoffMs,
                   "Delay after the first failed attempt (ms)")
        ->group(acquisition)
        ->capture_default_str();
    app.add_option("--backoff-multiplier", config.acquisition.backoffMultiplier,
                   "Growth factor of the retry delay")
        ->group(acquisition)
        ->capture_default_str();
    app.add_option("--max-backoff-ms", config.acquisition.maxBackoffMs,
                   "Upper bound of the retry delay (ms)")
        ->group(acquisition)
        ->capture_default_str();
    app.add_option("--max-transfers", config.acquisition.maxConcurrentTransfers,
                   "Concurrent transfers")
        ->group(acquisition)
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_flag("--manifest,!--no-manifest", config.acquisition.writeManifest,
                 "Append verified objects to manifest.tsv")
        ->group(acquisition);

    const std::string orchestrator = "Quality control";
    app.add_option("--qc-dir", config.orchestrator.qcDir, "Directory for analyzer outputs")
        ->group(orchestrator)
        ->capture_default_str();
    app.add_option("--short-read-tool", config.orchestrator.shortRead.executable,
                   "Short-read analyzer executable")
        ->group(orchestrator)
        ->capture_default_str();
    app.add_option("--short-read-args", config.orchestrator.shortRead.extraArgs,
                   "Extra short-read analyzer arguments")
        ->group(orchestrator)
        ->allow_extra_args(false);
    app.add_option("--long-read-tool", config.orchestrator.longRead.executable,
                   "Long-read analyzer executable")
        ->group(orchestrator)
        ->capture_default_str();
    app.add_option("--long-read-args", config.orchestrator.longRead.extraArgs,
                   "Extra long-read analyzer arguments")
        ->group(orchestrator)
        ->allow_extra_args(false);
    app.add_option("--tool-timeout", config.orchestrator.toolTimeoutSec,
                   "Analyzer timeout (seconds)")
        ->group(orchestrator)
        ->capture_default_str();
    app.add_option("--kill-grace-ms", config.orchestrator.killGraceMs,
                   "Delay between SIGTERM and SIGKILL (ms)")
        ->group(orchestrator)
        ->capture_default_str();
    app.add_option("--max-tools", config.orchestrator.maxConcurrentTools,
                   "Concurrent analyzer processes")
        ->group(orchestrator)
        ->capture_default_str()
        ->check(CLI::PositiveNumber);

    const std::string aggregator = "Aggregation";
    app.add_option("--report-dir", config.aggregator.reportDir, "Directory for reports")
        ->group(aggregator)
        ->capture_default_str();
    app.add_option("--merge-program", config.aggregator.mergeProgram,
                   "Report merge program ('' = built-in metrics table)")
        ->group(aggregator)
        ->capture_default_str();
    app.add_option("--merge-args", config.aggregator.mergeArgs, "Extra merge program arguments")
        ->group(aggregator)
        ->allow_extra_args(false);
    app.add_option("--merge-timeout", config.aggregator.mergeTimeoutSec,
                   "Merge program timeout (seconds)")
        ->group(aggregator)
        ->capture_default_str();

    app.add_option("--cap", config.sampling.cap, "Maximum points of a sampled series")
        ->group("Sampling")
        ->capture_default_str();
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void addSelectionOptions(CLI::App* command, gqc::commands::DatasetSelection& selection) {
    command->add_option("accessions", selection.accessions, "Run, experiment or study accessions");
    command->add_option("--sheet", selection.sheet, "Dataset sheet (TSV)")
        ->check(CLI::ExistingFile);
    command->add_option("--technology", selection.technology,
                        "Force the technology class (short-read or long-read)");
}

void setupResolveCommand(CLI::App& app) {
    auto* resolve = app.add_subcommand("resolve", "Resolve accessions into remote objects");
    addSelectionOptions(resolve, gResolveOpts.selection);
    resolve->add_flag("--json", gResolveOpts.jsonOutput, "Output as JSON");
}

void setupDiscoverCommand(CLI::App& app) {
    auto* discover = app.add_subcommand(
        "discover", "Find and acquire runs of an organism for a target coverage");
    discover->add_option("organism", gDiscoverOpts.organism, "Scientific name")->required();
    discover->add_option("--technology", gDiscoverOpts.technology, "short, long or both")
        ->capture_default_str()
        ->check(CLI::IsMember({"short", "long", "both", "short-read", "long-read"},
                              CLI::ignore_case));
    discover->add_flag("--dry-run", gDiscoverOpts.dryRun, "Print the plan without downloading");
}

void setupAcquireCommand(CLI::App& app) {
    auto* acquire = app.add_subcommand("acquire", "Download and verify datasets");
    addSelectionOptions(acquire, gAcquireOpts.selection);
}

void setupQcCommand(CLI::App& app) {
    auto* qc = app.add_subcommand("qc", "Run QC analyzers over local read files");
    qc->add_option("-d,--dataset", gQcOpts.datasets, "id:technology:file[,file...]")
        ->required();
    qc->add_flag("--aggregate", gQcOpts.aggregate, "Aggregate the runs into a report");
}

void setupAggregateCommand(CLI::App& app) {
    auto* aggregate =
        app.add_subcommand("aggregate", "Aggregate existing analyzer outputs into a report");
    aggregate->add_option("--datasets", gAggregateOpts.datasetIds, "Dataset ids")->required();
}

void setupSampleCommand(CLI::App& app) {
    auto* sample = app.add_subcommand("sample", "Emit a bounded sample of a metric series");
    sample->add_option("-i,--input", gSampleOpts.input, "FASTQ file (plain, gz, bz2 or xz)")
        ->check(CLI::ExistingFile);
    sample->add_option("--values", gSampleOpts.values, "Text file, one value per line")
        ->check(CLI::ExistingFile);
    sample->add_option("--metric", gSampleOpts.metric, "Read metric")
        ->capture_default_str()
        ->check(CLI::IsMember({"length", "mean_quality", "gc_percent"}));
    sample->add_option("-o,--output", gSampleOpts.output, "Output file (default: stdout)");
}

void setupRunCommand(CLI::App& app) {
    auto* run = app.add_subcommand("run", "Acquire, analyze and aggregate in one batch");
    addSelectionOptions(run, gRunOpts.selection);
}

gqc::log::Level logLevel() {
    if (auto level = gqc::log::levelFromString(gOptions.logLevel)) {
        return *level;
    }
    if (gOptions.quiet) {
        return gqc::log::Level::kError;
    }
    if (gOptions.verbosity >= 2) {
        return gqc::log::Level::kTrace;
    }
    if (gOptions.verbosity >= 1) {
        return gqc::log::Level::kDebug;
    }
    return gqc::log::Level::kInfo;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from an INI or TOML file");

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Worker threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");
    app.add_option("--log-level", gOptions.logLevel, "trace, debug, info, warning, error or critical")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error", "critical"},
                              CLI::ignore_case));
    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    addConfigOptions(app, gContext.config);

    setupResolveCommand(app);
    setupDiscoverCommand(app);
    setupAcquireCommand(app);
    setupQcCommand(app);
    setupAggregateCommand(app);
    setupSampleCommand(app);
    setupRunCommand(app);

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit 0; every other parse failure is a usage error.
        const int cliCode = app.exit(e);
        return cliCode == 0 ? EXIT_SUCCESS : gqc::toExitCode(gqc::ErrorCode::kUsageError);
    }

    try {
        gqc::log::init(gOptions.logFile, logLevel());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (auto valid = gContext.config.validate(); !valid) {
        int code = gqc::commands::reportError(
            gqc::Error{gqc::ErrorCode::kUsageError, valid.error().message()});
        gqc::log::shutdown();
        return code;
    }

    std::unique_ptr<tbb::global_control> threadLimit;
    if (gOptions.threads > 0) {
        threadLimit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<std::size_t>(gOptions.threads));
    }

    gqc::commands::installCancellationHandlers(gContext.cancellation);

    int exitCode = EXIT_SUCCESS;
    try {
        using namespace gqc::commands;
        if (app.got_subcommand("resolve")) {
            exitCode = ResolveCommand(gContext, gResolveOpts).execute();
        } else if (app.got_subcommand("discover")) {
            exitCode = DiscoverCommand(gContext, gDiscoverOpts).execute();
        } else if (app.got_subcommand("acquire")) {
            exitCode = AcquireCommand(gContext, gAcquireOpts).execute();
        } else if (app.got_subcommand("qc")) {
            exitCode = QcCommand(gContext, gQcOpts).execute();
        } else if (app.got_subcommand("aggregate")) {
            exitCode = AggregateCommand(gContext, gAggregateOpts).execute();
        } else if (app.got_subcommand("sample")) {
            exitCode = SampleCommand(gContext, gSampleOpts).execute();
        } else if (app.got_subcommand("run")) {
            exitCode = RunCommand(gContext, gRunOpts).execute();
        }
    } catch (const gqc::GQCException& ex) {
        GQC_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        GQC_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = gqc::toExitCode(gqc::ErrorCode::kInternalError);
    }

    gqc::log::shutdown();
    return exitCode;
}
