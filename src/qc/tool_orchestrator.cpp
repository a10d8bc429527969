// =============================================================================
// genoqc - Tool Orchestrator Implementation
// =============================================================================

#include "gqc/qc/tool_orchestrator.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "gqc/common/logger.h"

namespace gqc::qc {

// =============================================================================
// Dispatch
// =============================================================================

std::vector<AnalyzerKind> analyzersFor(ReadTechnology technology) {
    switch (technology) {
        case ReadTechnology::kShortRead:
            return {AnalyzerKind::kShortRead};
        case ReadTechnology::kLongRead:
            return {AnalyzerKind::kLongRead};
    }
    return {};
}

// =============================================================================
// Run Records
// =============================================================================

namespace {

Result<QCOutcome> parseOutcome(std::string_view text) {
    for (QCOutcome outcome : {QCOutcome::kOk, QCOutcome::kToolError, QCOutcome::kNotRun}) {
        if (qcOutcomeToString(outcome) == text) {
            return outcome;
        }
    }
    return makeError(ErrorCode::kFormatError, "unknown outcome '{}'", text);
}

}  // namespace

std::filesystem::path runRecordPath(const std::filesystem::path& outputDir,
                                    std::string_view analyzerName) {
    return outputDir / std::format("{}{}", analyzerName, kRunRecordSuffix);
}

VoidResult writeRunRecord(const QCRun& run) {
    nlohmann::json json;
    json["dataset"] = run.datasetId;
    json["analyzer"] = run.analyzerName;
    json["outcome"] = std::string(qcOutcomeToString(run.outcome));
    json["exit_code"] = run.exitCode ? nlohmann::json(*run.exitCode) : nlohmann::json();
    json["term_signal"] = run.termSignal ? nlohmann::json(*run.termSignal) : nlohmann::json();
    json["timed_out"] = run.timedOut;
    json["cancelled"] = run.cancelled;
    json["message"] = run.message;
    json["duration_ms"] = run.duration.count();
    json["inputs"] = nlohmann::json::array();
    for (const auto& input : run.inputs) {
        json["inputs"].push_back(input.string());
    }

    const auto path = runRecordPath(run.outputDir, run.analyzerName);
    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return makeError(ErrorCode::kIOError, "cannot open '{}' for writing", temp.string());
        }
        out << json.dump(2) << '\n';
        if (!out.flush()) {
            return makeError(ErrorCode::kIOError, "write to '{}' failed", temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return makeError(ErrorCode::kIOError, "cannot rename '{}': {}", temp.string(),
                         ec.message());
    }
    return {};
}

Result<QCRun> readRunRecord(const std::filesystem::path& outputDir,
                            std::string_view analyzerName) {
    const auto path = runRecordPath(outputDir, analyzerName);
    std::ifstream in(path);
    if (!in) {
        return makeError(ErrorCode::kIOError, "cannot open '{}'", path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();

    try {
        const auto json = nlohmann::json::parse(text.str());
        auto outcome = parseOutcome(json.at("outcome").get<std::string>());
        if (!outcome) {
            return makeError(ErrorCode::kFormatError, "{}: {}", path.string(),
                             outcome.error().message());
        }

        QCRun run;
        run.datasetId = json.at("dataset").get<std::string>();
        run.analyzerName = json.at("analyzer").get<std::string>();
        run.outcome = *outcome;
        if (!json.at("exit_code").is_null()) {
            run.exitCode = json.at("exit_code").get<int>();
        }
        if (!json.at("term_signal").is_null()) {
            run.termSignal = json.at("term_signal").get<int>();
        }
        run.timedOut = json.at("timed_out").get<bool>();
        run.cancelled = json.at("cancelled").get<bool>();
        run.message = json.at("message").get<std::string>();
        run.duration = std::chrono::milliseconds(json.value("duration_ms", std::int64_t{0}));
        for (const auto& input : json.at("inputs")) {
            run.inputs.emplace_back(input.get<std::string>());
        }
        run.outputDir = outputDir;
        run.logPath = outputDir / std::format("{}.log", analyzerName);
        return run;
    } catch (const nlohmann::json::exception& e) {
        return makeError(ErrorCode::kFormatError, "malformed run record '{}': {}", path.string(),
                         e.what());
    }
}

ErrorCode batchStatus(const std::vector<QCRun>& runs) noexcept {
    for (const auto& run : runs) {
        if (run.cancelled) {
            return ErrorCode::kCancelled;
        }
    }
    return ErrorCode::kSuccess;
}

// =============================================================================
// ToolOrchestrator::Impl
// =============================================================================

class ToolOrchestrator::Impl {
public:
    explicit Impl(std::size_t maxConcurrent) : arena_(static_cast<int>(maxConcurrent)) {}

    tbb::task_arena& arena() noexcept { return arena_; }

private:
    tbb::task_arena arena_;
};

// =============================================================================
// ToolOrchestrator
// =============================================================================

ToolOrchestrator::ToolOrchestrator(OrchestratorConfig config, CancellationTokenPtr cancellation)
    : config_(std::move(config)),
      cancellation_(cancellation ? std::move(cancellation) : makeCancellationToken()) {
    unwrapOrThrow(config_.validate());
    impl_ = std::make_unique<Impl>(config_.maxConcurrentTools);
}

ToolOrchestrator::~ToolOrchestrator() = default;

std::filesystem::path ToolOrchestrator::outputDirFor(std::string_view datasetId,
                                                     std::string_view analyzerName) const {
    return config_.qcDir / datasetId / analyzerName;
}

ProcessSpec ToolOrchestrator::commandFor(AnalyzerKind kind,
                                         const QCInput& input,
                                         const std::filesystem::path& outputDir) const {
    const AnalyzerConfig& analyzer = config_.analyzer(kind);

    ProcessSpec spec;
    spec.executable = analyzer.executable;
    spec.logPath = outputDir / std::format("{}.log", analyzer.name);
    spec.timeout = std::chrono::seconds(config_.toolTimeoutSec);
    spec.killGrace = std::chrono::milliseconds(config_.killGraceMs);

    std::vector<std::string> files;
    for (const auto& file : input.files) {
        files.push_back(std::filesystem::absolute(file).string());
    }
    const std::string outDir = std::filesystem::absolute(outputDir).string();

    switch (kind) {
        case AnalyzerKind::kShortRead:
            // fastqc --extract --quiet --outdir DIR [extra] FILE...
            spec.args = {"--extract", "--quiet", "--outdir", outDir};
            spec.args.insert(spec.args.end(), analyzer.extraArgs.begin(),
                             analyzer.extraArgs.end());
            spec.args.insert(spec.args.end(), files.begin(), files.end());
            break;
        case AnalyzerKind::kLongRead:
            // NanoPlot --fastq FILE... --outdir DIR --prefix ID_ [extra]
            spec.args = {"--fastq"};
            spec.args.insert(spec.args.end(), files.begin(), files.end());
            spec.args.insert(spec.args.end(),
                             {"--outdir", outDir, "--prefix", std::format("{}_", input.datasetId)});
            spec.args.insert(spec.args.end(), analyzer.extraArgs.begin(),
                             analyzer.extraArgs.end());
            break;
    }
    return spec;
}

QCRun ToolOrchestrator::invoke(AnalyzerKind kind, const QCInput& input) const {
    const AnalyzerConfig& analyzer = config_.analyzer(kind);

    QCRun run;
    run.datasetId = input.datasetId;
    run.analyzer = kind;
    run.analyzerName = analyzer.name;
    run.inputs = input.files;
    run.outputDir = outputDirFor(input.datasetId, analyzer.name);
    run.logPath = run.outputDir / std::format("{}.log", analyzer.name);

    if (cancellation_->isCancelled()) {
        run.outcome = QCOutcome::kNotRun;
        run.cancelled = true;
        run.message = "batch cancelled before start";
        return run;
    }
    if (input.files.empty()) {
        run.outcome = QCOutcome::kNotRun;
        run.message = "no input files";
        return run;
    }
    for (const auto& file : input.files) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            run.outcome = QCOutcome::kNotRun;
            run.message = std::format("input '{}' not found", file.string());
            GQC_LOG_WARNING("{}/{}: {}", input.datasetId, analyzer.name, run.message);
            // Outputs of an earlier run no longer match the inputs.
            std::filesystem::remove_all(run.outputDir, ec);
            return run;
        }
    }

    std::error_code ec;
    std::filesystem::remove_all(run.outputDir, ec);
    if (!ec) {
        std::filesystem::create_directories(run.outputDir, ec);
    }
    if (ec) {
        run.outcome = QCOutcome::kToolError;
        run.message = std::format("cannot prepare '{}': {}", run.outputDir.string(), ec.message());
        GQC_LOG_ERROR("{}/{}: {}", input.datasetId, analyzer.name, run.message);
        return run;
    }

    GQC_LOG_INFO("Running {} on {} ({} file(s))", analyzer.name, input.datasetId,
                 input.files.size());
    auto result = runProcess(commandFor(kind, input, run.outputDir), cancellation_.get());
    if (!result) {
        run.outcome = QCOutcome::kToolError;
        run.message = result.error().message();
        GQC_LOG_ERROR("{}/{}: {}", input.datasetId, analyzer.name, run.message);
    } else {
        run.exitCode = result->exitCode;
        run.termSignal = result->termSignal;
        run.timedOut = result->timedOut;
        run.cancelled = result->cancelled;
        run.duration = result->duration;
        if (result->succeeded()) {
            run.outcome = QCOutcome::kOk;
            GQC_LOG_INFO("{}/{}: ok in {} ms", input.datasetId, analyzer.name,
                         result->duration.count());
        } else {
            run.outcome = QCOutcome::kToolError;
            run.message = result->describe();
            GQC_LOG_WARNING("{}/{}: tool error ({}), see {}", input.datasetId, analyzer.name,
                            run.message, run.logPath.string());
        }
    }

    if (auto stored = writeRunRecord(run); !stored) {
        GQC_LOG_WARNING("{}/{}: {}", input.datasetId, analyzer.name, stored.error().message());
    }
    return run;
}

Result<std::vector<QCRun>> ToolOrchestrator::run(const QCInput& input,
                                                 std::string_view technologyClass) {
    auto technology = parseReadTechnology(technologyClass);
    if (!technology) {
        GQC_LOG_ERROR("{}: {}", input.datasetId, technology.error().message());
        return std::unexpected(technology.error());
    }
    return run(input, *technology);
}

std::vector<QCRun> ToolOrchestrator::run(const QCInput& input, ReadTechnology technology) {
    return runBatch({QCJob{input, technology}});
}

std::vector<QCRun> ToolOrchestrator::runBatch(const std::vector<QCJob>& jobs) {
    struct Task {
        const QCInput* input;
        AnalyzerKind kind;
    };
    std::vector<Task> tasks;
    for (const auto& job : jobs) {
        for (AnalyzerKind kind : analyzersFor(job.technology)) {
            tasks.push_back(Task{&job.input, kind});
        }
    }

    std::vector<QCRun> runs(tasks.size());
    impl_->arena().execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, tasks.size(), 1),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  runs[i] = invoke(tasks[i].kind, *tasks[i].input);
                              }
                          });
    });
    return runs;
}

}  // namespace gqc::qc
