// =============================================================================
// genoqc - Sample Command Implementation
// =============================================================================

#include "sample_command.h"

#include <format>
#include <fstream>
#include <iostream>
#include <span>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"
#include "gqc/viz/read_metrics.h"
#include "gqc/viz/sampling_reducer.h"

namespace gqc::commands {

Result<std::vector<double>> readValueFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return makeError(ErrorCode::kIOError, "cannot open '{}'", path.string());
    }
    std::vector<double> values;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        const auto text = trim(line);
        if (text.empty() || text.starts_with('#')) {
            continue;
        }
        auto value = parseNumber(text);
        if (!value) {
            return makeError(ErrorCode::kFormatError, "{}:{}: '{}' is not a number",
                             path.string(), lineNumber, text);
        }
        values.push_back(*value);
    }
    return values;
}

SampleCommand::SampleCommand(CommandContext& context, SampleOptions options)
    : context_(context), options_(std::move(options)) {}

int SampleCommand::execute() {
    const std::size_t cap = context_.config.sampling.cap;
    if (options_.input.empty() == options_.values.empty()) {
        return reportError(Error{ErrorCode::kUsageError, "give exactly one of --input or --values"});
    }

    viz::SampledSeries series;
    if (!options_.values.empty()) {
        auto values = readValueFile(options_.values);
        if (!values) {
            return reportError(values.error());
        }
        auto sampled = viz::sample(std::span<const double>(*values), cap);
        if (!sampled) {
            return reportError(sampled.error());
        }
        series = std::move(*sampled);
        series.metric = options_.values.stem().string();
    } else {
        auto metric = viz::parseReadMetric(options_.metric);
        if (!metric) {
            return reportError(metric.error());
        }
        auto extracted = viz::ReadMetricsExtractor(cap).extract(options_.input);
        if (!extracted) {
            return reportError(extracted.error());
        }
        GQC_LOG_INFO("Summary: {}", extracted->summary.toJson());
        series = std::move(extracted->series.at(*metric));
    }
    GQC_LOG_INFO("Sampled {} of {} point(s) for '{}'", series.size(), series.sourceLength,
                 series.metric);

    if (options_.output.empty()) {
        std::cout << series.toJson() << '\n';
        return toExitCode(ErrorCode::kSuccess);
    }
    std::ofstream out(options_.output, std::ios::trunc);
    if (!out || !(out << series.toJson() << '\n')) {
        return reportError(
            Error{ErrorCode::kIOError, std::format("cannot write '{}'", options_.output.string())});
    }
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace gqc::commands
