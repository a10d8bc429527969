// =============================================================================
// genoqc - QC Metric Parsers
// =============================================================================
// Normalizes analyzer reports into flat metric maps.
//
// Supported outputs:
// - FastQC fastqc_data.txt: ">>Basic Statistics" measures plus one
//   pass/warn/fail status per module
// - NanoPlot NanoStats.txt: "key: value" layout and the tab-separated
//   "Metrics<TAB>dataset" layout; thousands separators are removed
//
// Metric names are lower-case with '_' separators ("%GC" → "percent_gc").
// =============================================================================

#ifndef GQC_QC_METRICS_PARSER_H
#define GQC_QC_METRICS_PARSER_H

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc::qc {

/// @brief Metric name → value, ordered by name.
using MetricMap = std::map<std::string, std::string>;

/// @brief Normalize a report label into a metric name.
[[nodiscard]] std::string normalizeMetricName(std::string_view label);

/// @brief Parse the text of a FastQC fastqc_data.txt.
[[nodiscard]] Result<MetricMap> parseFastqcData(std::string_view text);

/// @brief Parse the text of a NanoPlot NanoStats.txt.
[[nodiscard]] Result<MetricMap> parseNanoStats(std::string_view text);

/// @brief Collect every report of one analyzer output directory.
/// @return Keys "<analyzerName>.<input stem>.<metric>"; empty when no report was found.
[[nodiscard]] Result<MetricMap> collectMetrics(AnalyzerKind kind,
                                               std::string_view analyzerName,
                                               const std::filesystem::path& outputDir);

}  // namespace gqc::qc

#endif  // GQC_QC_METRICS_PARSER_H
