// =============================================================================
// genoqc - Read Metric Extraction Implementation
// =============================================================================

#include "gqc/viz/read_metrics.h"

#include <nlohmann/json.hpp>

#include <array>
#include <format>
#include <functional>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::viz {

namespace {

constexpr std::array kAllMetrics = {ReadMetric::kLength, ReadMetric::kMeanQuality,
                                    ReadMetric::kGcPercent};

/// @brief N50 from a length histogram (length → read count).
std::uint64_t computeN50(const std::map<std::uint64_t, std::uint64_t, std::greater<>>& histogram,
                         std::uint64_t totalBases) {
    std::uint64_t accumulated = 0;
    for (const auto& [length, count] : histogram) {
        accumulated += length * count;
        if (2 * accumulated >= totalBases) {
            return length;
        }
    }
    return 0;
}

}  // namespace

std::string_view readMetricToString(ReadMetric metric) noexcept {
    switch (metric) {
        case ReadMetric::kLength:
            return "length";
        case ReadMetric::kMeanQuality:
            return "mean_quality";
        case ReadMetric::kGcPercent:
            return "gc_percent";
    }
    return "unknown";
}

Result<ReadMetric> parseReadMetric(std::string_view name) {
    const std::string lowered = toLower(trim(name));
    for (ReadMetric metric : kAllMetrics) {
        if (lowered == readMetricToString(metric)) {
            return metric;
        }
    }
    return makeError(ErrorCode::kUsageError,
                     "unknown read metric '{}' (expected length, mean_quality or gc_percent)",
                     name);
}

std::string ReadSummary::toJson() const {
    nlohmann::json root;
    root["readCount"] = readCount;
    root["totalBases"] = totalBases;
    root["minLength"] = minLength;
    root["maxLength"] = maxLength;
    root["meanLength"] = meanLength;
    root["n50"] = n50;
    return root.dump();
}

double readMetricValue(ReadMetric metric, const io::FastqRecord& record) noexcept {
    switch (metric) {
        case ReadMetric::kLength:
            return static_cast<double>(record.length());
        case ReadMetric::kMeanQuality: {
            if (record.quality.empty()) {
                return 0.0;
            }
            std::uint64_t sum = 0;
            for (char c : record.quality) {
                sum += io::qualityToPhred(c);
            }
            return static_cast<double>(sum) / static_cast<double>(record.quality.size());
        }
        case ReadMetric::kGcPercent: {
            std::uint64_t gc = 0;
            std::uint64_t called = 0;
            for (char c : record.sequence) {
                switch (c) {
                    case 'G':
                    case 'C':
                    case 'g':
                    case 'c':
                        ++gc;
                        ++called;
                        break;
                    case 'N':
                    case 'n':
                        break;
                    default:
                        ++called;
                        break;
                }
            }
            return called == 0 ? 0.0 : 100.0 * static_cast<double>(gc) / static_cast<double>(called);
        }
    }
    return 0.0;
}

ReadMetricsExtractor::ReadMetricsExtractor(std::size_t cap) : cap_(cap) {
    if (cap_ < 2) {
        throw GQCException(ErrorCode::kInvalidArgument,
                           std::format("sample cap must be at least 2, got {}", cap_));
    }
}

Result<ReadMetrics> ReadMetricsExtractor::extract(const std::filesystem::path& fastq) const {
    return tryExecute([&] {
        io::FastqParser parser(fastq);
        auto metrics = extract(parser);
        GQC_LOG_INFO("{}: {} reads, {} bases, N50 {}", fastq.string(), metrics.summary.readCount,
                     metrics.summary.totalBases, metrics.summary.n50);
        return metrics;
    });
}

ReadMetrics ReadMetricsExtractor::extract(io::FastqParser& parser) const {
    std::map<ReadMetric, StreamingSampler> samplers;
    for (ReadMetric metric : kAllMetrics) {
        samplers.emplace(metric, StreamingSampler(cap_, std::string(readMetricToString(metric))));
    }
    std::map<std::uint64_t, std::uint64_t, std::greater<>> lengthHistogram;

    ReadSummary summary;
    parser.forEach([&](const io::FastqRecord& record) {
        for (auto& [metric, sampler] : samplers) {
            sampler.push(readMetricValue(metric, record));
        }
        ++lengthHistogram[record.length()];
        return true;
    });

    const auto& stats = parser.stats();
    summary.readCount = stats.totalRecords;
    summary.totalBases = stats.totalBases;
    if (stats.totalRecords > 0) {
        summary.minLength = stats.minLength;
        summary.maxLength = stats.maxLength;
        summary.meanLength = stats.averageLength();
        summary.n50 = computeN50(lengthHistogram, stats.totalBases);
    }

    ReadMetrics result;
    result.summary = summary;
    for (const auto& [metric, sampler] : samplers) {
        result.series.emplace(metric, sampler.finish());
    }
    return result;
}

}  // namespace gqc::viz
