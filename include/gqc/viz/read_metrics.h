// =============================================================================
// genoqc - Read Metric Extraction
// =============================================================================
// Streams a FASTQ file once and produces per-read metric series, each reduced
// by a StreamingSampler, plus whole-file summary statistics.
// =============================================================================

#ifndef GQC_VIZ_READ_METRICS_H
#define GQC_VIZ_READ_METRICS_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "gqc/common/error.h"
#include "gqc/io/fastq_parser.h"
#include "gqc/viz/sampling_reducer.h"

namespace gqc::viz {

/// @brief Per-read metrics available for sampling.
enum class ReadMetric : std::uint8_t {
    kLength = 0,
    kMeanQuality = 1,  ///< Arithmetic mean of Phred+33 scores
    kGcPercent = 2,    ///< G+C share of called bases (N excluded), 0..100
};

[[nodiscard]] std::string_view readMetricToString(ReadMetric metric) noexcept;

/// @brief Parse "length", "mean_quality" or "gc_percent".
[[nodiscard]] Result<ReadMetric> parseReadMetric(std::string_view name);

/// @brief Whole-file statistics.
struct ReadSummary {
    std::uint64_t readCount = 0;
    std::uint64_t totalBases = 0;
    std::uint64_t minLength = 0;
    std::uint64_t maxLength = 0;
    double meanLength = 0.0;
    std::uint64_t n50 = 0;

    [[nodiscard]] std::string toJson() const;
};

/// @brief Output of one extraction pass.
struct ReadMetrics {
    ReadSummary summary;
    std::map<ReadMetric, SampledSeries> series;
};

/// @brief Per-read values of one record.
[[nodiscard]] double readMetricValue(ReadMetric metric, const io::FastqRecord& record) noexcept;

class ReadMetricsExtractor {
public:
    /// @throws GQCException (kInvalidArgument) when cap < 2.
    explicit ReadMetricsExtractor(std::size_t cap);

    /// @brief Stream @p fastq (plain, gzip, bzip2 or xz).
    [[nodiscard]] Result<ReadMetrics> extract(const std::filesystem::path& fastq) const;

    /// @brief Stream every remaining record of @p parser.
    /// @throws FormatError or IOError on malformed or unreadable input.
    [[nodiscard]] ReadMetrics extract(io::FastqParser& parser) const;

private:
    std::size_t cap_;
};

}  // namespace gqc::viz

#endif  // GQC_VIZ_READ_METRICS_H
