// =============================================================================
// genoqc - Sampling Reducer
// =============================================================================
// Reduces a metric series that is too large to plot into a bounded,
// representative subset of (position, value) points.
//
// Guarantees for cap >= 2:
// - the output never holds more than cap points
// - the global minimum and maximum of the series are always present
// - a series of at most cap points is returned unchanged
// - no randomness: equal input yields equal output
//
// sample() works on a series held in memory and also keeps percentile
// anchors. StreamingSampler accepts points one at a time in O(cap) memory.
// =============================================================================

#ifndef GQC_VIZ_SAMPLING_REDUCER_H
#define GQC_VIZ_SAMPLING_REDUCER_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "gqc/common/error.h"

namespace gqc::viz {

/// @brief One point of a metric series; position is the index in the source.
struct SamplePoint {
    std::uint64_t position = 0;
    double value = 0.0;

    bool operator==(const SamplePoint&) const = default;
};

/// @brief Bounded ordered subset of a metric series.
struct SampledSeries {
    /// @brief Metric label, e.g. "length". May be empty.
    std::string metric;

    /// @brief Number of points in the source series.
    std::uint64_t sourceLength = 0;

    /// @brief Sampled points, ordered by position.
    std::vector<SamplePoint> points;

    [[nodiscard]] std::size_t size() const noexcept { return points.size(); }

    /// @brief {"metric", "sourceLength", "points": [[position, value], ...]}
    [[nodiscard]] std::string toJson() const;

    bool operator==(const SampledSeries&) const = default;
};

/// @brief Percentiles of the value distribution kept by sample() when the cap allows.
inline constexpr double kPercentileAnchors[] = {0.05, 0.25, 0.50, 0.75, 0.95};

/// @brief Sample a series held in memory.
/// @return kInvalidArgument when cap < 2 and the series is longer than cap.
[[nodiscard]] Result<SampledSeries> sample(std::span<const double> series, std::size_t cap);

/// @brief Resample an already positioned series (e.g. a previous SampledSeries).
[[nodiscard]] Result<SampledSeries> sample(std::span<const SamplePoint> points, std::size_t cap);

// =============================================================================
// StreamingSampler
// =============================================================================

/// @brief Bounded-memory sampler fed one value at a time.
///
/// Keeps a grid of every stride-th point; the stride doubles whenever the grid
/// outgrows its budget. The first, last, minimum and maximum points are
/// tracked separately and always survive.
class StreamingSampler {
public:
    /// @throws GQCException (kInvalidArgument) when cap < 2.
    explicit StreamingSampler(std::size_t cap, std::string metric = {});

    void push(double value);

    /// @brief Number of values pushed so far.
    [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

    [[nodiscard]] std::uint64_t stride() const noexcept { return stride_; }

    /// @brief Current sample; the sampler may keep receiving values afterwards.
    [[nodiscard]] SampledSeries finish() const;

private:
    void compact();

    std::size_t cap_;
    std::size_t gridBudget_;
    std::string metric_;
    std::uint64_t count_ = 0;
    std::uint64_t stride_ = 1;
    std::vector<SamplePoint> grid_;
    std::optional<SamplePoint> first_;
    std::optional<SamplePoint> last_;
    std::optional<SamplePoint> min_;
    std::optional<SamplePoint> max_;
};

}  // namespace gqc::viz

#endif  // GQC_VIZ_SAMPLING_REDUCER_H
