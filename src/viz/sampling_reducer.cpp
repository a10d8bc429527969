// =============================================================================
// genoqc - Sampling Reducer Implementation
// =============================================================================

#include "gqc/viz/sampling_reducer.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <set>

namespace gqc::viz {

namespace {

constexpr std::size_t kMinCap = 2;

/// @brief Index set that refuses to grow past its capacity.
class Selection {
public:
    explicit Selection(std::size_t capacity) : capacity_(capacity) {}

    void add(std::size_t index) {
        if (!full()) {
            indices_.insert(index);
        }
    }

    [[nodiscard]] bool full() const noexcept { return indices_.size() >= capacity_; }

    [[nodiscard]] const std::set<std::size_t>& indices() const noexcept { return indices_; }

private:
    std::size_t capacity_;
    std::set<std::size_t> indices_;
};

std::uint64_t sourceLengthOf(std::span<const SamplePoint> points) {
    return points.empty() ? 0 : points.back().position + 1;
}

Error capTooSmall(std::size_t cap) {
    return Error{ErrorCode::kInvalidArgument,
                 std::format("sample cap must be at least {}, got {}", kMinCap, cap)};
}

}  // namespace

// =============================================================================
// SampledSeries
// =============================================================================

std::string SampledSeries::toJson() const {
    nlohmann::json root;
    root["metric"] = metric;
    root["sourceLength"] = sourceLength;
    nlohmann::json data = nlohmann::json::array();
    for (const auto& point : points) {
        data.push_back({point.position, point.value});
    }
    root["points"] = std::move(data);
    return root.dump();
}

// =============================================================================
// Batch Sampling
// =============================================================================

Result<SampledSeries> sample(std::span<const double> series, std::size_t cap) {
    std::vector<SamplePoint> points;
    points.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        points.push_back(SamplePoint{i, series[i]});
    }
    return sample(std::span<const SamplePoint>(points), cap);
}

Result<SampledSeries> sample(std::span<const SamplePoint> points, std::size_t cap) {
    SampledSeries result;
    result.sourceLength = sourceLengthOf(points);

    const std::size_t n = points.size();
    if (n <= cap) {
        result.points.assign(points.begin(), points.end());
        return result;
    }
    if (cap < kMinCap) {
        return std::unexpected(capTooSmall(cap));
    }

    auto byValue = [&](std::size_t a, std::size_t b) { return points[a].value < points[b].value; };
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), byValue);

    Selection selection(cap);

    // Extrema first, then the series ends.
    selection.add(order.front());
    selection.add(order.back());
    selection.add(0);
    selection.add(n - 1);

    for (double percentile : kPercentileAnchors) {
        auto rank = static_cast<std::size_t>(std::llround(percentile * static_cast<double>(n - 1)));
        selection.add(order[rank]);
    }

    // Even stride over positions; a second, half-shifted pass fills the gaps
    // left by anchors that already sat on the first grid.
    for (std::size_t k = 0; k < cap && !selection.full(); ++k) {
        selection.add(k * n / cap);
    }
    for (std::size_t k = 0; k < cap && !selection.full(); ++k) {
        selection.add((2 * k + 1) * n / (2 * cap));
    }

    result.points.reserve(selection.indices().size());
    for (std::size_t index : selection.indices()) {
        result.points.push_back(points[index]);
    }
    return result;
}

// =============================================================================
// StreamingSampler
// =============================================================================

StreamingSampler::StreamingSampler(std::size_t cap, std::string metric)
    : cap_(cap), gridBudget_(cap > 4 ? cap - 4 : 0), metric_(std::move(metric)) {
    if (cap_ < kMinCap) {
        capTooSmall(cap_).throwException();
    }
    grid_.reserve(cap_ + 1);
}

void StreamingSampler::push(double value) {
    const SamplePoint point{count_++, value};

    if (!first_) {
        first_ = point;
    }
    last_ = point;
    if (!min_ || value < min_->value) {
        min_ = point;
    }
    if (!max_ || value > max_->value) {
        max_ = point;
    }

    if (count_ <= cap_) {
        grid_.push_back(point);
        return;
    }
    if (gridBudget_ == 0) {
        grid_.clear();
        return;
    }
    if (point.position % stride_ == 0) {
        grid_.push_back(point);
    }
    if (grid_.size() > gridBudget_) {
        compact();
    }
}

void StreamingSampler::compact() {
    while (grid_.size() > gridBudget_) {
        stride_ *= 2;
        std::erase_if(grid_, [this](const SamplePoint& p) { return p.position % stride_ != 0; });
    }
}

SampledSeries StreamingSampler::finish() const {
    SampledSeries result;
    result.metric = metric_;
    result.sourceLength = count_;

    if (count_ <= cap_) {
        result.points = grid_;
        return result;
    }

    // Priority order when the cap is too small for all four tracked points.
    std::vector<SamplePoint> tracked;
    for (const auto& point : {min_, max_, first_, last_}) {
        if (point && std::none_of(tracked.begin(), tracked.end(), [&](const SamplePoint& p) {
                return p.position == point->position;
            })) {
            tracked.push_back(*point);
        }
    }
    if (tracked.size() > cap_) {
        tracked.resize(cap_);
    }

    result.points = grid_;
    for (const auto& point : tracked) {
        if (std::none_of(result.points.begin(), result.points.end(),
                         [&](const SamplePoint& p) { return p.position == point.position; })) {
            result.points.push_back(point);
        }
    }
    std::sort(result.points.begin(), result.points.end(),
              [](const SamplePoint& a, const SamplePoint& b) { return a.position < b.position; });
    return result;
}

}  // namespace gqc::viz
