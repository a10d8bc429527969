// =============================================================================
// genoqc - Sampling Reducer Property Tests
// =============================================================================
// Property-based tests for the bounded sampling of metric series.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <vector>

#include "gqc/viz/sampling_reducer.h"

namespace gqc::viz::test {

namespace {

/// @brief Values with deliberate ties so extrema are not unique.
rc::Gen<std::vector<double>> genSeries(std::size_t maxLength) {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, maxLength + 1), [](std::size_t n) {
        return rc::gen::container<std::vector<double>>(
            n, rc::gen::map(rc::gen::inRange(-500, 500),
                            [](int v) { return static_cast<double>(v) / 4.0; }));
    });
}

bool containsValue(const SampledSeries& sampled, double value) {
    return std::any_of(sampled.points.begin(), sampled.points.end(),
                       [value](const SamplePoint& p) { return p.value == value; });
}

bool isOrderedByPosition(const SampledSeries& sampled) {
    return std::is_sorted(sampled.points.begin(), sampled.points.end(),
                          [](const SamplePoint& a, const SamplePoint& b) {
                              return a.position < b.position;
                          }) &&
           std::adjacent_find(sampled.points.begin(), sampled.points.end(),
                              [](const SamplePoint& a, const SamplePoint& b) {
                                  return a.position == b.position;
                              }) == sampled.points.end();
}

}  // namespace

// =============================================================================
// Batch sampling
// =============================================================================

RC_GTEST_PROP(SamplingReducerProperty, NeverExceedsCapAndKeepsExtrema, ()) {
    const auto series = *genSeries(5000);
    const auto cap = *rc::gen::inRange<std::size_t>(2, 300);

    auto sampled = sample(series, cap);
    RC_ASSERT(sampled.has_value());
    RC_ASSERT(sampled->size() <= cap);
    RC_ASSERT(sampled->sourceLength == series.size());
    RC_ASSERT(isOrderedByPosition(*sampled));

    if (!series.empty()) {
        RC_ASSERT(containsValue(*sampled, *std::min_element(series.begin(), series.end())));
        RC_ASSERT(containsValue(*sampled, *std::max_element(series.begin(), series.end())));
    }
    for (const auto& point : sampled->points) {
        RC_ASSERT(point.position < series.size());
        RC_ASSERT(series[point.position] == point.value);
    }
}

RC_GTEST_PROP(SamplingReducerProperty, ShortSeriesIsReturnedUnchanged, ()) {
    const auto series = *genSeries(200);
    const auto cap = *rc::gen::inRange<std::size_t>(std::max<std::size_t>(series.size(), 2), 400);

    auto sampled = sample(series, cap);
    RC_ASSERT(sampled.has_value());
    RC_ASSERT(sampled->size() == series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        RC_ASSERT(sampled->points[i] == (SamplePoint{i, series[i]}));
    }
}

RC_GTEST_PROP(SamplingReducerProperty, ResamplingIsIdempotent, ()) {
    const auto series = *genSeries(3000);
    const auto cap = *rc::gen::inRange<std::size_t>(2, 100);

    auto once = sample(series, cap);
    RC_ASSERT(once.has_value());
    auto twice = sample(std::span<const SamplePoint>(once->points), cap);
    RC_ASSERT(twice.has_value());
    RC_ASSERT(twice->points == once->points);
}

RC_GTEST_PROP(SamplingReducerProperty, Deterministic, ()) {
    const auto series = *genSeries(2000);
    const auto cap = *rc::gen::inRange<std::size_t>(2, 64);
    auto first = sample(series, cap);
    auto second = sample(series, cap);
    RC_ASSERT(first.has_value() && second.has_value());
    RC_ASSERT(*first == *second);
}

TEST(SamplingReducerTest, CapBelowTwoIsRejected) {
    const std::vector<double> series = {3.0, 1.0, 2.0};
    auto sampled = sample(series, 1);
    ASSERT_FALSE(sampled.has_value());
    EXPECT_EQ(sampled.error().code(), ErrorCode::kInvalidArgument);

    EXPECT_THROW(StreamingSampler(1), GQCException);
}

TEST(SamplingReducerTest, CapOfTwoKeepsMinimumAndMaximum) {
    const std::vector<double> series = {5.0, 9.0, -3.0, 4.0, 4.0, 8.0};
    auto sampled = sample(series, 2);
    ASSERT_TRUE(sampled.has_value());
    const std::vector<SamplePoint> expected = {{1, 9.0}, {2, -3.0}};
    EXPECT_EQ(sampled->points, expected);
}

TEST(SamplingReducerTest, EmptySeries) {
    auto sampled = sample(std::vector<double>{}, 10);
    ASSERT_TRUE(sampled.has_value());
    EXPECT_EQ(sampled->size(), 0u);
    EXPECT_EQ(sampled->sourceLength, 0u);
}

TEST(SamplingReducerTest, JsonLayout) {
    SampledSeries series;
    series.metric = "length";
    series.sourceLength = 10;
    series.points = {{0, 151.0}, {9, 35.0}};

    const auto json = nlohmann::json::parse(series.toJson());
    EXPECT_EQ(json["metric"], "length");
    EXPECT_EQ(json["sourceLength"], 10);
    ASSERT_EQ(json["points"].size(), 2u);
    EXPECT_EQ(json["points"][1][0], 9);
    EXPECT_EQ(json["points"][1][1], 35.0);
}

// =============================================================================
// Streaming sampler
// =============================================================================

RC_GTEST_PROP(StreamingSamplerProperty, BoundedAndKeepsExtremaAndEnds, ()) {
    const auto series = *genSeries(20000);
    const auto cap = *rc::gen::inRange<std::size_t>(2, 200);

    StreamingSampler sampler(cap, "mean_quality");
    for (double value : series) {
        sampler.push(value);
    }
    const auto sampled = sampler.finish();

    RC_ASSERT(sampled.metric == "mean_quality");
    RC_ASSERT(sampled.sourceLength == series.size());
    RC_ASSERT(sampled.size() <= cap);
    RC_ASSERT(isOrderedByPosition(sampled));
    if (!series.empty()) {
        RC_ASSERT(containsValue(sampled, *std::min_element(series.begin(), series.end())));
        RC_ASSERT(containsValue(sampled, *std::max_element(series.begin(), series.end())));
    }
    if (series.size() <= cap) {
        RC_ASSERT(sampled.size() == series.size());
    } else if (cap >= 4) {
        RC_ASSERT(sampled.points.front().position == 0);
        RC_ASSERT(sampled.points.back().position == series.size() - 1);
    }
    for (const auto& point : sampled.points) {
        RC_ASSERT(series[point.position] == point.value);
    }
}

TEST(StreamingSamplerTest, StrideGrowsWithInput) {
    StreamingSampler sampler(16);
    for (int i = 0; i < 10000; ++i) {
        sampler.push(static_cast<double>(i % 97));
    }
    EXPECT_EQ(sampler.count(), 10000u);
    EXPECT_GT(sampler.stride(), 1u);
    EXPECT_LE(sampler.finish().size(), 16u);
}

TEST(StreamingSamplerTest, FinishDoesNotStopSampling) {
    StreamingSampler sampler(4);
    sampler.push(1.0);
    sampler.push(2.0);
    EXPECT_EQ(sampler.finish().size(), 2u);
    sampler.push(-1.0);
    const auto sampled = sampler.finish();
    EXPECT_EQ(sampled.sourceLength, 3u);
    EXPECT_TRUE(containsValue(sampled, -1.0));
}

}  // namespace gqc::viz::test
