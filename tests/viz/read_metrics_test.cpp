// =============================================================================
// genoqc - Read Metric Extraction Tests
// =============================================================================

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>

#include "gqc/viz/read_metrics.h"
#include "support/temp_dir.h"

namespace gqc::viz::test {

using gqc::test::TempDir;
using gqc::test::writeFile;

namespace {

[[nodiscard]] io::FastqRecord record(std::string sequence, std::string quality) {
    io::FastqRecord r;
    r.id = "r";
    r.sequence = std::move(sequence);
    r.quality = std::move(quality);
    return r;
}

[[nodiscard]] io::FastqParser parserFor(const std::string& text) {
    return io::FastqParser(std::make_unique<std::istringstream>(text));
}

// Lengths 2, 4, 6, 8: 20 bases, N50 is 6 (8 + 6 >= 10).
constexpr std::string_view kFourReads =
    "@a\nAC\n+\nII\n"
    "@b\nGGCC\n+\n!!!!\n"
    "@c\nATATAT\n+\n++++++\n"
    "@d\nACGTNNNN\n+\nIIIIIIII\n";

}  // namespace

TEST(ReadMetricsTest, PerReadValues) {
    const auto r = record("GCNA", "I+!5");
    EXPECT_DOUBLE_EQ(readMetricValue(ReadMetric::kLength, r), 4.0);
    // Phred 40, 10, 0, 20.
    EXPECT_DOUBLE_EQ(readMetricValue(ReadMetric::kMeanQuality, r), 17.5);
    // N is not a called base: 2 of 3.
    EXPECT_NEAR(readMetricValue(ReadMetric::kGcPercent, r), 200.0 / 3.0, 1e-9);

    EXPECT_DOUBLE_EQ(readMetricValue(ReadMetric::kGcPercent, record("NNNN", "!!!!")), 0.0);
    EXPECT_DOUBLE_EQ(readMetricValue(ReadMetric::kMeanQuality, record("", "")), 0.0);
}

TEST(ReadMetricsTest, ParsesMetricNames) {
    EXPECT_EQ(parseReadMetric("length").value(), ReadMetric::kLength);
    EXPECT_EQ(parseReadMetric(" Mean_Quality ").value(), ReadMetric::kMeanQuality);
    EXPECT_EQ(parseReadMetric("gc_percent").value(), ReadMetric::kGcPercent);

    auto unknown = parseReadMetric("entropy");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::kUsageError);
}

TEST(ReadMetricsTest, SummaryAndSeriesFromParser) {
    auto parser = parserFor(std::string(kFourReads));
    const auto metrics = ReadMetricsExtractor(16).extract(parser);

    EXPECT_EQ(metrics.summary.readCount, 4u);
    EXPECT_EQ(metrics.summary.totalBases, 20u);
    EXPECT_EQ(metrics.summary.minLength, 2u);
    EXPECT_EQ(metrics.summary.maxLength, 8u);
    EXPECT_DOUBLE_EQ(metrics.summary.meanLength, 5.0);
    EXPECT_EQ(metrics.summary.n50, 6u);

    ASSERT_EQ(metrics.series.size(), 3u);
    const auto& lengths = metrics.series.at(ReadMetric::kLength);
    EXPECT_EQ(lengths.metric, "length");
    ASSERT_EQ(lengths.size(), 4u);
    EXPECT_DOUBLE_EQ(lengths.points[3].value, 8.0);

    const auto& gc = metrics.series.at(ReadMetric::kGcPercent);
    EXPECT_DOUBLE_EQ(gc.points[1].value, 100.0);
    EXPECT_DOUBLE_EQ(gc.points[2].value, 0.0);
    EXPECT_DOUBLE_EQ(gc.points[3].value, 50.0);

    const auto& quality = metrics.series.at(ReadMetric::kMeanQuality);
    EXPECT_DOUBLE_EQ(quality.points[0].value, 40.0);
    EXPECT_DOUBLE_EQ(quality.points[1].value, 0.0);
}

TEST(ReadMetricsTest, SeriesRespectTheCap) {
    std::string text;
    for (int i = 0; i < 500; ++i) {
        const std::string seq(static_cast<std::size_t>(10 + i % 50), i % 3 == 0 ? 'G' : 'A');
        text += "@r" + std::to_string(i) + "\n" + seq + "\n+\n" + std::string(seq.size(), 'I') + "\n";
    }
    auto parser = parserFor(text);
    const auto metrics = ReadMetricsExtractor(20).extract(parser);

    EXPECT_EQ(metrics.summary.readCount, 500u);
    for (const auto& [metric, series] : metrics.series) {
        EXPECT_LE(series.size(), 20u) << readMetricToString(metric);
        EXPECT_EQ(series.sourceLength, 500u);
    }
}

TEST(ReadMetricsTest, EmptyInput) {
    auto parser = parserFor("");
    const auto metrics = ReadMetricsExtractor(8).extract(parser);
    EXPECT_EQ(metrics.summary.readCount, 0u);
    EXPECT_EQ(metrics.summary.n50, 0u);
    EXPECT_EQ(metrics.series.at(ReadMetric::kLength).size(), 0u);
}

TEST(ReadMetricsTest, ExtractsFromFile) {
    TempDir dir;
    writeFile(dir / "reads.fastq", kFourReads);
    auto metrics = ReadMetricsExtractor(8).extract(dir / "reads.fastq");
    ASSERT_TRUE(metrics.has_value()) << metrics.error().message();
    EXPECT_EQ(metrics->summary.n50, 6u);

    const auto json = nlohmann::json::parse(metrics->summary.toJson());
    EXPECT_EQ(json["readCount"], 4);
    EXPECT_EQ(json["n50"], 6);
}

TEST(ReadMetricsTest, FileErrorsAreReturned) {
    TempDir dir;
    auto missing = ReadMetricsExtractor(8).extract(dir / "absent.fastq");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::kIOError);

    writeFile(dir / "bad.fastq", ">fasta\nACGT\n");
    auto malformed = ReadMetricsExtractor(8).extract(dir / "bad.fastq");
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error().code(), ErrorCode::kFormatError);
}

TEST(ReadMetricsTest, CapBelowTwoThrows) {
    EXPECT_THROW(ReadMetricsExtractor(1), GQCException);
}

}  // namespace gqc::viz::test
