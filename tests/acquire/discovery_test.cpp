// =============================================================================
// genoqc - Dataset Discovery Tests
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "gqc/acquire/discovery.h"
#include "support/fake_range_source.h"
#include "support/fastq_data.h"
#include "support/temp_dir.h"

namespace gqc::acquire::test {

using gqc::test::FakeRangeSource;
using gqc::test::FakeStep;
using gqc::test::gunzipFile;
using gqc::test::gzipCompress;
using gqc::test::sampleFastq;
using gqc::test::TempDir;

namespace {

[[nodiscard]] RemoteObject remote(const std::string& name, ObjectRole role) {
    RemoteObject object;
    object.url = "https://files.example.org/" + name;
    object.fileName = name;
    object.role = role;
    return object;
}

[[nodiscard]] DatasetRef pairedRun(const std::string& accession, const std::string& sample) {
    DatasetRef run;
    run.accession = accession;
    run.technology = ReadTechnology::kShortRead;
    run.metadata.sampleAccession = sample;
    run.objects = {remote(accession + "_1.fastq.gz", ObjectRole::kShortR1),
                   remote(accession + "_2.fastq.gz", ObjectRole::kShortR2)};
    return run;
}

[[nodiscard]] DatasetRef longRun(const std::string& accession, const std::string& sample) {
    DatasetRef run;
    run.accession = accession;
    run.technology = ReadTechnology::kLongRead;
    run.metadata.sampleAccession = sample;
    run.objects = {remote(accession + ".fastq", ObjectRole::kLong)};
    return run;
}

}  // namespace

TEST(DiscoveryTest, GenomeSizeComesFromOverrideTableOrDefault) {
    EXPECT_EQ(knownGenomeSize("  Escherichia coli "), 4'600'000u);
    EXPECT_EQ(knownGenomeSize("HUMAN"), 3'200'000'000u);
    EXPECT_FALSE(knownGenomeSize("Thermus aquaticus").has_value());

    DiscoveryConfig config;
    EXPECT_EQ(genomeSizeFor("Saccharomyces cerevisiae", config), 12'000'000u);
    EXPECT_EQ(genomeSizeFor("Thermus aquaticus", config), kDefaultGenomeSize);
    config.genomeSize = 2'100'000;
    EXPECT_EQ(genomeSizeFor("Escherichia coli", config), 2'100'000u);
}

TEST(DiscoveryTest, TargetBasesScaleWithCoverageAndMargin) {
    EXPECT_EQ(targetBases(1'000'000, 30.0, 1.0), 30'000'000u);
    EXPECT_EQ(targetBases(2'000'000, 10.0, 1.5), 30'000'000u);
    EXPECT_EQ(targetBases(0, 50.0, 1.1), 0u);
}

TEST(DiscoveryTest, CandidatesNeedMatesAndEnoughBases) {
    DatasetRef single;
    single.accession = "ERR1";
    single.technology = ReadTechnology::kShortRead;
    single.objects = {remote("ERR1.fastq.gz", ObjectRole::kSingle)};

    DatasetRef small = pairedRun("ERR2", "S");
    small.metadata.baseCount = 1'000;

    DatasetRef withOrphan = pairedRun("ERR3", "S");
    withOrphan.objects.insert(withOrphan.objects.begin(),
                              remote("ERR3.fastq.gz", ObjectRole::kSingle));

    DatasetRef nanopore = longRun("ERR4", "S");
    nanopore.objects.push_back(remote("ERR4_extra.fastq", ObjectRole::kLong));

    const std::vector<DatasetRef> runs = {single, small, withOrphan, nanopore};

    const auto shortCandidates = selectCandidates(runs, ReadTechnology::kShortRead, 5'000);
    ASSERT_EQ(shortCandidates.size(), 2u);
    // Unknown base counts stay ahead of runs known to be too small.
    EXPECT_EQ(shortCandidates[0].accession, "ERR3");
    ASSERT_EQ(shortCandidates[0].objects.size(), 2u);
    EXPECT_EQ(shortCandidates[0].objects[0].role, ObjectRole::kShortR1);
    EXPECT_EQ(shortCandidates[0].objects[1].role, ObjectRole::kShortR2);
    EXPECT_EQ(shortCandidates[1].accession, "ERR2");

    const auto longCandidates = selectCandidates(runs, ReadTechnology::kLongRead, 5'000);
    ASSERT_EQ(longCandidates.size(), 1u);
    ASSERT_EQ(longCandidates[0].objects.size(), 1u);
    EXPECT_EQ(longCandidates[0].objects[0].fileName, "ERR4.fastq");
}

TEST(DiscoveryTest, CoverageLimitSplitsAcrossMates) {
    DatasetRef paired = pairedRun("ERR5", "S");
    applyCoverageLimit(paired, 1'000, 4096);
    ASSERT_TRUE(paired.objects[0].subset.has_value());
    EXPECT_EQ(paired.objects[0].subset->maxBases, 500u);
    EXPECT_EQ(paired.objects[0].subset->maxBytes, 4096u);
    ASSERT_TRUE(paired.objects[1].subset.has_value());
    EXPECT_FALSE(paired.objects[1].subset->maxBases.has_value());

    DatasetRef nanopore = longRun("ERR6", "S");
    applyCoverageLimit(nanopore, 1'000);
    EXPECT_EQ(nanopore.objects[0].subset->maxBases, 1'000u);
    EXPECT_FALSE(nanopore.objects[0].subset->maxBytes.has_value());
    EXPECT_EQ(nanopore.objects[0].fileName, "ERR6.fastq.gz");
}

TEST(DiscoveryTest, SampleMismatchFailsUnlessAllowed) {
    const std::vector<DatasetRef> same = {pairedRun("ERR1", "SAMEA1"), longRun("ERR2", "SAMEA1")};
    EXPECT_TRUE(checkSampleConsistency(same, false).has_value());

    const std::vector<DatasetRef> differ = {pairedRun("ERR1", "SAMEA1"),
                                            longRun("ERR2", "SAMEA2")};
    auto rejected = checkSampleConsistency(differ, false);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_NE(rejected.error().message().find("SAMEA2"), std::string::npos);
    EXPECT_TRUE(checkSampleConsistency(differ, true).has_value());

    const std::vector<DatasetRef> unknown = {pairedRun("ERR1", ""), longRun("ERR2", "SAMEA2")};
    EXPECT_TRUE(checkSampleConsistency(unknown, false).has_value());
}

class CandidateFallbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<FakeRangeSource>();
        config_.dataDir = dir_ / "data";
        config_.maxAttempts = 2;
        config_.initialBackoffMs = 1;
        config_.maxBackoffMs = 2;
        config_.writeManifest = false;
        plan_.bases = 45;
    }

    [[nodiscard]] std::unique_ptr<AcquisitionManager> manager() const {
        return std::make_unique<AcquisitionManager>(config_, TransferConfig{}, source_);
    }

    [[nodiscard]] std::string urlOf(const DatasetRef& run) const { return run.objects[0].url; }

    TempDir dir_;
    std::shared_ptr<FakeRangeSource> source_;
    AcquisitionConfig config_;
    CoveragePlan plan_;
};

TEST_F(CandidateFallbackTest, FailedCandidateFallsBackToTheNext) {
    const DatasetRef broken = longRun("ERR10", "");
    const DatasetRef working = longRun("ERR11", "");
    // Nothing registered for the broken run: every request fails.
    source_->add(urlOf(working), gzipCompress(sampleFastq(20)));

    auto acquired = acquireFirstCandidate(*manager(), {broken, working}, plan_, {}, false);
    ASSERT_TRUE(acquired.has_value()) << acquired.error().message();
    EXPECT_EQ(acquired->accession, "ERR11");
    ASSERT_TRUE(acquired->objects[0].subset.has_value());
    EXPECT_EQ(acquired->objects[0].subset->maxBases, 45u);

    // Reads of 10 bases: the fifth crosses 45.
    const auto stored = config_.dataDir / "ERR11" / "ERR11.fastq.gz";
    EXPECT_EQ(gunzipFile(stored), sampleFastq(5));
    EXPECT_FALSE(std::filesystem::exists(config_.dataDir / "ERR10" / "ERR10.fastq.gz"));
}

TEST_F(CandidateFallbackTest, EveryCandidateFailing) {
    const DatasetRef broken = longRun("ERR10", "");
    source_->add(urlOf(broken), sampleFastq(20));
    source_->script(urlOf(broken), {FakeStep::httpStatus(500), FakeStep::httpStatus(500),
                                    FakeStep::httpStatus(500)});

    auto acquired = acquireFirstCandidate(*manager(), {broken}, plan_, {}, false);
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code(), ErrorCode::kPartialAcquisitionFailure);

    auto none = acquireFirstCandidate(*manager(), {}, plan_, {}, false);
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code(), ErrorCode::kResolutionFailed);
}

TEST_F(CandidateFallbackTest, RunsOfTheChosenSampleGoFirst) {
    const std::vector<DatasetRef> chosen = {pairedRun("ERR1", "SAMEA1")};
    const DatasetRef other = longRun("ERR20", "SAMEA2");
    const DatasetRef matching = longRun("ERR21", "SAMEA1");
    source_->add(urlOf(other), sampleFastq(20));
    source_->add(urlOf(matching), sampleFastq(20));

    auto acquired = acquireFirstCandidate(*manager(), {other, matching}, plan_, chosen, false);
    ASSERT_TRUE(acquired.has_value()) << acquired.error().message();
    EXPECT_EQ(acquired->accession, "ERR21");
    EXPECT_EQ(source_->requestCount(urlOf(other)), 0u);

    auto mismatch = acquireFirstCandidate(*manager(), {other}, plan_, chosen, false);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(source_->requestCount(urlOf(other)), 0u);

    auto replicate = acquireFirstCandidate(*manager(), {other}, plan_, chosen, true);
    ASSERT_TRUE(replicate.has_value()) << replicate.error().message();
    EXPECT_EQ(replicate->accession, "ERR20");
}

}  // namespace gqc::acquire::test
