// =============================================================================
// genoqc - Registry Resolver Tests
// =============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "gqc/acquire/registry_resolver.h"
#include "support/fake_range_source.h"
#include "support/temp_dir.h"

namespace gqc::acquire::test {

using gqc::test::FakeRangeSource;
using gqc::test::TempDir;
using gqc::test::writeFile;

namespace {

constexpr std::string_view kEnaReport =
    "run_accession\tsample_accession\tstudy_accession\tscientific_name\tinstrument_platform\t"
    "instrument_model\tlibrary_layout\tfastq_ftp\tfastq_bytes\tfastq_md5\n"
    "ERR100\tSAMEA1\tPRJEB1\tHomo sapiens\tILLUMINA\tIllumina NovaSeq 6000\tPAIRED\t"
    "ftp.sra.ebi.ac.uk/vol1/fastq/ERR100/ERR100_2.fastq.gz;"
    "ftp.sra.ebi.ac.uk/vol1/fastq/ERR100/ERR100_1.fastq.gz\t2048;1024\t"
    "0123456789abcdef0123456789abcdef;fedcba9876543210fedcba9876543210\n"
    "ERR101\tSAMEA2\tPRJEB1\tHomo sapiens\tOXFORD_NANOPORE\tMinION\tSINGLE\t"
    "ftp.sra.ebi.ac.uk/vol1/fastq/ERR101/ERR101.fastq.gz\t4096\t"
    "00112233445566778899aabbccddeeff\n"
    "ERR102\tSAMEA3\tPRJEB1\tHomo sapiens\tILLUMINA\tHiSeq\tSINGLE\t\t\t\n";

constexpr std::string_view kNcbiRuninfo =
    "Run,ReleaseDate,download_path,Platform,Model,LibraryLayout,SRAStudy,Sample,ScientificName\n"
    "SRR200,2020-01-01,https://sra-downloadb.be-md.ncbi.nlm.nih.gov/sos5/sra-pub-zq-11/SRR200/"
    "SRR200.lite.1,PACBIO_SMRT,\"Sequel II, HiFi\",SINGLE,SRP9,SRS9,\"Mus musculus\"\n"
    "Run,ReleaseDate,download_path,Platform,Model,LibraryLayout,SRAStudy,Sample,ScientificName\n";

}  // namespace

TEST(RegistryResolverTest, ParsesEnaFilereport) {
    auto datasets = parseEnaFilereport(kEnaReport);
    ASSERT_TRUE(datasets.has_value()) << datasets.error().message();
    // A run without FASTQ links is skipped.
    ASSERT_EQ(datasets->size(), 2u);

    const DatasetRef& paired = datasets->at(0);
    EXPECT_EQ(paired.accession, "ERR100");
    EXPECT_EQ(paired.registry, Registry::kEna);
    EXPECT_EQ(paired.technology, ReadTechnology::kShortRead);
    EXPECT_EQ(paired.metadata.instrumentModel, "Illumina NovaSeq 6000");
    ASSERT_EQ(paired.objects.size(), 2u);
    // R1 is ordered first, with its size and digest kept aligned.
    EXPECT_EQ(paired.objects[0].role, ObjectRole::kShortR1);
    EXPECT_EQ(paired.objects[0].url,
              "https://ftp.sra.ebi.ac.uk/vol1/fastq/ERR100/ERR100_1.fastq.gz");
    EXPECT_EQ(paired.objects[0].fileName, "ERR100_1.fastq.gz");
    EXPECT_EQ(paired.objects[0].expectedSize, 1024u);
    ASSERT_TRUE(paired.objects[0].expectedChecksum.has_value());
    EXPECT_EQ(paired.objects[0].expectedChecksum->hexDigest, "fedcba9876543210fedcba9876543210");
    EXPECT_EQ(paired.objects[1].role, ObjectRole::kShortR2);
    EXPECT_EQ(paired.objects[1].expectedSize, 2048u);

    const DatasetRef& nanopore = datasets->at(1);
    EXPECT_EQ(nanopore.technology, ReadTechnology::kLongRead);
    EXPECT_EQ(nanopore.objects.at(0).role, ObjectRole::kLong);
}

TEST(RegistryResolverTest, TechnologyOverrideWins) {
    auto datasets = parseEnaFilereport(kEnaReport, ReadTechnology::kLongRead);
    ASSERT_TRUE(datasets.has_value());
    EXPECT_EQ(datasets->at(0).technology, ReadTechnology::kLongRead);
}

TEST(RegistryResolverTest, UnknownPlatformIsUnsupported) {
    const std::string report =
        "run_accession\tinstrument_platform\tfastq_ftp\n"
        "ERR300\tCAPILLARY\tftp.example.org/ERR300.fastq.gz\n";
    auto datasets = parseEnaFilereport(report);
    ASSERT_FALSE(datasets.has_value());
    EXPECT_EQ(datasets.error().code(), ErrorCode::kUnsupportedTechnology);
}

TEST(RegistryResolverTest, ParsesNcbiRuninfo) {
    auto datasets = parseNcbiRuninfo(kNcbiRuninfo);
    ASSERT_TRUE(datasets.has_value()) << datasets.error().message();
    ASSERT_EQ(datasets->size(), 1u);

    const DatasetRef& run = datasets->front();
    EXPECT_EQ(run.accession, "SRR200");
    EXPECT_EQ(run.registry, Registry::kNcbi);
    EXPECT_EQ(run.technology, ReadTechnology::kLongRead);
    EXPECT_EQ(run.metadata.instrumentModel, "Sequel II, HiFi");
    ASSERT_EQ(run.objects.size(), 1u);
    EXPECT_EQ(run.objects[0].fileName, "SRR200.lite.1");
    EXPECT_FALSE(run.objects[0].expectedSize.has_value());
    EXPECT_FALSE(run.objects[0].expectedChecksum.has_value());
}

TEST(RegistryResolverTest, ParsesDatasetSheet) {
    constexpr std::string_view kSheet =
        "accession\tregistry\ttechnology\turl\tsize\tchecksum\n"
        "# mirrored copies\n"
        "S1\tena\tshort-read\thttps://mirror.test/S1_R2.fq.gz\t20\t-\n"
        "S1\tena\tshort-read\thttps://mirror.test/S1_R1.fq.gz\t10\tmd5:0123456789abcdef0123456789abcdef\n"
        "SRR9\t-\tlong-read\thttps://mirror.test/SRR9.fastq\n";

    auto datasets = parseDatasetSheet(kSheet);
    ASSERT_TRUE(datasets.has_value()) << datasets.error().message();
    ASSERT_EQ(datasets->size(), 2u);

    const DatasetRef& s1 = datasets->at(0);
    ASSERT_EQ(s1.objects.size(), 2u);
    EXPECT_EQ(s1.objects[0].fileName, "S1_R1.fq.gz");
    EXPECT_EQ(s1.objects[0].expectedSize, 10u);
    EXPECT_TRUE(s1.objects[0].expectedChecksum.has_value());
    EXPECT_FALSE(s1.objects[1].expectedChecksum.has_value());

    // An empty registry cell is inferred from the accession.
    EXPECT_EQ(datasets->at(1).registry, Registry::kNcbi);
    EXPECT_EQ(datasets->at(1).technology, ReadTechnology::kLongRead);
}

TEST(RegistryResolverTest, SheetErrorsNameTheLine) {
    auto badTech = parseDatasetSheet("S1\tena\thybrid\thttps://mirror.test/a.fq\n");
    ASSERT_FALSE(badTech.has_value());
    EXPECT_EQ(badTech.error().code(), ErrorCode::kUnsupportedTechnology);

    auto badSize = parseDatasetSheet("# c\nS1\tena\tshort-read\thttps://mirror.test/a.fq\tten\n");
    ASSERT_FALSE(badSize.has_value());
    EXPECT_EQ(badSize.error().code(), ErrorCode::kFormatError);
    EXPECT_NE(badSize.error().message().find("line 2"), std::string::npos);

    auto mixed = parseDatasetSheet(
        "S1\tena\tshort-read\thttps://mirror.test/a.fq\n"
        "S1\tena\tlong-read\thttps://mirror.test/b.fq\n");
    ASSERT_FALSE(mixed.has_value());
}

TEST(RegistryResolverTest, LoadsSheetFromDisk) {
    TempDir dir;
    writeFile(dir / "sheet.tsv", "S1\tena\tshort-read\thttps://mirror.test/S1.fq\n");
    auto datasets = loadDatasetSheet(dir / "sheet.tsv");
    ASSERT_TRUE(datasets.has_value());
    EXPECT_EQ(datasets->front().objects.front().role, ObjectRole::kSingle);

    auto missing = loadDatasetSheet(dir / "absent.tsv");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::kIOError);
}

TEST(RegistryResolverTest, FileNameFromUrl) {
    EXPECT_EQ(fileNameFromUrl("https://h/a/b/ERR1_1.fastq.gz"), "ERR1_1.fastq.gz");
    EXPECT_EQ(fileNameFromUrl("https://h/a/file.fq?token=x#frag"), "file.fq");
    EXPECT_EQ(fileNameFromUrl("https://h/dir/"), "dir");
    EXPECT_EQ(fileNameFromUrl("https://h/a/.."), "");
    EXPECT_EQ(fileNameFromUrl("https://h/a/./"), "");
    EXPECT_EQ(fileNameFromUrl(""), "");
}

TEST(RegistryResolverTest, ReportWithUnusableFileNameIsRejected) {
    const std::string report =
        "run_accession\tinstrument_platform\tfastq_ftp\n"
        "ERR300\tILLUMINA\tftp.example.org/vol1/..\n";
    auto datasets = parseEnaFilereport(report);
    ASSERT_FALSE(datasets.has_value());
    EXPECT_EQ(datasets.error().code(), ErrorCode::kFormatError);

    const std::string badRun =
        "run_accession\tinstrument_platform\tfastq_ftp\n"
        "..\tILLUMINA\tftp.example.org/vol1/x.fastq.gz\n";
    EXPECT_FALSE(parseEnaFilereport(badRun).has_value());
}

TEST(RegistryResolverTest, SheetRejectsAccessionsThatAreNotDirectoryNames) {
    for (const char* accession : {"..", "a/b", "../../etc"}) {
        auto datasets = parseDatasetSheet(std::string(accession) +
                                          "\tena\tshort-read\thttps://mirror.test/a.fq\n");
        ASSERT_FALSE(datasets.has_value()) << accession;
        EXPECT_EQ(datasets.error().code(), ErrorCode::kFormatError);
        EXPECT_NE(datasets.error().message().find("line 1"), std::string::npos);
    }
}

TEST(RegistryResolverTest, SheetRejectsTheSameFileTwice) {
    auto datasets = parseDatasetSheet(
        "S1\tena\tshort-read\thttps://mirror.test/a/S1.fq\n"
        "S1\tena\tshort-read\thttps://other.test/b/S1.fq\n");
    ASSERT_FALSE(datasets.has_value());
    EXPECT_EQ(datasets.error().code(), ErrorCode::kFormatError);
    EXPECT_NE(datasets.error().message().find("line 2"), std::string::npos);
}

TEST(RegistryResolverTest, DropDuplicateAccessionsKeepsFirst) {
    std::vector<DatasetRef> datasets(4);
    datasets[0].accession = "ERR1";
    datasets[1].accession = "ERR2";
    datasets[2].accession = "ERR1";
    datasets[2].technology = ReadTechnology::kLongRead;
    datasets[3].accession = "ERR3";

    EXPECT_EQ(dropDuplicateAccessions(datasets), 1u);
    ASSERT_EQ(datasets.size(), 3u);
    EXPECT_EQ(datasets[0].accession, "ERR1");
    EXPECT_EQ(datasets[0].technology, ReadTechnology::kShortRead);
    EXPECT_EQ(datasets[2].accession, "ERR3");
}

TEST(RegistryResolverTest, SearchSkipsRunsOfOtherPlatforms) {
    const std::string body =
        "run_accession\tsample_accession\tinstrument_platform\tlibrary_strategy\tfastq_ftp\t"
        "read_count\tbase_count\n"
        "ERR300\tSAMEA9\tCAPILLARY\tWGS\tftp.example.org/ERR300.fastq.gz\t\t\n"
        "ERR301\tSAMEA9\tPACBIO_SMRT\tWGS\tftp.example.org/ERR301.fastq.gz\t120\t900000\n";
    auto runs = parseEnaSearch(body);
    ASSERT_TRUE(runs.has_value()) << runs.error().message();
    ASSERT_EQ(runs->size(), 1u);
    EXPECT_EQ(runs->front().accession, "ERR301");
    EXPECT_EQ(runs->front().metadata.libraryStrategy, "WGS");
    EXPECT_EQ(runs->front().metadata.readCount, 120u);
    EXPECT_EQ(runs->front().metadata.baseCount, 900'000u);
}

TEST(RegistryResolverTest, PairedLayoutWithoutMateSuffixKeepsListingOrder) {
    DatasetRef dataset;
    dataset.technology = ReadTechnology::kShortRead;
    dataset.metadata.libraryLayout = "paired";
    dataset.objects.resize(2);
    dataset.objects[0].fileName = "lane_a.fq";
    dataset.objects[1].fileName = "lane_b.fq";
    assignObjectRoles(dataset);
    EXPECT_EQ(dataset.objects[0].role, ObjectRole::kShortR1);
    EXPECT_EQ(dataset.objects[1].role, ObjectRole::kShortR2);
}

class RegistryResolverNetworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.enaFilereportUrl = "https://ena.test/filereport";
        config_.ncbiRuninfoUrl = "https://ncbi.test/runinfo";
        source_ = std::make_shared<FakeRangeSource>();
    }

    ResolverConfig config_;
    std::shared_ptr<FakeRangeSource> source_;
};

TEST_F(RegistryResolverNetworkTest, ResolvesThroughEachRegistry) {
    source_->add("https://ena.test/filereport?accession=ERR100", std::string(kEnaReport));
    source_->add("https://ncbi.test/runinfo?acc=SRR200", std::string(kNcbiRuninfo));
    RegistryResolver resolver(config_, TransferConfig{}, source_);

    auto all = resolver.resolveAll({"ERR100", "SRR200"});
    ASSERT_TRUE(all.has_value()) << all.error().message();
    ASSERT_EQ(all->size(), 3u);
    EXPECT_EQ(all->at(2).accession, "SRR200");

    const auto requests = source_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0].url.find("format=tsv"), std::string::npos);
    EXPECT_EQ(requests[0].offset, 0u);
}

TEST_F(RegistryResolverNetworkTest, RunReachedTwiceIsResolvedOnce) {
    source_->add("https://ena.test/filereport?accession=ERR100", std::string(kEnaReport));
    source_->add("https://ena.test/filereport?accession=ERP1", std::string(kEnaReport));
    RegistryResolver resolver(config_, TransferConfig{}, source_);

    auto all = resolver.resolveAll({"ERR100", "ERP1", "ERR100"});
    ASSERT_TRUE(all.has_value()) << all.error().message();
    ASSERT_EQ(all->size(), 2u);
    EXPECT_EQ(all->at(0).accession, "ERR100");
    EXPECT_EQ(all->at(1).accession, "ERR101");
}

TEST_F(RegistryResolverNetworkTest, DiscoverQueriesEnaSearch) {
    config_.enaSearchUrl = "https://ena.test/search";
    config_.searchLimit = 20;
    RegistryResolver resolver(config_, TransferConfig{}, source_);

    const std::string url = resolver.searchUrl("Escherichia coli", "wgs");
    EXPECT_EQ(url.rfind("https://ena.test/search?result=read_run&format=tsv&limit=20&", 0), 0u);
    EXPECT_NE(url.find("query=scientific_name%3D%22Escherichia%20coli%22%20AND%20"
                       "library_strategy%3D%22WGS%22"),
              std::string::npos);

    source_->add(url, std::string(kEnaReport));
    auto runs = resolver.discover("Escherichia coli", "wgs");
    ASSERT_TRUE(runs.has_value()) << runs.error().message();
    EXPECT_EQ(runs->size(), 2u);

    source_->add(resolver.searchUrl("Nothing here", ""), "run_accession\tfastq_ftp\n");
    auto none = resolver.discover("Nothing here", "");
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code(), ErrorCode::kResolutionFailed);

    auto empty = resolver.discover("  ", "WGS");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(RegistryResolverNetworkTest, UnknownPrefixFailsWithoutRequests) {
    RegistryResolver resolver(config_, TransferConfig{}, source_);
    auto result = resolver.resolve("XYZ123");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kResolutionFailed);
    EXPECT_TRUE(source_->requests().empty());
}

TEST_F(RegistryResolverNetworkTest, EmptyReportIsResolutionFailure) {
    source_->add("https://ena.test/filereport?accession=ERR404",
                 "run_accession\tfastq_ftp\n");
    RegistryResolver resolver(config_, TransferConfig{}, source_);
    auto result = resolver.resolve("ERR404");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kResolutionFailed);
}

TEST_F(RegistryResolverNetworkTest, NetworkFailureIsPropagated) {
    RegistryResolver resolver(config_, TransferConfig{}, source_);
    auto result = resolver.resolve("ERR555");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNetworkError);
    EXPECT_NE(result.error().message().find("ERR555"), std::string::npos);
}

}  // namespace gqc::acquire::test
