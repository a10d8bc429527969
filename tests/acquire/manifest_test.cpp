// =============================================================================
// genoqc - Acquisition Manifest Tests
// =============================================================================

#include <gtest/gtest.h>

#include <format>
#include <regex>
#include <string>
#include <thread>
#include <vector>

#include "gqc/acquire/manifest.h"
#include "support/temp_dir.h"

namespace gqc::acquire::test {

using gqc::test::readFile;
using gqc::test::TempDir;
using gqc::test::writeFile;

namespace {

[[nodiscard]] ManifestEntry entry(std::string fileName, ObjectRole role) {
    ManifestEntry e;
    e.fileName = std::move(fileName);
    e.role = role;
    e.accession = "SRR5";
    e.registry = Registry::kNcbi;
    e.technology = ReadTechnology::kShortRead;
    e.sourceUrl = "https://mirror.test/" + e.fileName;
    e.bytes = 4096;
    e.checksum = "md5:0123456789abcdef0123456789abcdef";
    e.createdUtc = "2024-05-01T12:00:00Z";
    return e;
}

}  // namespace

TEST(ManifestTest, AppendsAndReadsBack) {
    TempDir dir;
    ManifestWriter writer(dir / "data" / "manifest.tsv");
    ASSERT_TRUE(writer.append({entry("SRR5_1.fastq", ObjectRole::kShortR1)}).has_value());
    ASSERT_TRUE(writer.append({entry("SRR5_2.fastq", ObjectRole::kShortR2)}).has_value());

    // One header, two rows.
    const std::string text = readFile(writer.path());
    EXPECT_EQ(text.find("filename\t"), 0u);
    EXPECT_EQ(text.find("filename\t", 1), std::string::npos);

    auto entries = readManifest(writer.path());
    ASSERT_TRUE(entries.has_value()) << entries.error().message();
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ(entries->at(0).fileName, "SRR5_1.fastq");
    EXPECT_EQ(entries->at(1).role, ObjectRole::kShortR2);
    EXPECT_EQ(entries->at(1).registry, Registry::kNcbi);
    EXPECT_EQ(entries->at(1).bytes, 4096u);
    EXPECT_EQ(entries->at(1).checksum, "md5:0123456789abcdef0123456789abcdef");
}

TEST(ManifestTest, EmptyAppendCreatesNothing) {
    TempDir dir;
    ManifestWriter writer(dir / "manifest.tsv");
    ASSERT_TRUE(writer.append({}).has_value());
    EXPECT_FALSE(std::filesystem::exists(writer.path()));
}

TEST(ManifestTest, ConcurrentAppendsKeepRowsIntact) {
    TempDir dir;
    ManifestWriter writer(dir / "manifest.tsv");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&writer, t] {
            for (int i = 0; i < 25; ++i) {
                (void)writer.append({entry(std::format("f{}_{}.fq", t, i), ObjectRole::kSingle)});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto entries = readManifest(writer.path());
    ASSERT_TRUE(entries.has_value()) << entries.error().message();
    EXPECT_EQ(entries->size(), 100u);
}

TEST(ManifestTest, MalformedRowIsFormatError) {
    TempDir dir;
    writeFile(dir / "manifest.tsv", "a\tb\tc\n");
    auto entries = readManifest(dir / "manifest.tsv");
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().code(), ErrorCode::kFormatError);
}

TEST(ManifestTest, MissingFileIsIOError) {
    TempDir dir;
    auto entries = readManifest(dir / "absent.tsv");
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().code(), ErrorCode::kIOError);
}

TEST(ManifestTest, TimestampIsIso8601Utc) {
    const std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(utcTimestamp(), pattern)) << utcTimestamp();
}

}  // namespace gqc::acquire::test
