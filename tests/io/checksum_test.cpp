// =============================================================================
// genoqc - Checksum Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>

#include "gqc/io/checksum.h"
#include "support/temp_dir.h"

namespace gqc::io::test {

using gqc::test::TempDir;
using gqc::test::writeFile;

[[nodiscard]] std::string digestOf(ChecksumAlgorithm algorithm, std::string_view data) {
    StreamingHasher hasher(algorithm);
    hasher.update(data);
    return hasher.finalHex();
}

TEST(ChecksumTest, KnownVectors) {
    EXPECT_EQ(digestOf(ChecksumAlgorithm::kMd5, "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(digestOf(ChecksumAlgorithm::kSha256, "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digestOf(ChecksumAlgorithm::kXxHash64, ""), "ef46db3751d8e999");
}

TEST(ChecksumTest, HashFileMatchesInMemoryDigest) {
    TempDir dir;
    const std::string content(100'000, 'G');
    writeFile(dir / "reads.fq", content);

    auto digest = hashFile(dir / "reads.fq", ChecksumAlgorithm::kMd5, 4096);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, digestOf(ChecksumAlgorithm::kMd5, content));

    ChecksumSpec spec{ChecksumAlgorithm::kMd5, *digest};
    EXPECT_TRUE(verifyFile(dir / "reads.fq", spec).value());
    spec.hexDigest[0] = spec.hexDigest[0] == '0' ? '1' : '0';
    EXPECT_FALSE(verifyFile(dir / "reads.fq", spec).value());
}

TEST(ChecksumTest, MissingFileIsIOError) {
    TempDir dir;
    auto digest = hashFile(dir / "absent", ChecksumAlgorithm::kSha256);
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error().code(), ErrorCode::kIOError);
}

RC_GTEST_PROP(ChecksumProperty, ChunkingDoesNotChangeDigest,
              (const std::string& data, unsigned int splitSeed)) {
    const auto algorithm = *rc::gen::element(ChecksumAlgorithm::kMd5, ChecksumAlgorithm::kSha256,
                                             ChecksumAlgorithm::kXxHash64);
    const std::size_t split = data.empty() ? 0 : splitSeed % (data.size() + 1);

    StreamingHasher hasher(algorithm);
    hasher.update(std::string_view(data).substr(0, split));
    hasher.update(std::string_view(data).substr(split));
    RC_ASSERT(hasher.finalHex() == digestOf(algorithm, data));
}

}  // namespace gqc::io::test
