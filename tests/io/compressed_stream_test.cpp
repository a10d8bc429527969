// =============================================================================
// genoqc - Compressed Stream Tests
// =============================================================================
// Inputs are produced with the reference encoders (zlib, libbz2, liblzma) and
// read back through CompressedInputStream.
// =============================================================================

#include <gtest/gtest.h>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <array>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "gqc/io/compressed_stream.h"
#include "support/fastq_data.h"
#include "support/temp_dir.h"

namespace gqc::io::test {

using gqc::test::gzipCompress;
using gqc::test::sampleFastq;
using gqc::test::TempDir;
using gqc::test::writeFile;

namespace {

[[nodiscard]] std::string bzip2Compress(const std::string& data) {
    unsigned int length = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
    std::string out(length, '\0');
    EXPECT_EQ(BZ2_bzBuffToBuffCompress(out.data(), &length, const_cast<char*>(data.data()),
                                       static_cast<unsigned int>(data.size()), 9, 0, 0),
              BZ_OK);
    out.resize(length);
    return out;
}

[[nodiscard]] std::string xzCompress(const std::string& data) {
    std::string out(lzma_stream_buffer_bound(data.size()), '\0');
    std::size_t position = 0;
    EXPECT_EQ(lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                      reinterpret_cast<const std::uint8_t*>(data.data()),
                                      data.size(), reinterpret_cast<std::uint8_t*>(out.data()),
                                      &position, out.size()),
              LZMA_OK);
    out.resize(position);
    return out;
}

[[nodiscard]] std::string readAll(std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

}  // namespace

TEST(CompressedStreamTest, DetectsFormatFromMagicBytes) {
    const std::array<std::uint8_t, 4> gz{0x1f, 0x8b, 0x08, 0x00};
    const std::array<std::uint8_t, 4> bz{'B', 'Z', 'h', '9'};
    const std::array<std::uint8_t, 6> xz{0xfd, '7', 'z', 'X', 'Z', 0x00};
    const std::array<std::uint8_t, 4> plain{'@', 'r', '1', '\n'};
    EXPECT_EQ(detectCompressionFormat(gz), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormat(bz), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormat(xz), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormat(plain), CompressionFormat::kNone);
    EXPECT_EQ(detectCompressionFormat(std::span<const std::uint8_t>{}), CompressionFormat::kNone);
}

TEST(CompressedStreamTest, ReadsEveryFormat) {
    TempDir dir;
    const std::string content = sampleFastq(5'000);

    struct Case {
        std::string name;
        std::string bytes;
        CompressionFormat format;
    };
    const std::vector<Case> cases = {
        {"plain.fq", content, CompressionFormat::kNone},
        {"reads.fq.gz", gzipCompress(content), CompressionFormat::kGzip},
        {"reads.fq.bz2", bzip2Compress(content), CompressionFormat::kBzip2},
        {"reads.fq.xz", xzCompress(content), CompressionFormat::kXz},
    };

    for (const auto& testCase : cases) {
        SCOPED_TRACE(testCase.name);
        writeFile(dir / testCase.name, testCase.bytes);
        CompressedInputStream stream(dir / testCase.name);
        EXPECT_EQ(stream.format(), testCase.format);
        EXPECT_EQ(readAll(stream), content);
    }
}

TEST(CompressedStreamTest, ConcatenatedGzipMembersAreOneStream) {
    TempDir dir;
    const std::string first = sampleFastq(10);
    const std::string second = sampleFastq(20);
    writeFile(dir / "multi.fq.gz", gzipCompress(first) + gzipCompress(second));

    auto stream = openCompressedFile(dir / "multi.fq.gz");
    EXPECT_EQ(readAll(*stream), first + second);
}

TEST(CompressedStreamTest, ConcatenatedBzip2StreamsAreOneStream) {
    TempDir dir;
    const std::string first = sampleFastq(7);
    const std::string second = sampleFastq(3);
    writeFile(dir / "multi.fq.bz2", bzip2Compress(first) + bzip2Compress(second));

    auto stream = openCompressedFile(dir / "multi.fq.bz2");
    EXPECT_EQ(readAll(*stream), first + second);
}

TEST(CompressedStreamTest, TruncatedGzipFailsLoudly) {
    TempDir dir;
    std::string bytes = gzipCompress(sampleFastq(2'000));
    bytes.resize(bytes.size() / 2);
    writeFile(dir / "cut.fq.gz", bytes);

    auto stream = openCompressedFile(dir / "cut.fq.gz");
    std::string line;
    EXPECT_THROW(
        {
            while (std::getline(*stream, line)) {
            }
        },
        IOError);
}

TEST(CompressedStreamTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW((void)openCompressedFile(dir / "absent.fq.gz"), IOError);
}

}  // namespace gqc::io::test
