// =============================================================================
// genoqc - FASTQ Parser Tests
// =============================================================================
// Records formatted from generated reads must parse back field for field;
// malformed input must raise FormatError with the offending line number.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "gqc/io/fastq_parser.h"
#include "support/temp_dir.h"

namespace gqc::io::test {

// =============================================================================
// Test Utilities
// =============================================================================

[[nodiscard]] std::string formatFastqRecord(const FastqRecord& record) {
    std::ostringstream oss;
    oss << '@' << record.id;
    if (!record.comment.empty()) {
        oss << ' ' << record.comment;
    }
    oss << '\n' << record.sequence << "\n+\n" << record.quality << '\n';
    return oss.str();
}

[[nodiscard]] FastqParser parserFor(std::string text) {
    return FastqParser(std::make_unique<std::istringstream>(std::move(text)));
}

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<std::string> validSequence(std::size_t length) {
    return rc::gen::container<std::string>(length, rc::gen::element('A', 'C', 'G', 'T', 'N'));
}

[[nodiscard]] rc::Gen<std::string> validQuality(std::size_t length) {
    return rc::gen::container<std::string>(
        length, rc::gen::map(rc::gen::inRange(0, 42),
                             [](int phred) { return static_cast<char>('!' + phred); }));
}

[[nodiscard]] rc::Gen<std::string> validReadId() {
    return rc::gen::map(
        rc::gen::container<std::string>(
            rc::gen::inRange(1, 40),
            rc::gen::oneOf(rc::gen::inRange('a', 'z' + 1), rc::gen::inRange('A', 'Z' + 1),
                           rc::gen::inRange('0', '9' + 1), rc::gen::element('_', '-', ':', '.'))),
        [](std::string s) {
            if (std::isdigit(static_cast<unsigned char>(s[0]))) {
                s[0] = 'R';
            }
            return s;
        });
}

[[nodiscard]] rc::Gen<FastqRecord> validFastqRecord() {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(1, 400), [](std::size_t length) {
        return rc::gen::map(
            rc::gen::tuple(validReadId(), validSequence(length), validQuality(length)),
            [](const auto& tuple) {
                FastqRecord record;
                record.id = std::get<0>(tuple);
                record.sequence = std::get<1>(tuple);
                record.quality = std::get<2>(tuple);
                return record;
            });
    });
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(FastqParserProperty, RecordsParseBackUnchanged, ()) {
    const auto records = *rc::gen::container<std::vector<FastqRecord>>(
        *rc::gen::inRange<std::size_t>(1, 30), gen::validFastqRecord());

    std::string text;
    for (const auto& record : records) {
        text += formatFastqRecord(record);
    }

    auto parser = parserFor(text);
    std::vector<FastqRecord> parsed;
    while (auto record = parser.readRecord()) {
        parsed.push_back(std::move(*record));
    }

    RC_ASSERT(parsed.size() == records.size());
    std::uint64_t bases = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        RC_ASSERT(parsed[i].id == records[i].id);
        RC_ASSERT(parsed[i].sequence == records[i].sequence);
        RC_ASSERT(parsed[i].quality == records[i].quality);
        bases += records[i].sequence.size();
    }
    RC_ASSERT(parser.stats().totalRecords == records.size());
    RC_ASSERT(parser.stats().totalBases == bases);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(FastqParserTest, SplitsIdAndComment) {
    auto parser = parserFor("@SRR1.1 1:N:0:ATCACG\nACGT\n+SRR1.1\nIIII\n");
    auto record = parser.readRecord();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, "SRR1.1");
    EXPECT_EQ(record->comment, "1:N:0:ATCACG");
    EXPECT_EQ(record->length(), 4u);
    EXPECT_FALSE(parser.readRecord().has_value());
    EXPECT_TRUE(parser.eof());
}

TEST(FastqParserTest, ToleratesCrLfAndBlankLines) {
    auto parser = parserFor("@r1\r\nACGT\r\n+\r\nIIII\r\n\n\n@r2\nGG\n+\n##");
    std::vector<std::string> ids;
    parser.forEach([&](const FastqRecord& record) {
        ids.push_back(record.id);
        return true;
    });
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[1], "r2");
    EXPECT_EQ(parser.stats().minLength, 2u);
    EXPECT_EQ(parser.stats().maxLength, 4u);
}

TEST(FastqParserTest, ForEachStopsWhenCallbackDeclines) {
    auto parser = parserFor("@a\nA\n+\nI\n@b\nC\n+\nI\n@c\nG\n+\nI\n");
    const auto count = parser.forEach([](const FastqRecord&) { return false; });
    EXPECT_EQ(count, 1u);
}

TEST(FastqParserTest, MismatchedQualityLengthReportsLine) {
    auto parser = parserFor("@a\nACGT\n+\nIIII\n@b\nACGT\n+\nIII\n");
    ASSERT_TRUE(parser.readRecord().has_value());
    try {
        (void)parser.readRecord();
        FAIL() << "expected FormatError";
    } catch (const FormatError& ex) {
        EXPECT_NE(std::string(ex.what()).find("line 8"), std::string::npos);
        EXPECT_EQ(ex.code(), ErrorCode::kFormatError);
    }
}

TEST(FastqParserTest, RejectsMissingHeaderMarker) {
    auto parser = parserFor(">fasta\nACGT\n");
    EXPECT_THROW((void)parser.readRecord(), FormatError);
}

TEST(FastqParserTest, RejectsTruncatedRecord) {
    auto parser = parserFor("@a\nACGT\n");
    EXPECT_THROW((void)parser.readRecord(), FormatError);
}

TEST(FastqParserTest, QualityValidationCanBeDisabled) {
    const std::string text = "@a\nAC\n+\n\x7f\x7f\n";
    auto strict = parserFor(text);
    EXPECT_THROW((void)strict.readRecord(), FormatError);

    ParserOptions options;
    options.validateQuality = false;
    FastqParser lenient(std::make_unique<std::istringstream>(text), options);
    EXPECT_TRUE(lenient.readRecord().has_value());
}

TEST(FastqParserTest, OpensFilesByPath) {
    gqc::test::TempDir dir;
    gqc::test::writeFile(dir / "reads.fq", "@a\nACGT\n+\nIIII\n");
    FastqParser parser(dir / "reads.fq");
    EXPECT_TRUE(parser.readRecord().has_value());
}

TEST(FastqParserTest, PhredConversion) {
    EXPECT_EQ(qualityToPhred('!'), 0);
    EXPECT_EQ(qualityToPhred('I'), 40);
    EXPECT_TRUE(isValidQuality('~'));
    EXPECT_FALSE(isValidQuality(' '));
}

}  // namespace gqc::io::test
