// =============================================================================
// genoqc - Error Handling Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc::test {

TEST(ErrorCodeTest, ExitCodesAreStable) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kNetworkError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kIntegrityMismatch), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kUnsupportedTechnology), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kPartialAcquisitionFailure), 7);
    EXPECT_EQ(toExitCode(ErrorCode::kAggregationIncomplete), 9);
}

TEST(ErrorCodeTest, OnlyTransientFailuresAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::kInterrupted));
    EXPECT_TRUE(isRetryable(ErrorCode::kIntegrityMismatch));
    EXPECT_TRUE(isRetryable(ErrorCode::kTimeout));
    EXPECT_FALSE(isRetryable(ErrorCode::kNetworkError));
    EXPECT_FALSE(isRetryable(ErrorCode::kIOError));
    EXPECT_FALSE(isRetryable(ErrorCode::kUnsupportedTechnology));
}

TEST(GQCExceptionTest, WhatIncludesCategoryAndContext) {
    IntegrityError error("abc", "def", ErrorContext{}.withDataset("ERR1").withOffset(42));
    const std::string what = error.what();
    EXPECT_NE(what.find("[integrity mismatch]"), std::string::npos);
    EXPECT_NE(what.find("expected abc, got def"), std::string::npos);
    EXPECT_NE(what.find("dataset: ERR1"), std::string::npos);
    EXPECT_NE(what.find("offset: 42"), std::string::npos);
    EXPECT_EQ(error.exitCode(), 4);
    ASSERT_TRUE(error.expected().has_value());
    EXPECT_EQ(*error.expected(), "abc");
}

TEST(GQCExceptionTest, PartialAcquisitionCarriesFailedUrls) {
    PartialAcquisitionError error("2 failed", {"https://a/x", "https://a/y"});
    EXPECT_EQ(error.code(), ErrorCode::kPartialAcquisitionFailure);
    EXPECT_EQ(error.failedUrls().size(), 2u);
}

TEST(ResultTest, ThrowExceptionPreservesCode) {
    const Error error{ErrorCode::kUnsupportedTechnology, "tech 'hifi-x'"};
    try {
        error.throwException();
        FAIL() << "expected an exception";
    } catch (const UnsupportedTechnologyError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kUnsupportedTechnology);
        EXPECT_EQ(ex.message(), "tech 'hifi-x'");
    }
}

TEST(ResultTest, TryExecuteConvertsExceptions) {
    auto fromGqc = tryExecute([]() -> int { throw FormatError("bad line"); });
    ASSERT_FALSE(fromGqc.has_value());
    EXPECT_EQ(fromGqc.error().code(), ErrorCode::kFormatError);

    auto fromStd = tryExecute([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_FALSE(fromStd.has_value());
    EXPECT_EQ(fromStd.error().code(), ErrorCode::kInternalError);

    auto ok = tryExecute([] { return 7; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 7);
}

TEST(ResultTest, UnwrapOrThrowReturnsValueOrThrowsTypedException) {
    EXPECT_EQ(unwrapOrThrow(Result<int>{5}), 5);
    EXPECT_NO_THROW(unwrapOrThrow(VoidResult{}));

    Result<int> failed = makeError(ErrorCode::kResolutionFailed, "ERR1: no files");
    EXPECT_THROW((void)unwrapOrThrow(std::move(failed)), GQCException);

    try {
        unwrapOrThrow(VoidResult{makeError(ErrorCode::kIntegrityMismatch, "bad digest")});
        FAIL() << "expected an exception";
    } catch (const GQCException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kIntegrityMismatch);
    }
}

TEST(ResultTest, MakeErrorFormatsMessage) {
    Result<int> result = makeError(ErrorCode::kNetworkError, "HTTP {} for {}", 404, "x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message(), "HTTP 404 for x");
    EXPECT_EQ(result.error().exitCode(), 3);
}

// =============================================================================
// Common types
// =============================================================================

TEST(TypesTest, RegistryFromAccessionPrefix) {
    EXPECT_EQ(registryForAccession("SRR1234567").value(), Registry::kNcbi);
    EXPECT_EQ(registryForAccession("ERR000001").value(), Registry::kEna);
    EXPECT_EQ(registryForAccession("drr000001").value(), Registry::kEna);
    auto unknown = registryForAccession("XYZ123");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::kResolutionFailed);
}

TEST(TypesTest, TechnologyClassesAreClosed) {
    EXPECT_EQ(parseReadTechnology("Short-Read").value(), ReadTechnology::kShortRead);
    EXPECT_EQ(parseReadTechnology("long").value(), ReadTechnology::kLongRead);
    auto unknown = parseReadTechnology("hybrid");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::kUnsupportedTechnology);

    EXPECT_EQ(technologyForPlatform("ILLUMINA").value(), ReadTechnology::kShortRead);
    EXPECT_EQ(technologyForPlatform("OXFORD_NANOPORE").value(), ReadTechnology::kLongRead);
    EXPECT_FALSE(technologyForPlatform("CAPILLARY").has_value());
}

TEST(TypesTest, ChecksumSpecParsing) {
    auto md5 = parseChecksumSpec("D41D8CD98F00B204E9800998ECF8427E");
    ASSERT_TRUE(md5.has_value());
    EXPECT_EQ(md5->algorithm, ChecksumAlgorithm::kMd5);
    EXPECT_EQ(md5->hexDigest, "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5->toString(), "md5:d41d8cd98f00b204e9800998ecf8427e");

    auto xxh = parseChecksumSpec("xxh64:ef46db3751d8e999");
    ASSERT_TRUE(xxh.has_value());
    EXPECT_EQ(xxh->algorithm, ChecksumAlgorithm::kXxHash64);

    EXPECT_FALSE(parseChecksumSpec("md5:1234").has_value());
    EXPECT_FALSE(parseChecksumSpec("crc32:deadbeef").has_value());
    EXPECT_FALSE(parseChecksumSpec("not-a-digest").has_value());
}

TEST(TypesTest, TerminalTransferStates) {
    EXPECT_TRUE(isTerminal(TransferState::kVerified));
    EXPECT_TRUE(isTerminal(TransferState::kFailed));
    EXPECT_FALSE(isTerminal(TransferState::kPaused));
    EXPECT_FALSE(isTerminal(TransferState::kInProgress));
}

}  // namespace gqc::test
