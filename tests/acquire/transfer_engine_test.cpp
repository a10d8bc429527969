// =============================================================================
// genoqc - Transfer Engine Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "gqc/acquire/transfer_engine.h"
#include "gqc/io/checksum.h"
#include "support/fake_range_source.h"
#include "support/temp_dir.h"

namespace gqc::acquire::test {

using gqc::test::FakeRangeSource;
using gqc::test::FakeStep;
using gqc::test::readFile;
using gqc::test::TempDir;
using gqc::test::writeFile;

namespace {

constexpr const char* kUrl = "https://files.example.org/ERR1/ERR1_1.fastq.gz";

[[nodiscard]] std::string makeBody(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>((i * 131 + 7) % 251);
    }
    return body;
}

[[nodiscard]] std::string md5Of(std::string_view data) {
    io::StreamingHasher hasher(ChecksumAlgorithm::kMd5);
    hasher.update(data);
    return hasher.finalHex();
}

[[nodiscard]] RemoteObject objectFor(const std::string& body) {
    RemoteObject object;
    object.url = kUrl;
    object.fileName = "ERR1_1.fastq.gz";
    object.expectedSize = body.size();
    object.expectedChecksum = ChecksumSpec{ChecksumAlgorithm::kMd5, md5Of(body)};
    return object;
}

}  // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        body_ = makeBody(1000);
        source_ = std::make_shared<FakeRangeSource>();
        source_->add(kUrl, body_);
        part_ = dir_ / "ERR1_1.fastq.gz.part";
    }

    [[nodiscard]] TransferEngine engine(CancellationTokenPtr token = nullptr) const {
        return TransferEngine(TransferConfig{}, source_, std::move(token));
    }

    TempDir dir_;
    std::string body_;
    std::shared_ptr<FakeRangeSource> source_;
    std::filesystem::path part_;
};

TEST_F(TransferEngineTest, CleanFetchIsVerified) {
    const auto outcome = engine().fetch(objectFor(body_), part_, 0);
    ASSERT_EQ(outcome.status, FetchStatus::kCompleted) << outcome.message;
    EXPECT_EQ(outcome.bytesWritten, body_.size());
    EXPECT_EQ(outcome.confirmedBytes, body_.size());
    EXPECT_EQ(outcome.actualChecksum, md5Of(body_));
    EXPECT_EQ(readFile(part_), body_);
}

TEST_F(TransferEngineTest, DisconnectThenResumeFromConfirmedBytes) {
    source_->script(kUrl, {FakeStep::disconnectAfter(300)});
    const auto object = objectFor(body_);

    const auto first = engine().fetch(object, part_, 0);
    ASSERT_EQ(first.status, FetchStatus::kInterrupted);
    EXPECT_EQ(first.errorCode, ErrorCode::kInterrupted);
    EXPECT_EQ(first.confirmedBytes, 300u);

    const auto second = engine().fetch(object, part_, first.confirmedBytes);
    ASSERT_EQ(second.status, FetchStatus::kCompleted) << second.message;
    EXPECT_EQ(second.bytesWritten, body_.size() - 300);
    EXPECT_FALSE(second.rangeIgnored);
    EXPECT_EQ(readFile(part_), body_);

    const auto requests = source_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].offset, 300u);
}

TEST_F(TransferEngineTest, CorruptBodyIsIntegrityMismatch) {
    source_->script(kUrl, {FakeStep::corrupt()});
    const auto outcome = engine().fetch(objectFor(body_), part_, 0);
    EXPECT_EQ(outcome.status, FetchStatus::kIntegrityMismatch);
    EXPECT_EQ(outcome.errorCode, ErrorCode::kIntegrityMismatch);
    ASSERT_TRUE(outcome.actualChecksum.has_value());
    EXPECT_NE(*outcome.actualChecksum, md5Of(body_));
    // The engine never deletes; the caller decides.
    EXPECT_TRUE(std::filesystem::exists(part_));
}

TEST_F(TransferEngineTest, IgnoredRangeRewritesFromZero) {
    writeFile(part_, body_.substr(0, 400));
    source_->script(kUrl, {FakeStep::ignoreRange()});

    const auto outcome = engine().fetch(objectFor(body_), part_, 400);
    ASSERT_EQ(outcome.status, FetchStatus::kCompleted) << outcome.message;
    EXPECT_TRUE(outcome.rangeIgnored);
    EXPECT_EQ(outcome.bytesWritten, body_.size());
    EXPECT_EQ(readFile(part_), body_);
}

TEST_F(TransferEngineTest, LongerPartialFileIsTruncatedToOffset) {
    writeFile(part_, body_.substr(0, 200) + "garbage beyond the confirmed offset");
    const auto outcome = engine().fetch(objectFor(body_), part_, 200);
    ASSERT_EQ(outcome.status, FetchStatus::kCompleted) << outcome.message;
    EXPECT_EQ(readFile(part_), body_);
}

TEST_F(TransferEngineTest, ShorterPartialFileIsIntegrityMismatch) {
    writeFile(part_, body_.substr(0, 100));
    const auto outcome = engine().fetch(objectFor(body_), part_, 500);
    EXPECT_EQ(outcome.status, FetchStatus::kIntegrityMismatch);
    EXPECT_EQ(outcome.confirmedBytes, 100u);
    EXPECT_TRUE(source_->requests().empty());
}

TEST_F(TransferEngineTest, CompletePartialFileIsOnlyVerified) {
    writeFile(part_, body_);
    const auto outcome = engine().fetch(objectFor(body_), part_, body_.size());
    EXPECT_EQ(outcome.status, FetchStatus::kCompleted);
    EXPECT_TRUE(source_->requests().empty());
}

TEST_F(TransferEngineTest, SizeDisagreementAbortsBeforeWriting) {
    auto object = objectFor(body_);
    object.expectedSize = body_.size() + 1;
    const auto outcome = engine().fetch(object, part_, 0);
    EXPECT_EQ(outcome.status, FetchStatus::kIntegrityMismatch);
    EXPECT_EQ(outcome.bytesWritten, 0u);
}

TEST_F(TransferEngineTest, NotFoundIsPermanentFailure) {
    source_->script(kUrl, {FakeStep::httpStatus(404)});
    const auto outcome = engine().fetch(objectFor(body_), part_, 0);
    EXPECT_EQ(outcome.status, FetchStatus::kFailed);
    EXPECT_EQ(outcome.errorCode, ErrorCode::kNetworkError);
}

TEST_F(TransferEngineTest, ServerErrorIsTransient) {
    source_->script(kUrl, {FakeStep::httpStatus(503)});
    const auto outcome = engine().fetch(objectFor(body_), part_, 0);
    EXPECT_EQ(outcome.status, FetchStatus::kInterrupted);
}

TEST_F(TransferEngineTest, NothingToVerifyAgainstIsUnverifiable) {
    RemoteObject object;
    object.url = kUrl;
    object.fileName = "ERR1_1.fastq.gz";

    // The fake always reports a total size, so hide it behind a source that does not.
    class SizelessSource final : public net::RangeSource {
    public:
        explicit SizelessSource(std::shared_ptr<FakeRangeSource> inner) : inner_(std::move(inner)) {}
        Result<net::RangeResponse> get(const net::RangeRequest& request,
                                       const net::ResponseCallback& onResponse,
                                       const net::ChunkSink& sink) override {
            auto strip = [&](const net::RangeResponse& response) {
                net::RangeResponse copy = response;
                copy.totalSize.reset();
                return onResponse(copy);
            };
            auto response = inner_->get(request, strip, sink);
            if (response) {
                response->totalSize.reset();
            }
            return response;
        }

    private:
        std::shared_ptr<FakeRangeSource> inner_;
    };

    TransferEngine sizeless(TransferConfig{}, std::make_shared<SizelessSource>(source_));
    const auto outcome = sizeless.fetch(object, part_, 0);
    EXPECT_EQ(outcome.status, FetchStatus::kUnverifiable);
    EXPECT_EQ(readFile(part_), body_);
}

TEST_F(TransferEngineTest, CancelledTokenKeepsPartialBytes) {
    writeFile(part_, body_.substr(0, 250));
    auto token = makeCancellationToken();
    token->requestCancel();

    const auto outcome = engine(token).fetch(objectFor(body_), part_, 250);
    EXPECT_EQ(outcome.status, FetchStatus::kCancelled);
    EXPECT_EQ(outcome.confirmedBytes, 250u);
    EXPECT_TRUE(source_->requests().empty());
}

TEST_F(TransferEngineTest, ProgressIsMonotonic) {
    TransferConfig config;
    config.progressIntervalBytes = 128;
    TransferEngine reporting(config, source_);
    std::vector<ByteCount> seen;
    reporting.setProgressCallback(
        [&seen](const TransferProgress& progress) { seen.push_back(progress.confirmedBytes); });

    const auto outcome = reporting.fetch(objectFor(body_), part_, 0);
    ASSERT_TRUE(outcome.ok());
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.back(), body_.size());
}

RC_GTEST_PROP(TransferEngineProperty, ResumeAfterAnyDisconnectIsByteIdentical, ()) {
    const auto size = *rc::gen::inRange<std::size_t>(1, 4096);
    const auto cut = *rc::gen::inRange<std::size_t>(0, size);
    const auto chunk = *rc::gen::inRange<std::size_t>(1, 512);
    const std::string body = makeBody(size);

    TempDir dir;
    auto source = std::make_shared<FakeRangeSource>();
    source->add(kUrl, body);
    source->setChunkSize(chunk);
    source->script(kUrl, {FakeStep::disconnectAfter(cut)});

    TransferEngine engine(TransferConfig{}, source);
    const auto object = objectFor(body);
    const auto part = dir / "object.part";

    const auto first = engine.fetch(object, part, 0);
    RC_ASSERT(first.status == FetchStatus::kInterrupted);
    RC_ASSERT(first.confirmedBytes == cut);

    const auto second = engine.fetch(object, part, first.confirmedBytes);
    RC_ASSERT(second.status == FetchStatus::kCompleted);
    RC_ASSERT(readFile(part) == body);
}

}  // namespace gqc::acquire::test
