// =============================================================================
// genoqc - Acquisition Manager Implementation
// =============================================================================

#include "gqc/acquire/acquisition_manager.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/parallel_for_each.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <format>
#include <mutex>
#include <system_error>

#include "gqc/acquire/manifest.h"
#include "gqc/common/logger.h"
#include "gqc/common/strings.h"
#include "gqc/io/checksum.h"

namespace gqc::acquire {

namespace {

std::string joinUrls(const std::vector<std::string>& urls) {
    std::string joined;
    for (const auto& url : urls) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += url;
    }
    return joined;
}

std::optional<ByteCount> existingSize(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<ByteCount>(size);
}

}  // namespace

// =============================================================================
// AcquisitionResult / BatchAcquisitionResult
// =============================================================================

bool AcquisitionResult::ok() const noexcept {
    return std::all_of(objects.begin(), objects.end(), [](const ObjectRecord& record) {
        return record.state == TransferState::kVerified;
    });
}

std::size_t AcquisitionResult::verifiedCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(objects.begin(), objects.end(), [](const ObjectRecord& record) {
            return record.state == TransferState::kVerified;
        }));
}

std::vector<std::string> AcquisitionResult::failedUrls() const {
    std::vector<std::string> urls;
    for (const auto& record : objects) {
        if (record.state == TransferState::kFailed) {
            urls.push_back(record.object.url);
        }
    }
    return urls;
}

std::vector<std::filesystem::path> AcquisitionResult::verifiedFiles() const {
    std::vector<std::filesystem::path> files;
    for (const auto& record : objects) {
        if (record.state == TransferState::kVerified) {
            files.push_back(record.finalPath);
        }
    }
    return files;
}

VoidResult AcquisitionResult::status() const {
    const auto failed = failedUrls();
    if (!failed.empty()) {
        return makeError(ErrorCode::kPartialAcquisitionFailure, "{}: {} object(s) failed: {}",
                         accession, failed.size(), joinUrls(failed));
    }
    if (!ok()) {
        return makeError(ErrorCode::kCancelled, "{}: acquisition cancelled", accession);
    }
    return {};
}

bool BatchAcquisitionResult::ok() const noexcept {
    return std::all_of(datasets.begin(), datasets.end(),
                       [](const AcquisitionResult& result) { return result.ok(); });
}

std::vector<std::string> BatchAcquisitionResult::failedUrls() const {
    std::vector<std::string> urls;
    for (const auto& dataset : datasets) {
        auto failed = dataset.failedUrls();
        urls.insert(urls.end(), failed.begin(), failed.end());
    }
    return urls;
}

VoidResult BatchAcquisitionResult::status() const {
    const auto failed = failedUrls();
    if (!failed.empty()) {
        return makeError(ErrorCode::kPartialAcquisitionFailure, "{} object(s) failed: {}",
                         failed.size(), joinUrls(failed));
    }
    if (!ok()) {
        return makeError(ErrorCode::kCancelled, "acquisition cancelled");
    }
    return {};
}

void BatchAcquisitionResult::throwIfFailed() const {
    auto failed = failedUrls();
    if (!failed.empty()) {
        const std::string message =
            std::format("{} object(s) failed: {}", failed.size(), joinUrls(failed));
        throw PartialAcquisitionError(message, std::move(failed));
    }
}

// =============================================================================
// AcquisitionManager::Impl
// =============================================================================

class AcquisitionManager::Impl {
public:
    Impl(const AcquisitionConfig& config,
         TransferConfig transferConfig,
         net::RangeSourcePtr source,
         CancellationTokenPtr cancellation)
        : config_(config),
          cancellation_(cancellation ? std::move(cancellation) : makeCancellationToken()),
          engine_(transferConfig, source, cancellation_),
          subsetFetcher_(std::move(transferConfig), std::move(source), cancellation_),
          arena_(static_cast<int>(config.maxConcurrentTransfers)),
          manifest_(config.dataDir / kManifestFileName) {}

    AcquisitionResult acquire(const DatasetRef& dataset, const AcquisitionManager& owner);

    void setProgressCallback(const TransferProgressCallback& callback) {
        engine_.setProgressCallback(callback);
        subsetFetcher_.setProgressCallback(callback);
    }

    tbb::task_arena& arena() noexcept { return arena_; }

private:
    /// @brief Run the state machine of one object to a terminal (or paused) state.
    void drive(const DatasetRef& dataset, ObjectRecord& record,
               const std::optional<SubsetLimit>& limit) const;

    /// @brief Drive an R1/R2 subset pair; R2 stops at R1's read count.
    void drivePair(const DatasetRef& dataset, ObjectRecord& r1, ObjectRecord& r2) const;

    /// @brief Accept a final file left by an earlier run after checking it.
    [[nodiscard]] bool reuseExisting(const DatasetRef& dataset, ObjectRecord& record,
                                     const std::optional<SubsetLimit>& limit) const;

    /// @brief Rename a verified partial file and record its digest.
    void complete(ObjectRecord& record, const FetchOutcome& outcome,
                  const std::optional<SubsetLimit>& limit) const;

    /// @brief Retire the partial file after a verified fetch.
    void promote(ObjectRecord& record) const;

    /// @brief Delete the partial file; false (and record failed) if that fails.
    [[nodiscard]] bool discardPartial(ObjectRecord& record) const;

    void writeManifest(const DatasetRef& dataset, const std::vector<ObjectRecord>& records);

    const AcquisitionConfig& config_;
    CancellationTokenPtr cancellation_;
    TransferEngine engine_;
    SubsetFetcher subsetFetcher_;
    tbb::task_arena arena_;
    ManifestWriter manifest_;
};

AcquisitionResult AcquisitionManager::Impl::acquire(const DatasetRef& dataset,
                                                    const AcquisitionManager& owner) {
    AcquisitionResult result;
    result.accession = dataset.accession;
    result.objects.reserve(dataset.objects.size());
    bool pathsValid = true;
    for (const auto& object : dataset.objects) {
        ObjectRecord record;
        record.object = object;
        if (auto path = owner.finalPathFor(dataset, object)) {
            record.finalPath = std::move(*path);
            record.partPath = record.finalPath;
            record.partPath += kPartialSuffix;
        } else {
            record.state = TransferState::kFailed;
            record.lastError = path.error().code();
            record.lastMessage = path.error().message();
            GQC_LOG_ERROR("{}", record.lastMessage);
            pathsValid = false;
        }
        result.objects.push_back(std::move(record));
    }
    if (!pathsValid) {
        for (auto& record : result.objects) {
            if (record.state == TransferState::kPending) {
                record.state = TransferState::kFailed;
                record.lastError = ErrorCode::kInvalidArgument;
                record.lastMessage = "not attempted: dataset has invalid names";
            }
        }
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.dataDir / dataset.accession, ec);
    if (ec) {
        for (auto& record : result.objects) {
            record.state = TransferState::kFailed;
            record.lastError = ErrorCode::kIOError;
            record.lastMessage = std::format("cannot create dataset directory: {}", ec.message());
        }
        GQC_LOG_ERROR("{}: cannot create dataset directory: {}", dataset.accession, ec.message());
        return result;
    }

    // Paired subsets run as one unit so R2 can follow R1's read count.
    auto findRole = [&](ObjectRole role) -> ObjectRecord* {
        for (auto& record : result.objects) {
            if (record.object.role == role && record.object.subset) {
                return &record;
            }
        }
        return nullptr;
    };
    ObjectRecord* r1 = findRole(ObjectRole::kShortR1);
    ObjectRecord* r2 = findRole(ObjectRole::kShortR2);
    const bool paired = r1 != nullptr && r2 != nullptr;

    std::vector<ObjectRecord*> units;
    for (auto& record : result.objects) {
        if (!paired || &record != r2) {
            units.push_back(&record);
        }
    }
    tbb::parallel_for_each(units.begin(), units.end(), [&](ObjectRecord* record) {
        if (paired && record == r1) {
            drivePair(dataset, *r1, *r2);
        } else {
            drive(dataset, *record, record->object.subset);
        }
    });

    result.cancelled = std::any_of(
        result.objects.begin(), result.objects.end(),
        [](const ObjectRecord& record) { return !isTerminal(record.state); });

    if (config_.writeManifest) {
        writeManifest(dataset, result.objects);
    }

    GQC_LOG_INFO("{}: {}/{} object(s) verified", dataset.accession, result.verifiedCount(),
                 result.objects.size());
    return result;
}

void AcquisitionManager::Impl::drivePair(const DatasetRef& dataset, ObjectRecord& r1,
                                         ObjectRecord& r2) const {
    drive(dataset, r1, r1.object.subset);
    if (r1.state == TransferState::kVerified && r1.subset) {
        drive(dataset, r2, pairedMateLimit(r1.subset->reads));
        return;
    }
    if (r1.state == TransferState::kFailed) {
        r2.state = TransferState::kFailed;
        r2.lastError = ErrorCode::kInvalidState;
        r2.lastMessage = std::format("mate {} failed", r1.object.fileName);
        GQC_LOG_ERROR("{}: {} skipped: {}", dataset.accession, r2.object.fileName,
                      r2.lastMessage);
        return;
    }
    // R1 was cancelled; R2 stays pending.
    r2.lastError = ErrorCode::kCancelled;
    r2.lastMessage = "cancelled";
}

bool AcquisitionManager::Impl::reuseExisting(const DatasetRef& dataset, ObjectRecord& record,
                                             const std::optional<SubsetLimit>& limit) const {
    const RemoteObject& object = record.object;
    const auto size = existingSize(record.finalPath);
    if (!size) {
        return false;
    }
    const std::size_t bufferSize = engine_.config().hashBufferSize;

    std::optional<SubsetRecord> stored;
    std::optional<ChecksumSpec> expected;
    if (limit) {
        auto found = readSubsetRecord(record.finalPath);
        if (!found) {
            GQC_LOG_WARNING("{}: {} has no usable subset record ({}); downloading again",
                            dataset.accession, object.fileName, found.error().message());
            return false;
        }
        if (found->sourceUrl != object.url || found->limit != *limit || found->bytes != *size) {
            GQC_LOG_INFO("{}: stored subset of {} differs from the requested one; downloading "
                         "again",
                         dataset.accession, object.fileName);
            return false;
        }
        expected = ChecksumSpec{ChecksumAlgorithm::kSha256, found->sha256};
        stored = std::move(*found);
    } else {
        if (object.expectedSize && *object.expectedSize != *size) {
            GQC_LOG_WARNING("{}: {} has {} bytes, expected {}; downloading again",
                            dataset.accession, object.fileName, *size, *object.expectedSize);
            return false;
        }
        if (!object.expectedSize && !object.expectedChecksum) {
            GQC_LOG_WARNING("{}: {} exists but nothing is known to verify it; downloading again",
                            dataset.accession, object.fileName);
            return false;
        }
        expected = object.expectedChecksum;
    }

    if (expected) {
        auto match = io::verifyFile(record.finalPath, *expected, bufferSize);
        if (!match) {
            GQC_LOG_WARNING("{}: cannot verify existing {}: {}; downloading again",
                            dataset.accession, object.fileName, match.error().message());
            return false;
        }
        if (!*match) {
            GQC_LOG_WARNING("{}: existing {} does not match {}; downloading again",
                            dataset.accession, object.fileName, expected->toString());
            return false;
        }
        record.actualChecksum = expected;
    }

    record.state = TransferState::kVerified;
    record.confirmedBytes = *size;
    record.reused = true;
    record.subset = std::move(stored);
    GQC_LOG_DEBUG("{}: {} already verified", dataset.accession, object.fileName);
    return true;
}

void AcquisitionManager::Impl::drive(const DatasetRef& dataset, ObjectRecord& record,
                                     const std::optional<SubsetLimit>& limit) const {
    const RemoteObject& object = record.object;

    if (reuseExisting(dataset, record, limit)) {
        return;
    }

    // Subsets are rewritten from the first record on every attempt.
    ByteCount offset = limit ? 0 : existingSize(record.partPath).value_or(0);
    if (offset > 0) {
        GQC_LOG_INFO("{}: resuming {} at byte {}", dataset.accession, object.fileName, offset);
    }

    for (std::uint32_t attempt = 1; attempt <= config_.maxAttempts; ++attempt) {
        if (cancellation_->isCancelled()) {
            record.state = TransferState::kPaused;
            record.lastError = ErrorCode::kCancelled;
            record.lastMessage = "cancelled";
            return;
        }

        record.state = TransferState::kInProgress;
        record.attempts = attempt;
        FetchOutcome outcome;
        if (limit) {
            SubsetOutcome subset = subsetFetcher_.fetch(object, *limit, record.partPath);
            if (subset.transfer.ok()) {
                SubsetRecord stored;
                stored.sourceUrl = object.url;
                stored.limit = *limit;
                stored.reads = subset.reads;
                stored.bases = subset.bases;
                stored.bytes = subset.transfer.confirmedBytes;
                stored.sha256 = subset.transfer.actualChecksum.value_or("");
                record.subset = std::move(stored);
            }
            outcome = std::move(subset.transfer);
        } else {
            outcome = engine_.fetch(object, record.partPath, offset);
        }
        record.confirmedBytes = outcome.confirmedBytes;
        record.lastError = outcome.errorCode;
        record.lastMessage = outcome.message;

        switch (outcome.status) {
            case FetchStatus::kCompleted:
                complete(record, outcome, limit);
                return;

            case FetchStatus::kCancelled:
                record.state = TransferState::kPaused;
                return;

            case FetchStatus::kUnverifiable:
                // Unchecked bytes are never promoted; another attempt cannot verify them either.
                if (discardPartial(record)) {
                    record.state = TransferState::kFailed;
                    record.lastError = ErrorCode::kIntegrityMismatch;
                }
                GQC_LOG_ERROR("{}: {} failed: {}", dataset.accession, object.fileName,
                              outcome.message);
                return;

            case FetchStatus::kInterrupted:
            case FetchStatus::kIntegrityMismatch:
            case FetchStatus::kFailed:
                break;
        }

        if (!isRetryable(outcome.errorCode)) {
            record.state = TransferState::kFailed;
            GQC_LOG_ERROR("{}: {} failed: {}", dataset.accession, object.fileName,
                          outcome.message);
            return;
        }

        if (outcome.status == FetchStatus::kIntegrityMismatch) {
            // A failed whole-file check taints every byte; restart from zero.
            if (!discardPartial(record)) {
                return;
            }
            offset = 0;
            record.confirmedBytes = 0;
            GQC_LOG_WARNING("{}: {} failed verification (attempt {}/{}): {}",
                            dataset.accession, object.fileName, attempt, config_.maxAttempts,
                            outcome.message);
        } else {
            offset = limit ? 0 : outcome.confirmedBytes;
            GQC_LOG_WARNING("{}: {} interrupted at byte {} (attempt {}/{}): {}",
                            dataset.accession, object.fileName, outcome.confirmedBytes, attempt,
                            config_.maxAttempts, outcome.message);
        }
        record.state = TransferState::kPaused;

        if (attempt == config_.maxAttempts) {
            break;
        }
        if (cancellation_->waitFor(config_.backoffAfter(attempt))) {
            record.lastError = ErrorCode::kCancelled;
            record.lastMessage = "cancelled while waiting to retry";
            return;
        }
    }

    record.state = TransferState::kFailed;
    GQC_LOG_ERROR("{}: {} gave up after {} attempt(s): {}", dataset.accession, object.fileName,
                  record.attempts, record.lastMessage);
}

void AcquisitionManager::Impl::complete(ObjectRecord& record, const FetchOutcome& outcome,
                                        const std::optional<SubsetLimit>& limit) const {
    if (outcome.actualChecksum) {
        const ChecksumAlgorithm algorithm = limit ? ChecksumAlgorithm::kSha256
                                                  : record.object.expectedChecksum->algorithm;
        record.actualChecksum = ChecksumSpec{algorithm, *outcome.actualChecksum};
    }

    promote(record);
    if (record.state != TransferState::kVerified) {
        return;
    }

    if (!record.actualChecksum) {
        auto digest = io::hashFile(record.finalPath, ChecksumAlgorithm::kSha256,
                                   engine_.config().hashBufferSize);
        if (digest) {
            record.actualChecksum = ChecksumSpec{ChecksumAlgorithm::kSha256, std::move(*digest)};
        } else {
            GQC_LOG_WARNING("Cannot hash {}: {}", record.finalPath.string(),
                            digest.error().message());
        }
    }

    if (record.subset) {
        if (auto written = writeSubsetRecord(record.finalPath, *record.subset); !written) {
            GQC_LOG_WARNING("Subset record not written; {} will be downloaded again next run: {}",
                            record.finalPath.string(), written.error().message());
        }
    }
}

void AcquisitionManager::Impl::promote(ObjectRecord& record) const {
    std::error_code ec;
    std::filesystem::rename(record.partPath, record.finalPath, ec);
    if (ec) {
        record.state = TransferState::kFailed;
        record.lastError = ErrorCode::kIOError;
        record.lastMessage = std::format("cannot rename '{}' to '{}': {}",
                                         record.partPath.string(), record.finalPath.string(),
                                         ec.message());
        GQC_LOG_ERROR("{}", record.lastMessage);
        return;
    }
    record.state = TransferState::kVerified;
    GQC_LOG_INFO("Verified {} ({} bytes, {} attempt(s))", record.finalPath.string(),
                 record.confirmedBytes, record.attempts);
}

bool AcquisitionManager::Impl::discardPartial(ObjectRecord& record) const {
    std::error_code ec;
    std::filesystem::remove(record.partPath, ec);
    if (ec) {
        record.state = TransferState::kFailed;
        record.lastError = ErrorCode::kIOError;
        record.lastMessage =
            std::format("cannot discard '{}': {}", record.partPath.string(), ec.message());
        return false;
    }
    return true;
}

void AcquisitionManager::Impl::writeManifest(const DatasetRef& dataset,
                                             const std::vector<ObjectRecord>& records) {
    std::vector<ManifestEntry> entries;
    const std::string created = utcTimestamp();
    for (const auto& record : records) {
        if (record.state != TransferState::kVerified || record.reused) {
            continue;
        }
        ManifestEntry entry;
        entry.fileName = record.object.fileName;
        entry.role = record.object.role;
        entry.accession = dataset.accession;
        entry.registry = dataset.registry;
        entry.technology = dataset.technology;
        entry.sourceUrl = record.object.url;
        entry.bytes = record.confirmedBytes;
        if (record.actualChecksum) {
            entry.checksum = record.actualChecksum->toString();
        }
        entry.createdUtc = created;
        entries.push_back(std::move(entry));
    }
    if (auto written = manifest_.append(entries); !written) {
        GQC_LOG_WARNING("Manifest not updated: {}", written.error().message());
    }
}

// =============================================================================
// AcquisitionManager
// =============================================================================

AcquisitionManager::AcquisitionManager(AcquisitionConfig config,
                                       TransferConfig transferConfig,
                                       net::RangeSourcePtr source,
                                       CancellationTokenPtr cancellation)
    : config_(std::move(config)) {
    unwrapOrThrow(config_.validate());
    impl_ = std::make_unique<Impl>(config_, std::move(transferConfig), std::move(source),
                                   std::move(cancellation));
}

AcquisitionManager::~AcquisitionManager() = default;

Result<std::filesystem::path> AcquisitionManager::finalPathFor(const DatasetRef& dataset,
                                                               const RemoteObject& object) const {
    if (!isSafePathComponent(dataset.accession)) {
        return makeError(ErrorCode::kInvalidArgument,
                         "accession '{}' is not a valid directory name", dataset.accession);
    }
    if (!isSafePathComponent(object.fileName)) {
        return makeError(ErrorCode::kInvalidArgument, "{}: file name '{}' of {} is not valid",
                         dataset.accession, object.fileName, object.url);
    }
    return config_.dataDir / dataset.accession / object.fileName;
}

void AcquisitionManager::setProgressCallback(TransferProgressCallback callback) {
    impl_->setProgressCallback(callback);
}

AcquisitionResult AcquisitionManager::acquire(const DatasetRef& dataset) {
    AcquisitionResult result;
    impl_->arena().execute([&] { result = impl_->acquire(dataset, *this); });
    return result;
}

BatchAcquisitionResult AcquisitionManager::acquireBatch(const std::vector<DatasetRef>& datasets) {
    BatchAcquisitionResult batch;
    batch.datasets.resize(datasets.size());
    impl_->arena().execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, datasets.size()),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  batch.datasets[i] = impl_->acquire(datasets[i], *this);
                              }
                          });
    });
    return batch;
}

}  // namespace gqc::acquire
