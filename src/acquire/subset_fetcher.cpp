// =============================================================================
// genoqc - Subset Fetcher Implementation
// =============================================================================

#include "gqc/acquire/subset_fetcher.h"

#include <zlib.h>

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <system_error>

#include "gqc/common/logger.h"
#include "gqc/io/checksum.h"

namespace gqc::acquire {

namespace {

using Clock = std::chrono::steady_clock;

/// @brief Why the sink stopped accepting bytes.
enum class AbortReason : std::uint8_t {
    kNone,
    kLimitReached,
    kCancelled,
    kDeadline,
    kDecodeFailed,
    kRecordFailed
};

FetchOutcome failed(FetchOutcome outcome, FetchStatus status, ErrorCode code,
                    std::string message) {
    outcome.status = status;
    outcome.errorCode = code;
    outcome.message = std::move(message);
    return outcome;
}

ByteCount sizeOnDisk(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<ByteCount>(size);
}

std::string_view stripCarriageReturn(std::string_view line) noexcept {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

// =============================================================================
// BodyDecoder
// =============================================================================

/// @brief Push-mode decoder of a response body: gzip members or plain text.
class BodyDecoder {
public:
    BodyDecoder() = default;

    ~BodyDecoder() {
        if (stream_) {
            inflateEnd(stream_.get());
        }
    }

    BodyDecoder(const BodyDecoder&) = delete;
    BodyDecoder& operator=(const BodyDecoder&) = delete;

    /// @brief Decode @p length body bytes, appending text to @p out.
    VoidResult feed(const char* data, std::size_t length, std::string& out) {
        if (mode_ == Mode::kUndecided) {
            head_.append(data, length);
            if (head_.size() < 2) {
                return {};
            }
            const std::string head = std::move(head_);
            head_.clear();
            if (auto started = start(head); !started) {
                return started;
            }
            return decode(head.data(), head.size(), out);
        }
        return decode(data, length, out);
    }

    /// @brief End of body; a gzip member left open means the body was cut short.
    VoidResult finish(std::string& out) {
        if (mode_ == Mode::kUndecided) {
            out += head_;
            head_.clear();
            return {};
        }
        if (mode_ == Mode::kGzip && memberOpen_) {
            return makeError(ErrorCode::kIntegrityMismatch, "gzip body ends inside a member");
        }
        return {};
    }

private:
    enum class Mode : std::uint8_t { kUndecided, kPlain, kGzip };

    VoidResult start(std::string_view head) {
        const bool gzip = static_cast<unsigned char>(head[0]) == 0x1f &&
                          static_cast<unsigned char>(head[1]) == 0x8b;
        if (!gzip) {
            mode_ = Mode::kPlain;
            return {};
        }
        stream_ = std::make_unique<z_stream>();
        // 16 + MAX_WBITS selects the gzip wrapper.
        const int ret = inflateInit2(stream_.get(), 16 + MAX_WBITS);
        if (ret != Z_OK) {
            stream_.reset();
            return makeError(ErrorCode::kInternalError, "failed to initialize zlib: {}",
                             zError(ret));
        }
        mode_ = Mode::kGzip;
        return {};
    }

    VoidResult decode(const char* data, std::size_t length, std::string& out) {
        if (mode_ == Mode::kPlain) {
            out.append(data, length);
            return {};
        }
        z_stream* stream = stream_.get();
        stream->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        stream->avail_in = static_cast<uInt>(length);
        do {
            stream->next_out = reinterpret_cast<Bytef*>(buffer_.data());
            stream->avail_out = static_cast<uInt>(buffer_.size());
            const int ret = inflate(stream, Z_NO_FLUSH);
            out.append(buffer_.data(), buffer_.size() - stream->avail_out);
            if (ret == Z_STREAM_END) {
                // Another member may follow.
                inflateReset(stream);
                memberOpen_ = false;
            } else if (ret == Z_OK) {
                memberOpen_ = true;
            } else if (ret == Z_BUF_ERROR) {
                break;
            } else {
                return makeError(ErrorCode::kIntegrityMismatch, "gzip body is corrupt: {}",
                                 zError(ret));
            }
        } while (stream->avail_in > 0 || stream->avail_out == 0);
        return {};
    }

    Mode mode_ = Mode::kUndecided;
    std::string head_;
    std::unique_ptr<z_stream> stream_;
    bool memberOpen_ = false;
    std::array<char, 64 * 1024> buffer_{};
};

// =============================================================================
// RecordWriter
// =============================================================================

/// @brief Writes whole FASTQ records to a gzip file until a limit is reached.
class RecordWriter {
public:
    explicit RecordWriter(const SubsetLimit& limit) : limit_(limit) {}

    ~RecordWriter() {
        if (out_ != nullptr) {
            gzclose(out_);
        }
    }

    RecordWriter(const RecordWriter&) = delete;
    RecordWriter& operator=(const RecordWriter&) = delete;

    VoidResult open(const std::filesystem::path& path) {
        path_ = path;
        out_ = gzopen(path.string().c_str(), "wb6");
        if (out_ == nullptr) {
            return makeError(ErrorCode::kIOError, "cannot open '{}' for writing", path.string());
        }
        return {};
    }

    /// @brief Move every complete record out of @p text.
    /// @param endOfBody The body is complete; a last line may lack its newline.
    /// @return true once a limit is reached.
    Result<bool> consume(std::string& text, bool endOfBody) {
        const std::string_view view(text);
        std::size_t pos = 0;
        while (!limitReached_) {
            std::array<std::string_view, 4> lines;
            std::size_t cursor = pos;
            bool complete = true;
            for (std::size_t i = 0; i < lines.size(); ++i) {
                const std::size_t newline = view.find('\n', cursor);
                if (newline == std::string_view::npos) {
                    if (endOfBody && i == 3 && cursor < view.size()) {
                        lines[i] = view.substr(cursor);
                        cursor = view.size();
                        continue;
                    }
                    complete = false;
                    break;
                }
                lines[i] = view.substr(cursor, newline - cursor);
                cursor = newline + 1;
            }
            if (!complete) {
                break;
            }
            if (auto written = write(lines); !written) {
                return makeError(written.error());
            }
            pos = cursor;
        }
        if (endOfBody && !limitReached_ && view.find_first_not_of(" \t\r\n", pos) !=
                                               std::string_view::npos) {
            GQC_LOG_WARNING("Dropped an incomplete trailing record from {}", path_.string());
        }
        text.erase(0, pos);
        return limitReached_;
    }

    VoidResult close() {
        if (out_ == nullptr) {
            return {};
        }
        const int ret = gzclose(out_);
        out_ = nullptr;
        if (ret != Z_OK) {
            return makeError(ErrorCode::kIOError, "cannot finish '{}': {}", path_.string(),
                             zError(ret));
        }
        return {};
    }

    [[nodiscard]] std::uint64_t reads() const noexcept { return reads_; }

    [[nodiscard]] std::uint64_t bases() const noexcept { return bases_; }

private:
    VoidResult write(const std::array<std::string_view, 4>& lines) {
        const std::string_view header = stripCarriageReturn(lines[0]);
        const std::string_view sequence = stripCarriageReturn(lines[1]);
        const std::string_view separator = stripCarriageReturn(lines[2]);
        const std::string_view quality = stripCarriageReturn(lines[3]);
        if (!header.starts_with('@') || !separator.starts_with('+') ||
            sequence.size() != quality.size()) {
            return makeError(ErrorCode::kFormatError, "record {} is not FASTQ", reads_ + 1);
        }

        record_.clear();
        for (const std::string_view line : {header, sequence, separator, quality}) {
            record_ += line;
            record_ += '\n';
        }
        const int written = gzwrite(out_, record_.data(), static_cast<unsigned>(record_.size()));
        if (written != static_cast<int>(record_.size())) {
            int errnum = Z_OK;
            return makeError(ErrorCode::kIOError, "write to '{}' failed: {}", path_.string(),
                             gzerror(out_, &errnum));
        }

        ++reads_;
        bases_ += sequence.size();
        if ((limit_.maxReads && reads_ >= *limit_.maxReads) ||
            (limit_.maxBases && bases_ >= *limit_.maxBases)) {
            limitReached_ = true;
        } else if (limit_.maxBytes && reads_ % kSubsetSizeCheckInterval == 0) {
            if (gzflush(out_, Z_SYNC_FLUSH) != Z_OK) {
                return makeError(ErrorCode::kIOError, "flush of '{}' failed", path_.string());
            }
            limitReached_ = sizeOnDisk(path_) >= *limit_.maxBytes;
        }
        return {};
    }

    SubsetLimit limit_;
    std::filesystem::path path_;
    gzFile out_ = nullptr;
    std::string record_;
    std::uint64_t reads_ = 0;
    std::uint64_t bases_ = 0;
    bool limitReached_ = false;
};

nlohmann::json limitToJson(const SubsetLimit& limit) {
    auto optional = [](const std::optional<std::uint64_t>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };
    nlohmann::json json;
    json["maxBytes"] = optional(limit.maxBytes);
    json["maxReads"] = optional(limit.maxReads);
    json["maxBases"] = optional(limit.maxBases);
    return json;
}

SubsetLimit limitFromJson(const nlohmann::json& json) {
    auto optional = [&](const char* key) -> std::optional<std::uint64_t> {
        if (!json.contains(key) || json.at(key).is_null()) {
            return std::nullopt;
        }
        return json.at(key).get<std::uint64_t>();
    };
    SubsetLimit limit;
    limit.maxBytes = optional("maxBytes");
    limit.maxReads = optional("maxReads");
    limit.maxBases = optional("maxBases");
    return limit;
}

}  // namespace

// =============================================================================
// Subset Record
// =============================================================================

std::filesystem::path subsetRecordPath(const std::filesystem::path& dataFile) {
    std::filesystem::path path = dataFile;
    path += kSubsetRecordSuffix;
    return path;
}

Result<SubsetRecord> readSubsetRecord(const std::filesystem::path& dataFile) {
    const auto path = subsetRecordPath(dataFile);
    std::ifstream in(path);
    if (!in) {
        return makeError(ErrorCode::kIOError, "cannot open '{}'", path.string());
    }
    try {
        const auto json = nlohmann::json::parse(in);
        SubsetRecord record;
        record.sourceUrl = json.at("sourceUrl").get<std::string>();
        record.limit = limitFromJson(json.at("limit"));
        record.reads = json.at("reads").get<std::uint64_t>();
        record.bases = json.at("bases").get<std::uint64_t>();
        record.bytes = json.at("bytes").get<ByteCount>();
        record.sha256 = json.at("sha256").get<std::string>();
        return record;
    } catch (const nlohmann::json::exception& e) {
        return makeError(ErrorCode::kFormatError, "malformed subset record '{}': {}",
                         path.string(), e.what());
    }
}

VoidResult writeSubsetRecord(const std::filesystem::path& dataFile, const SubsetRecord& record) {
    nlohmann::json json;
    json["sourceUrl"] = record.sourceUrl;
    json["limit"] = limitToJson(record.limit);
    json["reads"] = record.reads;
    json["bases"] = record.bases;
    json["bytes"] = record.bytes;
    json["sha256"] = record.sha256;

    const auto path = subsetRecordPath(dataFile);
    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return makeError(ErrorCode::kIOError, "cannot open '{}' for writing", temp.string());
        }
        out << json.dump(2) << '\n';
        if (!out.flush()) {
            return makeError(ErrorCode::kIOError, "write to '{}' failed", temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return makeError(ErrorCode::kIOError, "cannot rename '{}': {}", temp.string(),
                         ec.message());
    }
    return {};
}

// =============================================================================
// Subset Policy
// =============================================================================

void applySubsetLimits(std::vector<DatasetRef>& datasets, const SubsetConfig& config) {
    for (auto& dataset : datasets) {
        for (auto& object : dataset.objects) {
            if (object.subset) {
                continue;
            }
            object.subset = config.limitFor(dataset.technology);
            if (!object.fileName.ends_with(".gz")) {
                object.fileName += ".gz";
            }
        }
    }
}

SubsetLimit pairedMateLimit(std::uint64_t r1Reads) noexcept {
    SubsetLimit limit;
    limit.maxReads = r1Reads;
    return limit;
}

// =============================================================================
// SubsetFetcher
// =============================================================================

SubsetFetcher::SubsetFetcher(TransferConfig config,
                             net::RangeSourcePtr source,
                             CancellationTokenPtr cancellation)
    : config_(std::move(config)),
      source_(std::move(source)),
      cancellation_(std::move(cancellation)) {
    if (!source_) {
        throw GQCException(ErrorCode::kInvalidArgument, "SubsetFetcher requires a RangeSource");
    }
}

SubsetOutcome SubsetFetcher::fetch(const RemoteObject& object,
                                   const SubsetLimit& limit,
                                   const std::filesystem::path& destination) const {
    SubsetOutcome result;
    FetchOutcome& outcome = result.transfer;

    if (cancellation_ && cancellation_->isCancelled()) {
        outcome = failed(std::move(outcome), FetchStatus::kCancelled, ErrorCode::kCancelled,
                         "cancelled before start");
        return result;
    }
    if (limit.empty()) {
        outcome = failed(std::move(outcome), FetchStatus::kFailed, ErrorCode::kInvalidArgument,
                         std::format("no subset limit for {}", object.url));
        return result;
    }

    std::optional<Error> failure;
    {
        RecordWriter writer(limit);
        if (auto opened = writer.open(destination); !opened) {
            outcome = failed(std::move(outcome), FetchStatus::kFailed, opened.error().code(),
                             opened.error().message());
            return result;
        }

        BodyDecoder decoder;
        std::string text;
        AbortReason abort = AbortReason::kNone;

        const auto started = Clock::now();
        const auto deadline = started + std::chrono::seconds(config_.attemptTimeoutSec);
        const auto progressInterval = std::chrono::milliseconds(config_.progressIntervalMs);
        auto lastReport = started;
        ByteCount sinceReport = 0;

        net::RangeRequest request;
        request.url = object.url;
        request.connectTimeoutSec = config_.connectTimeoutSec;
        request.readTimeoutSec = config_.readTimeoutSec;
        request.userAgent = config_.userAgent;
        request.verifyTls = config_.verifyTls;

        auto onResponse = [&](const net::RangeResponse& response) {
            outcome.totalBytes = response.totalSize;
            return true;
        };

        auto sink = [&](const char* data, std::size_t length) {
            if (cancellation_ && cancellation_->isCancelled()) {
                abort = AbortReason::kCancelled;
                return false;
            }
            if (Clock::now() >= deadline) {
                abort = AbortReason::kDeadline;
                return false;
            }
            result.sourceBytes += length;
            if (auto decoded = decoder.feed(data, length, text); !decoded) {
                failure = decoded.error();
                abort = AbortReason::kDecodeFailed;
                return false;
            }
            auto reached = writer.consume(text, false);
            if (!reached) {
                failure = reached.error();
                abort = AbortReason::kRecordFailed;
                return false;
            }
            if (*reached) {
                abort = AbortReason::kLimitReached;
                return false;
            }
            sinceReport += length;
            if (progressCallback_ && (sinceReport >= config_.progressIntervalBytes ||
                                      Clock::now() - lastReport >= progressInterval)) {
                sinceReport = 0;
                lastReport = Clock::now();
                progressCallback_(TransferProgress{
                    object.url, result.sourceBytes, outcome.totalBytes,
                    std::chrono::duration_cast<std::chrono::milliseconds>(lastReport - started)});
            }
            return true;
        };

        auto response = source_->get(request, onResponse, sink);

        if (abort == AbortReason::kNone && response) {
            if (auto finished = decoder.finish(text); !finished) {
                failure = finished.error();
                abort = AbortReason::kDecodeFailed;
            } else if (auto reached = writer.consume(text, true); !reached) {
                failure = reached.error();
                abort = AbortReason::kRecordFailed;
            } else {
                result.exhausted = !*reached;
            }
        }

        auto closed = writer.close();
        result.reads = writer.reads();
        result.bases = writer.bases();
        outcome.bytesWritten = sizeOnDisk(destination);
        outcome.confirmedBytes = outcome.bytesWritten;

        switch (abort) {
            case AbortReason::kNone:
            case AbortReason::kLimitReached:
                break;
            case AbortReason::kCancelled:
                outcome = failed(std::move(outcome), FetchStatus::kCancelled,
                                 ErrorCode::kCancelled, "cancelled");
                return result;
            case AbortReason::kDeadline:
                outcome = failed(std::move(outcome), FetchStatus::kInterrupted,
                                 ErrorCode::kTimeout,
                                 std::format("attempt exceeded {} s", config_.attemptTimeoutSec));
                return result;
            case AbortReason::kDecodeFailed:
            case AbortReason::kRecordFailed: {
                const ErrorCode code = failure->code();
                const FetchStatus status = code == ErrorCode::kIntegrityMismatch
                                               ? FetchStatus::kIntegrityMismatch
                                               : FetchStatus::kFailed;
                outcome = failed(std::move(outcome), status, code, failure->message());
                return result;
            }
        }

        if (abort == AbortReason::kNone && !response) {
            const Error& error = response.error();
            switch (error.code()) {
                case ErrorCode::kInterrupted:
                    outcome = failed(std::move(outcome), FetchStatus::kInterrupted,
                                     ErrorCode::kInterrupted, error.message());
                    return result;
                case ErrorCode::kIntegrityMismatch:
                    outcome = failed(std::move(outcome), FetchStatus::kIntegrityMismatch,
                                     ErrorCode::kIntegrityMismatch, error.message());
                    return result;
                default:
                    outcome = failed(std::move(outcome), FetchStatus::kFailed, error.code(),
                                     error.message());
                    return result;
            }
        }
        if (!closed) {
            outcome = failed(std::move(outcome), FetchStatus::kFailed, closed.error().code(),
                             closed.error().message());
            return result;
        }
    }

    if (result.reads == 0) {
        outcome = failed(std::move(outcome), FetchStatus::kFailed, ErrorCode::kFormatError,
                         std::format("no complete FASTQ record in {}", object.url));
        return result;
    }

    auto digest = io::hashFile(destination, ChecksumAlgorithm::kSha256, config_.hashBufferSize);
    if (!digest) {
        outcome = failed(std::move(outcome), FetchStatus::kFailed, digest.error().code(),
                         digest.error().message());
        return result;
    }
    outcome.actualChecksum = *digest;
    outcome.status = FetchStatus::kCompleted;
    outcome.errorCode = ErrorCode::kSuccess;
    outcome.message.clear();

    GQC_LOG_DEBUG("Subset of {}: {} reads, {} bases from {} source bytes{}", object.url,
                  result.reads, result.bases, result.sourceBytes,
                  result.exhausted ? " (whole file)" : "");
    return result;
}

}  // namespace gqc::acquire
