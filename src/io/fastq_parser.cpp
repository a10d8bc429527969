// =============================================================================
// genoqc - FASTQ Parser Implementation
// =============================================================================

#include "gqc/io/fastq_parser.h"

#include <algorithm>
#include <format>

#include "gqc/common/logger.h"
#include "gqc/io/compressed_stream.h"

namespace gqc::io {

FastqParser::FastqParser(const std::filesystem::path& filePath, ParserOptions options)
    : source_(filePath.string()), options_(options), stream_(openCompressedFile(filePath)) {
    GQC_LOG_DEBUG("Opened FASTQ file: {}", source_);
}

FastqParser::FastqParser(std::unique_ptr<std::istream> stream, ParserOptions options)
    : source_("<stream>"), options_(options), stream_(std::move(stream)) {
    if (!stream_) {
        throw IOError("FASTQ parser constructed without a stream");
    }
}

FastqParser::~FastqParser() = default;

FastqParser::FastqParser(FastqParser&&) noexcept = default;
FastqParser& FastqParser::operator=(FastqParser&&) noexcept = default;

std::optional<FastqRecord> FastqParser::readRecord() {
    if (eof_) {
        return std::nullopt;
    }
    FastqRecord record;
    if (!parseRecord(record)) {
        return std::nullopt;
    }
    stats_.update(record);
    return record;
}

std::uint64_t FastqParser::forEach(const RecordCallback& callback) {
    std::uint64_t count = 0;
    FastqRecord record;
    while (!eof_ && parseRecord(record)) {
        stats_.update(record);
        ++count;
        if (!callback(record)) {
            break;
        }
    }
    return count;
}

bool FastqParser::readLine(std::string& line) {
    if (!std::getline(*stream_, line)) {
        eof_ = true;
        return false;
    }
    ++lineNumber_;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    return true;
}

void FastqParser::fail(std::string_view what) const {
    throw FormatError(std::format("{}: invalid FASTQ at line {}: {}", source_, lineNumber_, what));
}

bool FastqParser::parseRecord(FastqRecord& record) {
    record.clear();

    // Line 1: '@' header; blank lines between records are tolerated.
    std::string idLine;
    do {
        if (!readLine(idLine)) {
            return false;
        }
    } while (idLine.empty());

    if (idLine.front() != '@') {
        fail("expected '@' at start of header line");
    }
    std::string_view idView(idLine);
    idView.remove_prefix(1);
    auto spacePos = idView.find_first_of(" \t");
    record.id = std::string(idView.substr(0, spacePos));
    if (spacePos != std::string_view::npos) {
        record.comment = std::string(idView.substr(spacePos + 1));
    }
    if (record.id.empty()) {
        fail("empty read id");
    }

    // Line 2: sequence
    if (!readLine(record.sequence)) {
        fail("unexpected end of input, missing sequence line");
    }
    if (record.sequence.empty() && !options_.allowEmptySequence) {
        fail("empty sequence");
    }

    // Line 3: '+' separator
    if (!readLine(separator_)) {
        fail("unexpected end of input, missing '+' line");
    }
    if (separator_.empty() || separator_.front() != '+') {
        fail("expected '+' at start of separator line");
    }

    // Line 4: quality; an empty quality line may be eaten by getline at EOF.
    if (!readLine(record.quality) && !record.sequence.empty()) {
        fail("unexpected end of input, missing quality line");
    }
    if (record.quality.size() != record.sequence.size()) {
        fail(std::format("quality length {} does not match sequence length {}",
                         record.quality.size(), record.sequence.size()));
    }
    if (options_.validateQuality &&
        !std::all_of(record.quality.begin(), record.quality.end(), isValidQuality)) {
        fail("invalid quality characters");
    }
    return true;
}

}  // namespace gqc::io
