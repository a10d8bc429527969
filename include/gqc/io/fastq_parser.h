// =============================================================================
// genoqc - FASTQ Parser
// =============================================================================
// Streaming 4-line FASTQ parser over plain or compressed input.
//
// Usage:
//   FastqParser parser("data/ERR000001/ERR000001_1.fastq.gz");
//   parser.forEach([](const FastqRecord& record) {
//       // process record...
//       return true;
//   });
// =============================================================================

#ifndef GQC_IO_FASTQ_PARSER_H
#define GQC_IO_FASTQ_PARSER_H

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gqc/common/error.h"

namespace gqc::io {

// =============================================================================
// FASTQ Record
// =============================================================================

/// @brief A single FASTQ record.
struct FastqRecord {
    /// @brief Read identifier (without '@' prefix).
    std::string id;

    /// @brief Optional comment after ID (space-separated).
    std::string comment;

    std::string sequence;

    /// @brief Quality scores (Phred+33 encoded).
    std::string quality;

    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }

    void clear() noexcept {
        id.clear();
        comment.clear();
        sequence.clear();
        quality.clear();
    }
};

// =============================================================================
// Parser Statistics
// =============================================================================

/// @brief Running totals over the records parsed so far.
struct ParserStats {
    std::uint64_t totalRecords = 0;
    std::uint64_t totalBases = 0;
    std::uint64_t minLength = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t maxLength = 0;

    void update(const FastqRecord& record) noexcept {
        ++totalRecords;
        auto len = static_cast<std::uint64_t>(record.length());
        totalBases += len;
        minLength = std::min(minLength, len);
        maxLength = std::max(maxLength, len);
    }

    [[nodiscard]] double averageLength() const noexcept {
        return totalRecords > 0 ? static_cast<double>(totalBases) / totalRecords : 0.0;
    }
};

/// @brief Parser configuration.
struct ParserOptions {
    /// @brief Reject quality characters outside Phred+33 '!'..'~'.
    bool validateQuality = true;

    /// @brief Accept records with an empty sequence (some long-read exports emit them).
    bool allowEmptySequence = true;
};

// =============================================================================
// FastqParser Class
// =============================================================================

/// @brief Streaming FASTQ parser.
/// @note Not thread-safe; use one parser per file.
class FastqParser {
public:
    /// @brief Callback for record processing; return false to stop.
    using RecordCallback = std::function<bool(const FastqRecord&)>;

    /// @brief Open @p filePath with transparent decompression.
    /// @throws IOError if the file cannot be opened.
    explicit FastqParser(const std::filesystem::path& filePath, ParserOptions options = {});

    /// @brief Parse from an already opened stream.
    explicit FastqParser(std::unique_ptr<std::istream> stream, ParserOptions options = {});

    ~FastqParser();

    FastqParser(const FastqParser&) = delete;
    FastqParser& operator=(const FastqParser&) = delete;
    FastqParser(FastqParser&&) noexcept;
    FastqParser& operator=(FastqParser&&) noexcept;

    /// @brief Read a single record.
    /// @return The parsed record, or nullopt at end of input.
    /// @throws FormatError on malformed input.
    [[nodiscard]] std::optional<FastqRecord> readRecord();

    /// @brief Process all remaining records.
    /// @return Number of records passed to @p callback.
    /// @throws FormatError on malformed input.
    std::uint64_t forEach(const RecordCallback& callback);

    [[nodiscard]] const ParserStats& stats() const noexcept { return stats_; }

    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    [[nodiscard]] bool eof() const noexcept { return eof_; }

private:
    [[nodiscard]] bool readLine(std::string& line);

    [[nodiscard]] bool parseRecord(FastqRecord& record);

    [[noreturn]] void fail(std::string_view what) const;

    std::string source_;
    ParserOptions options_;
    std::unique_ptr<std::istream> stream_;
    bool eof_ = false;
    std::uint64_t lineNumber_ = 0;
    ParserStats stats_;
    std::string separator_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert quality character to Phred score.
[[nodiscard]] constexpr std::uint8_t qualityToPhred(char c) noexcept {
    return static_cast<std::uint8_t>(c - '!');
}

/// @brief Check if a character is a valid quality score.
[[nodiscard]] constexpr bool isValidQuality(char c) noexcept {
    return c >= '!' && c <= '~';  // Phred+33: 0-93
}

}  // namespace gqc::io

#endif  // GQC_IO_FASTQ_PARSER_H
