// =============================================================================
// genoqc - Compressed Stream Support
// =============================================================================
// Transparent decompression of downloaded read files.
//
// Registries serve FASTQ as gzip almost exclusively; bzip2 and xz show up in
// user-supplied sheets. The format is detected from magic bytes, never from
// the file name.
//
// Usage:
//   auto stream = openCompressedFile("data/ERR000001/ERR000001_1.fastq.gz");
//   // Use stream like any std::istream
// =============================================================================

#ifndef GQC_IO_COMPRESSED_STREAM_H
#define GQC_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "gqc/common/error.h"

namespace gqc::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed (plain text)
    kGzip = 1,   ///< gzip (.gz)
    kBzip2 = 2,  ///< bzip2 (.bz2)
    kXz = 3,     ///< xz/lzma (.xz)
};

/// @brief Detect compression format from the leading bytes of a file.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

// =============================================================================
// Decompressing Stream Buffers
// =============================================================================

/// @brief Stream buffer for gzip decompression (zlib).
/// @note Concatenated gzip members are decoded as one stream.
class GzipStreamBuf : public std::streambuf {
public:
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);
    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    /// @brief Decompress more data into the output buffer.
    /// @return Number of bytes decompressed; 0 at end of input.
    std::size_t decompress();

    std::istream* source_;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;
    bool memberOpen_ = false;
    bool streamEnd_ = false;
};

/// @brief Stream buffer for bzip2 decompression (libbz2).
/// @note Concatenated bzip2 streams (pbzip2 output) are decoded as one stream.
class Bzip2StreamBuf : public std::streambuf {
public:
    explicit Bzip2StreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);
    ~Bzip2StreamBuf() override;

    Bzip2StreamBuf(const Bzip2StreamBuf&) = delete;
    Bzip2StreamBuf& operator=(const Bzip2StreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    std::size_t decompress();

    std::istream* source_;
    std::vector<char> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief bzip2 stream state (opaque pointer).
    void* bzStream_ = nullptr;
    bool memberOpen_ = false;
    bool streamEnd_ = false;
};

/// @brief Stream buffer for xz/lzma decompression (liblzma).
class XzStreamBuf : public std::streambuf {
public:
    explicit XzStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);
    ~XzStreamBuf() override;

    XzStreamBuf(const XzStreamBuf&) = delete;
    XzStreamBuf& operator=(const XzStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    std::size_t decompress();

    std::istream* source_;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief lzma stream state (opaque pointer).
    void* lzmaStream_ = nullptr;
    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input file stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @throws IOError if the file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);
    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

private:
    std::ifstream file_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kNone;
};

/// @brief Open a file with automatic decompression.
/// @throws IOError if the file cannot be opened or its stream initialized.
[[nodiscard]] std::unique_ptr<std::istream> openCompressedFile(const std::filesystem::path& path);

}  // namespace gqc::io

#endif  // GQC_IO_COMPRESSED_STREAM_H
