// =============================================================================
// genoqc - Compressed Stream Implementation
// =============================================================================

#include "gqc/io/compressed_stream.h"

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <cstring>
#include <format>

#include "gqc/common/logger.h"

namespace gqc::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

template <std::size_t N>
bool startsWith(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

/// @brief Refill @p buffer from @p source; returns the number of bytes read.
template <typename Byte>
std::size_t refill(std::istream& source, std::vector<Byte>& buffer) {
    if (source.eof()) {
        return 0;
    }
    source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return static_cast<std::size_t>(source.gcount());
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (startsWith(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (startsWith(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (startsWith(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kNone:
            return "none";
    }
    return "unknown";
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper.
    int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw IOError(std::format("failed to initialize zlib: {}", zError(ret)));
    }
    zlibStream_ = stream;
}

GzipStreamBuf::~GzipStreamBuf() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    inflateEnd(stream);
    delete stream;
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }
    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->avail_out = static_cast<uInt>(outputBuffer_.size());
    stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

    while (!streamEnd_ && stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0) {
            std::size_t bytesRead = refill(*source_, inputBuffer_);
            if (bytesRead == 0) {
                if (memberOpen_) {
                    throw IOError("truncated gzip stream");
                }
                streamEnd_ = true;
                break;
            }
            stream->avail_in = static_cast<uInt>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            // Another member may follow.
            inflateReset(stream);
            memberOpen_ = false;
        } else if (ret == Z_OK || ret == Z_BUF_ERROR) {
            memberOpen_ = true;
        } else {
            throw IOError(std::format("gzip decompression failed: {}", zError(ret)));
        }
    }
    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// Bzip2StreamBuf Implementation
// =============================================================================

Bzip2StreamBuf::Bzip2StreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto* stream = new bz_stream;
    std::memset(stream, 0, sizeof(bz_stream));

    int ret = BZ2_bzDecompressInit(stream, 0, 0);
    if (ret != BZ_OK) {
        delete stream;
        throw IOError(std::format("failed to initialize bzip2 (code {})", ret));
    }
    bzStream_ = stream;
}

Bzip2StreamBuf::~Bzip2StreamBuf() {
    auto* stream = static_cast<bz_stream*>(bzStream_);
    BZ2_bzDecompressEnd(stream);
    delete stream;
}

Bzip2StreamBuf::int_type Bzip2StreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }
    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t Bzip2StreamBuf::decompress() {
    auto* stream = static_cast<bz_stream*>(bzStream_);
    stream->avail_out = static_cast<unsigned int>(outputBuffer_.size());
    stream->next_out = outputBuffer_.data();

    while (!streamEnd_ && stream->avail_out == outputBuffer_.size()) {
        if (stream->avail_in == 0) {
            std::size_t bytesRead = refill(*source_, inputBuffer_);
            if (bytesRead == 0) {
                if (memberOpen_) {
                    throw IOError("truncated bzip2 stream");
                }
                streamEnd_ = true;
                break;
            }
            stream->avail_in = static_cast<unsigned int>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        int ret = BZ2_bzDecompress(stream);
        if (ret == BZ_STREAM_END) {
            // Restart the decoder for a following stream, keeping pending input.
            char* nextIn = stream->next_in;
            unsigned int availIn = stream->avail_in;
            char* nextOut = stream->next_out;
            unsigned int availOut = stream->avail_out;
            BZ2_bzDecompressEnd(stream);
            std::memset(stream, 0, sizeof(bz_stream));
            if (BZ2_bzDecompressInit(stream, 0, 0) != BZ_OK) {
                throw IOError("failed to reinitialize bzip2");
            }
            stream->next_in = nextIn;
            stream->avail_in = availIn;
            stream->next_out = nextOut;
            stream->avail_out = availOut;
            memberOpen_ = false;
        } else if (ret == BZ_OK) {
            memberOpen_ = true;
        } else {
            throw IOError(std::format("bzip2 decompression failed (code {})", ret));
        }
    }
    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// XzStreamBuf Implementation
// =============================================================================

XzStreamBuf::XzStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto* stream = new lzma_stream;
    *stream = LZMA_STREAM_INIT;

    lzma_ret ret = lzma_stream_decoder(stream, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        delete stream;
        throw IOError(std::format("failed to initialize liblzma (code {})", static_cast<int>(ret)));
    }
    lzmaStream_ = stream;
}

XzStreamBuf::~XzStreamBuf() {
    auto* stream = static_cast<lzma_stream*>(lzmaStream_);
    lzma_end(stream);
    delete stream;
}

XzStreamBuf::int_type XzStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }
    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t XzStreamBuf::decompress() {
    auto* stream = static_cast<lzma_stream*>(lzmaStream_);
    stream->avail_out = outputBuffer_.size();
    stream->next_out = reinterpret_cast<std::uint8_t*>(outputBuffer_.data());

    while (!streamEnd_ && stream->avail_out == outputBuffer_.size()) {
        lzma_action action = LZMA_RUN;
        if (stream->avail_in == 0) {
            std::size_t bytesRead = refill(*source_, inputBuffer_);
            if (bytesRead == 0) {
                // LZMA_CONCATENATED needs LZMA_FINISH to report the end.
                action = LZMA_FINISH;
            } else {
                stream->avail_in = bytesRead;
                stream->next_in = inputBuffer_.data();
            }
        }

        lzma_ret ret = lzma_code(stream, action);
        if (ret == LZMA_STREAM_END) {
            streamEnd_ = true;
        } else if (ret == LZMA_BUF_ERROR && action == LZMA_FINISH) {
            throw IOError("truncated xz stream");
        } else if (ret != LZMA_OK) {
            throw IOError(std::format("xz decompression failed (code {})", static_cast<int>(ret)));
        }
    }
    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr), file_(path, std::ios::binary) {
    if (!file_.is_open()) {
        throw IOError(std::format("failed to open '{}'", path.string()));
    }

    std::uint8_t magic[8];
    file_.read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(file_.gcount());
    file_.clear();
    file_.seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});
    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(file_.rdbuf());
            break;
        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(file_);
            break;
        case CompressionFormat::kBzip2:
            decompressBuf_ = std::make_unique<Bzip2StreamBuf>(file_);
            break;
        case CompressionFormat::kXz:
            decompressBuf_ = std::make_unique<XzStreamBuf>(file_);
            break;
    }
    // Decoder failures surface as exceptions rather than a silent EOF.
    exceptions(std::ios::badbit);
    if (decompressBuf_) {
        rdbuf(decompressBuf_.get());
        GQC_LOG_DEBUG("Opened {} compressed stream {}", compressionFormatName(format_),
                      path.string());
    }
}

CompressedInputStream::~CompressedInputStream() = default;

std::unique_ptr<std::istream> openCompressedFile(const std::filesystem::path& path) {
    return std::make_unique<CompressedInputStream>(path);
}

}  // namespace gqc::io
