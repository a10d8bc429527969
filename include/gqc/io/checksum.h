// =============================================================================
// genoqc - Checksum Computation
// =============================================================================
// Incremental digests for verifying downloaded objects.
//
// This module provides:
// - StreamingHasher: incremental MD5 / SHA-256 (OpenSSL EVP) and xxh64 (xxHash)
// - hashFile(): digest of a whole file read in bounded chunks
// - verifyFile(): compare a file against an expected ChecksumSpec
//
// Usage:
//   StreamingHasher hasher(ChecksumAlgorithm::kMd5);
//   hasher.update(bytes);
//   std::string hex = hasher.finalHex();
// =============================================================================

#ifndef GQC_IO_CHECKSUM_H
#define GQC_IO_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc::io {

// =============================================================================
// StreamingHasher
// =============================================================================

/// @brief Incremental digest over a byte stream.
class StreamingHasher {
public:
    /// @brief Construct a hasher for the given algorithm.
    /// @throws GQCException (kInternalError) if the digest backend cannot be initialized.
    explicit StreamingHasher(ChecksumAlgorithm algorithm);

    ~StreamingHasher();

    // Non-copyable
    StreamingHasher(const StreamingHasher&) = delete;
    StreamingHasher& operator=(const StreamingHasher&) = delete;

    // Movable
    StreamingHasher(StreamingHasher&& other) noexcept;
    StreamingHasher& operator=(StreamingHasher&& other) noexcept;

    /// @brief Feed more bytes.
    void update(std::span<const std::uint8_t> data);

    /// @brief Feed more bytes from a char buffer.
    void update(std::string_view data);

    /// @brief Finish and return the lower-case hex digest.
    /// @note The hasher cannot be updated afterwards.
    [[nodiscard]] std::string finalHex();

    [[nodiscard]] ChecksumAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    void release() noexcept;

    ChecksumAlgorithm algorithm_;

    /// @brief OpenSSL EVP_MD_CTX (opaque pointer).
    void* evpContext_ = nullptr;

    /// @brief XXH64_state_t (opaque pointer).
    void* xxhState_ = nullptr;

    bool finalized_ = false;
};

// =============================================================================
// File Helpers
// =============================================================================

/// @brief Hash a whole file.
/// @param path File to hash.
/// @param algorithm Digest algorithm.
/// @param bufferSize Bytes read per chunk.
/// @return Lower-case hex digest, or kIOError.
[[nodiscard]] Result<std::string> hashFile(const std::filesystem::path& path,
                                           ChecksumAlgorithm algorithm,
                                           std::size_t bufferSize = kDefaultHashBufferSize);

/// @brief Check a file against an expected digest.
/// @return true on match, false on mismatch, kIOError if unreadable.
[[nodiscard]] Result<bool> verifyFile(const std::filesystem::path& path,
                                      const ChecksumSpec& expected,
                                      std::size_t bufferSize = kDefaultHashBufferSize);

/// @brief Convert raw digest bytes to lower-case hex.
[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

}  // namespace gqc::io

#endif  // GQC_IO_CHECKSUM_H
