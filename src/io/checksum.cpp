// =============================================================================
// genoqc - Checksum Computation Implementation
// =============================================================================

#include "gqc/io/checksum.h"

#include <openssl/evp.h>
#include <xxhash.h>

#include <array>
#include <format>
#include <fstream>
#include <utility>
#include <vector>

namespace gqc::io {

namespace {

EVP_MD_CTX* evp(void* ptr) noexcept {
    return static_cast<EVP_MD_CTX*>(ptr);
}

XXH64_state_t* xxh(void* ptr) noexcept {
    return static_cast<XXH64_state_t*>(ptr);
}

const EVP_MD* evpDigest(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::kMd5:
            return EVP_md5();
        case ChecksumAlgorithm::kSha256:
            return EVP_sha256();
        case ChecksumAlgorithm::kXxHash64:
            return nullptr;
    }
    return nullptr;
}

}  // namespace

std::string toHex(std::span<const std::uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(bytes.size() * 2, '0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        out[2 * i] = kDigits[(bytes[i] >> 4) & 0x0F];
        out[2 * i + 1] = kDigits[bytes[i] & 0x0F];
    }
    return out;
}

// =============================================================================
// StreamingHasher Implementation
// =============================================================================

StreamingHasher::StreamingHasher(ChecksumAlgorithm algorithm) : algorithm_(algorithm) {
    if (algorithm_ == ChecksumAlgorithm::kXxHash64) {
        XXH64_state_t* state = XXH64_createState();
        if (state == nullptr || XXH64_reset(state, 0) == XXH_ERROR) {
            XXH64_freeState(state);
            throw GQCException(ErrorCode::kInternalError, "failed to initialize xxh64 state");
        }
        xxhState_ = state;
        return;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, evpDigest(algorithm_), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw GQCException(ErrorCode::kInternalError,
                           std::format("failed to initialize {} digest",
                                       checksumAlgorithmToString(algorithm_)));
    }
    evpContext_ = ctx;
}

StreamingHasher::~StreamingHasher() {
    release();
}

StreamingHasher::StreamingHasher(StreamingHasher&& other) noexcept
    : algorithm_(other.algorithm_),
      evpContext_(std::exchange(other.evpContext_, nullptr)),
      xxhState_(std::exchange(other.xxhState_, nullptr)),
      finalized_(other.finalized_) {}

StreamingHasher& StreamingHasher::operator=(StreamingHasher&& other) noexcept {
    if (this != &other) {
        release();
        algorithm_ = other.algorithm_;
        evpContext_ = std::exchange(other.evpContext_, nullptr);
        xxhState_ = std::exchange(other.xxhState_, nullptr);
        finalized_ = other.finalized_;
    }
    return *this;
}

void StreamingHasher::release() noexcept {
    if (evpContext_ != nullptr) {
        EVP_MD_CTX_free(evp(evpContext_));
        evpContext_ = nullptr;
    }
    if (xxhState_ != nullptr) {
        XXH64_freeState(xxh(xxhState_));
        xxhState_ = nullptr;
    }
}

void StreamingHasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw GQCException(ErrorCode::kInvalidState, "hasher already finalized");
    }
    if (data.empty()) {
        return;
    }
    if (xxhState_ != nullptr) {
        XXH64_update(xxh(xxhState_), data.data(), data.size());
        return;
    }
    if (EVP_DigestUpdate(evp(evpContext_), data.data(), data.size()) != 1) {
        throw GQCException(ErrorCode::kInternalError, "EVP_DigestUpdate failed");
    }
}

void StreamingHasher::update(std::string_view data) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()),
                                         data.size()));
}

std::string StreamingHasher::finalHex() {
    if (finalized_) {
        throw GQCException(ErrorCode::kInvalidState, "hasher already finalized");
    }
    finalized_ = true;

    if (xxhState_ != nullptr) {
        // Canonical (big-endian) form, matching xxhsum output.
        XXH64_canonical_t canonical;
        XXH64_canonicalFromHash(&canonical, XXH64_digest(xxh(xxhState_)));
        return toHex(std::span<const std::uint8_t>(canonical.digest, sizeof(canonical.digest)));
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(evp(evpContext_), digest.data(), &length) != 1) {
        throw GQCException(ErrorCode::kInternalError, "EVP_DigestFinal_ex failed");
    }
    return toHex(std::span<const std::uint8_t>(digest.data(), length));
}

// =============================================================================
// File Helpers
// =============================================================================

Result<std::string> hashFile(const std::filesystem::path& path,
                             ChecksumAlgorithm algorithm,
                             std::size_t bufferSize) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError(ErrorCode::kIOError, "cannot open '{}' for hashing", path.string());
    }

    return tryExecute([&]() -> std::string {
        StreamingHasher hasher(algorithm);
        std::vector<char> buffer(bufferSize);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = file.gcount();
            if (got > 0) {
                hasher.update(std::string_view(buffer.data(), static_cast<std::size_t>(got)));
            }
        }
        if (file.bad()) {
            throw IOError("read failed while hashing", ErrorContext{path.string()});
        }
        return hasher.finalHex();
    });
}

Result<bool> verifyFile(const std::filesystem::path& path,
                        const ChecksumSpec& expected,
                        std::size_t bufferSize) {
    auto actual = hashFile(path, expected.algorithm, bufferSize);
    if (!actual) {
        return std::unexpected(actual.error());
    }
    return *actual == expected.hexDigest;
}

}  // namespace gqc::io
