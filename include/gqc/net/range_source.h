// =============================================================================
// genoqc - HTTP Range Source
// =============================================================================
// Byte-range GET requests against registry file servers.
//
// This module provides:
// - RangeSource: abstract source of object bytes from an offset
// - HttplibRangeSource: cpp-httplib implementation (HTTP/HTTPS, redirects)
// - Status classification shared by all implementations
//
// The Transfer Engine depends only on RangeSource so tests can substitute a
// scripted in-memory source.
// =============================================================================

#ifndef GQC_NET_RANGE_SOURCE_H
#define GQC_NET_RANGE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gqc/common/config.h"
#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc::net {

// =============================================================================
// Request / Response
// =============================================================================

/// @brief One ranged GET.
struct RangeRequest {
    std::string url;

    /// @brief First byte wanted; 0 sends no Range header.
    ByteCount offset = 0;

    std::uint32_t connectTimeoutSec = kDefaultConnectTimeoutSec;
    std::uint32_t readTimeoutSec = kDefaultReadTimeoutSec;
    std::string userAgent{kDefaultUserAgent};
    bool verifyTls = true;
};

/// @brief Response header summary, delivered before the first body chunk.
struct RangeResponse {
    int status = 0;

    /// @brief Server honoured the Range header (206).
    bool partial = false;

    /// @brief Full object size (Content-Range total, or Content-Length of a 200).
    std::optional<ByteCount> totalSize;
};

/// @brief Receives the response header; return false to abort the request.
using ResponseCallback = std::function<bool(const RangeResponse&)>;

/// @brief Receives body bytes in order; return false to abort the request.
using ChunkSink = std::function<bool(const char* data, std::size_t length)>;

/// @brief Parts of an http(s) URL.
struct UrlParts {
    std::string scheme;
    std::string host;
    std::optional<std::uint16_t> port;

    /// @brief Path plus query, at least "/".
    std::string target;

    /// @brief "scheme://host[:port]".
    [[nodiscard]] std::string origin() const;
};

/// @brief Split an http:// or https:// URL.
[[nodiscard]] Result<UrlParts> parseUrl(std::string_view url);

/// @brief Rewrite ftp:// registry links to https:// (same host and path).
/// @note Registry mirrors serve identical content over both protocols.
[[nodiscard]] std::string normalizeUrl(std::string_view url);

/// @brief Classify an HTTP status that is not 200/206.
/// @return kInterrupted for 408/425/429/5xx, kIntegrityMismatch for 416,
///         kNetworkError otherwise.
[[nodiscard]] ErrorCode classifyHttpStatus(int status) noexcept;

/// @brief Parse "bytes a-b/N" (or "bytes */N") into N.
[[nodiscard]] std::optional<ByteCount> parseContentRangeTotal(std::string_view header);

// =============================================================================
// RangeSource
// =============================================================================

/// @brief Source of remote object bytes.
class RangeSource {
public:
    virtual ~RangeSource() = default;

    /// @brief Issue a GET from request.offset, streaming the body into @p sink.
    /// @return Response summary on a complete body. On failure:
    ///         kInterrupted (transient; resumable), kNetworkError (permanent),
    ///         kIntegrityMismatch (range not satisfiable), kCancelled (a callback
    ///         returned false).
    [[nodiscard]] virtual Result<RangeResponse> get(const RangeRequest& request,
                                                    const ResponseCallback& onResponse,
                                                    const ChunkSink& sink) = 0;

    /// @brief Fetch a small text document (metadata APIs).
    [[nodiscard]] virtual Result<std::string> fetchText(const RangeRequest& request);
};

using RangeSourcePtr = std::shared_ptr<RangeSource>;

// =============================================================================
// HttplibRangeSource
// =============================================================================

/// @brief RangeSource over cpp-httplib; follows redirects.
class HttplibRangeSource final : public RangeSource {
public:
    HttplibRangeSource() = default;

    [[nodiscard]] Result<RangeResponse> get(const RangeRequest& request,
                                            const ResponseCallback& onResponse,
                                            const ChunkSink& sink) override;
};

/// @brief Create the default network source.
[[nodiscard]] RangeSourcePtr makeHttpRangeSource();

}  // namespace gqc::net

#endif  // GQC_NET_RANGE_SOURCE_H
