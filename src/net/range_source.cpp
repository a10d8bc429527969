// =============================================================================
// genoqc - HTTP Range Source Implementation
// =============================================================================

#include "gqc/net/range_source.h"

#include <httplib.h>

#include <format>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::net {

// =============================================================================
// URL Helpers
// =============================================================================

std::string UrlParts::origin() const {
    if (port) {
        return std::format("{}://{}:{}", scheme, host, *port);
    }
    return std::format("{}://{}", scheme, host);
}

Result<UrlParts> parseUrl(std::string_view url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        return makeError(ErrorCode::kNetworkError, "URL '{}' has no scheme", url);
    }

    UrlParts parts;
    parts.scheme = std::string(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        return makeError(ErrorCode::kNetworkError, "unsupported URL scheme '{}' in '{}'",
                         parts.scheme, url);
    }

    std::string_view rest = url.substr(schemeEnd + 3);
    const auto pathStart = rest.find('/');
    std::string_view authority = rest.substr(0, pathStart);
    parts.target = pathStart == std::string_view::npos ? "/" : std::string(rest.substr(pathStart));

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port = parseUnsigned<std::uint16_t>(authority.substr(colon + 1));
        if (!port) {
            return makeError(ErrorCode::kNetworkError, "invalid port in URL '{}'", url);
        }
        parts.port = *port;
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return makeError(ErrorCode::kNetworkError, "URL '{}' has no host", url);
    }
    parts.host = std::string(authority);
    return parts;
}

std::string normalizeUrl(std::string_view url) {
    constexpr std::string_view kFtp = "ftp://";
    if (url.starts_with(kFtp)) {
        return std::format("https://{}", url.substr(kFtp.size()));
    }
    // ENA filereport lists bare "host/path" links.
    if (url.find("://") == std::string_view::npos) {
        return std::format("https://{}", url);
    }
    return std::string(url);
}

ErrorCode classifyHttpStatus(int status) noexcept {
    if (status == 416) {
        return ErrorCode::kIntegrityMismatch;
    }
    if (status == 408 || status == 425 || status == 429 || status >= 500) {
        return ErrorCode::kInterrupted;
    }
    return ErrorCode::kNetworkError;
}

std::optional<ByteCount> parseContentRangeTotal(std::string_view header) {
    const auto slash = header.rfind('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    return parseUnsigned<ByteCount>(header.substr(slash + 1));
}

// =============================================================================
// RangeSource
// =============================================================================

Result<std::string> RangeSource::fetchText(const RangeRequest& request) {
    std::string body;
    auto response = get(
        request, [](const RangeResponse&) { return true; },
        [&body](const char* data, std::size_t length) {
            body.append(data, length);
            return true;
        });
    if (!response) {
        return std::unexpected(response.error());
    }
    return body;
}

// =============================================================================
// HttplibRangeSource
// =============================================================================

Result<RangeResponse> HttplibRangeSource::get(const RangeRequest& request,
                                              const ResponseCallback& onResponse,
                                              const ChunkSink& sink) {
    auto parts = parseUrl(request.url);
    if (!parts) {
        return std::unexpected(parts.error());
    }

    httplib::Client client(parts->origin());
    client.set_follow_location(true);
    client.set_connection_timeout(static_cast<time_t>(request.connectTimeoutSec), 0);
    client.set_read_timeout(static_cast<time_t>(request.readTimeoutSec), 0);
    client.enable_server_certificate_verification(request.verifyTls);

    httplib::Headers headers{
        {"User-Agent", request.userAgent},
        {"Accept-Encoding", "identity"},
    };
    if (request.offset > 0) {
        headers.emplace("Range", std::format("bytes={}-", request.offset));
    }

    RangeResponse summary;
    bool statusRejected = false;
    bool callerAborted = false;

    auto result = client.Get(
        parts->target, headers,
        [&](const httplib::Response& response) {
            summary.status = response.status;
            if (response.status != 200 && response.status != 206) {
                statusRejected = true;
                return false;
            }
            summary.partial = response.status == 206;
            if (summary.partial) {
                summary.totalSize =
                    parseContentRangeTotal(response.get_header_value("Content-Range"));
            } else if (response.has_header("Content-Length")) {
                summary.totalSize =
                    parseUnsigned<ByteCount>(response.get_header_value("Content-Length"));
            }
            if (!onResponse(summary)) {
                callerAborted = true;
                return false;
            }
            return true;
        },
        [&](const char* data, std::size_t length) {
            if (!sink(data, length)) {
                callerAborted = true;
                return false;
            }
            return true;
        });

    if (statusRejected) {
        const ErrorCode code = classifyHttpStatus(summary.status);
        GQC_LOG_DEBUG("GET {} (offset {}) -> HTTP {}", request.url, request.offset,
                      summary.status);
        return makeError(code, "HTTP {} for {}", summary.status, request.url);
    }
    if (callerAborted) {
        return makeError(ErrorCode::kCancelled, "transfer of {} aborted", request.url);
    }
    if (!result) {
        return makeError(ErrorCode::kInterrupted, "transfer of {} failed: {}", request.url,
                         httplib::to_string(result.error()));
    }
    return summary;
}

RangeSourcePtr makeHttpRangeSource() {
    return std::make_shared<HttplibRangeSource>();
}

}  // namespace gqc::net
