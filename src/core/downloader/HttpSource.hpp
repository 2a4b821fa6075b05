#pragma once

/**
 * HttpSource.hpp
 *
 * HTTP(S) adapter for the download source contract, built on cpr.
 */

#include "DownloadSource.hpp"

#include <cpr/cprtypes.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::core::downloader {

/**
 * @brief HTTP request options
 */
struct HttpSourceOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{10000};
    std::string userAgent{"Ferry/1.0"};
    bool verifySsl{true};
    std::map<std::string, std::string> headers;

    // Body bytes queued between the connection and the reader
    size_t bufferLimit{1024 * 1024};

    /**
     * Read downloads.timeout and downloads.userAgent from the global config
     */
    static HttpSourceOptions fromConfig();
};

/**
 * Parsed "Content-Range: bytes first-last/total" (or "bytes * /total")
 */
struct ContentRange {
    std::optional<uint64_t> first;
    std::optional<uint64_t> last;
    std::optional<uint64_t> total;
};

/**
 * Status and headers of the final response, known before its body
 */
struct ResponseHead {
    long status{0};
    cpr::Header headers;

    /**
     * Feed one raw header line. A status line starts a new head, so only
     * the last response of a redirect chain is kept.
     */
    void addLine(const std::string& line);

    /**
     * Trimmed header value, nullopt when absent or blank
     */
    std::optional<std::string> header(const std::string& name) const;
};

enum class HttpMethod { Head, Get };

/**
 * One HTTP exchange delivered incrementally
 */
class HttpTransport {
public:
    using HeadHandler = std::function<bool(const ResponseHead&)>;
    using BodyHandler = std::function<bool(std::string_view)>;

    virtual ~HttpTransport() = default;

    /**
     * Send a request. onHead sees the head before any body byte, onBody
     * the body piece by piece; either one returning false ends the
     * exchange early without an error.
     * @throws SourceError Unreachable (transient) when the exchange breaks
     */
    virtual void perform(HttpMethod method, const std::string& url, const cpr::Header& headers,
                         const HeadHandler& onHead, const BodyHandler& onBody) = 0;
};

/**
 * libcurl transport through a cpr::Session per exchange
 */
class CprTransport : public HttpTransport {
public:
    explicit CprTransport(HttpSourceOptions options);

    void perform(HttpMethod method, const std::string& url, const cpr::Header& headers,
                 const HeadHandler& onHead, const BodyHandler& onBody) override;

private:
    HttpSourceOptions m_options;
};

class HttpSource : public DownloadSource {
public:
    explicit HttpSource(HttpSourceOptions options = {},
                        std::shared_ptr<HttpTransport> transport = nullptr);

    /**
     * HEAD, falling back to a one-byte ranged GET when HEAD is refused
     * or reports no length. The fallback stops at the response head.
     */
    SourceMetadata probe(const SourceLocator& locator) override;

    /**
     * One open-ended ranged GET guarded by If-Range, streamed through a
     * bounded queue
     */
    std::unique_ptr<ChunkStream> fetchRange(
        const SourceLocator& locator,
        uint64_t start,
        const FreshnessToken& expected
    ) override;

    // Header helpers
    static std::optional<ContentRange> parseContentRange(const std::string& value);

    /**
     * Weak validators ("W/...") cannot protect a resume
     */
    static std::optional<std::string> strongEtag(const std::string& value);

    /**
     * Map a non-success status to a classified error
     */
    static SourceError statusError(long statusCode, const std::string& url);

    /**
     * Judge the head of a ranged GET issued from offset start
     * @return the error to raise, nullopt when the body can be consumed
     */
    static std::optional<SourceError> checkRangeResponse(const ResponseHead& head, uint64_t start,
                                                         const FreshnessToken& expected,
                                                         const std::string& url);

    const HttpSourceOptions& options() const { return m_options; }

private:
    SourceMetadata probeWithRangedGet(const SourceLocator& locator);

    HttpSourceOptions m_options;
    std::shared_ptr<HttpTransport> m_transport;
};

} // namespace ferry::core::downloader
