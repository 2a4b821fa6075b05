#pragma once

/**
 * DownloadSource.hpp
 *
 * Transport-neutral contract between the resume state machine and a
 * byte source. Adapters are registered per protocol in a SourceFactory.
 */

#include <cctype>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::core::downloader {

/**
 * URL plus protocol discriminator ("http", "https", ...)
 */
struct SourceLocator {
    std::string url;
    std::string protocol;

    /**
     * Split the scheme off a URL
     * @return nullopt if the URL has no "scheme://" prefix
     */
    static std::optional<SourceLocator> fromUrl(const std::string& url) {
        auto pos = url.find("://");
        if (pos == std::string::npos || pos == 0 || pos + 3 >= url.size()) {
            return std::nullopt;
        }

        std::string scheme = url.substr(0, pos);
        for (auto& c : scheme) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return SourceLocator{url, scheme};
    }
};

/**
 * Result of a successful probe
 */
struct SourceMetadata {
    std::optional<uint64_t> expectedSize;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    bool acceptsRanges{false};

    bool hasFreshnessToken() const {
        return etag.has_value() || lastModified.has_value();
    }
};

/**
 * Validators a ranged fetch is conditioned on
 */
struct FreshnessToken {
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    /**
     * The strong ETag when known, otherwise the Last-Modified date
     */
    std::optional<std::string> preferred() const {
        return etag ? etag : lastModified;
    }
};

enum class SourceErrorKind {
    Protocol,               // Malformed or unsupported response
    Unreachable,            // Connection-level failure
    RangeUnsupported,       // Source ignored the requested offset
    UnexpectedStatus,
    ResourceChanged,        // Freshness precondition failed
    RangeNotSatisfiable
};

inline const char* toString(SourceErrorKind kind) {
    switch (kind) {
        case SourceErrorKind::Protocol:            return "Protocol";
        case SourceErrorKind::Unreachable:         return "Unreachable";
        case SourceErrorKind::RangeUnsupported:    return "RangeUnsupported";
        case SourceErrorKind::UnexpectedStatus:    return "UnexpectedStatus";
        case SourceErrorKind::ResourceChanged:     return "ResourceChanged";
        case SourceErrorKind::RangeNotSatisfiable: return "RangeNotSatisfiable";
    }
    return "Protocol";
}

/**
 * Classified adapter failure
 */
class SourceError : public std::runtime_error {
public:
    SourceError(SourceErrorKind kind, const std::string& message, bool transient = false)
        : std::runtime_error(message), m_kind(kind), m_transient(transient) {}

    SourceErrorKind kind() const { return m_kind; }
    bool transient() const { return m_transient; }

private:
    SourceErrorKind m_kind;
    bool m_transient;
};

/**
 * Lazy, finite, non-restartable byte stream starting at the requested offset
 */
class ChunkStream {
public:
    virtual ~ChunkStream() = default;

    /**
     * Read the next chunk
     * @param chunk Receives between 1 and maxBytes bytes
     * @param maxBytes Upper bound for this chunk
     * @return false at end of stream (chunk left empty)
     * @throws SourceError on transport failure
     */
    virtual bool next(std::vector<char>& chunk, size_t maxBytes) = 0;
};

class DownloadSource {
public:
    virtual ~DownloadSource() = default;

    /**
     * Fetch size, freshness tokens and range support
     * @throws SourceError
     */
    virtual SourceMetadata probe(const SourceLocator& locator) = 0;

    /**
     * Open a stream from byte offset start
     * @param expected Validators recorded for the partial data; a source
     *                 whose ETag or Last-Modified differs surfaces as
     *                 ResourceChanged
     * @throws SourceError (RangeUnsupported when start > 0 cannot be honored)
     */
    virtual std::unique_ptr<ChunkStream> fetchRange(
        const SourceLocator& locator,
        uint64_t start,
        const FreshnessToken& expected
    ) = 0;
};

using DownloadSourcePtr = std::shared_ptr<DownloadSource>;

/**
 * Protocol -> adapter lookup
 */
class SourceFactory {
public:
    void registerSource(const std::string& protocol, DownloadSourcePtr source) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sources[protocol] = std::move(source);
    }

    DownloadSourcePtr find(const std::string& protocol) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sources.find(protocol);
        return it != m_sources.end() ? it->second : nullptr;
    }

    bool supports(const std::string& protocol) const {
        return find(protocol) != nullptr;
    }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, DownloadSourcePtr> m_sources;
};

} // namespace ferry::core::downloader
