/**
 * HttpSource.cpp
 *
 * HTTP adapter implementation using cpr (which wraps libcurl).
 */

#include "HttpSource.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ferry::core::downloader {

using utils::StringUtils;

namespace {

std::optional<uint64_t> parseUInt(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void readValidators(const ResponseHead& head, SourceMetadata& meta) {
    if (auto etag = head.header("ETag")) {
        meta.etag = HttpSource::strongEtag(*etag);
    }
    meta.lastModified = head.header("Last-Modified");
}

/**
 * Run a request for its head only; the body is never consumed
 */
ResponseHead fetchHead(HttpTransport& transport, HttpMethod method, const std::string& url,
                       const cpr::Header& headers = {}) {
    ResponseHead result;
    transport.perform(method, url, headers,
                      [&result](const ResponseHead& head) {
                          result = head;
                          return false;
                      },
                      [](std::string_view) { return false; });
    return result;
}

std::optional<SourceError> changedValidator(const ResponseHead& head, const FreshnessToken& expected,
                                            const std::string& url) {
    if (expected.etag) {
        auto etag = head.header("ETag");
        auto strong = etag ? HttpSource::strongEtag(*etag) : std::nullopt;
        if (strong && *strong != *expected.etag) {
            return SourceError(SourceErrorKind::ResourceChanged, url + ": ETag changed to " + *strong, false);
        }
    }
    if (expected.lastModified) {
        auto lastModified = head.header("Last-Modified");
        if (lastModified && *lastModified != *expected.lastModified) {
            return SourceError(SourceErrorKind::ResourceChanged,
                               url + ": Last-Modified changed to " + *lastModified, false);
        }
    }
    return std::nullopt;
}

/**
 * Body of one ranged GET, pumped by a background thread into a bounded
 * queue. Destroying the stream cancels the exchange.
 */
class HttpChunkStream : public ChunkStream {
public:
    HttpChunkStream(std::shared_ptr<HttpTransport> transport, std::string url, uint64_t start,
                    FreshnessToken expected, size_t bufferLimit)
        : m_transport(std::move(transport))
        , m_url(std::move(url))
        , m_start(start)
        , m_expected(std::move(expected))
        , m_bufferLimit(std::max<size_t>(bufferLimit, 1)) {
        m_worker = std::thread([this] { pump(); });
    }

    ~HttpChunkStream() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_condition.notify_all();
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

    bool next(std::vector<char>& chunk, size_t maxBytes) override {
        chunk.clear();
        if (maxBytes == 0) {
            return false;
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return !m_buffer.empty() || m_done; });

        if (!m_buffer.empty()) {
            size_t count = std::min(maxBytes, m_buffer.size());
            auto end = m_buffer.begin() + static_cast<std::ptrdiff_t>(count);
            chunk.assign(m_buffer.begin(), end);
            m_buffer.erase(m_buffer.begin(), end);
            lock.unlock();
            m_condition.notify_all();
            return true;
        }

        // Bytes received before a failure are handed out first
        if (m_failure) {
            std::rethrow_exception(m_failure);
        }
        return false;
    }

private:
    void pump() {
        cpr::Header headers;
        if (m_start > 0) {
            headers["Range"] = "bytes=" + std::to_string(m_start) + "-";
            if (auto validator = m_expected.preferred()) {
                headers["If-Range"] = *validator;
            }
        }

        std::exception_ptr failure;
        try {
            m_transport->perform(HttpMethod::Get, m_url, headers,
                                 [this](const ResponseHead& head) { return accept(head); },
                                 [this](std::string_view data) { return push(data); });
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (failure && !m_failure) {
                m_failure = failure;
            }
            m_done = true;
        }
        m_condition.notify_all();
    }

    bool accept(const ResponseHead& head) {
        auto error = HttpSource::checkRangeResponse(head, m_start, m_expected, m_url);
        if (!error) {
            return true;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failure = std::make_exception_ptr(*error);
        return false;
    }

    bool push(std::string_view data) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return m_cancelled || m_buffer.size() < m_bufferLimit; });
        if (m_cancelled) {
            return false;
        }
        m_buffer.insert(m_buffer.end(), data.begin(), data.end());
        lock.unlock();
        m_condition.notify_all();
        return true;
    }

private:
    std::shared_ptr<HttpTransport> m_transport;
    std::string m_url;
    uint64_t m_start;
    FreshnessToken m_expected;
    size_t m_bufferLimit;

    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<char> m_buffer;
    std::exception_ptr m_failure;
    bool m_done{false};
    bool m_cancelled{false};

    std::thread m_worker;
};

} // namespace

// -- ResponseHead --

void ResponseHead::addLine(const std::string& line) {
    std::string text = StringUtils::trim(line);
    if (text.empty()) {
        return;
    }

    if (StringUtils::startsWith(text, "HTTP/")) {
        headers.clear();
        status = 0;
        auto space = text.find(' ');
        if (space != std::string::npos) {
            if (auto code = parseUInt(text.substr(space + 1, 3))) {
                status = static_cast<long>(*code);
            }
        }
        return;
    }

    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
        return;
    }
    headers[StringUtils::trim(text.substr(0, colon))] = StringUtils::trim(text.substr(colon + 1));
}

std::optional<std::string> ResponseHead::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    std::string value = StringUtils::trim(it->second);
    if (value.empty()) return std::nullopt;
    return value;
}

// -- CprTransport --

CprTransport::CprTransport(HttpSourceOptions options)
    : m_options(std::move(options)) {
}

void CprTransport::perform(HttpMethod method, const std::string& url, const cpr::Header& extra,
                           const HeadHandler& onHead, const BodyHandler& onBody) {
    cpr::Header headers;
    for (const auto& [key, value] : m_options.headers) headers[key] = value;
    for (const auto& [key, value] : extra) headers[key] = value;

    ResponseHead head;
    bool headSeen = false;
    bool stopped = false;
    std::exception_ptr failure;

    // Handlers run inside libcurl; exceptions are carried out by hand
    auto guarded = [&](const std::function<bool()>& handler) {
        try {
            if (handler()) return true;
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        stopped = true;
        return false;
    };

    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetHeader(headers);
    session.SetConnectTimeout(cpr::ConnectTimeout{m_options.connectTimeout});
    session.SetUserAgent(cpr::UserAgent{m_options.userAgent});
    session.SetVerifySsl(cpr::VerifySsl{m_options.verifySsl});

    if (method == HttpMethod::Head) {
        session.SetTimeout(cpr::Timeout{m_options.timeout});
    } else {
        // A body may take any time; only a stalled one is abandoned
        auto stall = std::chrono::duration_cast<std::chrono::seconds>(m_options.timeout).count();
        session.SetLowSpeed(cpr::LowSpeed{1, static_cast<std::int32_t>(std::max<int64_t>(stall, 1))});
    }

    session.SetHeaderCallback(cpr::HeaderCallback{[&head](std::string_view line, intptr_t) {
        head.addLine(std::string(line));
        return true;
    }});
    session.SetWriteCallback(cpr::WriteCallback{[&](std::string_view data, intptr_t) {
        if (stopped) return false;
        if (!headSeen) {
            headSeen = true;
            if (!guarded([&] { return onHead(head); })) return false;
        }
        return guarded([&] { return onBody(data); });
    }});

    cpr::Response response = method == HttpMethod::Head ? session.Head() : session.Get();

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (stopped) {
        return;
    }
    if (response.error.code != cpr::ErrorCode::OK || response.status_code == 0) {
        std::string message = response.error.message.empty() ? "no response" : response.error.message;
        throw SourceError(SourceErrorKind::Unreachable, url + ": " + message, true);
    }

    // Bodiless responses
    if (!headSeen) {
        if (head.status == 0) {
            head.status = response.status_code;
        }
        guarded([&] { return onHead(head); });
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
}

// -- HttpSourceOptions --

HttpSourceOptions HttpSourceOptions::fromConfig() {
    auto& config = Config::instance();
    HttpSourceOptions options;
    options.timeout = std::chrono::milliseconds(config.get<int64_t>("downloads.timeout", 30000));
    options.userAgent = config.get<std::string>("downloads.userAgent", "Ferry/1.0");
    return options;
}

// -- HttpSource --

HttpSource::HttpSource(HttpSourceOptions options, std::shared_ptr<HttpTransport> transport)
    : m_options(std::move(options))
    , m_transport(transport ? std::move(transport) : std::make_shared<CprTransport>(m_options)) {
}

SourceMetadata HttpSource::probe(const SourceLocator& locator) {
    ResponseHead head = fetchHead(*m_transport, HttpMethod::Head, locator.url);

    long status = head.status;
    bool headRefused = status == 403 || status == 405 || status == 501;

    if (status >= 200 && status < 300) {
        SourceMetadata meta;
        readValidators(head, meta);
        if (auto length = head.header("Content-Length")) {
            meta.expectedSize = parseUInt(*length);
        }
        auto acceptRanges = head.header("Accept-Ranges");
        meta.acceptsRanges = acceptRanges && StringUtils::toLower(*acceptRanges) == "bytes";

        if (meta.expectedSize) {
            LOG_DEBUG("HEAD {}: {} bytes, etag {}, ranges {}", locator.url, *meta.expectedSize,
                      meta.etag.value_or("-"), meta.acceptsRanges);
            return meta;
        }
    } else if (!headRefused) {
        throw statusError(status, locator.url);
    }

    LOG_DEBUG("HEAD {} gave no length (status {}), probing with a ranged GET", locator.url, status);
    return probeWithRangedGet(locator);
}

SourceMetadata HttpSource::probeWithRangedGet(const SourceLocator& locator) {
    ResponseHead head = fetchHead(*m_transport, HttpMethod::Get, locator.url,
                                  cpr::Header{{"Range", "bytes=0-0"}});

    SourceMetadata meta;
    readValidators(head, meta);

    auto rangeHeader = head.header("Content-Range");
    auto range = rangeHeader ? parseContentRange(*rangeHeader) : std::nullopt;

    switch (head.status) {
        case 206:
            meta.acceptsRanges = true;
            if (range) meta.expectedSize = range->total;
            break;
        case 416:
            // Only an empty entity rejects bytes=0-0
            meta.acceptsRanges = true;
            if (range) meta.expectedSize = range->total;
            break;
        case 200: {
            meta.acceptsRanges = false;
            auto length = head.header("Content-Length");
            meta.expectedSize = length ? parseUInt(*length) : std::nullopt;
            break;
        }
        default:
            throw statusError(head.status, locator.url);
    }

    return meta;
}

std::unique_ptr<ChunkStream> HttpSource::fetchRange(
    const SourceLocator& locator,
    uint64_t start,
    const FreshnessToken& expected
) {
    return std::make_unique<HttpChunkStream>(m_transport, locator.url, start, expected,
                                             m_options.bufferLimit);
}

std::optional<ContentRange> HttpSource::parseContentRange(const std::string& value) {
    std::string text = StringUtils::trim(value);
    const std::string unit = "bytes ";
    if (!StringUtils::startsWith(StringUtils::toLower(text), unit)) {
        return std::nullopt;
    }
    text = StringUtils::trim(text.substr(unit.size()));

    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    std::string span = StringUtils::trim(text.substr(0, slash));
    std::string total = StringUtils::trim(text.substr(slash + 1));

    ContentRange range;
    if (total != "*") {
        range.total = parseUInt(total);
        if (!range.total) return std::nullopt;
    }

    if (span != "*") {
        auto dash = span.find('-');
        if (dash == std::string::npos) return std::nullopt;
        range.first = parseUInt(span.substr(0, dash));
        range.last = parseUInt(span.substr(dash + 1));
        if (!range.first || !range.last || *range.last < *range.first) {
            return std::nullopt;
        }
    }

    return range;
}

std::optional<std::string> HttpSource::strongEtag(const std::string& value) {
    std::string etag = StringUtils::trim(value);
    if (etag.empty() || StringUtils::startsWith(etag, "W/") || StringUtils::startsWith(etag, "w/")) {
        return std::nullopt;
    }
    return etag;
}

SourceError HttpSource::statusError(long statusCode, const std::string& url) {
    std::string message = url + ": HTTP " + std::to_string(statusCode);

    if (statusCode >= 300 && statusCode < 400) {
        return SourceError(SourceErrorKind::Protocol, message + " (unfollowed redirect)", false);
    }
    if (statusCode == 408 || statusCode == 429 || statusCode >= 500) {
        return SourceError(SourceErrorKind::UnexpectedStatus, message, true);
    }
    return SourceError(SourceErrorKind::UnexpectedStatus, message, false);
}

std::optional<SourceError> HttpSource::checkRangeResponse(const ResponseHead& head, uint64_t start,
                                                          const FreshnessToken& expected,
                                                          const std::string& url) {
    switch (head.status) {
        case 206: {
            auto value = head.header("Content-Range");
            auto range = value ? parseContentRange(*value) : std::nullopt;
            if (!range || !range->first || *range->first != start) {
                return SourceError(SourceErrorKind::Protocol,
                                   url + ": Content-Range does not match offset " + std::to_string(start),
                                   false);
            }
            return changedValidator(head, expected, url);
        }
        case 200:
            // A failed If-Range answers with the new entity in full
            if (auto changed = changedValidator(head, expected, url)) {
                return changed;
            }
            if (start > 0) {
                return SourceError(SourceErrorKind::RangeUnsupported,
                                   url + ": server ignored Range from " + std::to_string(start), false);
            }
            return std::nullopt;
        case 412:
            return SourceError(SourceErrorKind::ResourceChanged, url + ": precondition failed", false);
        case 416:
            return SourceError(SourceErrorKind::RangeNotSatisfiable,
                               url + ": range from " + std::to_string(start) + " not satisfiable", false);
        default:
            return statusError(head.status, url);
    }
}

} // namespace ferry::core::downloader
