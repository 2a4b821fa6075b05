/**
 * ResumeStateMachine.cpp
 *
 * Probe, validate, stream, verify and finalize one download.
 */

#include "ResumeStateMachine.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <system_error>
#include <thread>
#include <vector>

namespace ferry::core::downloader {

using utils::FileUtils;
using utils::StringUtils;

namespace {

void applyRecord(DownloadStatus& status, const SidecarRecord& record) {
    status.bytesDownloaded = record.bytesDownloaded;
    status.expectedSize = record.expectedSize;
    status.etag = record.etag;
    status.lastModified = record.lastModified;
    status.expectedHash = record.expectedHash;
    status.finalHash = record.finalHash;
}

} // namespace

ResumeStateMachine::ResumeStateMachine(
    SidecarRecord record,
    DownloadState state,
    DownloadSourcePtr source,
    std::shared_ptr<const MetadataStore> store,
    DownloadOptions options,
    std::optional<RestartReason> pendingRestart
)
    : m_id(record.downloadId)
    , m_locator{record.url, record.protocol}
    , m_destination(record.destination)
    , m_partPath(MetadataStore::partPath(record.destination))
    , m_source(std::move(source))
    , m_store(std::move(store))
    , m_options(std::move(options))
    , m_record(std::move(record))
    , m_pendingRestart(pendingRestart) {

    if (m_record.expectedHash) {
        m_expectedDigest = IntegrityVerifier::parse(*m_record.expectedHash);
    }

    m_status.downloadId = m_id;
    m_status.url = m_locator.url;
    m_status.destination = m_destination.string();
    m_status.state = state;
    applyRecord(m_status, m_record);
}

void ResumeStateMachine::setStatusListener(StatusListener listener) {
    m_statusListener = std::move(listener);
}

void ResumeStateMachine::setRestartListener(RestartListener listener) {
    m_restartListener = std::move(listener);
}

// -- Commands --

bool ResumeStateMachine::markScheduled() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_scheduled) return false;
    m_scheduled = true;
    return true;
}

void ResumeStateMachine::pause() {
    DownloadStatus snapshot;

    {
        std::unique_lock<std::mutex> lock(m_mutex);

        switch (m_status.state) {
            case DownloadState::Completed:
                throw DownloadError::invalid("download " + m_id + " is already completed");
            case DownloadState::Failed:
                if (!m_status.isRecoverableFailure()) {
                    throw DownloadError::invalid("download " + m_id + " failed permanently");
                }
                break;
            case DownloadState::Paused:
            case DownloadState::AwaitingResume:
                return;
            default:
                break;
        }

        if (m_scheduled && m_executing) {
            m_pauseRequested = true;
            m_condition.notify_all();
            // Listeners run on the worker; it stops at its next checkpoint
            if (std::this_thread::get_id() == m_workerThread) {
                return;
            }
            m_condition.wait(lock, [this] { return !m_executing; });
            return;
        }

        if (m_status.state == DownloadState::Failed &&
            m_status.lastError->kind == ErrorKind::Integrity) {
            m_pendingRestart = RestartReason::IntegrityFailure;
        }

        // Nothing is running: a queued job exits as soon as it starts
        if (m_scheduled) {
            m_pauseRequested = true;
        }
        m_status.state = DownloadState::Paused;
        m_status.lastError.reset();
        snapshot = m_status;
    }

    LOG_INFO("[{}] Paused", m_id);
    if (m_statusListener) m_statusListener(snapshot);
}

bool ResumeStateMachine::resume(const std::optional<ExpectedDigest>& digest) {
    DownloadStatus snapshot;
    bool needsSubmit = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        DownloadState state = m_status.state;
        bool resumable = state == DownloadState::Paused ||
                         state == DownloadState::AwaitingResume ||
                         m_status.isRecoverableFailure();
        if (!resumable) {
            throw DownloadError::invalid(
                std::string("cannot resume download ") + m_id + " in state " + toString(state));
        }

        // No worker is attached in any resumable state
        if (state == DownloadState::Failed && m_status.lastError->kind == ErrorKind::Integrity) {
            m_pendingRestart = RestartReason::IntegrityFailure;
        }

        if (digest) {
            m_expectedDigest = digest;
            m_record.expectedHash = digest->toString();
            m_status.expectedHash = m_record.expectedHash;
        }

        m_pauseRequested = false;
        m_status.lastError.reset();
        m_status.state = DownloadState::PreparingHead;

        needsSubmit = !m_scheduled;
        m_scheduled = true;
        snapshot = m_status;
    }

    LOG_INFO("[{}] Resuming from byte {}", m_id, snapshot.bytesDownloaded);
    if (m_statusListener) m_statusListener(snapshot);
    return needsSubmit;
}

void ResumeStateMachine::abortSchedule() {
    DownloadStatus snapshot;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_executing) return;

        m_scheduled = false;
        m_pauseRequested = false;
        if (!isStable(m_status.state)) {
            m_status.state = DownloadState::Paused;
        }
        snapshot = m_status;
    }

    m_condition.notify_all();
    LOG_WARN("[{}] Could not be scheduled, parked in {}", m_id, toString(snapshot.state));
    if (m_statusListener) m_statusListener(snapshot);
}

DownloadStatus ResumeStateMachine::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool ResumeStateMachine::waitForIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] { return !m_scheduled; });
}

bool ResumeStateMachine::isScheduled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scheduled;
}

// -- Worker --

void ResumeStateMachine::run() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_scheduled || m_pauseRequested) {
            m_scheduled = false;
            m_pauseRequested = false;
            m_condition.notify_all();
            return;
        }
        m_executing = true;
        m_workerThread = std::this_thread::get_id();
    }

    m_attempts = 0;
    m_restartsThisRun = 0;

    LOG_INFO("[{}] Starting {} -> {}", m_id, m_locator.url, m_destination.string());

    DownloadState finalState = DownloadState::Failed;
    std::optional<ErrorInfo> error;

    try {
        finalState = drive();
    } catch (const DownloadError& e) {
        error = e.info();
    } catch (const SourceError& e) {
        error = DownloadError::source(e.what()).info();
    } catch (const std::system_error& e) {
        error = DownloadError::io(e.what()).info();
    } catch (const std::runtime_error& e) {
        error = DownloadError::io(e.what()).info();
    } catch (const std::exception& e) {
        error = DownloadError(ErrorKind::Io, std::string("internal error: ") + e.what(), false).info();
    }

    if (error) {
        finalState = DownloadState::Failed;
        LOG_ERROR("[{}] Failed ({}): {}", m_id, error->code, error->message);
    }

    // Closing never loses data here: every appended chunk was fsynced
    m_part.reset();

    DownloadStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_status.state = finalState;
        applyRecord(m_status, m_record);
        m_status.lastError = error;
        m_executing = false;
        m_workerThread = std::thread::id();
        m_scheduled = false;
        m_pauseRequested = false;
        snapshot = m_status;
    }
    m_condition.notify_all();

    if (finalState == DownloadState::Completed) {
        LOG_INFO("[{}] Completed: {} ({})", m_id, m_destination.string(),
                 StringUtils::formatBytes(snapshot.bytesDownloaded));
    } else if (finalState == DownloadState::Paused) {
        LOG_INFO("[{}] Paused at byte {}", m_id, snapshot.bytesDownloaded);
    }

    if (m_statusListener) m_statusListener(snapshot);
}

DownloadState ResumeStateMachine::drive() {
    bool needProbe = true;

    while (true) {
        if (pauseRequested()) {
            return DownloadState::Paused;
        }

        if (needProbe) {
            setState(DownloadState::PreparingHead);

            SourceMetadata meta;
            try {
                meta = m_source->probe(m_locator);
            } catch (const SourceError& e) {
                if (!e.transient()) {
                    throw DownloadError::source(e.what());
                }
                if (!backoff(e.what())) {
                    return DownloadState::Paused;
                }
                continue;
            }

            if (!meta.expectedSize) {
                throw DownloadError::source("source did not report a content length", false);
            }
            m_lastProbe = meta;

            std::optional<RestartReason> reason = m_pendingRestart ? m_pendingRestart : checkFreshness(meta);
            m_pendingRestart.reset();

            if (reason) {
                restart(*reason);
            } else {
                resetRecord(meta);
            }
            needProbe = false;
        }

        setState(DownloadState::ValidatingMetadata);
        if (auto reason = checkPartFile()) {
            restart(*reason);
        }

        setState(DownloadState::PreflightStorage);
        preflightStorage();

        if (m_record.bytesDownloaded < *m_record.expectedSize) {
            StreamOutcome outcome = transfer();
            if (outcome == StreamOutcome::Paused) {
                return DownloadState::Paused;
            }
            if (outcome != StreamOutcome::Finished) {
                needProbe = outcome != StreamOutcome::RefetchFromZero;
                continue;
            }
        }

        verifyAndFinalize();
        return DownloadState::Completed;
    }
}

std::optional<RestartReason> ResumeStateMachine::checkFreshness(const SourceMetadata& meta) const {
    if (m_record.bytesDownloaded == 0) {
        return std::nullopt;
    }

    if (m_record.expectedSize && *m_record.expectedSize != *meta.expectedSize) {
        return RestartReason::SizeChanged;
    }
    if (m_record.etag && meta.etag && *m_record.etag != *meta.etag) {
        return RestartReason::FreshnessChanged;
    }
    if (m_record.lastModified && meta.lastModified && *m_record.lastModified != *meta.lastModified) {
        return RestartReason::FreshnessChanged;
    }

    // At least one token must have been compared
    bool etagMatched = m_record.etag && meta.etag;
    bool lastModifiedMatched = m_record.lastModified && meta.lastModified;
    if (!etagMatched && !lastModifiedMatched) {
        return RestartReason::MissingFreshnessToken;
    }

    if (!meta.acceptsRanges) {
        return RestartReason::RangeUnsupported;
    }
    return std::nullopt;
}

std::optional<RestartReason> ResumeStateMachine::checkPartFile() const {
    auto partSize = FileUtils::getFileSize(m_partPath);
    bool hasSidecar = FileUtils::fileExists(MetadataStore::sidecarPath(m_destination));

    if (!partSize && !hasSidecar && m_record.bytesDownloaded == 0) {
        return std::nullopt;
    }
    if (!hasSidecar) {
        LOG_WARN("[{}] Partial data without a sidecar", m_id);
        return RestartReason::SidecarMismatch;
    }
    if (!partSize || *partSize != m_record.bytesDownloaded) {
        LOG_WARN("[{}] Sidecar records {} bytes, partial file has {}", m_id,
                 m_record.bytesDownloaded, partSize ? std::to_string(*partSize) : "none");
        return RestartReason::OffsetMismatch;
    }
    return std::nullopt;
}

void ResumeStateMachine::preflightStorage() {
    fs::path directory = m_destination.parent_path();

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw DownloadError::io("cannot create " + directory.string() + ": " + ec.message());
    }

    uint64_t needed = *m_record.expectedSize - m_record.bytesDownloaded;
    if (needed == 0 || !m_options.availableSpace) {
        return;
    }

    auto available = m_options.availableSpace(directory);
    if (!available) {
        LOG_WARN("[{}] Free space of {} unknown, skipping check", m_id, directory.string());
        return;
    }
    if (*available < needed) {
        throw DownloadError::storageExhausted(needed, *available);
    }

    LOG_DEBUG("[{}] Preflight ok: need {}, have {}", m_id,
              StringUtils::formatBytes(needed), StringUtils::formatBytes(*available));
}

ResumeStateMachine::StreamOutcome ResumeStateMachine::transfer() {
    if (!m_part) {
        m_part = std::make_unique<PartFile>(m_partPath);
    }

    // Appends land at the end of the file, which must be the recorded offset
    uint64_t onDisk = m_part->size();
    if (onDisk != m_record.bytesDownloaded) {
        LOG_WARN("[{}] Partial file holds {} bytes, sidecar records {}", m_id, onDisk,
                 m_record.bytesDownloaded);
        restart(RestartReason::OffsetMismatch);
        return StreamOutcome::RefetchFromZero;
    }

    // The pair on disk is consistent before the first byte arrives
    persist();

    std::unique_ptr<ChunkStream> stream;
    try {
        stream = m_source->fetchRange(m_locator, m_record.bytesDownloaded,
                                      FreshnessToken{m_record.etag, m_record.lastModified});
    } catch (const SourceError& e) {
        return handleStreamError(e);
    }

    const uint64_t expected = *m_record.expectedSize;
    std::vector<char> chunk;
    chunk.reserve(m_options.bufferSize);

    while (m_record.bytesDownloaded < expected) {
        setState(DownloadState::Downloading);

        bool more = false;
        try {
            more = stream->next(chunk, m_options.bufferSize);
        } catch (const SourceError& e) {
            return handleStreamError(e);
        }

        if (!more || chunk.empty()) {
            std::string cause = "stream ended at byte " + std::to_string(m_record.bytesDownloaded) +
                                " of " + std::to_string(expected);
            return backoff(cause) ? StreamOutcome::Retry : StreamOutcome::Paused;
        }

        if (chunk.size() > expected - m_record.bytesDownloaded) {
            throw DownloadError::source("source sent more than the expected " +
                                        std::to_string(expected) + " bytes");
        }

        setState(DownloadState::PersistingProgress);
        m_part->append(chunk.data(), chunk.size());
        m_part->sync();
        m_record.bytesDownloaded += chunk.size();
        persist();

        m_attempts = 0;
        LOG_TRACE("[{}] {} / {} bytes", m_id, m_record.bytesDownloaded, expected);

        if (pauseRequested()) {
            m_part->close();
            m_part.reset();
            return StreamOutcome::Paused;
        }
    }

    return StreamOutcome::Finished;
}

ResumeStateMachine::StreamOutcome ResumeStateMachine::handleStreamError(const SourceError& error) {
    LOG_WARN("[{}] Stream error at byte {}: {} ({})", m_id, m_record.bytesDownloaded,
             error.what(), toString(error.kind()));

    switch (error.kind()) {
        case SourceErrorKind::RangeUnsupported:
            if (m_record.bytesDownloaded == 0) {
                throw DownloadError::source(error.what());
            }
            restart(RestartReason::RangeUnsupported);
            return StreamOutcome::RefetchFromZero;

        case SourceErrorKind::ResourceChanged:
            restart(RestartReason::FreshnessChanged);
            return StreamOutcome::Reprobe;

        case SourceErrorKind::RangeNotSatisfiable:
            restart(RestartReason::OffsetMismatch);
            return StreamOutcome::Reprobe;

        default:
            break;
    }

    if (!error.transient()) {
        throw DownloadError::source(error.what());
    }
    return backoff(error.what()) ? StreamOutcome::Retry : StreamOutcome::Paused;
}

void ResumeStateMachine::verifyAndFinalize() {
    setState(DownloadState::VerifyingSha);

    if (!m_part) {
        // Zero-length downloads never opened the partial file
        m_part = std::make_unique<PartFile>(m_partPath);
    }
    m_part->sync();
    m_part->close();
    m_part.reset();

    const uint64_t expected = *m_record.expectedSize;
    auto actualSize = FileUtils::getFileSize(m_partPath);
    if (!actualSize || *actualSize != expected) {
        throw DownloadError::io("partial file holds " +
                                (actualSize ? std::to_string(*actualSize) : std::string("no")) +
                                " bytes, expected " + std::to_string(expected));
    }

    VerificationResult result = IntegrityVerifier::verify(m_partPath, m_expectedDigest);
    if (!result.matched) {
        throw DownloadError::integrity(result.algorithm + ":" + result.expected,
                                       result.algorithm + ":" + result.actual);
    }

    m_record.finalHash = result.algorithm + ":" + result.actual;
    persist();

    setState(DownloadState::FinalizingIo);
    try {
        FileUtils::moveFile(m_partPath, m_destination);
    } catch (const std::system_error& e) {
        throw DownloadError::io(std::string("cannot move into place: ") + e.what());
    }

    try {
        m_store->removeSidecar(m_destination);
    } catch (const std::system_error& e) {
        // The destination is already complete and durable
        LOG_WARN("[{}] Leftover sidecar: {}", m_id, e.what());
    }
}

void ResumeStateMachine::restart(RestartReason reason) {
    ++m_restartsThisRun;
    if (m_restartsThisRun > m_options.maxRestarts) {
        throw DownloadError::source(std::string("restart limit reached, last reason: ") + toString(reason));
    }

    LOG_WARN("[{}] Restarting from zero: {}", m_id, toString(reason));

    m_part.reset();
    m_store->discard(m_destination);

    m_record.bytesDownloaded = 0;
    m_record.finalHash.reset();
    if (m_lastProbe) {
        resetRecord(*m_lastProbe);
    }

    DownloadStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_status.restartCount;
        m_status.lastRestartReason = reason;
    }
    setState(DownloadState::Restarting);
    snapshot = status();

    if (m_restartListener) m_restartListener(snapshot, reason);
}

bool ResumeStateMachine::backoff(const std::string& cause) {
    ++m_attempts;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_status.retryCount;
    }

    if (m_attempts >= m_options.retry.maxAttempts) {
        throw DownloadError::source("giving up after " + std::to_string(m_attempts) +
                                    " attempts: " + cause);
    }

    auto delay = m_options.retry.delayFor(m_attempts);
    LOG_WARN("[{}] {} (attempt {}/{}), retrying in {} ms", m_id, cause, m_attempts,
             m_options.retry.maxAttempts, delay.count());

    setState(DownloadState::HeadBackoff);
    return !sleepInterruptibly(delay);
}

// -- Helpers --

void ResumeStateMachine::persist() {
    m_store->save(m_record);
}

void ResumeStateMachine::setState(DownloadState state) {
    DownloadStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_status.state = state;
        applyRecord(m_status, m_record);
        snapshot = m_status;
    }

    if (state == DownloadState::Downloading || state == DownloadState::PersistingProgress) {
        LOG_TRACE("[{}] -> {}", m_id, toString(state));
    } else {
        LOG_DEBUG("[{}] -> {}", m_id, toString(state));
    }

    if (m_statusListener) m_statusListener(snapshot);
}

bool ResumeStateMachine::pauseRequested() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pauseRequested;
}

bool ResumeStateMachine::sleepInterruptibly(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, delay, [this] { return m_pauseRequested; });
}

void ResumeStateMachine::resetRecord(const SourceMetadata& meta) {
    m_record.expectedSize = meta.expectedSize;
    m_record.etag = meta.etag;
    m_record.lastModified = meta.lastModified;
}

} // namespace ferry::core::downloader
