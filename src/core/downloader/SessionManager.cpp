/**
 * SessionManager.cpp
 *
 * Implementation of the download session manager.
 */

#include "SessionManager.hpp"
#include "IntegrityVerifier.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <stdexcept>

namespace ferry::core::downloader {

using utils::FileUtils;
using utils::StringUtils;

SessionManager::SessionManager(DownloadOptions options, std::shared_ptr<SourceFactory> sources)
    : m_options(std::move(options))
    , m_sources(std::move(sources)) {

    if (!m_sources) {
        m_sources = std::make_shared<SourceFactory>();
    }
    if (m_options.root.empty()) {
        m_options.root = utils::PathUtils::getDownloadsPath();
    }

    m_store = std::make_shared<MetadataStore>(m_options.root);
    m_pool = std::make_unique<ThreadPool>(m_options.maxConcurrent);

    LOG_INFO("SessionManager initialized (root: {}, max concurrent: {})",
             m_store->root().string(), m_pool->size());
}

SessionManager::~SessionManager() {
    shutdown();
}

std::string SessionManager::startDownload(const StartDownloadRequest& request) {
    std::lock_guard<std::mutex> lock(m_commandMutex);

    if (m_shutdown) {
        throw DownloadError::invalid("session manager is shut down");
    }

    std::string id = request.downloadId ? StringUtils::trim(*request.downloadId)
                                        : StringUtils::generateUUID();
    if (id.empty()) {
        throw DownloadError::invalid("empty download id");
    }
    if (m_registry.contains(id)) {
        throw DownloadError::invalid("download id already in use: " + id);
    }

    std::string url = StringUtils::trim(request.url);
    if (url.empty()) {
        throw DownloadError::invalid("empty source locator");
    }

    auto locator = SourceLocator::fromUrl(url);
    if (!locator) {
        throw DownloadError::invalid("malformed source locator: " + url);
    }

    DownloadSourcePtr source = m_sources->find(locator->protocol);
    if (!source) {
        throw DownloadError::invalid("unsupported protocol: " + locator->protocol);
    }

    auto destination = m_store->resolveDestination(request.destination);
    if (!destination) {
        throw DownloadError::invalid("destination outside download root: " + request.destination);
    }

    std::optional<ExpectedDigest> digest;
    if (request.expectedHash) {
        digest = IntegrityVerifier::parse(*request.expectedHash);
        if (!digest) {
            throw DownloadError::invalid("malformed expected hash: " + *request.expectedHash);
        }
    }

    // Completed and permanently failed tasks no longer hold their destination
    auto owner = m_registry.findIf([&](const ResumeStateMachine& machine) {
        if (machine.destination() != *destination) return false;
        DownloadStatus status = machine.status();
        return status.state != DownloadState::Completed &&
               (status.state != DownloadState::Failed || status.isRecoverableFailure());
    });
    if (owner) {
        throw DownloadError::invalid("destination in use by download " + owner->id());
    }

    checkExistingDestination(*destination, *locator, digest);

    SidecarRecord record;
    record.downloadId = id;
    record.url = locator->url;
    record.protocol = locator->protocol;
    record.destination = destination->string();
    if (digest) {
        record.expectedHash = digest->toString();
    }

    // Leftovers of an earlier run for this destination
    std::optional<RestartReason> pendingRestart;
    if (auto previous = m_store->load(*destination)) {
        if (previous->url == record.url) {
            record.bytesDownloaded = previous->bytesDownloaded;
            record.expectedSize = previous->expectedSize;
            record.etag = previous->etag;
            record.lastModified = previous->lastModified;
            LOG_INFO("Adopting {} bytes of earlier progress for {}",
                     record.bytesDownloaded, destination->string());
        } else {
            pendingRestart = RestartReason::SourceChanged;
        }
    } else if (FileUtils::fileExists(MetadataStore::sidecarPath(*destination))) {
        pendingRestart = RestartReason::SidecarMismatch;
    }

    auto machine = createMachine(std::move(record), DownloadState::Idle, source, pendingRestart);
    m_registry.insert(machine);

    LOG_INFO("Added download {}: {} -> {}", id, locator->url, destination->string());
    m_events.emit(kStatusEvent, nlohmann::json(machine->status()));

    if (machine->markScheduled()) {
        schedule(machine);
    }
    return id;
}

void SessionManager::pauseDownload(const std::string& id) {
    get(id)->pause();
}

void SessionManager::resumeDownload(const std::string& id,
                                    const std::optional<std::string>& expectedHash) {
    auto machine = get(id);

    std::optional<ExpectedDigest> digest;
    if (expectedHash) {
        digest = IntegrityVerifier::parse(*expectedHash);
        if (!digest) {
            throw DownloadError::invalid("malformed expected hash: " + *expectedHash);
        }
    }

    std::lock_guard<std::mutex> lock(m_commandMutex);
    if (m_shutdown) {
        throw DownloadError::invalid("session manager is shut down");
    }

    if (machine->resume(digest)) {
        schedule(machine);
    }
}

DownloadStatus SessionManager::getDownloadStatus(const std::string& id) const {
    return get(id)->status();
}

std::vector<DownloadStatus> SessionManager::listDownloads() const {
    std::vector<DownloadStatus> result;
    for (const auto& machine : m_registry.all()) {
        result.push_back(machine->status());
    }
    return result;
}

std::vector<std::string> SessionManager::recover() {
    std::lock_guard<std::mutex> lock(m_commandMutex);

    if (m_shutdown) {
        throw DownloadError::invalid("session manager is shut down");
    }

    std::vector<std::string> hydrated;
    RecoveryResult result = m_store->scan([this](const fs::path& destination) {
        return m_registry.findIf([&](const ResumeStateMachine& machine) {
            return machine.destination() == destination;
        }) != nullptr;
    });

    for (auto& record : result.records) {
        if (m_registry.contains(record.downloadId)) {
            continue;
        }

        fs::path destination(record.destination);
        auto owner = m_registry.findIf([&](const ResumeStateMachine& machine) {
            return machine.destination() == destination;
        });
        if (owner) {
            LOG_DEBUG("Sidecar for {} already owned by {}", destination.string(), owner->id());
            continue;
        }

        auto locator = SourceLocator::fromUrl(record.url);
        if (!locator) {
            LOG_WARN("Skipping {}: malformed source locator {}", record.downloadId, record.url);
            continue;
        }
        if (record.protocol.empty()) {
            record.protocol = locator->protocol;
        }

        DownloadSourcePtr source = m_sources->find(record.protocol);
        if (!source) {
            LOG_WARN("Skipping {}: no adapter for protocol {}", record.downloadId, record.protocol);
            continue;
        }

        std::string id = record.downloadId;
        auto machine = createMachine(std::move(record), DownloadState::AwaitingResume, source, std::nullopt);
        m_registry.insert(machine);
        hydrated.push_back(id);

        LOG_INFO("Recovered download {} at byte {}", id, machine->status().bytesDownloaded);
        m_events.emit(kStatusEvent, nlohmann::json(machine->status()));
    }

    return hydrated;
}

bool SessionManager::waitForIdle(const std::string& id, std::chrono::milliseconds timeout) const {
    return get(id)->waitForIdle(timeout);
}

void SessionManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_commandMutex);
        if (m_shutdown) return;
        m_shutdown = true;
    }

    LOG_INFO("Shutting down SessionManager");

    for (const auto& machine : m_registry.all()) {
        if (!machine->isScheduled()) continue;

        try {
            machine->pause();
        } catch (const DownloadError& e) {
            // Finished between the check and the pause
            LOG_DEBUG("Download {} not paused: {}", machine->id(), e.what());
        }
    }

    m_pool.reset();
    m_registry.clear();
}

// -- Private --

ResumeStateMachinePtr SessionManager::get(const std::string& id) const {
    auto machine = m_registry.find(id);
    if (!machine) {
        throw DownloadError::notFound(id);
    }
    return machine;
}

void SessionManager::checkExistingDestination(const fs::path& destination,
                                              const SourceLocator& locator,
                                              const std::optional<ExpectedDigest>& digest) const {
    std::error_code ec;
    if (!fs::exists(destination, ec)) {
        return;
    }
    if (!fs::is_regular_file(destination, ec)) {
        throw DownloadError::invalid("destination is not a regular file: " + destination.string());
    }

    auto completed = m_registry.findIf([&](const ResumeStateMachine& machine) {
        return machine.destination() == destination &&
               machine.locator().url == locator.url &&
               machine.status().state == DownloadState::Completed;
    });
    if (completed) {
        throw DownloadError::alreadyCompleted(destination.string());
    }

    if (digest && IntegrityVerifier::matches(destination, *digest)) {
        throw DownloadError::alreadyCompleted(destination.string());
    }

    throw DownloadError::invalid("destination already exists: " + destination.string());
}

ResumeStateMachinePtr SessionManager::createMachine(SidecarRecord record,
                                                    DownloadState state,
                                                    DownloadSourcePtr source,
                                                    std::optional<RestartReason> pendingRestart) {
    auto machine = std::make_shared<ResumeStateMachine>(
        std::move(record), state, std::move(source), m_store, m_options, pendingRestart);

    machine->setStatusListener([this](const DownloadStatus& status) {
        m_events.emit(kStatusEvent, nlohmann::json(status));
    });

    machine->setRestartListener([this](const DownloadStatus& status, RestartReason reason) {
        m_events.emit(kRestartEvent, {
            {"download_id", status.downloadId},
            {"reason", toString(reason)},
            {"restart_count", status.restartCount}
        });
    });

    return machine;
}

void SessionManager::schedule(const ResumeStateMachinePtr& machine) {
    try {
        m_pool->submit([machine] { machine->run(); });
    } catch (const std::runtime_error& e) {
        machine->abortSchedule();
        throw DownloadError::invalid(std::string("cannot schedule download: ") + e.what());
    }
}

} // namespace ferry::core::downloader
