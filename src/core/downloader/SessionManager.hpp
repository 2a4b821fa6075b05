#pragma once

/**
 * SessionManager.hpp
 *
 * Command surface of the download engine. Validates requests, owns the
 * registry and the worker pool, and fans status changes out on the
 * event bus.
 */

#include "DownloadOptions.hpp"
#include "DownloadRegistry.hpp"
#include "DownloadSource.hpp"
#include "DownloadTask.hpp"
#include "MetadataStore.hpp"
#include "../EventBus.hpp"
#include "../ThreadPool.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::core::downloader {

// Event names published on the bus
inline constexpr const char* kStatusEvent = "download.status";
inline constexpr const char* kRestartEvent = "download.restarted";

/**
 * SessionManager - resumable download sessions
 *
 * Every task runs on its own pool job; commands never block on a
 * transfer except pauseDownload(), which waits for the checkpoint.
 */
class SessionManager {
public:
    /**
     * @param options Root, buffer size, retry policy, pool size
     * @param sources Adapters by protocol
     */
    SessionManager(DownloadOptions options, std::shared_ptr<SourceFactory> sources);

    /**
     * Destructor - pauses running tasks and joins the pool
     */
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Register a download and schedule it
     * @return Download id (generated if the request carries none)
     * @throws DownloadError Invalid or AlreadyCompleted
     */
    std::string startDownload(const StartDownloadRequest& request);

    /**
     * Pause and wait until progress is durable
     * @throws DownloadError NotFound or Invalid
     */
    void pauseDownload(const std::string& id);

    /**
     * Re-enter header revalidation
     * @param expectedHash Replaces the hash the download is verified against
     * @throws DownloadError NotFound or Invalid (also for a malformed hash)
     */
    void resumeDownload(const std::string& id,
                        const std::optional<std::string>& expectedHash = std::nullopt);

    /**
     * @throws DownloadError NotFound
     */
    DownloadStatus getDownloadStatus(const std::string& id) const;

    std::vector<DownloadStatus> listDownloads() const;

    /**
     * Hydrate interrupted downloads found under the root as AwaitingResume
     * @return Ids of the hydrated downloads
     */
    std::vector<std::string> recover();

    /**
     * Block the caller until the download has no scheduled job
     * @return true if idle before the timeout
     * @throws DownloadError NotFound
     */
    bool waitForIdle(const std::string& id, std::chrono::milliseconds timeout) const;

    /**
     * Pause everything, drain the pool and forget all tasks
     */
    void shutdown();

    EventBus& events() { return m_events; }
    const MetadataStore& store() const { return *m_store; }
    const DownloadOptions& options() const { return m_options; }

private:
    ResumeStateMachinePtr get(const std::string& id) const;

    /**
     * Decide what an existing destination file means
     * @throws DownloadError AlreadyCompleted or Invalid
     */
    void checkExistingDestination(const fs::path& destination,
                                  const SourceLocator& locator,
                                  const std::optional<ExpectedDigest>& digest) const;

    ResumeStateMachinePtr createMachine(SidecarRecord record,
                                        DownloadState state,
                                        DownloadSourcePtr source,
                                        std::optional<RestartReason> pendingRestart);

    void schedule(const ResumeStateMachinePtr& machine);

private:
    DownloadOptions m_options;
    std::shared_ptr<SourceFactory> m_sources;
    std::shared_ptr<const MetadataStore> m_store;

    EventBus m_events;
    DownloadRegistry m_registry;

    // Serializes start/recover so destination checks and inserts are atomic
    std::mutex m_commandMutex;

    std::unique_ptr<ThreadPool> m_pool;
    bool m_shutdown{false};
};

} // namespace ferry::core::downloader
