#pragma once

/**
 * ResumeStateMachine.hpp
 *
 * Per-download driver. One instance owns one download for its whole
 * lifetime; run() is executed on a pool thread and returns once the
 * task reaches Paused, Completed or Failed.
 */

#include "DownloadOptions.hpp"
#include "DownloadSource.hpp"
#include "DownloadTask.hpp"
#include "IntegrityVerifier.hpp"
#include "MetadataStore.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace ferry::core::downloader {

using StatusListener = std::function<void(const DownloadStatus&)>;
using RestartListener = std::function<void(const DownloadStatus&, RestartReason)>;

class ResumeStateMachine {
public:
    /**
     * @param record Initial durable state (fresh, adopted or hydrated)
     * @param state Idle for new downloads, AwaitingResume when hydrated
     * @param pendingRestart Forces a clean restart before the first transfer
     */
    ResumeStateMachine(
        SidecarRecord record,
        DownloadState state,
        DownloadSourcePtr source,
        std::shared_ptr<const MetadataStore> store,
        DownloadOptions options,
        std::optional<RestartReason> pendingRestart = std::nullopt
    );

    ResumeStateMachine(const ResumeStateMachine&) = delete;
    ResumeStateMachine& operator=(const ResumeStateMachine&) = delete;

    void setStatusListener(StatusListener listener);
    void setRestartListener(RestartListener listener);

    /**
     * Claim the single execution slot before submitting run()
     * @return false if a job is already scheduled
     */
    bool markScheduled();

    /**
     * Drive the download until it reaches a stable state
     */
    void run();

    /**
     * Cooperative pause. Blocks until the worker has persisted its
     * progress and left the transfer loop. Called from the worker itself
     * (a status or restart listener), it only raises the request.
     * @throws DownloadError (Invalid) for Completed or unrecoverable Failed
     */
    void pause();

    /**
     * Move back to PreparingHead
     * @return true if the caller must submit run() to the pool; false if
     *         a queued job will pick the task up
     * @param digest Replaces the expected hash when given
     * @throws DownloadError (Invalid) unless Paused, AwaitingResume or
     *         recoverably Failed
     */
    bool resume(const std::optional<ExpectedDigest>& digest = std::nullopt);

    /**
     * Give back a slot claimed by markScheduled()/resume() whose job
     * could not be submitted; the task parks in Paused
     */
    void abortSchedule();

    /**
     * Snapshot, never blocks on the transfer loop
     */
    DownloadStatus status() const;

    /**
     * Block until no job is scheduled or the timeout expires
     * @return true if idle
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const;

    bool isScheduled() const;

    const std::string& id() const { return m_id; }
    const std::filesystem::path& destination() const { return m_destination; }
    const SourceLocator& locator() const { return m_locator; }

private:
    /**
     * Transfer loop; returns the stable state it stopped in
     * @throws DownloadError on failure
     */
    DownloadState drive();

    /**
     * Compare fresh probe results with the persisted record
     */
    std::optional<RestartReason> checkFreshness(const SourceMetadata& meta) const;

    /**
     * Compare the sidecar offset with the .part on disk
     */
    std::optional<RestartReason> checkPartFile() const;

    void preflightStorage();

    enum class StreamOutcome {
        Finished,
        Paused,
        Reprobe,        // Restarted on a changed resource
        RefetchFromZero,
        Retry           // Transient failure, back to PreparingHead
    };

    StreamOutcome transfer();
    StreamOutcome handleStreamError(const SourceError& error);
    void verifyAndFinalize();

    void restart(RestartReason reason);

    /**
     * Count a transient failure and sleep in HeadBackoff
     * @return false if a pause interrupted the backoff
     * @throws DownloadError once the attempt budget is spent
     */
    bool backoff(const std::string& cause);

    void persist();
    void setState(DownloadState state);

    bool pauseRequested() const;

    /**
     * @return true if interrupted by a pause request
     */
    bool sleepInterruptibly(std::chrono::milliseconds delay);

    void resetRecord(const SourceMetadata& meta);

private:
    const std::string m_id;
    const SourceLocator m_locator;
    const std::filesystem::path m_destination;
    const std::filesystem::path m_partPath;

    DownloadSourcePtr m_source;
    std::shared_ptr<const MetadataStore> m_store;
    DownloadOptions m_options;

    // Worker-owned
    SidecarRecord m_record;
    std::optional<ExpectedDigest> m_expectedDigest;
    std::optional<RestartReason> m_pendingRestart;
    std::optional<SourceMetadata> m_lastProbe;
    std::unique_ptr<PartFile> m_part;
    uint32_t m_attempts{0};
    uint32_t m_restartsThisRun{0};

    // Shared with command threads
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    DownloadStatus m_status;
    bool m_scheduled{false};
    bool m_executing{false};
    bool m_pauseRequested{false};
    std::thread::id m_workerThread;

    StatusListener m_statusListener;
    RestartListener m_restartListener;
};

} // namespace ferry::core::downloader
