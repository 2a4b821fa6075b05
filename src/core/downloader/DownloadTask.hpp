#pragma once

/**
 * DownloadTask.hpp
 *
 * Download lifecycle states, command payloads and the status snapshot
 * handed back to callers.
 */

#include "DownloadError.hpp"
#include "DownloadSource.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ferry::core::downloader {

/**
 * Resume state machine states
 */
enum class DownloadState {
    Idle,
    PreparingHead,
    HeadBackoff,
    Restarting,
    PreflightStorage,
    ValidatingMetadata,
    Downloading,
    PersistingProgress,
    Paused,
    AwaitingResume,
    VerifyingSha,
    FinalizingIo,
    Completed,
    Failed
};

inline const char* toString(DownloadState state) {
    switch (state) {
        case DownloadState::Idle:               return "Idle";
        case DownloadState::PreparingHead:      return "PreparingHead";
        case DownloadState::HeadBackoff:        return "HeadBackoff";
        case DownloadState::Restarting:         return "Restarting";
        case DownloadState::PreflightStorage:   return "PreflightStorage";
        case DownloadState::ValidatingMetadata: return "ValidatingMetadata";
        case DownloadState::Downloading:        return "Downloading";
        case DownloadState::PersistingProgress: return "PersistingProgress";
        case DownloadState::Paused:             return "Paused";
        case DownloadState::AwaitingResume:     return "AwaitingResume";
        case DownloadState::VerifyingSha:       return "VerifyingSha";
        case DownloadState::FinalizingIo:       return "FinalizingIo";
        case DownloadState::Completed:          return "Completed";
        case DownloadState::Failed:             return "Failed";
    }
    return "Idle";
}

/**
 * States in which no worker is attached to the task
 */
inline bool isStable(DownloadState state) {
    return state == DownloadState::Paused ||
           state == DownloadState::AwaitingResume ||
           state == DownloadState::Completed ||
           state == DownloadState::Failed;
}

/**
 * Why persisted progress was thrown away
 */
enum class RestartReason {
    FreshnessChanged,
    SizeChanged,
    RangeUnsupported,
    OffsetMismatch,
    IntegrityFailure,
    MissingFreshnessToken,
    SourceChanged,
    SidecarMismatch
};

inline const char* toString(RestartReason reason) {
    switch (reason) {
        case RestartReason::FreshnessChanged:      return "FreshnessChanged";
        case RestartReason::SizeChanged:           return "SizeChanged";
        case RestartReason::RangeUnsupported:      return "RangeUnsupported";
        case RestartReason::OffsetMismatch:        return "OffsetMismatch";
        case RestartReason::IntegrityFailure:      return "IntegrityFailure";
        case RestartReason::MissingFreshnessToken: return "MissingFreshnessToken";
        case RestartReason::SourceChanged:         return "SourceChanged";
        case RestartReason::SidecarMismatch:       return "SidecarMismatch";
    }
    return "SourceChanged";
}

/**
 * startDownload payload
 */
struct StartDownloadRequest {
    std::optional<std::string> downloadId;  // Generated when absent
    std::string url;
    std::string destination;                // Relative paths resolve under the root
    std::optional<std::string> expectedHash;

    StartDownloadRequest() = default;

    StartDownloadRequest(const std::string& url_, const std::string& dest_)
        : url(url_), destination(dest_) {}

    StartDownloadRequest(const std::string& url_, const std::string& dest_, const std::string& hash_)
        : url(url_), destination(dest_), expectedHash(hash_) {}
};

/**
 * Point-in-time view of one download
 */
struct DownloadStatus {
    std::string downloadId;
    std::string url;
    std::string destination;
    DownloadState state{DownloadState::Idle};
    uint64_t bytesDownloaded{0};
    std::optional<uint64_t> expectedSize;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> expectedHash;
    std::optional<std::string> finalHash;
    std::optional<ErrorInfo> lastError;

    // Telemetry
    uint32_t retryCount{0};
    uint32_t restartCount{0};
    std::optional<RestartReason> lastRestartReason;

    bool isComplete() const {
        return state == DownloadState::Completed;
    }

    bool isRecoverableFailure() const {
        return state == DownloadState::Failed && lastError && lastError->recoverable;
    }

    float progress() const {
        if (!expectedSize || *expectedSize == 0) {
            return state == DownloadState::Completed ? 1.0f : 0.0f;
        }
        return static_cast<float>(bytesDownloaded) / static_cast<float>(*expectedSize);
    }
};

inline void to_json(nlohmann::json& j, const DownloadStatus& status) {
    j = nlohmann::json{
        {"download_id", status.downloadId},
        {"url", status.url},
        {"destination", status.destination},
        {"state", toString(status.state)},
        {"bytes_downloaded", status.bytesDownloaded},
        {"expected_size", nullptr},
        {"etag", nullptr},
        {"last_modified", nullptr},
        {"final_hash", nullptr},
        {"last_error", nullptr},
        {"retry_count", status.retryCount},
        {"restart_count", status.restartCount},
        {"last_restart_reason", nullptr}
    };

    if (status.expectedSize) j["expected_size"] = *status.expectedSize;
    if (status.etag) j["etag"] = *status.etag;
    if (status.lastModified) j["last_modified"] = *status.lastModified;
    if (status.finalHash) j["final_hash"] = *status.finalHash;
    if (status.lastError) j["last_error"] = *status.lastError;
    if (status.lastRestartReason) j["last_restart_reason"] = toString(*status.lastRestartReason);
}

} // namespace ferry::core::downloader
