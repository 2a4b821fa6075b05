#pragma once

/**
 * DownloadOptions.hpp
 *
 * Tunables for the session manager and the resume state machine.
 */

#include "../Config.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ferry::core::downloader {

/**
 * Exponential backoff schedule: base * 2^(attempt-1), capped
 */
struct RetryPolicy {
    uint32_t maxAttempts{5};
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{30000};

    /**
     * Delay before retry number attempt (1-based)
     */
    std::chrono::milliseconds delayFor(uint32_t attempt) const {
        if (attempt == 0) return std::chrono::milliseconds(0);

        auto delay = baseDelay;
        for (uint32_t i = 1; i < attempt; ++i) {
            if (delay >= maxDelay) break;
            delay *= 2;
        }
        return delay < maxDelay ? delay : maxDelay;
    }
};

using SpaceProbe = std::function<std::optional<uint64_t>(const std::filesystem::path&)>;

struct DownloadOptions {
    // Destinations must resolve strictly inside this directory
    std::filesystem::path root;

    size_t maxConcurrent{4};
    size_t bufferSize{1024 * 1024};
    uint32_t maxRestarts{3};
    RetryPolicy retry;

    // Free space query used by the storage preflight
    SpaceProbe availableSpace = &utils::FileUtils::availableSpace;

    /**
     * Snapshot the "downloads.*" section of the global config
     */
    static DownloadOptions fromConfig() {
        auto& config = Config::instance();
        DownloadOptions options;

        std::string root = config.get<std::string>("downloads.root", "");
        options.root = root.empty() ? utils::PathUtils::getDownloadsPath() : std::filesystem::path(root);

        options.maxConcurrent = config.get<size_t>("downloads.maxConcurrent", 4);
        options.bufferSize = config.get<size_t>("downloads.bufferSize", 1024 * 1024);
        options.maxRestarts = config.get<uint32_t>("downloads.maxRestarts", 3);
        options.retry.maxAttempts = config.get<uint32_t>("downloads.retry.maxAttempts", 5);
        options.retry.baseDelay = std::chrono::milliseconds(
            config.get<int64_t>("downloads.retry.baseDelayMs", 1000));
        options.retry.maxDelay = std::chrono::milliseconds(
            config.get<int64_t>("downloads.retry.maxDelayMs", 30000));

        if (options.maxConcurrent == 0) options.maxConcurrent = 1;
        if (options.bufferSize == 0) options.bufferSize = 1024 * 1024;
        if (options.retry.maxAttempts == 0) options.retry.maxAttempts = 1;

        return options;
    }
};

} // namespace ferry::core::downloader
