#pragma once

/**
 * MetadataStore.hpp
 *
 * Durable per-download state: the JSON sidecar (<dest>.meta.json) and the
 * partial data file (<dest>.part) that becomes the destination on success.
 */

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ferry::core::downloader {

namespace fs = std::filesystem;

/**
 * Sidecar schema, version 1
 */
struct SidecarRecord {
    static constexpr uint32_t kVersion = 1;

    uint32_t version{kVersion};
    std::string downloadId;
    std::string url;
    std::string protocol;
    std::string destination;
    std::optional<std::string> etag;
    std::optional<uint64_t> expectedSize;
    uint64_t bytesDownloaded{0};
    std::optional<std::string> lastModified;
    std::optional<std::string> expectedHash;
    std::optional<std::string> finalHash;
};

void to_json(nlohmann::json& j, const SidecarRecord& record);

/**
 * @throws std::runtime_error on a missing field or an unknown version
 */
void from_json(const nlohmann::json& j, SidecarRecord& record);

/**
 * Append-only handle on a .part file
 *
 * Holds an exclusive advisory lock for its lifetime so two engines
 * never write the same partial file.
 */
class PartFile {
public:
    /**
     * Open (creating if needed) and lock
     * @throws std::system_error if the file cannot be opened or is locked
     */
    explicit PartFile(const fs::path& path);
    ~PartFile();

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;

    /**
     * Append bytes at the end, retrying short writes
     */
    void append(const char* data, size_t size);

    void sync();
    uint64_t size() const;

    /**
     * Release the lock and the descriptor
     * @throws std::system_error if close reports a deferred write error
     */
    void close();

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
    int m_fd{-1};
};

/**
 * Result of a recovery scan
 */
struct RecoveryResult {
    std::vector<SidecarRecord> records;     // Consistent sidecar + .part pairs
    size_t discarded{0};                    // Pairs or lone files removed as inconsistent
    size_t staleTempFiles{0};
};

class MetadataStore {
public:
    /**
     * @param root Directory every destination must live under
     */
    explicit MetadataStore(const fs::path& root);

    const fs::path& root() const { return m_root; }

    /**
     * Resolve a destination against the root
     * @return Normalized absolute path, nullopt if it escapes the root
     */
    std::optional<fs::path> resolveDestination(const std::string& destination) const;

    static fs::path partPath(const fs::path& destination);
    static fs::path sidecarPath(const fs::path& destination);

    /**
     * Atomically replace the sidecar (tmp, fsync, rename, fsync dir)
     * @throws std::system_error / fs::filesystem_error
     */
    void save(const SidecarRecord& record) const;

    /**
     * Read the sidecar for a destination
     * @return nullopt if absent or unreadable
     */
    std::optional<SidecarRecord> load(const fs::path& destination) const;

    /**
     * Remove .part, sidecar and any sidecar temp file
     * @throws fs::filesystem_error if a file exists but cannot be removed
     */
    void discard(const fs::path& destination) const;

    /**
     * Remove only the sidecar after a successful finalize
     */
    void removeSidecar(const fs::path& destination) const;

    /**
     * Walk the root, keep consistent pairs, delete everything else
     * @param isOwned Destinations for which it returns true belong to a
     *        live task and are left untouched
     */
    RecoveryResult scan(const std::function<bool(const fs::path&)>& isOwned = {}) const;

private:
    fs::path m_root;
};

} // namespace ferry::core::downloader
