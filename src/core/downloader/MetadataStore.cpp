/**
 * MetadataStore.cpp
 *
 * Sidecar persistence and .part file handling.
 */

#include "MetadataStore.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry::core::downloader {

using utils::FileUtils;
using utils::JsonUtils;
using utils::StringUtils;

namespace {

constexpr const char* kPartSuffix = ".part";
constexpr const char* kSidecarSuffix = ".meta.json";
constexpr const char* kSidecarTempSuffix = ".meta.json.tmp";

std::system_error errnoError(const std::string& what, const fs::path& path) {
    return std::system_error(errno, std::generic_category(), what + " " + path.string());
}

fs::path stripSuffix(const fs::path& path, const std::string& suffix) {
    std::string str = path.string();
    return fs::path(str.substr(0, str.size() - suffix.size()));
}

void removeIfExists(const fs::path& path) {
    std::error_code ec;
    if (FileUtils::deleteFile(path, ec)) {
        LOG_DEBUG("Removed {}", path.string());
    } else if (ec) {
        throw fs::filesystem_error("cannot remove", path, ec);
    }
}

} // namespace

// -- Sidecar serialization --

void to_json(nlohmann::json& j, const SidecarRecord& record) {
    j = nlohmann::json{
        {"version", record.version},
        {"download_id", record.downloadId},
        {"url", record.url},
        {"protocol", record.protocol},
        {"destination", record.destination},
        {"bytes_downloaded", record.bytesDownloaded}
    };
    JsonUtils::setOptional(j, "etag", record.etag);
    JsonUtils::setOptional(j, "expected_size", record.expectedSize);
    JsonUtils::setOptional(j, "last_modified", record.lastModified);
    JsonUtils::setOptional(j, "expected_hash", record.expectedHash);
    JsonUtils::setOptional(j, "final_hash", record.finalHash);
}

void from_json(const nlohmann::json& j, SidecarRecord& record) {
    if (!j.is_object()) {
        throw std::runtime_error("sidecar is not a JSON object");
    }

    auto version = JsonUtils::getOptionalUInt64(j, "version");
    if (!version || *version != SidecarRecord::kVersion) {
        throw std::runtime_error("unsupported sidecar version");
    }

    auto downloadId = JsonUtils::getOptionalString(j, "download_id");
    auto url = JsonUtils::getOptionalString(j, "url");
    auto bytes = JsonUtils::getOptionalUInt64(j, "bytes_downloaded");
    if (!downloadId || downloadId->empty() || !url || url->empty() || !bytes) {
        throw std::runtime_error("sidecar is missing required fields");
    }

    record.version = SidecarRecord::kVersion;
    record.downloadId = *downloadId;
    record.url = *url;
    record.protocol = JsonUtils::getString(j, "protocol");
    record.destination = JsonUtils::getString(j, "destination");
    record.bytesDownloaded = *bytes;
    record.etag = JsonUtils::getOptionalString(j, "etag");
    record.expectedSize = JsonUtils::getOptionalUInt64(j, "expected_size");
    record.lastModified = JsonUtils::getOptionalString(j, "last_modified");
    record.expectedHash = JsonUtils::getOptionalString(j, "expected_hash");
    record.finalHash = JsonUtils::getOptionalString(j, "final_hash");

    if (record.expectedSize && record.bytesDownloaded > *record.expectedSize) {
        throw std::runtime_error("sidecar offset exceeds expected size");
    }
}

// -- PartFile --

PartFile::PartFile(const fs::path& path)
    : m_path(path) {
    m_fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (m_fd < 0) {
        throw errnoError("cannot open", path);
    }

    if (::flock(m_fd, LOCK_EX | LOCK_NB) != 0) {
        auto error = errnoError("cannot lock", path);
        ::close(m_fd);
        m_fd = -1;
        throw error;
    }
}

PartFile::~PartFile() {
    if (m_fd >= 0) {
        // Closing drops the flock as well
        ::close(m_fd);
    }
}

void PartFile::append(const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(m_fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errnoError("write failed for", m_path);
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

void PartFile::sync() {
    if (::fsync(m_fd) != 0) {
        throw errnoError("fsync failed for", m_path);
    }
}

uint64_t PartFile::size() const {
    struct stat st {};
    if (::fstat(m_fd, &st) != 0) {
        throw errnoError("stat failed for", m_path);
    }
    return static_cast<uint64_t>(st.st_size);
}

void PartFile::close() {
    if (m_fd < 0) return;

    int fd = m_fd;
    m_fd = -1;
    if (::close(fd) != 0) {
        throw errnoError("close failed for", m_path);
    }
}

// -- MetadataStore --

MetadataStore::MetadataStore(const fs::path& root)
    : m_root(FileUtils::normalizePath(root)) {
}

std::optional<fs::path> MetadataStore::resolveDestination(const std::string& destination) const {
    std::string trimmed = StringUtils::trim(destination);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    fs::path candidate(trimmed);
    if (candidate.is_relative()) {
        candidate = m_root / candidate;
    }

    fs::path normalized = FileUtils::normalizePath(candidate);
    if (!FileUtils::isPathWithin(normalized, m_root)) {
        return std::nullopt;
    }

    // A trailing separator names a directory, not a file
    if (!normalized.has_filename()) {
        return std::nullopt;
    }
    return normalized;
}

fs::path MetadataStore::partPath(const fs::path& destination) {
    return FileUtils::appendSuffix(destination, kPartSuffix);
}

fs::path MetadataStore::sidecarPath(const fs::path& destination) {
    return FileUtils::appendSuffix(destination, kSidecarSuffix);
}

void MetadataStore::save(const SidecarRecord& record) const {
    nlohmann::json j = record;
    FileUtils::writeFileAtomic(sidecarPath(record.destination), j.dump(2));
}

std::optional<SidecarRecord> MetadataStore::load(const fs::path& destination) const {
    fs::path path = sidecarPath(destination);
    if (!FileUtils::fileExists(path)) {
        return std::nullopt;
    }

    auto j = JsonUtils::parseFile(path);
    if (!j) {
        LOG_WARN("Unparsable sidecar {}", path.string());
        return std::nullopt;
    }

    try {
        SidecarRecord record = j->get<SidecarRecord>();
        // The sidecar's own location is authoritative
        record.destination = destination.string();
        return record;
    } catch (const std::exception& e) {
        LOG_WARN("Rejecting sidecar {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

void MetadataStore::discard(const fs::path& destination) const {
    removeIfExists(partPath(destination));
    removeIfExists(sidecarPath(destination));
    removeIfExists(FileUtils::appendSuffix(destination, kSidecarTempSuffix));
}

void MetadataStore::removeSidecar(const fs::path& destination) const {
    removeIfExists(sidecarPath(destination));
    FileUtils::syncDirectory(destination.parent_path());
}

RecoveryResult MetadataStore::scan(const std::function<bool(const fs::path&)>& isOwned) const {
    RecoveryResult result;

    if (!FileUtils::directoryExists(m_root)) {
        return result;
    }

    std::vector<fs::path> sidecars;
    std::vector<fs::path> partFiles;
    std::vector<fs::path> tempFiles;

    std::error_code ec;
    fs::recursive_directory_iterator it(m_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("Cannot scan {}: {}", m_root.string(), ec.message());
        return result;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARN("Scan of {} stopped early: {}", m_root.string(), ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) continue;

        std::string name = it->path().filename().string();
        if (StringUtils::endsWith(name, kSidecarTempSuffix)) {
            tempFiles.push_back(it->path());
        } else if (StringUtils::endsWith(name, kSidecarSuffix)) {
            sidecars.push_back(it->path());
        } else if (StringUtils::endsWith(name, kPartSuffix)) {
            partFiles.push_back(it->path());
        }
    }

    auto owned = [&](const fs::path& destination) {
        return isOwned && isOwned(destination);
    };

    for (const auto& temp : tempFiles) {
        if (owned(stripSuffix(temp, kSidecarTempSuffix))) continue;
        try {
            removeIfExists(temp);
            ++result.staleTempFiles;
        } catch (const fs::filesystem_error& e) {
            LOG_WARN("Cannot remove stale temp file: {}", e.what());
        }
    }

    for (const auto& sidecar : sidecars) {
        fs::path destination = stripSuffix(sidecar, kSidecarSuffix);
        if (owned(destination)) continue;

        auto record = load(destination);

        if (record && FileUtils::fileExists(partPath(destination))) {
            result.records.push_back(*record);
            continue;
        }

        LOG_WARN("Discarding inconsistent download state for {}", destination.string());
        try {
            discard(destination);
            ++result.discarded;
        } catch (const fs::filesystem_error& e) {
            LOG_WARN("Cannot discard {}: {}", destination.string(), e.what());
        }
    }

    // Partial data without a sidecar cannot be trusted
    for (const auto& part : partFiles) {
        fs::path destination = stripSuffix(part, kPartSuffix);
        if (owned(destination) || FileUtils::fileExists(sidecarPath(destination))) continue;
        if (!FileUtils::fileExists(part)) continue;

        LOG_WARN("Discarding partial data without a sidecar: {}", part.string());
        try {
            removeIfExists(part);
            ++result.discarded;
        } catch (const fs::filesystem_error& e) {
            LOG_WARN("Cannot discard {}: {}", part.string(), e.what());
        }
    }

    LOG_INFO("Recovery scan of {}: {} resumable, {} discarded, {} stale temp files",
             m_root.string(), result.records.size(), result.discarded, result.staleTempFiles);
    return result;
}

} // namespace ferry::core::downloader
