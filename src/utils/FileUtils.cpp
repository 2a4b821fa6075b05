/**
 * FileUtils.cpp
 *
 * POSIX-backed durable file operations.
 */

#include "FileUtils.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry::utils {

namespace {

std::system_error errnoError(const std::string& what, const fs::path& path) {
    return std::system_error(errno, std::generic_category(), what + " " + path.string());
}

class ScopedFd {
public:
    explicit ScopedFd(int fd) : m_fd(fd) {}
    ~ScopedFd() { if (m_fd >= 0) ::close(m_fd); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return m_fd; }

    int release() {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }

private:
    int m_fd;
};

void writeAll(int fd, const char* data, size_t size, const fs::path& path) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errnoError("write failed for", path);
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

} // namespace

// -- Queries --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::optional<uint64_t> FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::optional<uint64_t> FileUtils::availableSpace(const fs::path& path) {
    std::error_code ec;
    auto info = fs::space(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(info.available);
}

bool FileUtils::deleteFile(const fs::path& path, std::error_code& ec) {
    ec.clear();
    return fs::remove(path, ec);
}

// -- Path utilities --

fs::path FileUtils::normalizePath(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) absolute = path;

    // Resolves symlinks for the existing prefix, lexical for the rest
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) canonical = absolute;
    return canonical.lexically_normal();
}

bool FileUtils::isPathWithin(const fs::path& path, const fs::path& root) {
    fs::path normalizedPath = normalizePath(path);
    fs::path normalizedRoot = normalizePath(root);

    auto rootIt = normalizedRoot.begin();
    auto pathIt = normalizedPath.begin();
    for (; rootIt != normalizedRoot.end(); ++rootIt, ++pathIt) {
        if (rootIt->empty()) break;
        if (pathIt == normalizedPath.end() || *pathIt != *rootIt) {
            return false;
        }
    }

    // The root itself is not a file location inside the root
    for (; pathIt != normalizedPath.end(); ++pathIt) {
        if (!pathIt->empty()) return true;
    }
    return false;
}

fs::path FileUtils::appendSuffix(const fs::path& path, const std::string& suffix) {
    fs::path result = path;
    result += suffix;
    return result;
}

// -- Durability --

void FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    fs::path tempPath = appendSuffix(path, ".tmp");

    {
        ScopedFd fd(::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (fd.get() < 0) {
            throw errnoError("cannot create", tempPath);
        }

        try {
            writeAll(fd.get(), content.data(), content.size(), tempPath);
            if (::fsync(fd.get()) != 0) {
                throw errnoError("fsync failed for", tempPath);
            }
        } catch (...) {
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw;
        }

        if (::close(fd.release()) != 0) {
            throw errnoError("close failed for", tempPath);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw fs::filesystem_error("atomic rename failed", tempPath, path, ec);
    }

    syncDirectory(path.parent_path());
}

void FileUtils::syncFile(const fs::path& path) {
    ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        throw errnoError("cannot open", path);
    }
    if (::fsync(fd.get()) != 0) {
        throw errnoError("fsync failed for", path);
    }
}

void FileUtils::syncDirectory(const fs::path& dir) {
    fs::path target = dir.empty() ? fs::path(".") : dir;
    ScopedFd fd(::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() < 0) {
        throw errnoError("cannot open directory", target);
    }
    // Some file systems refuse fsync on directories; the rename already happened
    if (::fsync(fd.get()) != 0 && errno != EINVAL && errno != EROFS) {
        throw errnoError("fsync failed for directory", target);
    }
}

void FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);

    if (ec == std::errc::cross_device_link) {
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
        syncFile(destination);
        fs::remove(source);
    } else if (ec) {
        throw fs::filesystem_error("rename failed", source, destination, ec);
    }

    syncDirectory(destination.parent_path());
}

} // namespace ferry::utils
