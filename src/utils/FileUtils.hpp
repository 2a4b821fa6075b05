// Ferry - File Utilities
// Durable file system operations used by the metadata store

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace ferry::utils {

/**
 * @brief File and directory utilities
 *
 * Query helpers never throw. The durability helpers (writeFileAtomic,
 * syncFile, syncDirectory, moveFile) throw std::system_error or
 * fs::filesystem_error with the failing path in the message.
 */
class FileUtils {
public:
    // Queries
    static bool fileExists(const fs::path& path);
    static bool directoryExists(const fs::path& path);
    static std::optional<uint64_t> getFileSize(const fs::path& path);
    static std::optional<uint64_t> availableSpace(const fs::path& path);

    // Removal; a missing file is not an error
    static bool deleteFile(const fs::path& path, std::error_code& ec);

    // Path utilities
    static fs::path normalizePath(const fs::path& path);
    static bool isPathWithin(const fs::path& path, const fs::path& root);
    static fs::path appendSuffix(const fs::path& path, const std::string& suffix);

    // Durability
    static void writeFileAtomic(const fs::path& path, const std::string& content);
    static void syncFile(const fs::path& path);
    static void syncDirectory(const fs::path& dir);
    static void moveFile(const fs::path& source, const fs::path& destination);
};

} // namespace ferry::utils
