// Ferry - String Utilities
// Small string helpers shared by the engine and the CLI

#pragma once

#include <cstdint>
#include <string>

namespace ferry::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string toLower(const std::string& str);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // "52.3 MB"
    static std::string formatBytes(uint64_t bytes);

    // UUID v4, lowercase, dashed
    static std::string generateUUID();
    static bool isValidUUID(const std::string& str);
};

} // namespace ferry::utils
