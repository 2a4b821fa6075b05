// Ferry - JSON Utilities
// Parsing and tolerant field access for persisted records

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ferry::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str);
    static std::optional<json> parseFile(const std::filesystem::path& path);

    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static uint64_t getUInt64(const json& j, const std::string& key, uint64_t defaultValue = 0);

    // Null or absent -> nullopt
    static std::optional<std::string> getOptionalString(const json& j, const std::string& key);
    static std::optional<uint64_t> getOptionalUInt64(const json& j, const std::string& key);

    // Writes null for an empty optional
    template<typename T>
    static void setOptional(json& j, const std::string& key, const std::optional<T>& value) {
        if (value) {
            j[key] = *value;
        } else {
            j[key] = nullptr;
        }
    }
};

} // namespace ferry::utils
