/**
 * JsonUtils.cpp
 *
 * JSON parsing and accessor helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>

namespace ferry::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str) {
    try { return json::parse(str); }
    catch (const json::exception&) { return std::nullopt; }
}

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

uint64_t JsonUtils::getUInt64(const json& j, const std::string& key, uint64_t defaultValue) {
    if (j.contains(key) && j[key].is_number_unsigned()) return j[key].get<uint64_t>();
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() >= 0) {
        return static_cast<uint64_t>(j[key].get<int64_t>());
    }
    return defaultValue;
}

std::optional<std::string> JsonUtils::getOptionalString(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<uint64_t> JsonUtils::getOptionalUInt64(const json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_number_integer()) return std::nullopt;
    if (!j[key].is_number_unsigned() && j[key].get<int64_t>() < 0) return std::nullopt;
    return getUInt64(j, key);
}

} // namespace ferry::utils
