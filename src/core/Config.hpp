#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to engine settings with defaults.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace ferry::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Keys are addressed with dot notation ("downloads.retry.maxAttempts").
 * Values loaded from disk are merged over the defaults so a partial
 * config file never removes a setting the engine relies on.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception& e) {
            LOG_WARN("Ignoring malformed config {}: {}", path, e.what());
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return file.good();

        } catch (const std::filesystem::filesystem_error& e) {
            LOG_ERROR("Cannot save config {}: {}", savePath, e.what());
            return false;
        }
    }

    /**
     * Reset to default values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"log", {
                {"level", "warn"}
            }},
            {"downloads", {
                {"root", ""},
                {"maxConcurrent", 4},
                {"bufferSize", 1024 * 1024},
                {"maxRestarts", 3},
                {"timeout", 30000},
                {"userAgent", "Ferry/1.0"},
                {"retry", {
                    {"maxAttempts", 5},
                    {"baseDelayMs", 1000},
                    {"maxDelayMs", 30000}
                }}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.bufferSize")
     * @param defaultValue Default value if key not found or mistyped
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception& e) {
            LOG_WARN("Config key {} has unexpected type: {}", key, e.what());
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            pointer += (c == '.') ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace ferry::core
