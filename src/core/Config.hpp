#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace fetchkit::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages application settings with:
 * - Type-safe getters with defaults
 * - Dot-notation keys ("transfers.chunkSize")
 * - JSON persistence
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file.
     * Values present in the file override the defaults; missing keys keep them.
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

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }

            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
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

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"transfers", {
                {"chunkSize", 8192},
                {"progressIntervalMs", 100},
                {"speedWindowMs", 5000},
                {"maxRetries", 3},
                {"retryDelayMs", 2000},
                {"retryBackoff", 1.0},
                {"maxRetryDelayMs", 60000},
                {"autoRetry", true},
                {"timeoutSeconds", 30},
                {"userAgent", "fetchkit/1.0"},
                {"verifySSL", true}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""},
                {"file", true}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "transfers.chunkSize")
     * @param defaultValue Default value if key not found or of another type
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "transfers.maxRetries")
     * @param value Value to set
     * @return false if the key cannot address a JSON location
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            return m_config.contains(ptr);
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Remove configuration key
     * @param key Key path
     */
    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (!m_config.contains(ptr)) {
                return;
            }

            json::json_pointer parent = ptr.parent_pointer();
            std::string leafKey = ptr.back();

            if (parent.empty()) {
                m_config.erase(leafKey);
            } else if (m_config.contains(parent)) {
                m_config.at(parent).erase(leafKey);
            }
        } catch (const json::exception&) {
            // Key doesn't exist or invalid path
        }
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace fetchkit::core
