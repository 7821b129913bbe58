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

namespace assetdock::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Keys use dot notation ("downloads.timeoutMs"). Values missing from a
 * loaded file keep their defaults because load() merges over them.
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

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }
            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        } catch (const std::filesystem::filesystem_error&) {
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
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to the built-in defaults
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"catalog", {
                {"url", "http://vrton.org/data/catalog.json"},
                {"apiHosts", json::array({"api.github.com"})}
            }},
            {"downloads", {
                {"scratchDirectory", ""},
                {"timeoutMs", 30000},
                {"timeoutMultiplier", 10},
                {"maxSizeBytes", 500LL * 1024 * 1024},
                {"packageExtension", ".unitypackage"},
                {"maxConcurrent", 4},
                {"pollIntervalMs", 100}
            }},
            {"security", {
                {"allowPrivateHosts", false}
            }},
            {"import", {
                {"directory", ""}
            }},
            {"logging", {
                {"level", "info"}
            }},
            {"http", {
                {"userAgent", "AssetDock/1.0"},
                {"metadataWorkers", 2}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "catalog.url")
     * @param defaultValue Default value if key not found or of the wrong type
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

} // namespace assetdock::core
