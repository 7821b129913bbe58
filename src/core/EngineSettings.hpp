#pragma once

/**
 * EngineSettings.hpp
 *
 * Immutable knobs consumed by the sync engine and its components.
 * Built from Config in the application, or directly in tests.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace assetdock::core {

class Config;

struct EngineSettings {
    std::string catalogUrl;
    std::vector<std::string> apiHosts{"api.github.com"};
    std::filesystem::path scratchDirectory;
    std::chrono::milliseconds requestTimeout{30000};
    int downloadTimeoutMultiplier{10};
    int64_t maxDownloadBytes{500LL * 1024 * 1024};
    bool allowPrivateHosts{false};
    std::string packageExtension{".unitypackage"};
    std::string userAgent{"AssetDock/1.0"};

    /**
     * Bound applied to a whole package download
     */
    std::chrono::milliseconds downloadTimeout() const;

    /**
     * Private/loopback targets are allowed when configured, or when the
     * catalog itself is served from such a host (development setup).
     */
    bool effectiveAllowPrivateHosts() const;

    /**
     * Build settings from the configuration store
     * @param config Loaded configuration
     */
    static EngineSettings fromConfig(const Config& config);

    /**
     * Default scratch directory: <temp>/AssetDock
     */
    static std::filesystem::path defaultScratchDirectory();
};

} // namespace assetdock::core
