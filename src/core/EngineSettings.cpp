/**
 * EngineSettings.cpp
 */

#include "EngineSettings.hpp"
#include "Config.hpp"
#include "security/UrlValidator.hpp"

#include <algorithm>
#include <system_error>

namespace assetdock::core {

std::chrono::milliseconds EngineSettings::downloadTimeout() const {
    int multiplier = std::max(1, downloadTimeoutMultiplier);
    return requestTimeout * multiplier;
}

bool EngineSettings::effectiveAllowPrivateHosts() const {
    if (allowPrivateHosts) {
        return true;
    }
    auto parsed = security::parseUrl(catalogUrl);
    return parsed && security::isLoopbackOrPrivateHost(parsed->host);
}

EngineSettings EngineSettings::fromConfig(const Config& config) {
    EngineSettings settings;

    settings.catalogUrl = config.get<std::string>("catalog.url", "");
    settings.apiHosts = config.get<std::vector<std::string>>("catalog.apiHosts", settings.apiHosts);

    auto scratch = config.get<std::string>("downloads.scratchDirectory", "");
    settings.scratchDirectory = scratch.empty() ? defaultScratchDirectory()
                                                : std::filesystem::path(scratch);

    auto timeoutMs = config.get<int64_t>("downloads.timeoutMs", 30000);
    settings.requestTimeout = std::chrono::milliseconds(std::max<int64_t>(1, timeoutMs));
    settings.downloadTimeoutMultiplier = config.get<int>("downloads.timeoutMultiplier", 10);
    settings.maxDownloadBytes = config.get<int64_t>("downloads.maxSizeBytes", settings.maxDownloadBytes);
    settings.packageExtension = config.get<std::string>("downloads.packageExtension", ".unitypackage");
    if (!settings.packageExtension.empty() && settings.packageExtension.front() != '.') {
        settings.packageExtension.insert(settings.packageExtension.begin(), '.');
    }

    settings.allowPrivateHosts = config.get<bool>("security.allowPrivateHosts", false);
    settings.userAgent = config.get<std::string>("http.userAgent", settings.userAgent);

    return settings;
}

std::filesystem::path EngineSettings::defaultScratchDirectory() {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = std::filesystem::current_path(ec);
    }
    return temp / "AssetDock";
}

} // namespace assetdock::core
