/**
 * Application.cpp
 */

#include "Application.hpp"
#include "Config.hpp"
#include "EngineSettings.hpp"
#include "Logger.hpp"
#include "catalog/CatalogSyncEngine.hpp"
#include "importer/DirectoryImporter.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PathUtils.hpp"

#include <algorithm>
#include <thread>

namespace assetdock::core {

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized) {
        shutdown();
    }
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    auto& config = Config::instance();

    try {
        EngineSettings settings = EngineSettings::fromConfig(config);

        auto workers = std::max<int64_t>(1, config.get<int64_t>("downloads.maxConcurrent", 4));
        auto metadataWorkers = std::max<int64_t>(1, config.get<int64_t>("http.metadataWorkers", 2));
        m_httpClient = std::make_unique<utils::HttpClient>(static_cast<size_t>(workers),
                                                           static_cast<size_t>(metadataWorkers));

        auto importDir = config.get<std::string>("import.directory", "");
        m_importer = std::make_unique<importer::DirectoryImporter>(
            importDir.empty() ? utils::PathUtils::getImportPath() : std::filesystem::path(importDir));

        m_pollInterval = std::chrono::milliseconds(
            std::max<int64_t>(1, config.get<int64_t>("downloads.pollIntervalMs", 100)));

        m_engine = std::make_unique<catalog::CatalogSyncEngine>(std::move(settings), *m_httpClient, *m_importer);
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to initialize application: {}", e.what());
        m_engine.reset();
        m_importer.reset();
        m_httpClient.reset();
        setState(AppState::Error);
        return false;
    }

    Logger::instance().info("Scratch directory: {}", m_engine->settings().scratchDirectory.string());
    Logger::instance().info("Import directory: {}", m_importer->targetDirectory().string());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_engine) {
        m_engine->shutdown();
    }

    // Engine first: it holds references to the transport and the importer
    m_engine.reset();
    m_importer.reset();
    m_httpClient.reset();

    Logger::instance().info("Application shutdown complete");
    setState(AppState::Uninitialized);
}

bool Application::runUntil(const std::function<bool()>& done) {
    if (!m_engine) {
        return false;
    }

    while (!m_stopRequested) {
        m_engine->update();
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(m_pollInterval);
    }
    return false;
}

} // namespace assetdock::core
