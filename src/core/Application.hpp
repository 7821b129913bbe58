#pragma once

/**
 * Application.hpp
 *
 * Wires the catalog engine to its collaborators for the command-line host
 * and runs the cooperative update loop.
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace assetdock::utils { class HttpClient; }
namespace assetdock::core::catalog { class CatalogSyncEngine; }
namespace assetdock::core::importer { class DirectoryImporter; }

namespace assetdock::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Owns the HTTP transport, the importer and the engine, in that
 * construction order, and tears them down in reverse.
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Build every subsystem from the current configuration
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Cancel outstanding work and release subsystems
     */
    void shutdown();

    /**
     * Ask the update loop to stop. Only touches an atomic flag, so it may
     * be called from a signal handler.
     */
    void requestStop() { m_stopRequested = true; }
    bool stopRequested() const { return m_stopRequested.load(); }

    /**
     * Drive the engine until @p done returns true or a stop is requested
     * @return false if interrupted
     */
    bool runUntil(const std::function<bool()>& done);

    AppState getState() const { return m_state.load(); }

    catalog::CatalogSyncEngine& engine() { return *m_engine; }

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "AssetDock"; }

private:
    void setState(AppState state) { m_state = state; }

    std::atomic<AppState> m_state{AppState::Uninitialized};
    std::atomic<bool> m_stopRequested{false};
    std::chrono::milliseconds m_pollInterval{100};

    std::unique_ptr<utils::HttpClient> m_httpClient;
    std::unique_ptr<importer::DirectoryImporter> m_importer;
    std::unique_ptr<catalog::CatalogSyncEngine> m_engine;
};

} // namespace assetdock::core
