/**
 * AssetDock - Package catalog client
 *
 * Command-line host for the catalog engine: syncs the catalog, lists its
 * entries, and downloads the requested packages into the import directory.
 */

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/catalog/CatalogSyncEngine.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using assetdock::core::Application;
using assetdock::core::Config;
using assetdock::core::Logger;
using assetdock::core::LogLevel;
using assetdock::utils::StringUtils;

// Global application instance for signal handling
std::unique_ptr<Application> g_app;

namespace {

struct Options {
    bool debug{false};
    bool all{false};
    std::string configPath;
    std::string catalogUrl;
    std::vector<std::string> downloads;
};

void signalHandler(int /*signal*/) {
    if (g_app) {
        g_app->requestStop();
    }
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cout << "AssetDock - package catalog client\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Configuration file\n"
              << "      --catalog <url>     Catalog URL (overrides configuration)\n"
              << "      --download <name>   Download and import an entry (repeatable)\n"
              << "  -a, --all               Download every entry\n"
              << "  -d, --debug             Enable debug logging\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << std::endl;
}

/**
 * Load configuration, creating a default file on first run
 */
bool loadConfiguration(const std::string& path) {
    auto& config = Config::instance();
    fs::path configPath = path.empty() ? assetdock::utils::PathUtils::getConfigPath() : fs::path(path);

    std::error_code ec;
    if (fs::exists(configPath, ec)) {
        if (!config.load(configPath.string())) {
            std::cerr << "Invalid configuration file: " << configPath.string() << std::endl;
            return false;
        }
        return true;
    }

    if (!path.empty()) {
        std::cerr << "Configuration file not found: " << configPath.string() << std::endl;
        return false;
    }

    config.setDefaults();
    if (!config.save(configPath.string())) {
        std::cerr << "Could not write default configuration to " << configPath.string() << std::endl;
    }
    return true;
}

void printCatalog(assetdock::core::catalog::CatalogSyncEngine& engine) {
    auto views = engine.entries();
    for (const auto& view : views) {
        std::string size = view.effectiveSize > 0 ? StringUtils::formatBytes(view.effectiveSize) : "unknown";
        std::cout << "  " << std::left << std::setw(32) << view.entry.name
                  << std::setw(12) << view.entry.version
                  << std::setw(16) << view.entry.category
                  << size << '\n';
    }
    std::cout << std::flush;
}

int runDownloads(Application& app, const std::vector<std::string>& names) {
    auto& engine = app.engine();
    int failures = 0;

    // A name given twice is started and reported once
    std::vector<std::string> started;
    for (const auto& name : StringUtils::uniqueInOrder(names)) {
        auto status = engine.startDownload(name);
        switch (status) {
            case assetdock::SubmitStatus::Started:
            case assetdock::SubmitStatus::AlreadyInFlight:
                started.push_back(name);
                break;
            case assetdock::SubmitStatus::MissingUrl:
                std::cerr << name << ": no download URL" << std::endl;
                ++failures;
                break;
            case assetdock::SubmitStatus::SizeLimitExceeded:
                std::cerr << engine.statusMessage() << std::endl;
                ++failures;
                break;
            case assetdock::SubmitStatus::Unavailable:
                std::cerr << name << ": not available in the catalog" << std::endl;
                ++failures;
                break;
        }
    }

    if (!app.runUntil([&engine]() { return !engine.hasActiveWork(); })) {
        std::cerr << "Interrupted" << std::endl;
        return 130;
    }

    for (const auto& name : started) {
        auto view = engine.entry(name);
        if (!view) {
            continue;
        }
        const auto& record = view->download;
        if (record.lastOutcome == assetdock::DownloadOutcome::Completed) {
            std::cout << "Successfully downloaded and imported " << name << std::endl;
        } else {
            std::string reason = record.lastError ? record.lastError->message : "unknown error";
            std::cerr << "Failed to download " << name << ": " << reason << std::endl;
            ++failures;
        }
    }

    return failures == 0 ? 0 : 1;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--all" || arg == "-a") {
            options.all = true;
        } else if (arg == "--config" || arg == "-c") {
            options.configPath = next();
        } else if (arg == "--catalog") {
            options.catalogUrl = next();
        } else if (arg == "--download") {
            options.downloads.push_back(next());
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!loadConfiguration(options.configPath)) {
        return 1;
    }
    auto& config = Config::instance();
    if (!options.catalogUrl.empty()) {
        config.set("catalog.url", options.catalogUrl);
    }

    LogLevel level = Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    Logger::instance().initialize(options.debug ? LogLevel::Debug : level,
                                  assetdock::utils::PathUtils::getLogsPath().string());

    auto& logger = Logger::instance();
    logger.info("{} v{} starting...", Application::getName(), Application::getVersion());

    setupSignalHandlers();

    try {
        g_app = std::make_unique<Application>();
        if (!g_app->initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        auto& engine = g_app->engine();
        engine.sync();
        if (!g_app->runUntil([&engine]() { return !engine.isSyncing(); })) {
            g_app->shutdown();
            return 130;
        }

        std::cout << engine.statusMessage() << std::endl;
        if (engine.status().state != assetdock::SyncState::Ok) {
            g_app->shutdown();
            return 1;
        }

        // Fill in sizes the catalog does not publish
        for (const auto& view : engine.entries()) {
            engine.probeSize(view.entry.name);
        }
        if (!g_app->runUntil([&engine]() { return !engine.hasActiveWork(); })) {
            g_app->shutdown();
            return 130;
        }
        printCatalog(engine);

        std::vector<std::string> targets = options.downloads;
        if (options.all) {
            targets.clear();
            for (const auto& entry : *engine.snapshot()) {
                targets.push_back(entry.name);
            }
        }

        int exitCode = 0;
        if (!targets.empty() && !g_app->stopRequested()) {
            exitCode = runDownloads(*g_app, targets);
        }

        g_app->shutdown();
        g_app.reset();
        logger.info("AssetDock shutdown complete");
        logger.flush();
        return exitCode;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
