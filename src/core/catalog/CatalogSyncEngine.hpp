#pragma once

/**
 * CatalogSyncEngine.hpp
 *
 * Owns the published catalog and drives refresh cycles, metadata probes
 * and downloads against it. The host calls update() from its loop; every
 * other call returns immediately.
 */

#include "CatalogParser.hpp"
#include "MetadataProber.hpp"
#include "../downloader/DownloadCoordinator.hpp"
#include "../importer/PackageImporter.hpp"
#include "../EngineSettings.hpp"
#include "../EventBus.hpp"
#include "../models/Models.hpp"
#include "../../utils/HttpClient.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetdock::core::catalog {

/**
 * CatalogSyncEngine - catalog refresh and per-entry orchestration
 *
 * One instance owns its catalog, in-flight sets and settings; several
 * engines may coexist. Not thread-safe: all calls come from the host thread.
 */
class CatalogSyncEngine {
public:
    /**
     * @param settings Engine settings
     * @param transport HTTP transport shared by fetch, probes and downloads
     * @param importer Receives every verified package
     */
    CatalogSyncEngine(EngineSettings settings,
                      utils::HttpTransport& transport,
                      importer::PackageImporter& importer);
    ~CatalogSyncEngine();

    CatalogSyncEngine(const CatalogSyncEngine&) = delete;
    CatalogSyncEngine& operator=(const CatalogSyncEngine&) = delete;

    // Operations

    /**
     * Start a refresh cycle. Not re-entrant: a second call while one is
     * running returns AlreadyInProgress.
     */
    SyncResult sync();

    /**
     * Advance the in-flight fetch, probes and downloads.
     */
    void update();

    SubmitStatus startDownload(const std::string& name);
    bool cancelDownload(const std::string& name);
    bool probeSize(const std::string& name);
    bool probeImage(const std::string& name);

    /**
     * Abort the fetch and every download, abandon probes. Later calls
     * report Unavailable.
     */
    void shutdown() noexcept;

    // Reads

    CatalogSnapshot snapshot() const { return m_catalog; }
    std::vector<EntryView> entries() const;
    std::optional<EntryView> entry(const std::string& name) const;

    const SyncStatus& status() const { return m_status; }
    const std::string& statusMessage() const { return m_statusMessage; }

    bool isSyncing() const { return m_syncRequest.has_value(); }
    bool isShutDown() const { return m_shutDown; }

    /**
     * Whether anything is in flight; hosts use it to decide on redraws.
     */
    bool hasActiveWork() const;

    EventBus& events() { return m_events; }
    const EngineSettings& settings() const { return m_settings; }

private:
    utils::RequestOptions syncOptions() const;
    void pollSync();
    void followSyncRedirect(const utils::HttpResponse& response);
    void completeSync(utils::HttpResponse response);
    void publishCatalog(ParsedCatalog parsed);
    void failSync(const Error& error, const std::string& message);
    void setStatusMessage(const std::string& message);
    void onDownloadState(const json& payload);

    const CatalogEntry* findEntry(const std::string& name) const;
    EntryView makeView(const CatalogEntry& entry) const;

    EngineSettings m_settings;
    bool m_allowPrivateHosts;
    bool m_apiEnvelope;

    EventBus m_events;
    SubscriptionPtr m_downloadSubscription;

    utils::HttpTransport& m_transport;
    MetadataProber m_prober;
    downloader::DownloadCoordinator m_coordinator;

    CatalogSnapshot m_catalog;
    std::unordered_map<std::string, size_t> m_index;

    SyncStatus m_status;
    std::string m_statusMessage;

    std::optional<utils::PendingRequest> m_syncRequest;
    std::string m_syncUrl;          // current hop of the catalog fetch
    int m_syncRedirects{0};
    bool m_shutDown{false};
};

} // namespace assetdock::core::catalog
