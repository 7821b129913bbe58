/**
 * CatalogSyncEngine.cpp
 */

#include "CatalogSyncEngine.hpp"
#include "EnvelopeDecoder.hpp"
#include "../Logger.hpp"
#include "../security/UrlValidator.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/JsonUtils.hpp"

#include <unordered_set>

namespace assetdock::core::catalog {

using utils::HttpResponse;
using utils::JsonUtils;

namespace {

EngineSettings normalized(EngineSettings settings) {
    if (settings.scratchDirectory.empty()) {
        settings.scratchDirectory = EngineSettings::defaultScratchDirectory();
    }
    return settings;
}

} // namespace

CatalogSyncEngine::CatalogSyncEngine(EngineSettings settings,
                                     utils::HttpTransport& transport,
                                     importer::PackageImporter& importer)
    : m_settings(normalized(std::move(settings)))
    , m_allowPrivateHosts(m_settings.effectiveAllowPrivateHosts())
    , m_apiEnvelope(isApiEnvelopeSource(m_settings.catalogUrl, m_settings.apiHosts))
    , m_transport(transport)
    , m_prober(transport, m_settings, m_events)
    , m_coordinator(transport, m_settings, importer, m_events)
    , m_catalog(std::make_shared<const Catalog>()) {

    if (!utils::FileUtils::createDirectories(m_settings.scratchDirectory)) {
        LOG_WARN("Cannot create scratch directory {}", m_settings.scratchDirectory.string());
    }

    m_downloadSubscription = m_events.subscribe(events::DownloadState,
        [this](const json& payload) { onDownloadState(payload); });

    LOG_DEBUG("Catalog engine ready (source: {}, envelope: {}, private hosts: {})",
              m_settings.catalogUrl, m_apiEnvelope, m_allowPrivateHosts);
}

CatalogSyncEngine::~CatalogSyncEngine() {
    shutdown();
    m_events.unsubscribe(m_downloadSubscription);
}

// -- Sync --

SyncResult CatalogSyncEngine::sync() {
    if (m_shutDown) {
        return SyncResult::Unavailable;
    }
    if (m_syncRequest) {
        LOG_DEBUG("Catalog sync already in progress");
        return SyncResult::AlreadyInProgress;
    }

    if (!security::isFetchable(m_settings.catalogUrl, true)) {
        failSync(Error(ErrorKind::ValidationRejected, "Invalid catalog URL"),
                 "Failed to load catalog: invalid URL");
        return SyncResult::Unavailable;
    }

    LOG_INFO("Syncing catalog from {}", m_settings.catalogUrl);
    m_status.state = SyncState::InProgress;
    m_status.error.reset();
    setStatusMessage("Loading catalog...");
    m_events.emit(events::SyncStarted, {{"url", m_settings.catalogUrl}});

    // Runtime state of entries that are still listed starts over with
    // every refresh
    std::unordered_set<std::string> current;
    for (const auto& entry : *m_catalog) {
        current.insert(entry.name);
    }
    m_coordinator.reconcile(current);

    try {
        m_syncRequest = m_transport.get(m_settings.catalogUrl, syncOptions());
        m_syncUrl = m_settings.catalogUrl;
        m_syncRedirects = 0;
    } catch (const std::exception& e) {
        m_syncRequest.reset();
        failSync(Error(ErrorKind::Network, e.what()),
                 std::string("Error loading catalog: ") + e.what());
    }

    return SyncResult::Started;
}

utils::RequestOptions CatalogSyncEngine::syncOptions() const {
    utils::RequestOptions options;
    options.timeout = m_settings.requestTimeout;
    options.userAgent = m_settings.userAgent;
    options.lane = utils::RequestLane::Metadata;
    return options;
}

void CatalogSyncEngine::pollSync() {
    if (!m_syncRequest) {
        return;
    }

    // The deadline counts from the moment a transport worker took the request
    bool ready = m_syncRequest->ready();
    if (!ready && !m_syncRequest->pastDeadline(m_settings.requestTimeout)) {
        return;
    }

    // Clear the guard before any step that can fail
    utils::PendingRequest request = std::move(*m_syncRequest);
    m_syncRequest.reset();

    if (!ready) {
        request.abort();
        failSync(Error(ErrorKind::Timeout, "Request timed out"),
                 "Failed to load catalog: Request timed out");
        return;
    }

    try {
        HttpResponse response = request.response.get();
        if (response.isRedirect()) {
            followSyncRedirect(response);
            return;
        }
        completeSync(std::move(response));
    } catch (const std::exception& e) {
        m_syncRequest.reset();
        failSync(Error(ErrorKind::Network, e.what()),
                 std::string("Error loading catalog: ") + e.what());
    }
}

void CatalogSyncEngine::followSyncRedirect(const HttpResponse& response) {
    std::string location = response.header("Location").value_or("");
    if (m_syncRedirects >= security::kMaxRedirects) {
        failSync(Error(ErrorKind::Network, "Too many redirects"),
                 "Failed to load catalog: Too many redirects");
        return;
    }

    auto target = security::redirectTarget(m_syncUrl, location, m_allowPrivateHosts);
    if (!target) {
        LOG_WARN("Refusing catalog redirect from {} to '{}'", m_syncUrl, location);
        failSync(Error(ErrorKind::ValidationRejected, "Redirect to a disallowed location"),
                 "Failed to load catalog: Redirect to a disallowed location");
        return;
    }

    LOG_DEBUG("Catalog redirected to {}", *target);
    m_syncRequest = m_transport.get(*target, syncOptions());
    m_syncUrl = *target;
    ++m_syncRedirects;
}

void CatalogSyncEngine::completeSync(HttpResponse response) {
    if (response.timedOut) {
        failSync(Error(ErrorKind::Timeout, "Request timed out"),
                 "Failed to load catalog: Request timed out");
        return;
    }
    if (!response.error.empty()) {
        failSync(Error(ErrorKind::Network, response.error),
                 "Failed to load catalog: " + response.error);
        return;
    }
    if (!response.isSuccess()) {
        std::string reason = "HTTP " + std::to_string(response.statusCode);
        failSync(Error(ErrorKind::Network, reason), "Failed to load catalog: " + reason);
        return;
    }

    auto decoded = decodeCatalog(response.body, m_apiEnvelope, m_allowPrivateHosts);
    if (!decoded.ok()) {
        failSync(*decoded.error, "Failed to load catalog: " + decoded.error->message);
        return;
    }

    publishCatalog(std::move(decoded.catalog));
}

void CatalogSyncEngine::publishCatalog(ParsedCatalog parsed) {
    auto catalog = std::make_shared<const Catalog>(std::move(parsed.entries));

    std::unordered_map<std::string, size_t> index;
    std::unordered_set<std::string> names;
    std::unordered_set<std::string> urls;
    for (size_t i = 0; i < catalog->size(); ++i) {
        const auto& entry = (*catalog)[i];
        index.emplace(entry.name, i);
        names.insert(entry.name);
        if (!entry.downloadUrl.empty()) urls.insert(entry.downloadUrl);
        if (!entry.imageUrl.empty()) urls.insert(entry.imageUrl);
    }

    m_coordinator.reconcile(names);
    m_prober.retain(urls);

    m_catalog = std::move(catalog);
    m_index = std::move(index);

    m_status.state = SyncState::Ok;
    m_status.count = m_catalog->size();
    m_status.rejected = parsed.rejected;
    m_status.error.reset();

    LOG_INFO("Catalog loaded: {} entries ({} parsed, {} filtered, {} duplicate, {} invalid)",
             m_catalog->size(), parsed.totalParsed, parsed.rejected, parsed.duplicates, parsed.invalid);
    setStatusMessage("Loaded " + std::to_string(m_catalog->size()) + " assets");

    m_events.emit(events::SyncFinished, {
        {"ok", true},
        {"count", m_catalog->size()},
        {"total", parsed.totalParsed},
        {"rejected", parsed.rejected},
        {"duplicates", parsed.duplicates},
        {"invalid", parsed.invalid}
    });
}

void CatalogSyncEngine::failSync(const Error& error, const std::string& message) {
    LOG_ERROR("Catalog sync failed ({}): {}", errorKindName(error.kind), error.message);

    m_status.state = SyncState::Failed;
    m_status.error = error;
    setStatusMessage(message);

    m_events.emit(events::SyncFinished, {
        {"ok", false},
        {"count", m_catalog->size()},
        {"errorKind", errorKindName(error.kind)},
        {"error", error.message}
    });
}

// -- Per-entry operations --

SubmitStatus CatalogSyncEngine::startDownload(const std::string& name) {
    if (m_shutDown) {
        return SubmitStatus::Unavailable;
    }
    const CatalogEntry* entry = findEntry(name);
    if (!entry) {
        return SubmitStatus::Unavailable;
    }

    int64_t knownSize = m_prober.probedSize(entry->downloadUrl).value_or(0);
    return m_coordinator.startDownload(*entry, knownSize);
}

bool CatalogSyncEngine::cancelDownload(const std::string& name) {
    return m_coordinator.cancel(name);
}

bool CatalogSyncEngine::probeSize(const std::string& name) {
    if (m_shutDown) {
        return false;
    }
    const CatalogEntry* entry = findEntry(name);
    return entry && m_prober.probeSize(*entry);
}

bool CatalogSyncEngine::probeImage(const std::string& name) {
    if (m_shutDown) {
        return false;
    }
    const CatalogEntry* entry = findEntry(name);
    return entry && m_prober.probeImage(*entry);
}

void CatalogSyncEngine::update() {
    if (m_shutDown) {
        return;
    }
    pollSync();
    m_prober.update();
    m_coordinator.update();
}

void CatalogSyncEngine::onDownloadState(const json& payload) {
    std::string state = JsonUtils::getString(payload, "state");
    std::string name = JsonUtils::getString(payload, "name");
    std::string reason = JsonUtils::getString(payload, "error");

    if (state == downloadStateName(DownloadState::Succeeded)) {
        if (JsonUtils::getString(payload, "outcome") == downloadOutcomeName(DownloadOutcome::Completed)) {
            setStatusMessage("Successfully downloaded and imported " + name);
        } else {
            setStatusMessage("Downloaded " + name + " but import failed: " + reason);
        }
    } else if (state == downloadStateName(DownloadState::Failed) ||
               state == downloadStateName(DownloadState::TimedOut) ||
               state == downloadStateName(DownloadState::Cancelled)) {
        setStatusMessage("Failed to download " + name + ": " + reason);
    }
}

void CatalogSyncEngine::shutdown() noexcept {
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;

    try {
        if (m_syncRequest) {
            m_syncRequest->abort();
            m_syncRequest.reset();
        }
        m_prober.abandonAll();
        m_status.state = SyncState::ShutDown;
    } catch (const std::exception& e) {
        LOG_ERROR("Error during shutdown: {}", e.what());
    }

    m_coordinator.cancelAll();
    LOG_INFO("Catalog engine shut down");
}

// -- Reads --

const CatalogEntry* CatalogSyncEngine::findEntry(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end() || it->second >= m_catalog->size()) {
        return nullptr;
    }
    return &(*m_catalog)[it->second];
}

EntryView CatalogSyncEngine::makeView(const CatalogEntry& entry) const {
    EntryView view;
    view.entry = entry;
    view.effectiveSize = entry.fileSize > 0 ? entry.fileSize
                                            : m_prober.probedSize(entry.downloadUrl).value_or(0);
    view.preview = entry.imageUrl.empty() ? nullptr : m_prober.preview(entry.imageUrl);
    view.download = m_coordinator.record(entry.name);
    return view;
}

std::vector<EntryView> CatalogSyncEngine::entries() const {
    std::vector<EntryView> views;
    views.reserve(m_catalog->size());
    for (const auto& entry : *m_catalog) {
        views.push_back(makeView(entry));
    }
    return views;
}

std::optional<EntryView> CatalogSyncEngine::entry(const std::string& name) const {
    const CatalogEntry* found = findEntry(name);
    if (!found) {
        return std::nullopt;
    }
    return makeView(*found);
}

bool CatalogSyncEngine::hasActiveWork() const {
    return m_syncRequest.has_value() || m_coordinator.activeCount() > 0 || m_prober.inFlightCount() > 0;
}

void CatalogSyncEngine::setStatusMessage(const std::string& message) {
    if (message == m_statusMessage) {
        return;
    }
    m_statusMessage = message;
    m_events.emit(events::StatusChanged, {{"message", message}});
}

} // namespace assetdock::core::catalog
