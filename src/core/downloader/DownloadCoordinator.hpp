#pragma once

/**
 * DownloadCoordinator.hpp
 *
 * Per-entry download lifecycle: request, progress polling, deadline and
 * size enforcement, write-verify-import, and cleanup.
 */

#include "../models/Models.hpp"
#include "../EngineSettings.hpp"
#include "../EventBus.hpp"
#include "../importer/PackageImporter.hpp"
#include "../../utils/HttpClient.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace assetdock::core::downloader {

/**
 * DownloadCoordinator - keyed download state machine
 *
 * Idle -> Requesting -> (Succeeded | Failed | TimedOut | Cancelled) -> Idle
 *
 * The entry name is the coordination key; at most one transfer per name is
 * active. All methods are called from the host thread; transfers run on the
 * transport's workers and are observed by update().
 */
class DownloadCoordinator {
public:
    DownloadCoordinator(utils::HttpTransport& transport,
                        const EngineSettings& settings,
                        importer::PackageImporter& importer,
                        EventBus& events);
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    /**
     * Start downloading an entry
     * @param entry Catalog entry
     * @param knownSize Size learned by a probe, 0 if unknown
     * @return Started, or why nothing was issued
     */
    SubmitStatus startDownload(const CatalogEntry& entry, int64_t knownSize = 0);

    /**
     * Poll active transfers: publish progress, enforce deadlines, finalize
     * finished ones.
     */
    void update();

    /**
     * Abort one active transfer
     * @return true if the entry was requesting
     */
    bool cancel(const std::string& name);

    /**
     * Abort every active transfer. Safe to call at any time.
     */
    void cancelAll() noexcept;

    /**
     * Align records with a refreshed catalog: records of removed entries are
     * dropped (their transfers cancelled), idle survivors are reset.
     */
    void reconcile(const std::unordered_set<std::string>& survivingNames);

    DownloadRecord record(const std::string& name) const;
    bool isRequesting(const std::string& name) const;
    size_t activeCount() const { return m_active.size(); }

    /**
     * Scratch file for an entry: <dir>/<name>_<version><ext>, every
     * component sanitized so the result stays inside @p scratchDirectory.
     */
    static std::filesystem::path destinationPath(const std::filesystem::path& scratchDirectory,
                                                 const CatalogEntry& entry,
                                                 const std::string& extension);

private:
    struct ActiveDownload {
        CatalogEntry entry;
        utils::PendingRequest request;
        std::string url;            // current hop
        int redirects{0};
    };

    struct Completion {
        DownloadState state;
        DownloadOutcome outcome;
        std::optional<Error> error;
        std::string localPath;
    };

    utils::RequestOptions requestOptions() const;
    std::optional<Error> followRedirect(ActiveDownload& active, const utils::HttpResponse& response);
    Completion finalize(const ActiveDownload& active, utils::HttpResponse response);
    void settle(const std::string& name, const Completion& completion);
    void publishState(const std::string& name, const DownloadRecord& record);

    utils::HttpTransport& m_transport;
    EngineSettings m_settings;
    importer::PackageImporter& m_importer;
    EventBus& m_events;
    bool m_allowPrivateHosts;

    std::unordered_map<std::string, ActiveDownload> m_active;
    std::unordered_map<std::string, DownloadRecord> m_records;
};

} // namespace assetdock::core::downloader
