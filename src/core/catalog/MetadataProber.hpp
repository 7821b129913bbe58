#pragma once

/**
 * MetadataProber.hpp
 *
 * Lazy, non-fatal metadata lookups for catalog entries: byte size through
 * a header-only request and preview image bytes through a full fetch.
 * Probes are deduplicated by resource URL, never by entry name.
 */

#include "../models/Models.hpp"
#include "../EngineSettings.hpp"
#include "../EventBus.hpp"
#include "../../utils/HttpClient.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace assetdock::core::catalog {

class MetadataProber {
public:
    MetadataProber(utils::HttpTransport& transport, const EngineSettings& settings, EventBus& events);
    ~MetadataProber();

    MetadataProber(const MetadataProber&) = delete;
    MetadataProber& operator=(const MetadataProber&) = delete;

    /**
     * Issue a size probe against the entry's download URL.
     * No-op when the catalog already knows the size, the URL was probed
     * before, or a probe for it is in flight.
     * @return true if a new request was issued
     */
    bool probeSize(const CatalogEntry& entry);

    /**
     * Issue a preview fetch against the entry's image URL.
     * No-op when the image is resolved, failed earlier or is in flight.
     * @return true if a new request was issued
     */
    bool probeImage(const CatalogEntry& entry);

    /**
     * Poll in-flight probes, publish finished results, expire late ones.
     */
    void update();

    /**
     * Stop tracking every in-flight probe. Results arriving later are
     * dropped with their futures.
     */
    void abandonAll();

    /**
     * Forget results and failure marks for URLs that are no longer
     * referenced by the catalog; failure marks are cleared for all URLs so
     * a refresh allows another attempt.
     */
    void retain(const std::unordered_set<std::string>& urls);

    std::optional<int64_t> probedSize(const std::string& url) const;
    PreviewHandle preview(const std::string& url) const;

    size_t inFlightCount() const { return m_sizeProbes.size() + m_imageProbes.size(); }
    bool isProbing(const std::string& url) const;

    /**
     * Identify an image by its leading signature bytes.
     */
    static std::optional<ImageFormat> sniffImageFormat(const std::string& bytes);

private:
    struct Probe {
        utils::PendingRequest request;
        std::string url;            // current hop
        int redirects{0};
    };

    using ProbeMap = std::unordered_map<std::string, Probe>;
    using Finished = std::vector<std::pair<std::string, utils::HttpResponse>>;

    utils::RequestOptions requestOptions() const;
    void poll(ProbeMap& probes, std::unordered_set<std::string>& failed, Finished& finished, bool headOnly);
    bool followRedirect(Probe& probe, const utils::HttpResponse& response, bool headOnly);
    void finishSizeProbe(const std::string& url, utils::HttpResponse response);
    void finishImageProbe(const std::string& url, utils::HttpResponse response);

    utils::HttpTransport& m_transport;
    EngineSettings m_settings;
    EventBus& m_events;
    bool m_allowPrivateHosts;

    ProbeMap m_sizeProbes;
    ProbeMap m_imageProbes;

    std::unordered_map<std::string, int64_t> m_sizes;
    std::unordered_map<std::string, PreviewHandle> m_previews;
    std::unordered_set<std::string> m_failedSizes;
    std::unordered_set<std::string> m_failedImages;
};

} // namespace assetdock::core::catalog
