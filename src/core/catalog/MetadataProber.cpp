/**
 * MetadataProber.cpp
 */

#include "MetadataProber.hpp"
#include "../Logger.hpp"
#include "../security/UrlValidator.hpp"
#include "../../utils/StringUtils.hpp"

#include <vector>

namespace assetdock::core::catalog {

using utils::HttpResponse;
using utils::StringUtils;

namespace {

using Clock = std::chrono::steady_clock;

const char* imageFormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:  return "png";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Gif:  return "gif";
        case ImageFormat::Bmp:  return "bmp";
        case ImageFormat::WebP: return "webp";
    }
    return "unknown";
}

std::string describeFailure(const HttpResponse& response) {
    if (response.timedOut) return "timed out";
    if (!response.error.empty()) return response.error;
    return "HTTP " + std::to_string(response.statusCode);
}

} // namespace

MetadataProber::MetadataProber(utils::HttpTransport& transport, const EngineSettings& settings,
                               EventBus& events)
    : m_transport(transport)
    , m_settings(settings)
    , m_events(events)
    , m_allowPrivateHosts(settings.effectiveAllowPrivateHosts()) {
}

MetadataProber::~MetadataProber() {
    abandonAll();
}

utils::RequestOptions MetadataProber::requestOptions() const {
    utils::RequestOptions options;
    options.timeout = m_settings.requestTimeout;
    options.userAgent = m_settings.userAgent;
    options.lane = utils::RequestLane::Metadata;
    return options;
}

bool MetadataProber::probeSize(const CatalogEntry& entry) {
    const std::string& url = entry.downloadUrl;
    if (entry.fileSize > 0 || url.empty()) return false;
    if (m_sizeProbes.count(url) || m_sizes.count(url) || m_failedSizes.count(url)) return false;

    if (!security::isFetchable(url, m_allowPrivateHosts)) {
        LOG_DEBUG("Size probe for '{}' skipped: URL not fetchable", entry.name);
        m_failedSizes.insert(url);
        return false;
    }

    try {
        Probe probe;
        probe.request = m_transport.head(url, requestOptions());
        probe.url = url;
        m_sizeProbes.emplace(url, std::move(probe));
    } catch (const std::exception& e) {
        LOG_DEBUG("Size probe for '{}' could not start: {}", entry.name, e.what());
        return false;
    }

    LOG_TRACE("Probing size of {}", url);
    return true;
}

bool MetadataProber::probeImage(const CatalogEntry& entry) {
    const std::string& url = entry.imageUrl;
    if (url.empty()) return false;
    if (m_imageProbes.count(url) || m_previews.count(url) || m_failedImages.count(url)) return false;

    if (!security::isFetchable(url, m_allowPrivateHosts)) {
        LOG_DEBUG("Preview for '{}' skipped: URL not fetchable", entry.name);
        m_failedImages.insert(url);
        return false;
    }

    try {
        Probe probe;
        probe.request = m_transport.get(url, requestOptions());
        probe.url = url;
        m_imageProbes.emplace(url, std::move(probe));
    } catch (const std::exception& e) {
        LOG_DEBUG("Preview for '{}' could not start: {}", entry.name, e.what());
        return false;
    }

    LOG_TRACE("Fetching preview {}", url);
    return true;
}

void MetadataProber::update() {
    // Subscribers may issue new probes while results are published, so the
    // maps are never iterated across a finish call.
    Finished sizes;
    Finished images;
    poll(m_sizeProbes, m_failedSizes, sizes, true);
    poll(m_imageProbes, m_failedImages, images, false);

    for (auto& [url, response] : sizes) {
        finishSizeProbe(url, std::move(response));
    }
    for (auto& [url, response] : images) {
        finishImageProbe(url, std::move(response));
    }
}

void MetadataProber::poll(ProbeMap& probes, std::unordered_set<std::string>& failed,
                          Finished& finished, bool headOnly) {
    const auto now = Clock::now();

    std::vector<std::string> done;
    for (auto& [url, probe] : probes) {
        if (probe.request.ready()) {
            done.push_back(url);
        } else if (probe.request.pastDeadline(m_settings.requestTimeout, now)) {
            probe.request.abort();
            LOG_DEBUG("Probe of {} timed out", url);
            failed.insert(url);
            done.push_back(url);
        }
    }

    for (const auto& url : done) {
        auto it = probes.find(url);
        if (failed.count(url)) {
            probes.erase(it);
            continue;
        }

        HttpResponse response;
        try {
            response = it->second.request.response.get();
        } catch (const std::exception& e) {
            LOG_DEBUG("Probe of {} failed: {}", url, e.what());
            failed.insert(url);
            probes.erase(it);
            continue;
        }

        if (response.isRedirect()) {
            if (!followRedirect(it->second, response, headOnly)) {
                failed.insert(url);
                probes.erase(it);
            }
            continue;
        }

        finished.emplace_back(url, std::move(response));
        probes.erase(it);
    }
}

bool MetadataProber::followRedirect(Probe& probe, const HttpResponse& response, bool headOnly) {
    std::string location = response.header("Location").value_or("");
    if (probe.redirects >= security::kMaxRedirects) {
        LOG_DEBUG("Probe of {} stopped after {} redirects", probe.url, probe.redirects);
        return false;
    }

    auto target = security::redirectTarget(probe.url, location, m_allowPrivateHosts);
    if (!target) {
        LOG_WARN("Refusing redirect from {} to '{}'", probe.url, location);
        return false;
    }

    try {
        probe.request = headOnly ? m_transport.head(*target, requestOptions())
                                 : m_transport.get(*target, requestOptions());
    } catch (const std::exception& e) {
        LOG_DEBUG("Probe redirect to {} could not start: {}", *target, e.what());
        return false;
    }

    probe.url = *target;
    ++probe.redirects;
    return true;
}

void MetadataProber::finishSizeProbe(const std::string& url, HttpResponse response) {
    if (!response.isSuccess()) {
        LOG_DEBUG("Size probe of {} failed: {}", url, describeFailure(response));
        m_failedSizes.insert(url);
        return;
    }

    auto header = response.header("Content-Length");
    auto length = header ? StringUtils::parseLong(StringUtils::trim(*header)) : std::nullopt;
    if (!length || *length <= 0) {
        LOG_DEBUG("Size probe of {} returned no usable Content-Length", url);
        m_failedSizes.insert(url);
        return;
    }

    m_sizes[url] = *length;
    m_events.emit(events::ProbeSize, {{"url", url}, {"size", *length}});
}

void MetadataProber::finishImageProbe(const std::string& url, HttpResponse response) {
    if (!response.isSuccess()) {
        LOG_DEBUG("Preview fetch of {} failed: {}", url, describeFailure(response));
        m_failedImages.insert(url);
        return;
    }

    auto format = sniffImageFormat(response.body);
    if (!format) {
        LOG_DEBUG("Preview fetch of {} did not return an image", url);
        m_failedImages.insert(url);
        return;
    }

    auto image = std::make_shared<PreviewImage>();
    image->format = *format;
    image->bytes = std::move(response.body);
    size_t byteCount = image->bytes.size();
    m_previews[url] = std::move(image);

    m_events.emit(events::ProbeImage, {
        {"url", url},
        {"format", imageFormatName(*format)},
        {"bytes", byteCount}
    });
}

void MetadataProber::abandonAll() {
    for (auto& [url, probe] : m_sizeProbes) {
        probe.request.abort();
    }
    for (auto& [url, probe] : m_imageProbes) {
        probe.request.abort();
    }
    m_sizeProbes.clear();
    m_imageProbes.clear();
}

void MetadataProber::retain(const std::unordered_set<std::string>& urls) {
    auto prune = [&urls](auto& results) {
        for (auto it = results.begin(); it != results.end();) {
            if (urls.count(it->first)) {
                ++it;
            } else {
                it = results.erase(it);
            }
        }
    };
    auto pruneProbes = [&urls](ProbeMap& probes) {
        for (auto it = probes.begin(); it != probes.end();) {
            if (urls.count(it->first)) {
                ++it;
            } else {
                it->second.request.abort();
                it = probes.erase(it);
            }
        }
    };
    prune(m_sizes);
    prune(m_previews);
    pruneProbes(m_sizeProbes);
    pruneProbes(m_imageProbes);

    m_failedSizes.clear();
    m_failedImages.clear();
}

std::optional<int64_t> MetadataProber::probedSize(const std::string& url) const {
    auto it = m_sizes.find(url);
    if (it == m_sizes.end()) return std::nullopt;
    return it->second;
}

PreviewHandle MetadataProber::preview(const std::string& url) const {
    auto it = m_previews.find(url);
    return it != m_previews.end() ? it->second : nullptr;
}

bool MetadataProber::isProbing(const std::string& url) const {
    return m_sizeProbes.count(url) > 0 || m_imageProbes.count(url) > 0;
}

std::optional<ImageFormat> MetadataProber::sniffImageFormat(const std::string& bytes) {
    auto startsWith = [&bytes](const char* magic, size_t length, size_t offset = 0) {
        return bytes.size() >= offset + length && bytes.compare(offset, length, magic, length) == 0;
    };

    if (startsWith("\x89PNG\r\n\x1a\n", 8)) return ImageFormat::Png;
    if (startsWith("\xFF\xD8\xFF", 3)) return ImageFormat::Jpeg;
    if (startsWith("GIF87a", 6) || startsWith("GIF89a", 6)) return ImageFormat::Gif;
    if (startsWith("BM", 2) && bytes.size() > 14) return ImageFormat::Bmp;
    if (startsWith("RIFF", 4) && startsWith("WEBP", 4, 8)) return ImageFormat::WebP;
    return std::nullopt;
}

} // namespace assetdock::core::catalog
