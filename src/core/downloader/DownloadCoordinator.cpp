/**
 * DownloadCoordinator.cpp
 */

#include "DownloadCoordinator.hpp"
#include "../Logger.hpp"
#include "../security/UrlValidator.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <vector>

namespace assetdock::core::downloader {

using utils::FileUtils;
using utils::HttpResponse;
using utils::StringUtils;

namespace {

using Clock = std::chrono::steady_clock;

/**
 * Leaves the record retryable if finalize exits through an exception.
 */
class FinalizeGuard {
public:
    explicit FinalizeGuard(DownloadRecord& record) : m_record(record) {}

    ~FinalizeGuard() {
        if (m_armed) {
            m_record.state = DownloadState::Idle;
            m_record.lastOutcome = DownloadOutcome::Failed;
            m_record.lastError.reset();
        }
    }

    FinalizeGuard(const FinalizeGuard&) = delete;
    FinalizeGuard& operator=(const FinalizeGuard&) = delete;

    void dismiss() { m_armed = false; }

private:
    DownloadRecord& m_record;
    bool m_armed{true};
};

DownloadOutcome outcomeFor(DownloadState state) {
    switch (state) {
        case DownloadState::Succeeded: return DownloadOutcome::Completed;
        case DownloadState::TimedOut:  return DownloadOutcome::TimedOut;
        case DownloadState::Cancelled: return DownloadOutcome::Cancelled;
        default:                       return DownloadOutcome::Failed;
    }
}

} // namespace

DownloadCoordinator::DownloadCoordinator(utils::HttpTransport& transport,
                                         const EngineSettings& settings,
                                         importer::PackageImporter& importer,
                                         EventBus& events)
    : m_transport(transport)
    , m_settings(settings)
    , m_importer(importer)
    , m_events(events)
    , m_allowPrivateHosts(settings.effectiveAllowPrivateHosts()) {
}

DownloadCoordinator::~DownloadCoordinator() {
    cancelAll();
}

SubmitStatus DownloadCoordinator::startDownload(const CatalogEntry& entry, int64_t knownSize) {
    const std::string& name = entry.name;
    if (name.empty()) {
        return SubmitStatus::Unavailable;
    }
    if (isRequesting(name)) {
        LOG_DEBUG("Download of {} already in progress", name);
        return SubmitStatus::AlreadyInFlight;
    }
    if (entry.downloadUrl.empty()) {
        return SubmitStatus::MissingUrl;
    }

    int64_t expectedSize = std::max(entry.fileSize, knownSize);
    if (m_settings.maxDownloadBytes > 0 && expectedSize > m_settings.maxDownloadBytes) {
        LOG_WARN("Refusing {}: {} exceeds the {} limit", name,
                 StringUtils::formatBytes(expectedSize),
                 StringUtils::formatBytes(m_settings.maxDownloadBytes));
        settle(name, {DownloadState::Failed, DownloadOutcome::Failed,
                      Error(ErrorKind::SizeLimitExceeded,
                            "File is too large (" + StringUtils::formatBytes(expectedSize) + ")"),
                      ""});
        return SubmitStatus::SizeLimitExceeded;
    }

    if (!security::isPermitted(entry.downloadUrl, m_allowPrivateHosts)) {
        LOG_WARN("Refusing {}: download URL not permitted ({})", name, entry.downloadUrl);
        settle(name, {DownloadState::Failed, DownloadOutcome::Failed,
                      Error(ErrorKind::ValidationRejected, "Download URL is not permitted"), ""});
        return SubmitStatus::Unavailable;
    }

    ActiveDownload active;
    active.entry = entry;
    active.url = entry.downloadUrl;
    try {
        active.request = m_transport.get(entry.downloadUrl, requestOptions());
    } catch (const std::exception& e) {
        LOG_ERROR("Could not start download of {}: {}", name, e.what());
        settle(name, {DownloadState::Failed, DownloadOutcome::Failed,
                      Error(ErrorKind::Network, e.what()), ""});
        return SubmitStatus::Unavailable;
    }
    m_active.emplace(name, std::move(active));

    auto& record = m_records[name];
    record.state = DownloadState::Requesting;
    record.progress = 0.0f;
    record.lastError.reset();
    record.localPath.clear();

    LOG_INFO("Downloading {} from {}", name, entry.downloadUrl);
    publishState(name, record);
    return SubmitStatus::Started;
}

utils::RequestOptions DownloadCoordinator::requestOptions() const {
    utils::RequestOptions options;
    options.timeout = m_settings.downloadTimeout();
    options.userAgent = m_settings.userAgent;
    options.maxBytes = m_settings.maxDownloadBytes;
    options.lane = utils::RequestLane::Transfer;
    return options;
}

void DownloadCoordinator::update() {
    const auto now = Clock::now();
    const auto timeout = m_settings.downloadTimeout();

    std::vector<std::string> finished;
    std::vector<std::string> expired;
    std::vector<std::string> progressed;

    for (auto& [name, active] : m_active) {
        if (active.request.ready()) {
            finished.push_back(name);
        } else if (active.request.pastDeadline(timeout, now)) {
            expired.push_back(name);
        } else if (active.request.progress) {
            auto& record = m_records[name];
            float fraction = active.request.progress->fraction();
            if (fraction > record.progress) {
                record.progress = fraction;
                progressed.push_back(name);
            }
        }
    }

    // Event subscribers may start or cancel downloads, so every name is
    // looked up again before acting on it.
    for (const auto& name : progressed) {
        auto it = m_records.find(name);
        if (it == m_records.end() || !isRequesting(name)) continue;
        m_events.emit(events::DownloadProgress, {{"name", name}, {"progress", it->second.progress}});
    }

    for (const auto& name : expired) {
        auto it = m_active.find(name);
        if (it == m_active.end()) continue;
        it->second.request.abort();
        m_active.erase(it);

        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(m_settings.downloadTimeout()).count();
        LOG_WARN("Download of {} timed out after {}s", name, seconds);
        settle(name, {DownloadState::TimedOut, DownloadOutcome::TimedOut,
                      Error(ErrorKind::Timeout, "Timed out after " + std::to_string(seconds) + "s"), ""});
    }

    for (const auto& name : finished) {
        auto node = m_active.extract(name);
        if (node.empty()) continue;
        ActiveDownload active = std::move(node.mapped());

        FinalizeGuard guard(m_records[name]);

        HttpResponse response;
        try {
            response = active.request.response.get();
        } catch (const std::exception& e) {
            response.error = e.what();
        }

        if (response.isRedirect()) {
            auto refused = followRedirect(active, response);
            guard.dismiss();
            if (!refused) {
                m_active.emplace(name, std::move(active));
            } else {
                settle(name, {DownloadState::Failed, DownloadOutcome::Failed, refused, ""});
            }
            continue;
        }

        Completion completion = finalize(active, std::move(response));
        guard.dismiss();
        settle(name, completion);
    }
}

std::optional<Error> DownloadCoordinator::followRedirect(ActiveDownload& active, const HttpResponse& response) {
    const std::string& name = active.entry.name;
    if (active.redirects >= security::kMaxRedirects) {
        LOG_WARN("Download of {} stopped after {} redirects", name, active.redirects);
        return Error(ErrorKind::Network, "Too many redirects");
    }

    // The package rule covers the entry's own URL; later hops must be fetchable
    auto target = security::redirectTarget(active.url, response.header("Location").value_or(""),
                                           m_allowPrivateHosts);
    if (!target) {
        LOG_WARN("Refusing redirect of {} from {} to '{}'", name, active.url,
                 response.header("Location").value_or(""));
        return Error(ErrorKind::ValidationRejected, "Redirect to a disallowed location");
    }

    try {
        active.request = m_transport.get(*target, requestOptions());
    } catch (const std::exception& e) {
        LOG_ERROR("Could not follow redirect of {}: {}", name, e.what());
        return Error(ErrorKind::Network, e.what());
    }

    LOG_DEBUG("Download of {} redirected to {}", name, *target);
    active.url = *target;
    ++active.redirects;
    return std::nullopt;
}

DownloadCoordinator::Completion DownloadCoordinator::finalize(const ActiveDownload& active,
                                                              HttpResponse response) {
    const CatalogEntry& entry = active.entry;
    auto fail = [](DownloadState state, ErrorKind kind, std::string message) {
        return Completion{state, outcomeFor(state), Error(kind, std::move(message)), ""};
    };

    bool limitHit = active.request.progress && active.request.progress->limitExceeded;
    if (limitHit) {
        return fail(DownloadState::Failed, ErrorKind::SizeLimitExceeded,
                    "Download exceeded " + StringUtils::formatBytes(m_settings.maxDownloadBytes));
    }
    if (response.timedOut) {
        return fail(DownloadState::TimedOut, ErrorKind::Timeout, "Request timed out");
    }
    if (!response.error.empty()) {
        return fail(DownloadState::Failed, ErrorKind::Network, response.error);
    }
    if (!response.isSuccess()) {
        return fail(DownloadState::Failed, ErrorKind::Network, "HTTP " + std::to_string(response.statusCode));
    }
    if (response.body.empty()) {
        return fail(DownloadState::Failed, ErrorKind::Integrity, "Downloaded file is empty");
    }

    int64_t received = static_cast<int64_t>(response.body.size());
    if (m_settings.maxDownloadBytes > 0 && received > m_settings.maxDownloadBytes) {
        return fail(DownloadState::Failed, ErrorKind::SizeLimitExceeded,
                    "Downloaded file is too large (" + StringUtils::formatBytes(received) + ")");
    }

    auto path = destinationPath(m_settings.scratchDirectory, entry, m_settings.packageExtension);
    if (!FileUtils::createDirectories(m_settings.scratchDirectory)) {
        return fail(DownloadState::Failed, ErrorKind::Filesystem,
                    "Cannot create " + m_settings.scratchDirectory.string());
    }
    if (!FileUtils::isStrictlyInside(m_settings.scratchDirectory, path)) {
        return fail(DownloadState::Failed, ErrorKind::ValidationRejected, "Unsafe destination path");
    }

    utils::ScopedFileRemoval cleanup(path);

    if (!FileUtils::writeBinaryFile(path, response.body)) {
        return fail(DownloadState::Failed, ErrorKind::Filesystem, "Cannot write " + path.string());
    }
    response.body.clear();

    if (!FileUtils::fileExists(path) || FileUtils::getFileSize(path) != received) {
        return fail(DownloadState::Failed, ErrorKind::Integrity, "Downloaded file is missing or truncated");
    }

    importer::ImportResult imported;
    try {
        imported = m_importer.importPackage(path, entry.name);
    } catch (const std::exception& e) {
        imported.success = false;
        imported.message = e.what();
    }

    if (!imported.success) {
        LOG_ERROR("Import of {} failed: {}", entry.name, imported.message);
        return Completion{DownloadState::Succeeded, DownloadOutcome::ImportFailed,
                          Error(ErrorKind::Import, imported.message), path.string()};
    }

    LOG_INFO("Downloaded and imported {} ({})", entry.name, StringUtils::formatBytes(received));
    return Completion{DownloadState::Succeeded, DownloadOutcome::Completed, std::nullopt, path.string()};
}

void DownloadCoordinator::settle(const std::string& name, const Completion& completion) {
    auto& record = m_records[name];
    record.lastOutcome = completion.outcome;
    record.lastError = completion.error;
    record.localPath = completion.localPath;
    if (completion.state == DownloadState::Succeeded) {
        record.progress = 1.0f;
    }

    // The terminal state is reported once; the record is already Idle so
    // observers may retry from inside the callback.
    DownloadRecord reported = record;
    reported.state = completion.state;
    record.state = DownloadState::Idle;

    if (completion.error) {
        LOG_DEBUG("{} -> {} ({}: {})", name, downloadStateName(completion.state),
                  errorKindName(completion.error->kind), completion.error->message);
    }
    publishState(name, reported);
}

void DownloadCoordinator::publishState(const std::string& name, const DownloadRecord& record) {
    json payload = {
        {"name", name},
        {"state", downloadStateName(record.state)},
        {"outcome", downloadOutcomeName(record.lastOutcome)},
        {"progress", record.progress}
    };
    if (record.lastError) {
        payload["errorKind"] = errorKindName(record.lastError->kind);
        payload["error"] = record.lastError->message;
    }
    m_events.emit(events::DownloadState, payload);
}

bool DownloadCoordinator::cancel(const std::string& name) {
    auto it = m_active.find(name);
    if (it == m_active.end()) {
        return false;
    }

    it->second.request.abort();
    m_active.erase(it);

    LOG_INFO("Cancelled download of {}", name);
    settle(name, {DownloadState::Cancelled, DownloadOutcome::Cancelled,
                  Error(ErrorKind::Cancelled, "Download cancelled"), ""});
    return true;
}

void DownloadCoordinator::cancelAll() noexcept {
    try {
        std::vector<std::string> names;
        names.reserve(m_active.size());
        for (const auto& [name, active] : m_active) {
            names.push_back(name);
        }
        for (const auto& name : names) {
            cancel(name);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error while cancelling downloads: {}", e.what());
    }

    for (auto& [name, active] : m_active) {
        active.request.abort();
        auto it = m_records.find(name);
        if (it != m_records.end()) {
            it->second.state = DownloadState::Idle;
            it->second.lastOutcome = DownloadOutcome::Cancelled;
        }
    }
    m_active.clear();
}

void DownloadCoordinator::reconcile(const std::unordered_set<std::string>& survivingNames) {
    std::vector<std::string> removed;
    for (const auto& [name, record] : m_records) {
        if (!survivingNames.count(name)) {
            removed.push_back(name);
        }
    }

    for (const auto& name : removed) {
        auto it = m_active.find(name);
        if (it != m_active.end()) {
            it->second.request.abort();
            m_active.erase(it);
            LOG_INFO("Cancelled download of {}: entry no longer in the catalog", name);
        }
        m_records.erase(name);
    }

    for (auto& [name, record] : m_records) {
        if (record.state != DownloadState::Requesting) {
            record = DownloadRecord{};
        }
    }
}

DownloadRecord DownloadCoordinator::record(const std::string& name) const {
    auto it = m_records.find(name);
    return it != m_records.end() ? it->second : DownloadRecord{};
}

bool DownloadCoordinator::isRequesting(const std::string& name) const {
    return m_active.count(name) > 0;
}

std::filesystem::path DownloadCoordinator::destinationPath(const std::filesystem::path& scratchDirectory,
                                                           const CatalogEntry& entry,
                                                           const std::string& extension) {
    std::string ext = extension;
    ext.erase(0, ext.find_first_not_of('.'));

    std::string fileName = StringUtils::sanitizeFileName(entry.name) + "_" +
                           StringUtils::sanitizeFileName(entry.version, "unversioned") + "." +
                           StringUtils::sanitizeFileName(ext, "pkg");
    return scratchDirectory / fileName;
}

} // namespace assetdock::core::downloader
