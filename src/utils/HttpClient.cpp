/**
 * HttpClient.cpp
 *
 * HTTP transport implementation using cpr (which wraps libcurl).
 * Requests run on a worker pool; callers poll the returned futures.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"
#include "../core/ThreadPool.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

namespace assetdock::utils {

// -- CurlGlobalInit --

std::atomic<int> CurlGlobalInit::s_refs{0};

void CurlGlobalInit::init() {
    if (s_refs.fetch_add(1) == 0) {
        curl_global_init(CURL_GLOBAL_ALL);
    }
}

void CurlGlobalInit::cleanup() {
    if (s_refs.fetch_sub(1) == 1) {
        curl_global_cleanup();
    }
}

// -- HttpResponse --

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::toLower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

// -- HttpClient --

namespace {

HttpResponse toResponse(const cpr::Response& response, const TransferProgress& progress) {
    HttpResponse result;
    result.statusCode = static_cast<int>(response.status_code);
    result.body = response.text;
    result.elapsed = response.elapsed;

    for (const auto& [key, value] : response.header) {
        result.headers[StringUtils::toLower(key)] = value;
    }

    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        result.timedOut = true;
        result.error = "Request timed out";
    } else if (progress.limitExceeded) {
        result.error = "Transfer exceeded the size limit";
    } else if (progress.abortRequested) {
        result.error = "Transfer aborted";
    } else if (response.error) {
        result.error = response.error.message.empty() ? "Transfer failed" : response.error.message;
    }

    return result;
}

} // namespace

HttpClient::HttpClient(size_t transferWorkers, size_t metadataWorkers)
    : m_transferPool(std::make_unique<core::ThreadPool>(transferWorkers == 0 ? 1 : transferWorkers))
    , m_metadataPool(std::make_unique<core::ThreadPool>(metadataWorkers == 0 ? 1 : metadataWorkers)) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() {
    // Joins the workers; aborted transfers finish promptly via the progress callback
    m_transferPool.reset();
    m_metadataPool.reset();
    CurlGlobalInit::cleanup();
}

PendingRequest HttpClient::get(const std::string& url, const RequestOptions& options) {
    return submit("GET", url, options);
}

PendingRequest HttpClient::head(const std::string& url, const RequestOptions& options) {
    return submit("HEAD", url, options);
}

PendingRequest HttpClient::submit(const std::string& method, const std::string& url,
                                  const RequestOptions& options) {
    PendingRequest pending;
    pending.progress = std::make_shared<TransferProgress>();

    auto progress = pending.progress;
    auto& pool = options.lane == RequestLane::Metadata ? *m_metadataPool : *m_transferPool;
    pending.response = pool.submit([method, url, options, progress]() -> HttpResponse {
        progress->markStarted();
        if (progress->abortRequested) {
            HttpResponse aborted;
            aborted.error = "Transfer aborted";
            return aborted;
        }

        cpr::ProgressCallback onProgress(
            [progress, maxBytes = options.maxBytes](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                                    cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                                    intptr_t /*userdata*/) -> bool {
                progress->total = static_cast<int64_t>(downloadTotal);
                progress->received = static_cast<int64_t>(downloadNow);

                if (maxBytes > 0 && downloadNow > maxBytes) {
                    progress->limitExceeded = true;
                    return false;
                }
                return !progress->abortRequested;
            });

        cpr::Response response;
        if (method == "HEAD") {
            response = cpr::Head(cpr::Url{url},
                                 cpr::Timeout{options.timeout},
                                 cpr::ConnectTimeout{options.connectTimeout},
                                 cpr::UserAgent{options.userAgent},
                                 cpr::Redirect{false});
        } else {
            response = cpr::Get(cpr::Url{url},
                                cpr::Timeout{options.timeout},
                                cpr::ConnectTimeout{options.connectTimeout},
                                cpr::UserAgent{options.userAgent},
                                cpr::Redirect{false},
                                onProgress);
        }

        return toResponse(response, *progress);
    });

    return pending;
}

} // namespace assetdock::utils
