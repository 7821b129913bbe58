// AssetDock - HTTP Client
// Non-blocking HTTP transport using cpr (libcurl) on a worker pool

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace assetdock::core { class ThreadPool; }

namespace assetdock::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;     // keys lower-cased
    std::string error;                              // transport error, empty on success
    bool timedOut{false};
    double elapsed{0.0};

    bool isSuccess() const {
        return error.empty() && statusCode >= 200 && statusCode < 300;
    }

    /** 3xx with a target; transports never follow these themselves. */
    bool isRedirect() const {
        return error.empty() && (statusCode == 301 || statusCode == 302 || statusCode == 303 ||
                                 statusCode == 307 || statusCode == 308);
    }

    /**
     * Case-insensitive header lookup
     */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief Worker lane a request is queued on
 *
 * Catalog fetches and metadata lookups never wait behind package downloads.
 */
enum class RequestLane {
    Metadata,
    Transfer
};

/**
 * @brief HTTP request options
 */
struct RequestOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{10000};
    std::string userAgent{"AssetDock/1.0"};
    int64_t maxBytes{0};        // abort the transfer past this many bytes, 0 = unbounded
    RequestLane lane{RequestLane::Transfer};
};

/**
 * @brief Live transfer counters shared between a worker and the poller
 */
struct TransferProgress {
    using Clock = std::chrono::steady_clock;

    std::atomic<int64_t> received{0};
    std::atomic<int64_t> total{0};
    std::atomic<bool> abortRequested{false};
    std::atomic<bool> limitExceeded{false};
    std::atomic<Clock::rep> startedAt{0};       // steady_clock ticks, 0 while queued

    void abort() { abortRequested = true; }

    /** Called by the worker that picks the request up. */
    void markStarted() { startedAt = std::max<Clock::rep>(Clock::now().time_since_epoch().count(), 1); }

    std::optional<Clock::time_point> started() const {
        Clock::rep ticks = startedAt.load();
        if (ticks == 0) return std::nullopt;
        return Clock::time_point(Clock::duration(ticks));
    }

    /** Fraction in [0,1]; 0 while the total is unknown. */
    float fraction() const {
        int64_t t = total.load();
        int64_t r = received.load();
        if (t <= 0) return 0.0f;
        return std::clamp(static_cast<float>(r) / static_cast<float>(t), 0.0f, 1.0f);
    }
};

/**
 * @brief Handle to a request running on the transport
 */
struct PendingRequest {
    std::future<HttpResponse> response;
    std::shared_ptr<TransferProgress> progress;

    bool valid() const { return response.valid(); }

    bool ready() const {
        return response.valid() &&
               response.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void abort() {
        if (progress) progress->abort();
    }

    /**
     * True once @p budget has elapsed since a worker started the request.
     * Time spent queued does not count.
     */
    bool pastDeadline(std::chrono::milliseconds budget,
                      std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
        auto start = progress ? progress->started() : std::nullopt;
        return start && now >= *start + budget;
    }
};

/**
 * @brief Transport seam used by the engine
 *
 * Implementations must return immediately; the engine polls the returned
 * future and enforces its own deadlines. Redirects are returned to the
 * caller, not followed, and the progress is marked started when the
 * request leaves the queue.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual PendingRequest get(const std::string& url, const RequestOptions& options) = 0;

    /** Header-only request; the response body is empty. */
    virtual PendingRequest head(const std::string& url, const RequestOptions& options) = 0;
};

/**
 * @brief cpr-backed transport
 */
class HttpClient final : public HttpTransport {
public:
    /**
     * @param transferWorkers Number of concurrent package transfers
     * @param metadataWorkers Number of concurrent catalog and metadata requests
     */
    explicit HttpClient(size_t transferWorkers = 4, size_t metadataWorkers = 2);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    PendingRequest get(const std::string& url, const RequestOptions& options) override;
    PendingRequest head(const std::string& url, const RequestOptions& options) override;

private:
    PendingRequest submit(const std::string& method, const std::string& url,
                          const RequestOptions& options);

    std::unique_ptr<core::ThreadPool> m_transferPool;
    std::unique_ptr<core::ThreadPool> m_metadataPool;
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
    static void cleanup();

private:
    static std::atomic<int> s_refs;
};

} // namespace assetdock::utils
