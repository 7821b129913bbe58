#include <catch2/catch.hpp>

#include "TestSupport.hpp"
#include "core/downloader/DownloadCoordinator.hpp"
#include "core/security/UrlValidator.hpp"
#include "utils/FileUtils.hpp"

#include <string>
#include <vector>

using namespace assetdock;
using namespace assetdock::core;
using namespace assetdock::test;
using assetdock::core::downloader::DownloadCoordinator;

namespace {

constexpr int64_t MB = 1024 * 1024;

CatalogEntry makeEntry(const std::string& name, const std::string& url, int64_t size = 0) {
    CatalogEntry entry;
    entry.name = name;
    entry.version = "1.0";
    entry.downloadUrl = url;
    entry.fileSize = size;
    return entry;
}

struct Harness {
    TempDir dir;
    FakeTransport transport;
    RecordingImporter importer;
    EventBus bus;
    EngineSettings settings;
    std::vector<json> states;
    SubscriptionPtr subscription;
    std::unique_ptr<DownloadCoordinator> coordinator;

    explicit Harness(std::function<void(EngineSettings&)> tweak = nullptr) {
        settings = testSettings(dir.path() / "scratch");
        if (tweak) tweak(settings);
        subscription = bus.subscribe(events::DownloadState,
                                        [this](const json& payload) { states.push_back(payload); });
        coordinator = std::make_unique<DownloadCoordinator>(transport, settings, importer, bus);
    }

    ~Harness() {
        coordinator.reset();
    }

    std::vector<std::string> stateNames() const {
        std::vector<std::string> names;
        for (const auto& payload : states) {
            names.push_back(payload.value("state", ""));
        }
        return names;
    }
};

const std::string kUrl = "https://example.com/files/shaders.unitypackage";

} // namespace

TEST_CASE("DownloadCoordinator: pre-flight size limit", "[downloader]") {
    Harness h;

    SECTION("Catalog size above the limit fails without a request") {
        auto status = h.coordinator->startDownload(makeEntry("Huge", kUrl, 600 * MB));

        CHECK(status == SubmitStatus::SizeLimitExceeded);
        CHECK(h.transport.calls().empty());

        auto record = h.coordinator->record("Huge");
        CHECK(record.state == DownloadState::Idle);
        CHECK(record.lastOutcome == DownloadOutcome::Failed);
        REQUIRE(record.lastError.has_value());
        CHECK(record.lastError->kind == ErrorKind::SizeLimitExceeded);

        CHECK(h.stateNames() == std::vector<std::string>{"failed"});
    }

    SECTION("Probed size above the limit fails the same way") {
        auto status = h.coordinator->startDownload(makeEntry("Huge", kUrl), 600 * MB);
        CHECK(status == SubmitStatus::SizeLimitExceeded);
        CHECK(h.transport.calls().empty());
    }

    SECTION("Size at the limit is allowed") {
        auto status = h.coordinator->startDownload(makeEntry("Big", kUrl, 500 * MB));
        CHECK(status == SubmitStatus::Started);
    }
}

TEST_CASE("DownloadCoordinator: submission guards", "[downloader]") {
    Harness h;

    SECTION("Second start for the same entry is a no-op while requesting") {
        auto entry = makeEntry("Shaders", kUrl);
        CHECK(h.coordinator->startDownload(entry) == SubmitStatus::Started);
        CHECK(h.coordinator->startDownload(entry) == SubmitStatus::AlreadyInFlight);

        CHECK(h.transport.callCount(kUrl) == 1);
        CHECK(h.coordinator->isRequesting("Shaders"));
        CHECK(h.coordinator->activeCount() == 1);
        CHECK(h.coordinator->record("Shaders").state == DownloadState::Requesting);
    }

    SECTION("Different entries run side by side") {
        CHECK(h.coordinator->startDownload(makeEntry("A", kUrl)) == SubmitStatus::Started);
        CHECK(h.coordinator->startDownload(makeEntry("B", "https://example.com/files/b.zip")) ==
              SubmitStatus::Started);
        CHECK(h.coordinator->activeCount() == 2);
    }

    SECTION("Missing URL issues nothing") {
        CHECK(h.coordinator->startDownload(makeEntry("Empty", "")) == SubmitStatus::MissingUrl);
        CHECK(h.transport.calls().empty());
        CHECK(h.coordinator->record("Empty").lastOutcome == DownloadOutcome::None);
    }

    SECTION("URL outside the policy is refused") {
        CHECK(h.coordinator->startDownload(makeEntry("Local", "http://127.0.0.1/pkg.zip")) ==
              SubmitStatus::Unavailable);
        CHECK(h.transport.calls().empty());
        auto record = h.coordinator->record("Local");
        REQUIRE(record.lastError.has_value());
        CHECK(record.lastError->kind == ErrorKind::ValidationRejected);
    }

    SECTION("Transport failure to start leaves the entry retryable") {
        h.transport.failNextRequest();
        CHECK(h.coordinator->startDownload(makeEntry("A", kUrl)) == SubmitStatus::Unavailable);
        CHECK_FALSE(h.coordinator->isRequesting("A"));
        CHECK(h.coordinator->record("A").lastError->kind == ErrorKind::Network);

        CHECK(h.coordinator->startDownload(makeEntry("A", kUrl)) == SubmitStatus::Started);
    }

    SECTION("Request carries the download bounds") {
        h.coordinator->startDownload(makeEntry("A", kUrl));
        const auto* call = h.transport.lastCall(kUrl);
        REQUIRE(call != nullptr);
        CHECK(call->method == "GET");
        CHECK(call->options.maxBytes == h.settings.maxDownloadBytes);
        CHECK(call->options.timeout == h.settings.downloadTimeout());
        CHECK(call->options.lane == utils::RequestLane::Transfer);
    }
}

TEST_CASE("DownloadCoordinator: successful download", "[downloader]") {
    Harness h;
    auto entry = makeEntry("Shaders", kUrl);

    REQUIRE(h.coordinator->startDownload(entry) == SubmitStatus::Started);

    SECTION("Progress is published and never goes backwards") {
        h.transport.setProgress(kUrl, 50, 100);
        h.coordinator->update();
        CHECK(h.coordinator->record("Shaders").progress == Approx(0.5f));

        h.transport.setProgress(kUrl, 25, 100);
        h.coordinator->update();
        CHECK(h.coordinator->record("Shaders").progress == Approx(0.5f));

        h.transport.setProgress(kUrl, 90, 100);
        h.coordinator->update();
        CHECK(h.coordinator->record("Shaders").progress == Approx(0.9f));
    }

    SECTION("File is written, verified, imported and removed") {
        h.transport.complete(kUrl, okResponse("PACKAGE-BYTES"));
        h.coordinator->update();

        REQUIRE(h.importer.imports.size() == 1);
        const auto& imported = h.importer.imports[0];
        CHECK(imported.name == "Shaders");
        CHECK(imported.existed);
        CHECK(imported.contents == "PACKAGE-BYTES");
        CHECK(imported.path.filename() == "Shaders_1.0.unitypackage");
        CHECK(utils::FileUtils::isStrictlyInside(h.settings.scratchDirectory, imported.path));
        CHECK_FALSE(fs::exists(imported.path));

        auto record = h.coordinator->record("Shaders");
        CHECK(record.state == DownloadState::Idle);
        CHECK(record.lastOutcome == DownloadOutcome::Completed);
        CHECK_FALSE(record.lastError.has_value());
        CHECK(record.progress == Approx(1.0f));
        CHECK(record.localPath == imported.path.string());

        CHECK(h.stateNames() == std::vector<std::string>{"requesting", "succeeded"});
        CHECK(h.coordinator->activeCount() == 0);
    }

    SECTION("A finished entry can be downloaded again") {
        h.transport.complete(kUrl, okResponse("PACKAGE-BYTES"));
        h.coordinator->update();
        CHECK(h.coordinator->startDownload(entry) == SubmitStatus::Started);
        CHECK(h.transport.callCount(kUrl) == 2);
    }
}

TEST_CASE("DownloadCoordinator: import failures", "[downloader]") {
    Harness h;
    auto entry = makeEntry("Shaders", kUrl);

    SECTION("Rejected import is a distinct outcome") {
        h.importer.succeed = false;
        h.coordinator->startDownload(entry);
        h.transport.complete(kUrl, okResponse("PACKAGE-BYTES"));
        h.coordinator->update();

        auto record = h.coordinator->record("Shaders");
        CHECK(record.lastOutcome == DownloadOutcome::ImportFailed);
        REQUIRE(record.lastError.has_value());
        CHECK(record.lastError->kind == ErrorKind::Import);
        CHECK(h.stateNames().back() == "succeeded");

        REQUIRE(h.importer.imports.size() == 1);
        CHECK_FALSE(fs::exists(h.importer.imports[0].path));
    }

    SECTION("Throwing importer is contained") {
        h.importer.throwError = true;
        h.coordinator->startDownload(entry);
        h.transport.complete(kUrl, okResponse("PACKAGE-BYTES"));
        REQUIRE_NOTHROW(h.coordinator->update());

        auto record = h.coordinator->record("Shaders");
        CHECK(record.lastOutcome == DownloadOutcome::ImportFailed);
        CHECK(record.lastError->message == "importer crashed");
        CHECK_FALSE(fs::exists(h.importer.imports[0].path));
    }
}

TEST_CASE("DownloadCoordinator: transfer failures", "[downloader]") {
    Harness h([](EngineSettings& s) { s.maxDownloadBytes = 16; });
    auto entry = makeEntry("Shaders", kUrl);
    h.coordinator->startDownload(entry);

    auto finishWith = [&](const HttpResponse& response) {
        h.transport.complete(kUrl, response);
        h.coordinator->update();
        return h.coordinator->record("Shaders");
    };

    SECTION("HTTP error status") {
        auto record = finishWith(statusResponse(404));
        CHECK(record.lastOutcome == DownloadOutcome::Failed);
        CHECK(record.lastError->kind == ErrorKind::Network);
        CHECK(record.lastError->message == "HTTP 404");
    }

    SECTION("Connection failure") {
        auto record = finishWith(networkError("Could not resolve host"));
        CHECK(record.lastError->kind == ErrorKind::Network);
        CHECK(record.lastError->message == "Could not resolve host");
    }

    SECTION("Empty body after success") {
        auto record = finishWith(okResponse(""));
        CHECK(record.lastError->kind == ErrorKind::Integrity);
    }

    SECTION("Body larger than announced") {
        auto record = finishWith(okResponse(std::string(64, 'x')));
        CHECK(record.lastOutcome == DownloadOutcome::Failed);
        CHECK(record.lastError->kind == ErrorKind::SizeLimitExceeded);
    }

    SECTION("Stream aborted at the byte ceiling") {
        h.transport.exceedLimit(kUrl);
        h.coordinator->update();
        auto record = h.coordinator->record("Shaders");
        CHECK(record.lastError->kind == ErrorKind::SizeLimitExceeded);
    }

    SECTION("Transport-level timeout") {
        HttpResponse response;
        response.timedOut = true;
        response.error = "Request timed out";
        auto record = finishWith(response);
        CHECK(record.lastOutcome == DownloadOutcome::TimedOut);
        CHECK(record.lastError->kind == ErrorKind::Timeout);
    }

    CHECK(h.importer.imports.empty());
    CHECK(h.coordinator->record("Shaders").state == DownloadState::Idle);
    CHECK_FALSE(h.coordinator->isRequesting("Shaders"));
}

TEST_CASE("DownloadCoordinator: deadline", "[downloader]") {
    Harness h([](EngineSettings& s) {
        s.requestTimeout = std::chrono::milliseconds(20);
        s.downloadTimeoutMultiplier = 1;
    });
    auto entry = makeEntry("Slow", kUrl);
    h.coordinator->startDownload(entry);

    sleepPast(h.settings.downloadTimeout());
    h.coordinator->update();

    auto record = h.coordinator->record("Slow");
    CHECK(record.state == DownloadState::Idle);
    CHECK(record.lastOutcome == DownloadOutcome::TimedOut);
    CHECK(record.lastError->kind == ErrorKind::Timeout);
    CHECK(h.transport.wasAborted(kUrl));
    CHECK(h.stateNames() == std::vector<std::string>{"requesting", "timed_out"});

    SECTION("A late response is ignored") {
        h.transport.complete(kUrl, okResponse("LATE"));
        h.coordinator->update();
        CHECK(h.importer.imports.empty());
        CHECK(h.coordinator->record("Slow").lastOutcome == DownloadOutcome::TimedOut);
    }

    SECTION("Timed out entries can be retried") {
        CHECK(h.coordinator->startDownload(entry) == SubmitStatus::Started);
        CHECK(h.transport.callCount(kUrl) == 2);
    }
}

TEST_CASE("DownloadCoordinator: deadline counts from the start of the transfer", "[downloader]") {
    Harness h([](EngineSettings& s) {
        s.requestTimeout = std::chrono::milliseconds(20);
        s.downloadTimeoutMultiplier = 1;
    });
    h.transport.holdQueued(kUrl);
    REQUIRE(h.coordinator->startDownload(makeEntry("Queued", kUrl)) == SubmitStatus::Started);

    // Waiting behind other transfers is not a timeout
    sleepPast(h.settings.downloadTimeout());
    h.coordinator->update();
    CHECK(h.coordinator->isRequesting("Queued"));
    CHECK_FALSE(h.transport.wasAborted(kUrl));

    h.transport.startQueued(kUrl);
    h.coordinator->update();
    CHECK(h.coordinator->isRequesting("Queued"));

    SECTION("Completes normally once a worker runs it") {
        h.transport.complete(kUrl, okResponse("PACKAGE-BYTES"));
        h.coordinator->update();
        CHECK(h.coordinator->record("Queued").lastOutcome == DownloadOutcome::Completed);
    }

    SECTION("Times out once running for longer than the timeout") {
        sleepPast(h.settings.downloadTimeout());
        h.coordinator->update();
        CHECK(h.coordinator->record("Queued").lastOutcome == DownloadOutcome::TimedOut);
        CHECK(h.transport.wasAborted(kUrl));
    }
}

TEST_CASE("DownloadCoordinator: redirects", "[downloader][security]") {
    Harness h;
    const std::string asset = "https://github.com/acme/shaders/releases/download/v1/shaders.unitypackage";
    auto entry = makeEntry("Shaders", asset);

    SECTION("A release asset redirected to object storage is followed") {
        const std::string storage = "https://objects.githubusercontent.com/store/123?sig=abc";
        h.transport.respond(asset, redirectResponse(storage));
        REQUIRE(h.coordinator->startDownload(entry) == SubmitStatus::Started);

        h.coordinator->update();
        CHECK(h.coordinator->isRequesting("Shaders"));
        REQUIRE(h.transport.callCount("GET", storage) == 1);
        CHECK(h.transport.lastCall(storage)->options.maxBytes == h.settings.maxDownloadBytes);

        h.transport.complete(storage, okResponse("PACKAGE-BYTES"));
        h.coordinator->update();

        REQUIRE(h.importer.imports.size() == 1);
        CHECK(h.importer.imports[0].contents == "PACKAGE-BYTES");
        CHECK(h.coordinator->record("Shaders").lastOutcome == DownloadOutcome::Completed);
        CHECK(h.stateNames() == std::vector<std::string>{"requesting", "succeeded"});
    }

    SECTION("A redirect to a private host is refused before it is requested") {
        const std::vector<std::string> targets = {
            "http://127.0.0.1/shaders.unitypackage",
            "http://192.168.1.5/shaders.unitypackage",
            "http://[0:0:0:0:0:ffff:7f00:1]/shaders.unitypackage",
            "http://localhost:8080/shaders.unitypackage",
        };
        for (const auto& target : targets) {
            INFO(target);
            h.transport.respond(asset, redirectResponse(target, 307));
            REQUIRE(h.coordinator->startDownload(entry) == SubmitStatus::Started);
            h.coordinator->update();

            CHECK(h.transport.callCount(target) == 0);
            CHECK_FALSE(h.coordinator->isRequesting("Shaders"));
            auto record = h.coordinator->record("Shaders");
            CHECK(record.lastOutcome == DownloadOutcome::Failed);
            REQUIRE(record.lastError.has_value());
            CHECK(record.lastError->kind == ErrorKind::ValidationRejected);
        }
        CHECK(h.importer.imports.empty());
    }

    SECTION("A redirect without a Location header is refused") {
        HttpResponse bare = statusResponse(302);
        h.transport.respond(asset, bare);
        REQUIRE(h.coordinator->startDownload(entry) == SubmitStatus::Started);
        h.coordinator->update();

        CHECK(h.transport.calls().size() == 1);
        CHECK(h.coordinator->record("Shaders").lastError->kind == ErrorKind::ValidationRejected);
    }

    SECTION("Redirect loops stop after a bounded number of hops") {
        const std::string hop = "https://example.com/mirror/next";
        h.transport.respond(asset, redirectResponse(hop));
        h.transport.respond(hop, redirectResponse(hop));
        REQUIRE(h.coordinator->startDownload(entry) == SubmitStatus::Started);

        for (int i = 0; i < 10 && h.coordinator->isRequesting("Shaders"); ++i) {
            h.coordinator->update();
        }

        CHECK_FALSE(h.coordinator->isRequesting("Shaders"));
        CHECK(h.transport.callCount(hop) == static_cast<size_t>(core::security::kMaxRedirects));
        auto record = h.coordinator->record("Shaders");
        CHECK(record.lastOutcome == DownloadOutcome::Failed);
        CHECK(record.lastError->message == "Too many redirects");
    }
}

TEST_CASE("DownloadCoordinator: cancellation", "[downloader]") {
    Harness h;
    const std::string otherUrl = "https://example.com/files/other.zip";
    h.coordinator->startDownload(makeEntry("A", kUrl));
    h.coordinator->startDownload(makeEntry("B", otherUrl));

    SECTION("Cancel one") {
        CHECK(h.coordinator->cancel("A"));
        CHECK_FALSE(h.coordinator->cancel("A"));
        CHECK(h.transport.wasAborted(kUrl));
        CHECK_FALSE(h.transport.wasAborted(otherUrl));

        auto record = h.coordinator->record("A");
        CHECK(record.lastOutcome == DownloadOutcome::Cancelled);
        CHECK(record.lastError->kind == ErrorKind::Cancelled);
        CHECK(h.coordinator->isRequesting("B"));
    }

    SECTION("Cancel all") {
        h.coordinator->cancelAll();
        CHECK(h.coordinator->activeCount() == 0);
        CHECK(h.transport.wasAborted(kUrl));
        CHECK(h.transport.wasAborted(otherUrl));
        CHECK(h.coordinator->record("A").lastOutcome == DownloadOutcome::Cancelled);
        CHECK(h.coordinator->record("B").lastOutcome == DownloadOutcome::Cancelled);

        h.transport.complete(kUrl, okResponse("LATE"));
        h.coordinator->update();
        CHECK(h.importer.imports.empty());
    }

    SECTION("Cancel all survives a throwing observer") {
        auto sub = h.bus.subscribe(events::DownloadState,
                                      [](const json&) { throw std::runtime_error("observer failed"); });
        REQUIRE_NOTHROW(h.coordinator->cancelAll());
        CHECK(h.coordinator->activeCount() == 0);
    }
}

TEST_CASE("DownloadCoordinator: reconcile after a refresh", "[downloader]") {
    Harness h;
    const std::string keptUrl = "https://example.com/files/kept.zip";
    const std::string goneUrl = "https://example.com/files/gone.zip";

    h.coordinator->startDownload(makeEntry("Kept", keptUrl));
    h.transport.complete(keptUrl, statusResponse(500));
    h.coordinator->update();
    REQUIRE(h.coordinator->record("Kept").lastOutcome == DownloadOutcome::Failed);

    h.coordinator->startDownload(makeEntry("Gone", goneUrl));
    h.coordinator->startDownload(makeEntry("Busy", kUrl));

    h.coordinator->reconcile({"Kept", "Busy"});

    CHECK_FALSE(h.coordinator->isRequesting("Gone"));
    CHECK(h.transport.wasAborted(goneUrl));
    CHECK(h.coordinator->record("Gone").lastOutcome == DownloadOutcome::None);

    CHECK(h.coordinator->record("Kept").lastOutcome == DownloadOutcome::None);
    CHECK_FALSE(h.coordinator->record("Kept").lastError.has_value());

    CHECK(h.coordinator->isRequesting("Busy"));
    CHECK(h.coordinator->record("Busy").state == DownloadState::Requesting);
}

TEST_CASE("DownloadCoordinator: destination paths", "[downloader][security]") {
    TempDir dir;
    const auto scratch = dir.path() / "scratch";

    SECTION("Traversal in the name stays inside the scratch directory") {
        CatalogEntry entry = makeEntry("../../evil", kUrl);
        auto path = DownloadCoordinator::destinationPath(scratch, entry, ".unitypackage");

        CHECK(path.parent_path() == scratch);
        CHECK(path.filename() == "evil_1.0.unitypackage");
        CHECK(utils::FileUtils::isStrictlyInside(scratch, path));
    }

    SECTION("Separators and traversal in every component are neutralized") {
        CatalogEntry entry;
        entry.name = "..\\..\\Windows/System32";
        entry.version = "../1.0/..";
        auto path = DownloadCoordinator::destinationPath(scratch, entry, "/../.zip");

        CHECK(path.parent_path() == scratch);
        CHECK(path.filename().string().find("..") == std::string::npos);
        CHECK(utils::FileUtils::isStrictlyInside(scratch, path));
    }

    SECTION("Empty components fall back to placeholders") {
        CatalogEntry entry;
        entry.name = "///";
        auto path = DownloadCoordinator::destinationPath(scratch, entry, "");
        CHECK(path.filename() == "package_unversioned.pkg");
    }

    SECTION("Download of a traversal name writes inside the scratch directory") {
        Harness h;
        h.coordinator->startDownload(makeEntry("../../evil", kUrl));
        h.transport.complete(kUrl, okResponse("PAYLOAD"));
        h.coordinator->update();

        REQUIRE(h.importer.imports.size() == 1);
        CHECK(h.importer.imports[0].existed);
        CHECK(utils::FileUtils::isStrictlyInside(h.settings.scratchDirectory, h.importer.imports[0].path));
        CHECK(h.coordinator->record("../../evil").lastOutcome == DownloadOutcome::Completed);
    }
}
