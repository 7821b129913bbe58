#include <catch2/catch.hpp>

#include "TestSupport.hpp"
#include "core/catalog/MetadataProber.hpp"

#include <string>
#include <unordered_set>
#include <vector>

using namespace assetdock;
using namespace assetdock::core;
using namespace assetdock::test;
using assetdock::core::catalog::MetadataProber;

namespace {

const std::string kPackageUrl = "https://example.com/files/shaders.unitypackage";
const std::string kImageUrl = "https://example.com/previews/shaders.png";

const std::string kPngBytes = std::string("\x89PNG\r\n\x1a\n", 8) + "IHDR-and-some-pixels";

CatalogEntry makeEntry(const std::string& name, const std::string& url, const std::string& image = "") {
    CatalogEntry entry;
    entry.name = name;
    entry.downloadUrl = url;
    entry.imageUrl = image;
    return entry;
}

HttpResponse sizeResponse(const std::string& length) {
    return okResponse("", {{"content-length", length}});
}

struct Harness {
    FakeTransport transport;
    EventBus bus;
    EngineSettings settings;
    std::vector<json> sizes;
    std::vector<json> images;
    SubscriptionPtr sizeSubscription;
    SubscriptionPtr imageSubscription;
    std::unique_ptr<MetadataProber> prober;

    explicit Harness(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        settings = testSettings(fs::temp_directory_path());
        settings.requestTimeout = timeout;
        sizeSubscription = bus.subscribe(events::ProbeSize, [this](const json& p) { sizes.push_back(p); });
        imageSubscription = bus.subscribe(events::ProbeImage, [this](const json& p) { images.push_back(p); });
        prober = std::make_unique<MetadataProber>(transport, settings, bus);
    }

    ~Harness() {
        prober.reset();
    }
};

} // namespace

TEST_CASE("MetadataProber: size probes", "[probe][size]") {
    Harness h;

    SECTION("Content-Length of a HEAD response becomes the probed size") {
        h.transport.respondHead(kPackageUrl, sizeResponse("1234"));

        REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        CHECK(h.transport.callCount("HEAD", kPackageUrl) == 1);
        CHECK(h.transport.callCount("GET", kPackageUrl) == 0);

        h.prober->update();
        REQUIRE(h.prober->probedSize(kPackageUrl).has_value());
        CHECK(*h.prober->probedSize(kPackageUrl) == 1234);
        CHECK(h.prober->inFlightCount() == 0);

        REQUIRE(h.sizes.size() == 1);
        CHECK(h.sizes[0]["url"] == kPackageUrl);
        CHECK(h.sizes[0]["size"] == 1234);

        SECTION("A resolved URL is not probed again") {
            CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
            CHECK(h.transport.callCount(kPackageUrl) == 1);
        }
    }

    SECTION("Known catalog size makes the probe a no-op") {
        auto entry = makeEntry("Shaders", kPackageUrl);
        entry.fileSize = 4096;
        CHECK_FALSE(h.prober->probeSize(entry));
        CHECK(h.transport.calls().empty());
    }

    SECTION("Entry without a download URL") {
        CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders", "")));
        CHECK(h.transport.calls().empty());
    }

    SECTION("Entries sharing a URL share one probe") {
        CHECK(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders Mirror", kPackageUrl)));
        CHECK(h.prober->isProbing(kPackageUrl));
        CHECK(h.transport.callCount(kPackageUrl) == 1);

        h.transport.complete(kPackageUrl, sizeResponse("77"));
        h.prober->update();
        CHECK(h.prober->probedSize(kPackageUrl) == 77);
        CHECK(h.sizes.size() == 1);
    }

    SECTION("Unusable Content-Length headers leave the size unknown") {
        for (const char* value : {"", "0", "-10", "lots", "12abc"}) {
            INFO(value);
            std::string url = kPackageUrl + "?v=" + value;
            h.transport.respondHead(url, sizeResponse(value));
            REQUIRE(h.prober->probeSize(makeEntry("Shaders", url)));
            h.prober->update();
            CHECK_FALSE(h.prober->probedSize(url).has_value());
        }

        SECTION("Missing header") {
            h.transport.respondHead(kPackageUrl, okResponse(""));
            REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
            h.prober->update();
            CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());
        }

        CHECK(h.sizes.empty());
    }

    SECTION("Failed probes are not retried until the catalog is refreshed") {
        h.transport.respondHead(kPackageUrl, statusResponse(404));
        REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        h.prober->update();
        CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());

        CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        CHECK(h.transport.callCount(kPackageUrl) == 1);

        h.prober->retain({kPackageUrl});
        h.transport.respondHead(kPackageUrl, sizeResponse("2048"));
        CHECK(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        h.prober->update();
        CHECK(h.prober->probedSize(kPackageUrl) == 2048);
    }

    SECTION("Transport errors are not fatal") {
        h.transport.respondHead(kPackageUrl, networkError("Could not resolve host"));
        REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        REQUIRE_NOTHROW(h.prober->update());
        CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());
    }

    SECTION("A transport that refuses the request reports no probe") {
        h.transport.failNextRequest();
        CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        CHECK(h.prober->inFlightCount() == 0);
    }

    SECTION("Private hosts are never probed") {
        CHECK_FALSE(h.prober->probeSize(makeEntry("Internal", "http://10.0.0.4/pkg.zip")));
        CHECK(h.transport.calls().empty());
    }
}

TEST_CASE("MetadataProber: probe deadline", "[probe][timeout]") {
    Harness h(std::chrono::milliseconds(20));

    REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
    h.prober->update();
    CHECK(h.prober->inFlightCount() == 1);

    sleepPast(std::chrono::milliseconds(20));
    h.prober->update();

    CHECK(h.prober->inFlightCount() == 0);
    CHECK(h.transport.wasAborted(kPackageUrl));
    CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());

    SECTION("A late answer is ignored") {
        h.transport.complete(kPackageUrl, sizeResponse("99"));
        h.prober->update();
        CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());
        CHECK(h.sizes.empty());
    }
}

TEST_CASE("MetadataProber: preview images", "[probe][image]") {
    Harness h;

    SECTION("Image bytes are kept with their sniffed format") {
        h.transport.respond(kImageUrl, okResponse(kPngBytes));

        REQUIRE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        CHECK(h.transport.callCount("GET", kImageUrl) == 1);
        h.prober->update();

        auto preview = h.prober->preview(kImageUrl);
        REQUIRE(preview != nullptr);
        CHECK(preview->format == ImageFormat::Png);
        CHECK(preview->bytes == kPngBytes);

        REQUIRE(h.images.size() == 1);
        CHECK(h.images[0]["format"] == "png");
        CHECK(h.images[0]["bytes"] == kPngBytes.size());
    }

    SECTION("Preview fetches carry no byte ceiling") {
        REQUIRE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        const auto* call = h.transport.lastCall(kImageUrl);
        REQUIRE(call != nullptr);
        CHECK(call->options.maxBytes == 0);
    }

    SECTION("A page that is not an image leaves no preview") {
        h.transport.respond(kImageUrl, okResponse("<html><body>Not found</body></html>"));
        REQUIRE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        h.prober->update();
        CHECK(h.prober->preview(kImageUrl) == nullptr);
        CHECK(h.images.empty());

        CHECK_FALSE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
    }

    SECTION("Entries sharing an image share one fetch") {
        CHECK(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        CHECK_FALSE(h.prober->probeImage(makeEntry("Shaders Lite", kPackageUrl + "?lite", kImageUrl)));
        CHECK(h.transport.callCount(kImageUrl) == 1);

        h.transport.complete(kImageUrl, okResponse(kPngBytes));
        h.prober->update();
        CHECK(h.prober->preview(kImageUrl) != nullptr);
        CHECK_FALSE(h.prober->probeImage(makeEntry("Shaders Lite", kPackageUrl + "?lite", kImageUrl)));
    }

    SECTION("No image URL") {
        CHECK_FALSE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl)));
        CHECK(h.transport.calls().empty());
    }

    SECTION("Private image hosts are skipped") {
        CHECK_FALSE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, "http://127.0.0.1/preview.png")));
        CHECK(h.transport.calls().empty());
    }
}

TEST_CASE("MetadataProber: abandon and retain", "[probe]") {
    Harness h;

    SECTION("Abandoned probes are aborted and their answers dropped") {
        REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        REQUIRE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        CHECK(h.prober->inFlightCount() == 2);

        h.prober->abandonAll();
        CHECK(h.prober->inFlightCount() == 0);
        CHECK(h.transport.wasAborted(kPackageUrl));
        CHECK(h.transport.wasAborted(kImageUrl));

        h.transport.complete(kPackageUrl, sizeResponse("10"));
        h.transport.complete(kImageUrl, okResponse(kPngBytes));
        h.prober->update();
        CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());
        CHECK(h.prober->preview(kImageUrl) == nullptr);
        CHECK(h.sizes.empty());
        CHECK(h.images.empty());
    }

    SECTION("Results for URLs no longer referenced are forgotten") {
        const std::string otherUrl = "https://example.com/files/avatar.zip";
        h.transport.respondHead(kPackageUrl, sizeResponse("100"));
        h.transport.respondHead(otherUrl, sizeResponse("200"));
        REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        REQUIRE(h.prober->probeSize(makeEntry("Avatar", otherUrl)));
        h.prober->update();

        h.prober->retain({otherUrl});
        CHECK_FALSE(h.prober->probedSize(kPackageUrl).has_value());
        CHECK(h.prober->probedSize(otherUrl) == 200);
    }

    SECTION("In-flight probes for dropped URLs are aborted") {
        REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
        h.prober->retain({});
        CHECK(h.prober->inFlightCount() == 0);
        CHECK(h.transport.wasAborted(kPackageUrl));
    }
}

TEST_CASE("MetadataProber::sniffImageFormat", "[probe][image]") {
    CHECK(MetadataProber::sniffImageFormat(kPngBytes) == ImageFormat::Png);
    CHECK(MetadataProber::sniffImageFormat(std::string("\xFF\xD8\xFF\xE0", 4) + "JFIF") == ImageFormat::Jpeg);
    CHECK(MetadataProber::sniffImageFormat("GIF89a....") == ImageFormat::Gif);
    CHECK(MetadataProber::sniffImageFormat("GIF87a....") == ImageFormat::Gif);
    CHECK(MetadataProber::sniffImageFormat("BM" + std::string(40, '\0')) == ImageFormat::Bmp);
    CHECK(MetadataProber::sniffImageFormat(std::string("RIFF\x10\0\0\0WEBPVP8 ", 16) + std::string(8, 'x')) == ImageFormat::WebP);

    CHECK_FALSE(MetadataProber::sniffImageFormat("").has_value());
    CHECK_FALSE(MetadataProber::sniffImageFormat("BM").has_value());
    CHECK_FALSE(MetadataProber::sniffImageFormat(std::string("RIFF\x10\0\0\0WAVEfmt ", 16)).has_value());
    CHECK_FALSE(MetadataProber::sniffImageFormat(std::string("\x89PNG", 4)).has_value());
    CHECK_FALSE(MetadataProber::sniffImageFormat("<!DOCTYPE html>").has_value());
}

TEST_CASE("MetadataProber: time spent queued does not count against the deadline", "[metadata][deadline]") {
    Harness h(std::chrono::milliseconds(20));
    h.transport.holdQueued(kPackageUrl);

    REQUIRE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
    CHECK(h.transport.lastCall(kPackageUrl)->options.lane == utils::RequestLane::Metadata);

    sleepPast(h.settings.requestTimeout);
    h.prober->update();
    CHECK(h.prober->isProbing(kPackageUrl));
    CHECK_FALSE(h.transport.wasAborted(kPackageUrl));

    h.transport.startQueued(kPackageUrl);

    SECTION("The answer is used once it arrives") {
        h.transport.complete(kPackageUrl, sizeResponse("4096"));
        h.prober->update();
        CHECK(h.prober->probedSize(kPackageUrl) == 4096);
    }

    SECTION("A started request still expires") {
        sleepPast(h.settings.requestTimeout);
        h.prober->update();
        CHECK_FALSE(h.prober->isProbing(kPackageUrl));
        CHECK(h.transport.wasAborted(kPackageUrl));
        CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders", kPackageUrl)));
    }
}

TEST_CASE("MetadataProber: redirected lookups", "[metadata][security]") {
    Harness h;
    const std::string asset = "https://github.com/acme/shaders/releases/download/v1/shaders.unitypackage";

    SECTION("Size is read from the redirect target and kept under the catalog URL") {
        const std::string storage = "https://objects.githubusercontent.com/store/123";
        h.transport.respondHead(asset, redirectResponse(storage));
        h.transport.respondHead(storage, sizeResponse("2048"));

        REQUIRE(h.prober->probeSize(makeEntry("Shaders", asset)));
        h.prober->update();
        CHECK(h.transport.callCount("HEAD", storage) == 1);
        CHECK(h.prober->isProbing(asset));

        h.prober->update();
        CHECK(h.prober->probedSize(asset) == 2048);
        CHECK_FALSE(h.prober->probedSize(storage).has_value());
        REQUIRE(h.sizes.size() == 1);
        CHECK(h.sizes[0]["url"] == asset);
    }

    SECTION("A size redirect to a private host is refused") {
        const std::string internal = "http://169.254.0.1.nip.io@10.0.0.8/pack.zip";
        h.transport.respondHead(asset, redirectResponse(internal, 301));

        REQUIRE(h.prober->probeSize(makeEntry("Shaders", asset)));
        h.prober->update();

        CHECK(h.transport.calls().size() == 1);
        CHECK_FALSE(h.prober->isProbing(asset));
        CHECK_FALSE(h.prober->probedSize(asset).has_value());
        CHECK_FALSE(h.prober->probeSize(makeEntry("Shaders", asset)));
        CHECK(h.sizes.empty());
    }

    SECTION("A preview redirect to a loopback address is refused") {
        h.transport.respond(kImageUrl, redirectResponse("http://[::ffff:127.0.0.1]/preview.png"));

        REQUIRE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        h.prober->update();

        CHECK(h.transport.calls().size() == 1);
        CHECK(h.prober->preview(kImageUrl) == nullptr);
        CHECK(h.images.empty());
    }

    SECTION("A relative preview redirect stays on the same host") {
        h.transport.respond(kImageUrl, redirectResponse("/cdn/shaders.png"));
        h.transport.respond("https://example.com/cdn/shaders.png", okResponse(kPngBytes));

        REQUIRE(h.prober->probeImage(makeEntry("Shaders", kPackageUrl, kImageUrl)));
        h.prober->update();
        h.prober->update();

        auto image = h.prober->preview(kImageUrl);
        REQUIRE(image != nullptr);
        CHECK(image->format == ImageFormat::Png);
    }
}
