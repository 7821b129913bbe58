/**
 * CatalogParser.cpp
 *
 * Catalog document parsing and download URL filtering.
 */

#include "CatalogParser.hpp"
#include "EnvelopeDecoder.hpp"
#include "../Logger.hpp"
#include "../security/UrlValidator.hpp"
#include "../../utils/JsonUtils.hpp"

#include <unordered_set>

namespace assetdock::core::catalog {

using utils::JsonUtils;

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

CatalogEntry entryFromJson(const json& j) {
    CatalogEntry entry;
    entry.name = JsonUtils::getString(j, "name");
    entry.description = JsonUtils::getString(j, "description");
    entry.version = JsonUtils::getString(j, "version");
    entry.downloadUrl = JsonUtils::getString(j, "downloadUrl");
    entry.imageUrl = JsonUtils::getString(j, "imageUrl");
    entry.category = JsonUtils::getString(j, "category");

    int64_t size = JsonUtils::getLong(j, "fileSize", 0);
    entry.fileSize = size > 0 ? size : 0;
    return entry;
}

} // namespace

DecodeResult parseCatalogDocument(const std::string& text) {
    DecodeResult result;

    std::string body = text;
    if (body.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        body.erase(0, kUtf8Bom.size());
    }

    std::string parseError;
    auto document = JsonUtils::parse(body, parseError);
    if (!document) {
        result.error = Error(ErrorKind::MalformedCatalog, "Catalog is not valid JSON: " + parseError);
        return result;
    }
    if (!document->is_object()) {
        result.error = Error(ErrorKind::MalformedCatalog, "Catalog is not a JSON object");
        return result;
    }
    if (!JsonUtils::isArray(*document, "assets")) {
        result.error = Error(ErrorKind::MalformedCatalog, "Catalog has no \"assets\" array");
        return result;
    }

    const auto& assets = (*document)["assets"];
    auto& parsed = result.catalog;
    parsed.totalParsed = assets.size();

    std::unordered_set<std::string> seen;
    for (const auto& item : assets) {
        if (!item.is_object()) {
            ++parsed.invalid;
            continue;
        }

        CatalogEntry entry = entryFromJson(item);
        if (entry.name.empty()) {
            Logger::instance().warn("Skipping catalog entry without a name");
            ++parsed.invalid;
            continue;
        }

        if (!seen.insert(entry.name).second) {
            Logger::instance().warn("Duplicate catalog entry '{}' ignored", entry.name);
            ++parsed.duplicates;
            continue;
        }

        parsed.entries.push_back(std::move(entry));
    }

    return result;
}

DecodeResult decodeCatalog(const std::string& raw, bool sourceIsApiEnvelope, bool allowPrivateHosts) {
    std::string text;
    if (sourceIsApiEnvelope) {
        auto envelope = unwrapEnvelope(raw);
        if (!envelope.ok()) {
            DecodeResult failed;
            failed.error = envelope.error;
            return failed;
        }
        text = std::move(envelope.payload);
    } else {
        text = raw;
    }

    DecodeResult result = parseCatalogDocument(text);
    if (!result.ok()) {
        return result;
    }

    auto& parsed = result.catalog;
    Catalog permitted;
    permitted.reserve(parsed.entries.size());
    for (auto& entry : parsed.entries) {
        if (security::isPermitted(entry.downloadUrl, allowPrivateHosts)) {
            permitted.push_back(std::move(entry));
        } else {
            Logger::instance().warn("Filtered '{}': download URL not permitted ({})",
                                    entry.name, entry.downloadUrl);
            ++parsed.rejected;
        }
    }
    parsed.entries = std::move(permitted);

    return result;
}

} // namespace assetdock::core::catalog
