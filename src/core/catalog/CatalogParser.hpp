#pragma once

/**
 * CatalogParser.hpp
 *
 * Turns a fetched catalog body into the validated entry list the rest of
 * the engine works with.
 */

#include "../models/Models.hpp"
#include "../Errors.hpp"

#include <optional>
#include <string>

namespace assetdock::core::catalog {

struct ParsedCatalog {
    Catalog entries;            // surviving entries, document order
    size_t totalParsed{0};      // rows in the "assets" array
    size_t invalid{0};          // non-object rows or rows without a name
    size_t duplicates{0};       // repeated names, first occurrence kept
    size_t rejected{0};         // download URL failed the security policy
};

struct DecodeResult {
    ParsedCatalog catalog;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * Parse a catalog document: { "assets": [ { "name": ..., ... }, ... ] }
 * A document that is not an object or lacks the "assets" array yields
 * ErrorKind::MalformedCatalog. No URL filtering happens here.
 */
DecodeResult parseCatalogDocument(const std::string& text);

/**
 * Full decode pipeline: optional envelope unwrap, parse, then drop
 * entries whose download URL is not permitted.
 * @param raw Response body
 * @param sourceIsApiEnvelope Unwrap a source-hosting API envelope first
 * @param allowPrivateHosts Passed to the URL policy
 */
DecodeResult decodeCatalog(const std::string& raw, bool sourceIsApiEnvelope, bool allowPrivateHosts);

} // namespace assetdock::core::catalog
