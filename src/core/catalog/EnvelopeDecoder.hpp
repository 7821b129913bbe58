#pragma once

/**
 * EnvelopeDecoder.hpp
 *
 * Unwraps the JSON envelope that source-hosting APIs put around file
 * contents: { "content": "<base64>", "encoding": "base64", ... }.
 */

#include "../Errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace assetdock::core::catalog {

struct EnvelopeResult {
    std::string payload;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * Whether a catalog URL is served through a source-hosting API and thus
 * wrapped in an envelope.
 * @param catalogUrl Configured catalog URL
 * @param apiHosts Substrings identifying API hosts (e.g. "api.github.com")
 */
bool isApiEnvelopeSource(const std::string& catalogUrl, const std::vector<std::string>& apiHosts);

/**
 * Extract and decode the envelope payload.
 * Every failure is reported as ErrorKind::Envelope.
 */
EnvelopeResult unwrapEnvelope(const std::string& raw);

} // namespace assetdock::core::catalog
