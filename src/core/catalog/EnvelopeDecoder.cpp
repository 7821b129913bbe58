/**
 * EnvelopeDecoder.cpp
 */

#include "EnvelopeDecoder.hpp"
#include "../../utils/EncodingUtils.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace assetdock::core::catalog {

using utils::JsonUtils;
using utils::StringUtils;

bool isApiEnvelopeSource(const std::string& catalogUrl, const std::vector<std::string>& apiHosts) {
    std::string lower = StringUtils::toLower(catalogUrl);
    for (const auto& host : apiHosts) {
        if (!host.empty() && StringUtils::contains(lower, StringUtils::toLower(host))) {
            return true;
        }
    }
    return false;
}

EnvelopeResult unwrapEnvelope(const std::string& raw) {
    EnvelopeResult result;

    std::string parseError;
    auto envelope = JsonUtils::parse(raw, parseError);
    if (!envelope) {
        result.error = Error(ErrorKind::Envelope, "Envelope is not valid JSON: " + parseError);
        return result;
    }
    if (!envelope->is_object()) {
        result.error = Error(ErrorKind::Envelope, "Envelope is not a JSON object");
        return result;
    }

    std::string encoding = StringUtils::toLower(JsonUtils::getString(*envelope, "encoding"));
    if (!encoding.empty() && encoding != "base64") {
        result.error = Error(ErrorKind::Envelope, "Unsupported envelope encoding '" + encoding + "'");
        return result;
    }

    std::string content = JsonUtils::getString(*envelope, "content");
    if (StringUtils::trim(content).empty()) {
        result.error = Error(ErrorKind::Envelope, "Envelope has no content");
        return result;
    }

    auto decoded = utils::EncodingUtils::base64Decode(content);
    if (!decoded) {
        result.error = Error(ErrorKind::Envelope, "Envelope content is not valid base64");
        return result;
    }

    result.payload = std::move(*decoded);
    return result;
}

} // namespace assetdock::core::catalog
