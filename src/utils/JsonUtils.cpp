/**
 * JsonUtils.cpp
 *
 * JSON parsing helpers.
 */

#include "JsonUtils.hpp"

#include <cmath>
#include <limits>

namespace assetdock::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str, std::string& error) {
    try {
        return json::parse(str);
    } catch (const json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (!j.is_object()) return defaultValue;
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) return it->get<std::string>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (!j.is_object()) return defaultValue;
    auto it = j.find(key);
    if (it == j.end()) return defaultValue;
    if (it->is_number_unsigned()) {
        auto u = it->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return defaultValue;
        return static_cast<int64_t>(u);
    }
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float()) {
        double v = it->get<double>();
        if (!std::isfinite(v) || v < 0 || v > static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return defaultValue;
        }
        return static_cast<int64_t>(v);
    }
    return defaultValue;
}

// -- Type checking --

bool JsonUtils::isArray(const json& j, const std::string& key) {
    return j.is_object() && j.contains(key) && j[key].is_array();
}

} // namespace assetdock::utils
