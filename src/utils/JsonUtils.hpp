// AssetDock - JSON Utilities
// JSON parsing helpers with type-checked accessors

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace assetdock::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 *
 * Accessors return the default when the key is missing or holds another
 * type, so a loosely typed remote document never throws past them.
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str, std::string& error);

    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);

    // Type check
    static bool isArray(const json& j, const std::string& key);
};

} // namespace assetdock::utils
