// AssetDock - String Utilities
// String manipulation and formatting

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace assetdock::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // First occurrence of each string, original order kept
    static std::vector<std::string> uniqueInOrder(const std::vector<std::string>& items);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(int64_t bytes);

    // Parsing
    static std::optional<int64_t> parseLong(const std::string& str);

    /**
     * Reduce an arbitrary string to a single safe file name component.
     * Keeps [A-Za-z0-9._-], turns spaces into underscores, strips everything
     * else, collapses dot runs and removes leading dots so the result can
     * never name a parent directory.
     * @return Sanitized name, or @p fallback when nothing usable remains
     */
    static std::string sanitizeFileName(const std::string& name, const std::string& fallback = "package");
};

} // namespace assetdock::utils
