/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace assetdock::utils {

namespace {
constexpr size_t kMaxFileNameComponent = 96;
}

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

std::vector<std::string> StringUtils::uniqueInOrder(const std::vector<std::string>& items) {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (seen.insert(item).second) unique.push_back(item);
    }
    return unique;
}

// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(std::max<int64_t>(0, bytes));
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

// -- Parsing --

std::optional<int64_t> StringUtils::parseLong(const std::string& str) {
    std::string s = trim(str);
    if (s.empty() || s.size() > 19) return std::nullopt;
    int64_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// -- File names --

std::string StringUtils::sanitizeFileName(const std::string& name, const std::string& fallback) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_') {
            result += c;
        } else if (c == '.') {
            if (!result.empty() && result.back() != '.') result += c;
        } else if (c == ' ') {
            if (!result.empty() && result.back() != '_') result += '_';
        }
    }

    if (result.size() > kMaxFileNameComponent) {
        result.resize(kMaxFileNameComponent);
    }
    while (!result.empty() && (result.back() == '.' || result.back() == '_')) {
        result.pop_back();
    }

    return result.empty() ? fallback : result;
}

} // namespace assetdock::utils
