/**
 * UrlValidator.cpp
 *
 * Security policy for catalog-supplied URLs.
 */

#include "UrlValidator.hpp"
#include "../../utils/StringUtils.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <vector>

namespace assetdock::core::security {

using utils::StringUtils;

namespace {

constexpr std::array<const char*, 3> kPackageExtensions = {".unitypackage", ".zip", ".tar.gz"};
constexpr std::array<const char*, 3> kPathMarkers = {"/download", "/releases/", "/attachments/"};
constexpr std::array<const char*, 4> kHostingPlatforms = {
    "github.com", "githubusercontent.com", "gitlab.com", "codeberg.org"
};

bool isSchemeChar(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

bool isHostChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

/**
 * Strict dotted-quad: four decimal labels 0-255, no leading zeros.
 */
std::optional<std::array<int, 4>> parseIpv4(const std::string& host) {
    auto labels = StringUtils::split(host, '.');
    if (labels.size() != 4 || host.back() == '.') return std::nullopt;

    std::array<int, 4> octets{};
    for (size_t i = 0; i < 4; ++i) {
        const auto& label = labels[i];
        if (label.empty() || label.size() > 3) return std::nullopt;
        if (label.size() > 1 && label[0] == '0') return std::nullopt;
        int value = 0;
        for (char c : label) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
            value = value * 10 + (c - '0');
        }
        if (value > 255) return std::nullopt;
        octets[i] = value;
    }
    return octets;
}

/**
 * Hosts made only of numeric-looking labels ("2130706433", "0x7f.1",
 * "0177.0.0.1") are resolved as addresses by libcurl. Only the canonical
 * dotted-quad form is accepted so the private-range check cannot be
 * sidestepped.
 */
bool isAmbiguousNumericHost(const std::string& host) {
    auto labels = StringUtils::split(host, '.');
    if (labels.empty()) return false;
    for (const auto& label : labels) {
        if (label.empty()) continue;
        bool numeric = std::isdigit(static_cast<unsigned char>(label[0])) != 0;
        for (char c : label) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (!std::isxdigit(uc) && c != 'x') numeric = false;
        }
        if (!numeric) return false;
    }
    return !parseIpv4(host).has_value();
}

bool isPrivateIpv4(const std::array<int, 4>& ip) {
    if (ip[0] == 127 || ip[0] == 10 || ip[0] == 0) return true;
    if (ip[0] == 172 && ip[1] >= 16 && ip[1] <= 31) return true;
    if (ip[0] == 192 && ip[1] == 168) return true;
    return false;
}

/**
 * Colon-separated hex groups; the last one may be a dotted quad when
 * @p allowIpv4Tail is set, counting as two groups.
 */
std::optional<std::vector<uint16_t>> parseIpv6Groups(const std::string& text, bool allowIpv4Tail) {
    std::vector<uint16_t> groups;
    if (text.empty()) return groups;

    size_t start = 0;
    while (true) {
        size_t colon = text.find(':', start);
        std::string label = text.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        bool last = colon == std::string::npos;

        if (last && allowIpv4Tail && label.find('.') != std::string::npos) {
            auto v4 = parseIpv4(label);
            if (!v4) return std::nullopt;
            groups.push_back(static_cast<uint16_t>(((*v4)[0] << 8) | (*v4)[1]));
            groups.push_back(static_cast<uint16_t>(((*v4)[2] << 8) | (*v4)[3]));
            return groups;
        }

        if (label.empty() || label.size() > 4) return std::nullopt;
        uint16_t value = 0;
        for (char c : label) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
            int digit = std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : std::tolower(c) - 'a' + 10;
            value = static_cast<uint16_t>((value << 4) | digit);
        }
        groups.push_back(value);

        if (last) return groups;
        start = colon + 1;
    }
}

/**
 * RFC 4291 text form (with at most one "::" and an optional dotted-quad
 * tail) to the 16 address bytes.
 */
std::optional<std::array<uint8_t, 16>> parseIpv6(const std::string& host) {
    std::vector<uint16_t> groups;
    auto gap = host.find("::");
    if (gap == std::string::npos) {
        auto all = parseIpv6Groups(host, true);
        if (!all || all->size() != 8) return std::nullopt;
        groups = *all;
    } else {
        if (host.find("::", gap + 1) != std::string::npos) return std::nullopt;
        auto head = parseIpv6Groups(host.substr(0, gap), false);
        auto tail = parseIpv6Groups(host.substr(gap + 2), true);
        if (!head || !tail || head->size() + tail->size() > 7) return std::nullopt;
        groups = *head;
        groups.resize(8 - tail->size(), 0);
        groups.insert(groups.end(), tail->begin(), tail->end());
    }

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[2 * i] = static_cast<uint8_t>(groups[i] >> 8);
        bytes[2 * i + 1] = static_cast<uint8_t>(groups[i] & 0xff);
    }
    return bytes;
}

/**
 * Classified on the address bytes so that every spelling of an address
 * ("::1", "0:0:0:0:0:0:0:1", "::0:1") gets the same answer. A literal that
 * does not parse counts as private.
 */
bool isPrivateIpv6(const std::string& host) {
    auto address = parseIpv6(host);
    if (!address) return true;
    const auto& b = *address;

    auto zeroUpTo = [&b](size_t end) {
        for (size_t i = 0; i < end; ++i) {
            if (b[i] != 0) return false;
        }
        return true;
    };
    std::array<int, 4> tail = {b[12], b[13], b[14], b[15]};

    // ::/96 (unspecified, loopback, IPv4-compatible) and ::ffff:0:0/96 (IPv4-mapped)
    if (zeroUpTo(12)) return isPrivateIpv4(tail);
    if (zeroUpTo(10) && b[10] == 0xff && b[11] == 0xff) return isPrivateIpv4(tail);

    // fc00::/7 unique local, fe80::/10 link local
    if ((b[0] & 0xfe) == 0xfc) return true;
    return b[0] == 0xfe && (b[1] & 0xc0) == 0x80;
}

bool isHostingPlatform(const std::string& host) {
    for (const char* platform : kHostingPlatforms) {
        std::string p(platform);
        if (host == p || StringUtils::endsWith(host, "." + p)) {
            return true;
        }
    }
    return false;
}

bool looksLikePackage(const std::string& text) {
    for (const char* ext : kPackageExtensions) {
        if (StringUtils::endsWith(text, ext)) return true;
    }
    for (const char* marker : kPathMarkers) {
        if (StringUtils::contains(text, marker)) return true;
    }
    return false;
}

} // namespace

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    if (url.empty()) return std::nullopt;
    for (char c : url) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) return std::nullopt;
    }

    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) return std::nullopt;

    ParsedUrl parsed;
    parsed.scheme = StringUtils::toLower(url.substr(0, schemeEnd));
    if (!std::isalpha(static_cast<unsigned char>(parsed.scheme[0]))) return std::nullopt;
    for (char c : parsed.scheme) {
        if (!isSchemeChar(static_cast<unsigned char>(c))) return std::nullopt;
    }

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart,
        authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityStart);

    std::string rest = authorityEnd == std::string::npos ? "" : url.substr(authorityEnd);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos) rest.erase(fragment);
    auto queryStart = rest.find('?');
    if (queryStart != std::string::npos) {
        parsed.query = rest.substr(queryStart + 1);
        rest.erase(queryStart);
    }
    parsed.path = rest.empty() ? "/" : rest;

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        parsed.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return std::nullopt;
            portText = tail.substr(1);
        }
        for (char c : parsed.host) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (!std::isxdigit(uc) && c != ':' && c != '.') return std::nullopt;
        }
    } else {
        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) portText = authority.substr(colon + 1);
        for (char c : parsed.host) {
            if (!isHostChar(static_cast<unsigned char>(c))) return std::nullopt;
        }
    }

    parsed.host = StringUtils::toLower(parsed.host);
    while (!parsed.host.empty() && parsed.host.back() == '.') parsed.host.pop_back();
    if (parsed.host.empty()) return std::nullopt;

    if (!portText.empty()) {
        if (portText.size() > 5) return std::nullopt;
        auto port = StringUtils::parseLong(portText);
        if (!port || *port > 65535) return std::nullopt;
        parsed.port = static_cast<int>(*port);
    }

    return parsed;
}

bool isLoopbackOrPrivateHost(const std::string& rawHost) {
    std::string host = StringUtils::toLower(rawHost);
    if (!host.empty() && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (host.empty()) return false;

    if (host == "localhost" || StringUtils::endsWith(host, ".localhost")) return true;
    if (host.find(':') != std::string::npos) return isPrivateIpv6(host);

    auto ip = parseIpv4(host);
    return ip && isPrivateIpv4(*ip);
}

bool isFetchable(const std::string& url, bool allowPrivateHosts) {
    auto parsed = parseUrl(url);
    if (!parsed) return false;

    if (parsed->scheme != "http" && parsed->scheme != "https") return false;

    if (parsed->host.find(':') != std::string::npos) {
        if (!parseIpv6(parsed->host)) return false;
    } else if (isAmbiguousNumericHost(parsed->host)) {
        return false;
    }

    if (!allowPrivateHosts && isLoopbackOrPrivateHost(parsed->host)) return false;

    return true;
}

std::optional<std::string> redirectTarget(const std::string& currentUrl, const std::string& location,
                                          bool allowPrivateHosts) {
    auto base = parseUrl(currentUrl);
    std::string reference = StringUtils::trim(location);
    if (!base || reference.empty()) return std::nullopt;

    std::string origin = base->scheme + "://" +
                         (base->host.find(':') != std::string::npos ? "[" + base->host + "]" : base->host) +
                         (base->port >= 0 ? ":" + std::to_string(base->port) : "");

    std::string target;
    if (reference.find("://") != std::string::npos) {
        target = reference;
    } else if (StringUtils::startsWith(reference, "//")) {
        target = base->scheme + ":" + reference;
    } else if (reference[0] == '/') {
        target = origin + reference;
    } else if (reference[0] == '?') {
        target = origin + base->path + reference;
    } else {
        target = origin + base->path.substr(0, base->path.rfind('/') + 1) + reference;
    }

    if (!isFetchable(target, allowPrivateHosts)) return std::nullopt;
    return target;
}

bool isPermitted(const std::string& url, bool allowPrivateHosts) {
    if (!isFetchable(url, allowPrivateHosts)) return false;

    auto parsed = parseUrl(url);
    std::string path = StringUtils::toLower(parsed->path);
    std::string query = StringUtils::toLower(parsed->query);

    if (looksLikePackage(path) || looksLikePackage(query)) return true;

    if (isHostingPlatform(parsed->host) &&
        (StringUtils::contains(path, "/releases/") || StringUtils::contains(path, "/download/"))) {
        return true;
    }

    return false;
}

} // namespace assetdock::core::security
