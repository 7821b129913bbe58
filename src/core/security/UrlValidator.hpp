#pragma once

/**
 * UrlValidator.hpp
 *
 * Security policy for URLs taken from a remote catalog. Pure functions,
 * no network access.
 */

#include <optional>
#include <string>

namespace assetdock::core::security {

/**
 * Components of an absolute URL
 */
struct ParsedUrl {
    std::string scheme;     // lower-cased
    std::string host;       // lower-cased, IPv6 brackets removed
    int port{-1};           // -1 when absent
    std::string path;       // "/" when absent
    std::string query;      // without '?'
};

/**
 * Parse an absolute URL of the form scheme://[userinfo@]host[:port][/path][?query][#fragment]
 * @return Parsed components, or std::nullopt if the URL is not absolute or malformed
 */
std::optional<ParsedUrl> parseUrl(const std::string& url);

/**
 * Loopback (localhost, 127.0.0.0/8, ::1) or private range
 * (10.0.0.0/8, 172.16.0.0/12, 192.168.0.0/16, fc00::/7, fe80::/10).
 * IPv6 literals are compared as addresses, and IPv4-mapped or
 * IPv4-compatible ones are judged by their IPv4 part.
 */
bool isLoopbackOrPrivateHost(const std::string& host);

/**
 * Absolute http(s) URL whose host is public, or private with @p allowPrivateHosts.
 * Applies to any resource the engine fetches, including preview images.
 */
bool isFetchable(const std::string& url, bool allowPrivateHosts);

/** Redirect hops followed for a single request before giving up. */
constexpr int kMaxRedirects = 5;

/**
 * Resolve a redirect's Location header against the URL that returned it.
 * Handles absolute, scheme-relative, absolute-path and relative references.
 * @return The absolute target, or std::nullopt when it is malformed or not
 *         isFetchable()
 */
std::optional<std::string> redirectTarget(const std::string& currentUrl, const std::string& location,
                                          bool allowPrivateHosts);

/**
 * Full policy for package download URLs: isFetchable() plus a path or
 * query that looks like a package or release artifact (.unitypackage,
 * .zip, .tar.gz, /download, /releases/, /attachments/).
 */
bool isPermitted(const std::string& url, bool allowPrivateHosts);

} // namespace assetdock::core::security
