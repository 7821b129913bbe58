#pragma once

/**
 * Errors.hpp
 *
 * Error taxonomy shared by the catalog, probe and download components.
 * Errors travel as values; nothing here is thrown.
 */

#include <string>
#include <utility>

namespace assetdock::core {

enum class ErrorKind {
    Network,            // connection, DNS, protocol or HTTP status failure
    Timeout,            // deadline exceeded
    Envelope,           // API envelope present but malformed
    MalformedCatalog,   // body is not a valid catalog document
    ValidationRejected, // URL or path failed the security policy
    SizeLimitExceeded,  // pre- or post-flight size bound
    Integrity,          // empty or missing result after a reported success
    Import,             // importer failed on an otherwise good file
    Cancelled,
    Filesystem
};

struct Error {
    ErrorKind kind{ErrorKind::Network};
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network:            return "network";
        case ErrorKind::Timeout:            return "timeout";
        case ErrorKind::Envelope:           return "envelope";
        case ErrorKind::MalformedCatalog:   return "malformed_catalog";
        case ErrorKind::ValidationRejected: return "validation_rejected";
        case ErrorKind::SizeLimitExceeded:  return "size_limit_exceeded";
        case ErrorKind::Integrity:          return "integrity";
        case ErrorKind::Import:             return "import";
        case ErrorKind::Cancelled:          return "cancelled";
        case ErrorKind::Filesystem:         return "filesystem";
    }
    return "unknown";
}

} // namespace assetdock::core
