// AssetDock - Data Models
// Catalog and per-entry runtime structures shared by the engine components

#pragma once

#include "../Errors.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace assetdock {

using json = nlohmann::json;

//=============================================================================
// Catalog Models
//=============================================================================

/**
 * One downloadable package as published by the remote catalog.
 * `name` is the coordination key and is unique within a published catalog.
 */
struct CatalogEntry {
    std::string name;
    std::string description;
    std::string version;
    std::string downloadUrl;
    std::string imageUrl;
    std::string category;
    int64_t fileSize{0};    // 0 = unknown

    bool operator==(const CatalogEntry& other) const {
        return name == other.name &&
               description == other.description &&
               version == other.version &&
               downloadUrl == other.downloadUrl &&
               imageUrl == other.imageUrl &&
               category == other.category &&
               fileSize == other.fileSize;
    }

    bool operator!=(const CatalogEntry& other) const { return !(*this == other); }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(CatalogEntry, name, description, version,
                                   downloadUrl, imageUrl, category, fileSize)
};

/** Display-ordered entry list; replaced wholesale on every successful sync. */
using Catalog = std::vector<CatalogEntry>;
using CatalogSnapshot = std::shared_ptr<const Catalog>;

//=============================================================================
// Download Models
//=============================================================================

enum class DownloadState {
    Idle,
    Requesting,
    Succeeded,
    Failed,
    TimedOut,
    Cancelled
};

/** Result of the most recent finished attempt for an entry. */
enum class DownloadOutcome {
    None,
    Completed,      // downloaded and imported
    ImportFailed,   // downloaded, importer rejected it
    Failed,
    TimedOut,
    Cancelled
};

/** Returned by submit calls; the entry name is the handle to poll. */
enum class SubmitStatus {
    Started,
    AlreadyInFlight,
    MissingUrl,
    SizeLimitExceeded,
    Unavailable     // unknown entry, or engine shut down
};

struct DownloadRecord {
    DownloadState state{DownloadState::Idle};
    float progress{0.0f};
    DownloadOutcome lastOutcome{DownloadOutcome::None};
    std::optional<core::Error> lastError;
    std::string localPath;
};

inline const char* downloadStateName(DownloadState state) {
    switch (state) {
        case DownloadState::Idle:       return "idle";
        case DownloadState::Requesting: return "requesting";
        case DownloadState::Succeeded:  return "succeeded";
        case DownloadState::Failed:     return "failed";
        case DownloadState::TimedOut:   return "timed_out";
        case DownloadState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

inline const char* downloadOutcomeName(DownloadOutcome outcome) {
    switch (outcome) {
        case DownloadOutcome::None:         return "none";
        case DownloadOutcome::Completed:    return "completed";
        case DownloadOutcome::ImportFailed: return "import_failed";
        case DownloadOutcome::Failed:       return "failed";
        case DownloadOutcome::TimedOut:     return "timed_out";
        case DownloadOutcome::Cancelled:    return "cancelled";
    }
    return "unknown";
}

//=============================================================================
// Preview Models
//=============================================================================

enum class ImageFormat {
    Png,
    Jpeg,
    Gif,
    Bmp,
    WebP
};

/** Fetched preview bytes; turning them into a texture is the host's job. */
struct PreviewImage {
    ImageFormat format{ImageFormat::Png};
    std::string bytes;
};

using PreviewHandle = std::shared_ptr<const PreviewImage>;

//=============================================================================
// Sync Models
//=============================================================================

enum class SyncState {
    Idle,
    InProgress,
    Ok,
    Failed,
    ShutDown
};

enum class SyncResult {
    Started,
    AlreadyInProgress,
    Unavailable
};

struct SyncStatus {
    SyncState state{SyncState::Idle};
    size_t count{0};            // entries published by the last successful sync
    size_t rejected{0};         // entries dropped by URL validation
    std::optional<core::Error> error;
};

/**
 * Read-only view handed to the presentation layer.
 */
struct EntryView {
    CatalogEntry entry;
    int64_t effectiveSize{0};   // catalog size, else probed size, else 0
    PreviewHandle preview;
    DownloadRecord download;
};

} // namespace assetdock
