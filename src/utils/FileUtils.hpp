// AssetDock - File Utilities
// File system operations used by the download pipeline

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace assetdock::utils {

/**
 * @brief File and directory utilities
 *
 * Every function reports failure through its return value; none throws.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool copyFile(const fs::path& source, const fs::path& destination, bool overwrite = false);
    static int64_t getFileSize(const fs::path& path);     // -1 when unavailable

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static bool writeBinaryFile(const fs::path& path, const std::string& data);

    /**
     * Check that @p child resolves to a location strictly below @p parent.
     * Both paths are normalized first, so "..", "." and symlinked parents
     * are accounted for.
     */
    static bool isStrictlyInside(const fs::path& parent, const fs::path& child);
};

/**
 * @brief Removes a file when it goes out of scope unless released
 */
class ScopedFileRemoval {
public:
    explicit ScopedFileRemoval(fs::path path) : m_path(std::move(path)) {}
    ~ScopedFileRemoval();

    ScopedFileRemoval(const ScopedFileRemoval&) = delete;
    ScopedFileRemoval& operator=(const ScopedFileRemoval&) = delete;

    void release() { m_path.clear(); }
    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

} // namespace assetdock::utils
