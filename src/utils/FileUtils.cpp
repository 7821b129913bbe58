/**
 * FileUtils.cpp
 *
 * File system operations used by the download pipeline.
 */

#include "FileUtils.hpp"
#include "../core/Logger.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace assetdock::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::copyFile(const fs::path& source, const fs::path& destination, bool overwrite) {
    std::error_code ec;
    auto opts = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    return fs::copy_file(source, destination, opts, ec) && !ec;
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeBinaryFile(const fs::path& path, const std::string& data) {
    if (path.has_parent_path() && !createDirectories(path.parent_path())) return false;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    return !file.fail();
}

// -- Containment --

bool FileUtils::isStrictlyInside(const fs::path& parent, const fs::path& child) {
    std::error_code ec;
    auto base = fs::weakly_canonical(parent, ec);
    if (ec) return false;
    auto target = fs::weakly_canonical(child, ec);
    if (ec) return false;

    auto rel = target.lexically_relative(base);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

// -- ScopedFileRemoval --

ScopedFileRemoval::~ScopedFileRemoval() {
    if (!m_path.empty()) {
        std::error_code ec;
        fs::remove(m_path, ec);
        if (ec) {
            LOG_WARN("Could not remove temporary file {}: {}", m_path.string(), ec.message());
        }
    }
}

} // namespace assetdock::utils
