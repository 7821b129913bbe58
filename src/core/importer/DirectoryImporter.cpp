/**
 * DirectoryImporter.cpp
 */

#include "DirectoryImporter.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

namespace assetdock::core::importer {

using utils::FileUtils;

DirectoryImporter::DirectoryImporter(std::filesystem::path targetDirectory)
    : m_targetDirectory(std::move(targetDirectory)) {
}

ImportResult DirectoryImporter::importPackage(const std::filesystem::path& packagePath,
                                              const std::string& packageName) {
    ImportResult result;

    if (!FileUtils::fileExists(packagePath)) {
        result.message = "Package file is missing";
        return result;
    }

    if (!FileUtils::createDirectories(m_targetDirectory)) {
        result.message = "Cannot create import directory " + m_targetDirectory.string();
        return result;
    }

    auto destination = m_targetDirectory / packagePath.filename();
    if (!FileUtils::copyFile(packagePath, destination, true)) {
        result.message = "Cannot copy package to " + destination.string();
        return result;
    }

    LOG_INFO("Imported {} into {}", packageName, destination.string());
    result.success = true;
    result.message = destination.string();
    return result;
}

} // namespace assetdock::core::importer
