#pragma once

/**
 * DirectoryImporter.hpp
 *
 * Importer used by the command-line host: keeps a copy of every package
 * in a target directory.
 */

#include "PackageImporter.hpp"

namespace assetdock::core::importer {

class DirectoryImporter final : public PackageImporter {
public:
    explicit DirectoryImporter(std::filesystem::path targetDirectory);

    ImportResult importPackage(const std::filesystem::path& packagePath,
                               const std::string& packageName) override;

    const std::filesystem::path& targetDirectory() const { return m_targetDirectory; }

private:
    std::filesystem::path m_targetDirectory;
};

} // namespace assetdock::core::importer
