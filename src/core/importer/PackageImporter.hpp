#pragma once

/**
 * PackageImporter.hpp
 *
 * Hand-off point for downloaded packages. The engine only guarantees that
 * the path exists, is non-empty and lies inside the scratch directory; what
 * "import" means is up to the host.
 */

#include <filesystem>
#include <string>

namespace assetdock::core::importer {

struct ImportResult {
    bool success{false};
    std::string message;
};

class PackageImporter {
public:
    virtual ~PackageImporter() = default;

    /**
     * Import a validated package
     * @param packagePath Local file; removed by the caller after this returns
     * @param packageName Catalog entry name
     */
    virtual ImportResult importPackage(const std::filesystem::path& packagePath,
                                       const std::string& packageName) = 0;
};

} // namespace assetdock::core::importer
