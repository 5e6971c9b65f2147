// =================================================================
// include/CodePack/ProjectScanner.hpp
// =================================================================
// Header for the classify, walk and describe step of opening a project.

#pragma once

#include "CodePack/Types.hpp"
#include "CodePack/TreeScanner.hpp"
#include <string>
#include <vector>

namespace CodePack {

/**
 * @brief Produces a ScanResult for a project root
 *
 * Classifies the root, walks it with the matched plugin's exclusions and
 * extensions added, and extracts manifest metadata.
 */
class ProjectScanner {
public:
    /**
     * @brief Construct a new ProjectScanner
     * @param plugins Plugin definitions consulted before the built-in types
     * @param options Options passed to the tree walk
     */
    explicit ProjectScanner(const std::vector<PluginDef>& plugins = {},
                            const ScanOptions& options = ScanOptions());

    /**
     * @brief Scan a project
     *
     * Throws std::invalid_argument if the root is not a directory.
     * @param root_path Project root
     * @return Type, tree (all unchecked), file count and metadata
     */
    ScanResult scan(const std::string& root_path) const;

private:
    std::vector<PluginDef> m_plugins;
    ScanOptions m_options;
};

} // namespace CodePack
