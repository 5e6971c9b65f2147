// =================================================================
// include/CodePack/ProjectClassifier.hpp
// =================================================================
// Header for project type detection from root marker files.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace CodePack {

/**
 * @brief Result of classifying a project root
 */
struct Classification {
    std::string project_type;
    bool plugin_matched = false;
    PluginDef plugin;              ///< Valid only when plugin_matched is true
};

/**
 * @brief Assigns a project type from the root's marker files
 *
 * Plugins are evaluated first, in the order given, and the first match wins.
 * Otherwise the built-in marker table is consulted in a fixed order, and
 * "generic" is returned when nothing matches.
 */
class ProjectClassifier {
public:
    static const std::string GENERIC_TYPE;

    /**
     * @brief Construct a classifier
     * @param plugins Plugin definitions checked before the built-in table
     */
    explicit ProjectClassifier(const std::vector<PluginDef>& plugins = {});

    /**
     * @brief Classify a project root
     * @param root_path Project root directory
     * @return Project type and, when applicable, the matching plugin
     */
    Classification classify(const std::string& root_path) const;

    /**
     * @brief Check whether a plugin matches a root
     *
     * All detect_files must exist and all detect_dirs must be directories.
     * A plugin with no detect rules never matches.
     */
    static bool pluginMatches(const PluginDef& plugin, const std::filesystem::path& root);

    /**
     * @brief Evaluate only the built-in marker table
     * @param root Project root
     * @return Project type name or GENERIC_TYPE
     */
    static std::string detectBuiltinType(const std::filesystem::path& root);

private:
    std::vector<PluginDef> m_plugins;
};

} // namespace CodePack
