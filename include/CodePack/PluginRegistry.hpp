// =================================================================
// include/CodePack/PluginRegistry.hpp
// =================================================================
// Loads, validates and persists JSON plugin definitions.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>

namespace CodePack {

/**
 * @brief Directory-backed collection of plugin definitions
 *
 * Each plugin lives in its own `<kebab-name>.json` file. Definitions are
 * read once and cached; save() and remove() refresh the cache.
 */
class PluginRegistry {
public:
    /**
     * @brief Construct a registry over a plugin directory
     * @param plugins_dir Directory holding *.json plugin files
     */
    explicit PluginRegistry(const std::string& plugins_dir);

    /**
     * @brief Get all valid plugins, loading them on first use
     * @return Plugins ordered by file name
     */
    const std::vector<PluginDef>& getPlugins();

    /**
     * @brief Drop the cache and re-read the plugin directory
     */
    void reload();

    /**
     * @brief Validate and persist a plugin definition
     *
     * Throws std::invalid_argument when the name is empty or both detect
     * lists are empty, std::runtime_error when the file cannot be written.
     * @param plugin Plugin to save
     * @return Path of the written file
     */
    std::string save(const PluginDef& plugin);

    /**
     * @brief Delete a plugin by name
     * @param name Plugin name (same name that was saved)
     * @return True if a file was removed
     */
    bool remove(const std::string& name);

    const std::string& getDirectory() const { return m_plugins_dir; }

    /**
     * @brief File name used to persist a plugin ("Unity Game" -> "unity-game.json")
     */
    static std::string fileNameFor(const std::string& name);

    /**
     * @brief Parse a plugin definition from JSON text
     * @param json_text JSON document
     * @param plugin Receives the parsed plugin
     * @param error Receives a description when parsing fails
     * @return True if the document is a well-formed plugin object
     */
    static bool parsePlugin(const std::string& json_text, PluginDef& plugin, std::string& error);

    /**
     * @brief Serialize a plugin definition as pretty-printed JSON
     */
    static std::string toJson(const PluginDef& plugin);

    /**
     * @brief Check the minimum a plugin needs to be usable
     * @param plugin Plugin to check
     * @param reason Receives the failure description
     * @return True if the plugin has a name and at least one detect rule
     */
    static bool validate(const PluginDef& plugin, std::string& reason);

private:
    std::string m_plugins_dir;
    std::vector<PluginDef> m_plugins;
    bool m_loaded;

    void loadAll();
};

} // namespace CodePack
