// =================================================================
// include/CodePack/ConfigStore.hpp
// =================================================================
// Header for the app-wide JSON store of per-project selections.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>
#include <map>

namespace CodePack {

/**
 * @brief Persists ProjectConfig entries keyed by project root
 *
 * The whole store lives in one JSON document of the form
 * {"projects": {"<root>": {...}}}. Every mutation rewrites the file
 * atomically; a failed write is logged and reported through the return
 * value while the in-memory state keeps the change.
 */
class ConfigStore {
public:
    explicit ConfigStore(const std::string& config_path);

    /**
     * @brief Read the store from disk
     *
     * A missing file gives an empty store. A malformed file is logged and
     * also gives an empty store.
     * @return False if the file existed but could not be parsed
     */
    bool load();

    /**
     * @brief Write the whole store through a temporary file and rename
     * @return True on success
     */
    bool save();

    /**
     * @brief Look up a project
     * @return False if the project has no saved entry
     */
    bool loadProject(const std::string& project_path, ProjectConfig& config) const;

    /**
     * @brief Store the checked paths of a project and refresh last_opened
     *
     * Presets, exclusions and the pinned flag are kept.
     */
    bool saveSelection(const std::string& project_path, const std::vector<std::string>& checked_paths);

    /**
     * @brief Create or overwrite a named preset
     *
     * Throws std::invalid_argument for an empty name.
     */
    bool savePreset(const std::string& project_path, const std::string& name,
                    const std::vector<std::string>& paths);

    /**
     * @brief Delete a preset
     * @return False if the preset did not exist or the write failed
     */
    bool deletePreset(const std::string& project_path, const std::string& name);

    /**
     * @brief Preset names of a project in sorted order
     */
    std::vector<std::string> listPresets(const std::string& project_path) const;

    bool getPreset(const std::string& project_path, const std::string& name,
                   std::vector<std::string>& paths) const;

    bool setPinned(const std::string& project_path, bool pinned);

    bool setExcludedPaths(const std::string& project_path, const std::vector<std::string>& paths);

    /**
     * @brief Known projects, pinned first, then most recently opened
     */
    std::vector<ProjectConfig> recentProjects() const;

    const std::string& getConfigPath() const { return m_config_path; }

    /**
     * @brief Seconds since the epoch as a decimal string
     */
    static std::string currentTimestamp();

    /**
     * @brief Render the store as pretty-printed JSON
     */
    std::string serialize() const;

    /**
     * @brief Replace the in-memory store from JSON text
     * @param error Receives a message when parsing fails
     * @return False if the text is not a valid store
     */
    bool deserialize(const std::string& text, std::string& error);

private:
    std::string m_config_path;
    std::map<std::string, ProjectConfig> m_projects;

    ProjectConfig& entryFor(const std::string& project_path);
};

} // namespace CodePack
