// =================================================================
// include/CodePack/ProjectSession.hpp
// =================================================================
// Header for the open-project state: tree, selection and persistence.

#pragma once

#include "CodePack/Types.hpp"
#include "CodePack/AppSettings.hpp"
#include "CodePack/Packer.hpp"
#include "CodePack/SelectionStateManager.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace CodePack {

class ConfigStore;
class PluginRegistry;

/**
 * @brief One open project and its selection
 *
 * Owns the scanned tree and keeps the saved selection in step with it:
 * every change to the selection is written to the ConfigStore. A failed
 * write is logged and the in-memory selection is kept. Operations other
 * than open() throw std::runtime_error when no project is open.
 */
class ProjectSession {
public:
    explicit ProjectSession(const AppSettings& settings);
    ~ProjectSession();

    /**
     * @brief Scan a project and restore its saved selection
     *
     * Without a saved entry every file starts checked.
     * @param root_path Project root
     * @return The scan result with the restored selection
     */
    const ScanResult& open(const std::string& root_path);

    /**
     * @brief Re-scan and carry the selection over
     *
     * A call made while another refresh is running returns immediately
     * with performed=false.
     */
    ReconcileReport refresh();

    /**
     * @brief Check or uncheck one file or directory
     * @return False if the path is not in the tree
     */
    bool toggle(const std::string& path, bool checked);

    void applyBulk(BulkAction action, const std::string& arg = "", const GitStatus& git = GitStatus());

    /**
     * @brief Save the current selection under a name
     *
     * Throws std::invalid_argument for an empty name or an empty selection.
     * @return False if the store could not be written
     */
    bool savePreset(const std::string& name);

    /**
     * @brief Replace the selection with a saved preset
     * @return False if the preset does not exist
     */
    bool loadPreset(const std::string& name);

    bool deletePreset(const std::string& name);

    std::vector<std::string> listPresets() const;

    /**
     * @brief Pack the checked files
     *
     * Paths, root and project type are taken from the session; the other
     * request fields are used as given.
     */
    PackResult pack(PackRequest request);

    TokenEstimate estimate() const;
    ProjectStats stats() const;
    std::vector<FileSecretReport> secrets() const;

    const FileNode& getTree() const;
    const ScanResult& getScanResult() const;
    std::vector<std::string> getCheckedPaths() const;
    const std::string& getRootPath() const { return m_root_path; }
    bool isOpen() const { return m_open; }

    Packer& getPacker() { return m_packer; }

private:
    AppSettings m_settings;
    std::unique_ptr<ConfigStore> m_store;
    std::unique_ptr<PluginRegistry> m_plugins;
    Packer m_packer;

    std::string m_root_path;
    ScanResult m_scan;
    bool m_open = false;
    std::atomic<bool> m_refreshing{false};

    ScanResult scanProject() const;
    bool persistSelection();
    void requireOpen() const;
};

} // namespace CodePack
